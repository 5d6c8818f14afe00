#pragma once
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include "voice/audio_chunk.hpp"

namespace Voice {

    // ------------------------------------------------------------
    // ChunkReorderBuffer
    // ------------------------------------------------------------
    // Fragments arrive in any order; they leave popReady() in strictly
    // ascending id order with no gaps except ids that were skipped.
    //
    // Invariants after every submit()/skip():
    // - pending never holds nextExpectedId()
    // - at most one entry per id
    // - ids < nextExpectedId() are never stored again
    //
    // Not thread-safe: the session drives it from its pipeline loop.
    class ChunkReorderBuffer {
    public:
        using ReadyListener = std::function<void()>;

        // Store (or overwrite) chunkId and release whatever is now in sequence
        void submit(int chunkId, AudioChunk chunk);

        // chunkId resolved without audio (decode failure, expired, ...)
        void skip(int chunkId);

        // End of stream: release everything pending in id order,
        // treating missing ids as skipped
        void flush();

        void clear();

        std::optional<AudioChunk> popReady();

        bool hasReady() const { return !ready_.empty(); }
        size_t readyCount() const { return ready_.size(); }
        size_t pendingCount() const { return pending_.size(); }
        int nextExpectedId() const { return nextExpected_; }

        // Fired when the ready queue goes from empty to non-empty
        void setOnReady(ReadyListener listener) { onReady_ = std::move(listener); }

    private:
        bool accepts(int chunkId, const char* what) const;
        void release();

        std::map<int, std::optional<AudioChunk>> pending_;   // nullopt = skip marker
        std::deque<AudioChunk> ready_;
        int nextExpected_ = 0;
        ReadyListener onReady_;
    };

} // namespace Voice
