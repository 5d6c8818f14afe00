#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include "voice/audio_output.hpp"
#include "voice/chunk_reorder_buffer.hpp"

namespace Voice {

    // ------------------------------------------------------------
    // PlaybackScheduler
    // ------------------------------------------------------------
    // Plays the reorder buffer's ready queue one chunk at a time.
    // Idle → Playing → Gap → Playing ... → Idle once the queue runs dry.
    // Cooperative: the owner calls update() every tick.
    class PlaybackScheduler {
    public:
        enum class State { Idle, Playing, Gap };

        using Clock = std::chrono::steady_clock;
        using Listener = std::function<void()>;
        using ChunkListener = std::function<void(int chunkId, const std::string& text)>;

        PlaybackScheduler(ChunkReorderBuffer& buffer,
                          std::unique_ptr<AudioOutput> output,
                          std::chrono::milliseconds interChunkGap = std::chrono::milliseconds(50),
                          std::chrono::milliseconds retryGap = std::chrono::milliseconds(100));
        ~PlaybackScheduler();

        PlaybackScheduler(const PlaybackScheduler&) = delete;
        PlaybackScheduler& operator=(const PlaybackScheduler&) = delete;

        // Begin a run if idle and something is ready
        void start();

        void update();

        // Stop the device, drop everything queued. Safe at any time.
        void stop();

        bool isActive() const { return active_; }
        bool isPlaying() const { return state_ == State::Playing; }
        State state() const { return state_; }
        size_t playedCount() const { return played_; }

        // 🔹 Listeners
        void setOnStarted(Listener l)         { onStarted_ = std::move(l); }
        void setOnChunkStarted(ChunkListener l) { onChunkStarted_ = std::move(l); }
        void setOnPlaybackComplete(Listener l) { onComplete_ = std::move(l); }

    private:
        void playNext();

        ChunkReorderBuffer& buffer_;
        std::unique_ptr<AudioOutput> output_;
        std::chrono::milliseconds gap_;
        std::chrono::milliseconds retryGap_;

        State state_ = State::Idle;
        bool active_ = false;
        bool runStarted_ = false;   // first chunk of this run reached the device
        Clock::time_point gapUntil_{};
        size_t played_ = 0;

        Listener onStarted_;
        ChunkListener onChunkStarted_;
        Listener onComplete_;
    };

} // namespace Voice
