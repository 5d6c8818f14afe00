#include "chunk_reorder_buffer.hpp"
#include "logger.hpp"

#include <string>

namespace Voice {

    bool ChunkReorderBuffer::accepts(int chunkId, const char* what) const {
        if (chunkId < 0) {
            LOG_ERROR("Reorder", std::string(what) + " with negative id " + std::to_string(chunkId) + " discarded");
            return false;
        }
        if (chunkId < nextExpected_) {
            LOG_DEBUG("Reorder", std::string(what) + " for chunk " + std::to_string(chunkId) +
                                 " arrived after its turn (next=" + std::to_string(nextExpected_) + "), discarded");
            return false;
        }
        return true;
    }

    void ChunkReorderBuffer::submit(int chunkId, AudioChunk chunk) {
        if (!accepts(chunkId, "Submit")) return;

        chunk.id = chunkId;
        auto it = pending_.find(chunkId);
        if (it != pending_.end()) {
            LOG_DEBUG("Reorder", "Chunk " + std::to_string(chunkId) + " delivered twice, keeping the latest");
            it->second = std::move(chunk);
        } else {
            pending_.emplace(chunkId, std::move(chunk));
        }

        release();
    }

    void ChunkReorderBuffer::skip(int chunkId) {
        if (!accepts(chunkId, "Skip")) return;

        // A real chunk already stored for this id wins over the skip
        if (pending_.emplace(chunkId, std::nullopt).second) {
            LOG_TRACE("Reorder", "Chunk " + std::to_string(chunkId) + " marked as skipped");
        }

        release();
    }

    void ChunkReorderBuffer::release() {
        const bool wasEmpty = ready_.empty();

        auto it = pending_.find(nextExpected_);
        while (it != pending_.end()) {
            if (it->second) {
                ready_.push_back(std::move(*it->second));
            }
            pending_.erase(it);
            ++nextExpected_;
            it = pending_.find(nextExpected_);
        }

        if (wasEmpty && !ready_.empty() && onReady_) {
            onReady_();
        }
    }

    void ChunkReorderBuffer::flush() {
        if (pending_.empty()) return;

        const bool wasEmpty = ready_.empty();
        int missing = 0;

        for (auto& [id, entry] : pending_) {
            missing += id - nextExpected_;
            if (entry) {
                ready_.push_back(std::move(*entry));
            }
            nextExpected_ = id + 1;
        }
        pending_.clear();

        if (missing > 0) {
            LOG_DEBUG("Reorder", "Flush skipped " + std::to_string(missing) + " chunk(s) that never arrived");
        }

        if (wasEmpty && !ready_.empty() && onReady_) {
            onReady_();
        }
    }

    void ChunkReorderBuffer::clear() {
        pending_.clear();
        ready_.clear();
        nextExpected_ = 0;
    }

    std::optional<AudioChunk> ChunkReorderBuffer::popReady() {
        if (ready_.empty()) return std::nullopt;
        AudioChunk chunk = std::move(ready_.front());
        ready_.pop_front();
        return chunk;
    }

} // namespace Voice
