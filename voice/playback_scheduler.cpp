#include "playback_scheduler.hpp"
#include "logger.hpp"

namespace Voice {

    PlaybackScheduler::PlaybackScheduler(ChunkReorderBuffer& buffer,
                                         std::unique_ptr<AudioOutput> output,
                                         std::chrono::milliseconds interChunkGap,
                                         std::chrono::milliseconds retryGap)
        : buffer_(buffer),
          output_(std::move(output)),
          gap_(interChunkGap),
          retryGap_(retryGap)
    {
        buffer_.setOnReady([this] { start(); });
    }

    PlaybackScheduler::~PlaybackScheduler() {
        buffer_.setOnReady(nullptr);
        if (output_) output_->stop();
    }

    void PlaybackScheduler::start() {
        if (active_ || !buffer_.hasReady()) return;
        LOG_TRACE("Playback", "Starting run");
        playNext();
    }

    void PlaybackScheduler::playNext() {
        auto chunk = buffer_.popReady();
        if (!chunk) {
            const bool wasActive = active_;
            state_ = State::Idle;
            active_ = false;
            runStarted_ = false;
            if (wasActive) {
                LOG_DEBUG("Playback", "Queue drained after " + std::to_string(played_) + " chunk(s)");
                if (onComplete_) onComplete_();
            }
            return;
        }

        active_ = true;
        const int id = chunk->id;
        const std::string text = chunk->text;

        if (!output_ || !output_->play(std::move(*chunk))) {
            LOG_ERROR("Playback", "Device refused chunk " + std::to_string(id) + ", moving on");
            state_ = State::Gap;
            gapUntil_ = Clock::now() + retryGap_;
            return;
        }

        state_ = State::Playing;
        ++played_;

        if (!runStarted_) {
            runStarted_ = true;
            if (onStarted_) onStarted_();
        }
        if (onChunkStarted_) onChunkStarted_(id, text);
    }

    void PlaybackScheduler::update() {
        if (!active_) return;

        if (state_ == State::Playing && output_->isFinished()) {
            state_ = State::Gap;
            gapUntil_ = Clock::now() + gap_;
        }

        if (state_ == State::Gap && Clock::now() >= gapUntil_) {
            playNext();
        }
    }

    void PlaybackScheduler::stop() {
        if (output_) output_->stop();
        buffer_.clear();

        if (active_) {
            LOG_DEBUG("Playback", "Stopped");
        }
        state_ = State::Idle;
        active_ = false;
        runStarted_ = false;
    }

} // namespace Voice
