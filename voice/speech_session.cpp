#include "speech_session.hpp"
#include "encoding.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "voice/stream_frame_parser.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace Voice {

    // ============================================================
    // Helpers
    // ============================================================
    namespace {

        // What a fetch/decode task hands back to the cycle loop
        struct ChunkOutcome {
            int chunkId = -1;
            std::optional<AudioChunk> chunk;
            std::string errorCode;      // set when chunk is empty
            std::string detail;
        };

        ChunkOutcome failedChunk(int chunkId, const char* code, std::string detail) {
            ChunkOutcome out;
            out.chunkId = chunkId;
            out.errorCode = code;
            out.detail = "chunk " + std::to_string(chunkId) + ": " + detail;
            return out;
        }

        std::optional<std::string> fetchBytes(const FetchResult& r, int chunkId, ChunkOutcome& failure) {
            if (r.status == FetchResult::Status::Ok) return r.bytes;
            failure = failedChunk(chunkId,
                                  r.status == FetchResult::Status::NotFound ? "ERR_CHUNK_EXPIRED" : "ERR_CHUNK_FETCH",
                                  r.message);
            return std::nullopt;
        }

        // Runs on a std::async worker: never touches the buffer or scheduler
        ChunkOutcome resolveChunk(const StreamFrame& frame, VoiceTransport& transport, const AudioDecoder& decoder) {
            const int id = *frame.chunkId;
            ChunkOutcome failure;
            std::optional<std::string> bytes;

            if (!frame.audioId.empty()) {
                bytes = fetchBytes(transport.fetchAudio(frame.audioId), id, failure);
            } else if (encoding::startsWith(frame.audioUrl, "data:")) {
                bytes = encoding::decodeDataUrl(frame.audioUrl);
                if (!bytes) failure = failedChunk(id, "ERR_CHUNK_DECODE", "malformed data URL");
            } else if (encoding::startsWith(frame.audioUrl, "http://") ||
                       encoding::startsWith(frame.audioUrl, "https://")) {
                bytes = fetchBytes(transport.fetchUrl(frame.audioUrl), id, failure);
            } else {
                failure = failedChunk(id, "ERR_CHUNK_FETCH", "unsupported audio URL");
            }

            if (!bytes) return failure;

            auto decoded = decoder.decode(*bytes);
            if (!decoded) {
                return failedChunk(id, "ERR_CHUNK_DECODE", std::to_string(bytes->size()) + " bytes undecodable");
            }

            ChunkOutcome out;
            out.chunkId = id;
            out.chunk = AudioChunk{id, std::move(*decoded), frame.text};
            return out;
        }

        // ------------------------------------------------------------
        // StreamReader: transport.stream() on its own thread, body bytes
        // into a channel. Joined on destruction.
        // ------------------------------------------------------------
        class StreamReader {
        public:
            StreamReader(std::shared_ptr<VoiceTransport> transport, StreamRequest request) {
                auto outer = std::move(request.cancelled);
                request.cancelled = [this, outer] { return stop_ || (outer && outer()); };

                thread_ = std::thread([this, transport = std::move(transport), request = std::move(request)] {
                    status_ = transport->stream(request, [this](std::string_view data) {
                        if (stop_) return false;
                        bytes_.push(std::string(data));
                        return true;
                    });
                    bytes_.close();
                });
            }

            ~StreamReader() {
                halt();
                join();
            }

            Channel<std::string>& bytes() { return bytes_; }

            void halt() { stop_ = true; }

            const TransportStatus& join() {
                if (thread_.joinable()) thread_.join();
                return status_;
            }

        private:
            std::atomic<bool> stop_{false};
            Channel<std::string> bytes_;
            TransportStatus status_;
            std::thread thread_;
        };

    } // namespace

    // ============================================================
    // SpeechSession::Cycle: state of one submit()
    // ============================================================
    class SpeechSession::Cycle {
    public:
        Cycle(SpeechSession& session, std::uint64_t generation)
            : s_(session), gen_(generation) {}

        CycleResult run(const AudioClip& clip);

    private:
        // Caller holds pipelineMutex_
        void handleFrame(StreamFrame& frame);
        void collectFetches();
        void announceComplete(const StreamFrame& frame);

        CycleResult fail(const std::string& code, const std::string& userMessage, const std::string& detail);
        CycleResult cancelled();

        SpeechSession& s_;
        const std::uint64_t gen_;

        StreamFrameParser parser_;
        std::vector<std::future<ChunkOutcome>> fetches_;
        std::optional<StreamFrame> complete_;
        std::optional<StreamFrame> serverError_;
        std::string streamedText_;      // every text frame, verbatim
        bool flushed_ = false;
    };

    CycleResult SpeechSession::Cycle::run(const AudioClip& clip) {
        StreamRequest request;
        request.audioWav  = encoding::encodeWav(clip.samples, clip.sampleRate);
        request.projectId = s_.config_.projectId;
        request.sessionId = s_.config_.sessionId;
        request.voice     = s_.config_.voice;
        request.persona   = s_.config_.persona;
        request.history   = s_.conversation();
        request.cancelled = [this] { return !s_.current(gen_); };

        LOG_PHASE("Stream request sent", true);

        StreamReader reader(s_.transport_, std::move(request));
        const auto tick = std::chrono::milliseconds(std::max(1, s_.config_.tickMs));
        bool streamClosed = false;

        while (true) {
            std::vector<StreamFrame> frames;
            if (!streamClosed) {
                auto data = reader.bytes().waitPop(tick);
                if (data) {
                    frames = parser_.feed(*data);
                } else if (reader.bytes().drained()) {
                    streamClosed = true;
                    frames = parser_.finish();
                }
            } else {
                std::this_thread::sleep_for(tick);
            }

            bool idle = false;
            {
                std::lock_guard<std::mutex> lock(s_.pipelineMutex_);
                if (!s_.current(gen_)) return cancelled();

                for (auto& frame : frames) handleFrame(frame);
                collectFetches();

                if (complete_ && fetches_.empty() && !flushed_) {
                    s_.buffer_.flush();
                    flushed_ = true;
                }
                s_.scheduler_.update();

                idle = flushed_ && !s_.scheduler_.isActive() && !s_.buffer_.hasReady();
                if (idle) s_.phase_ = Phase::Idle;
            }

            if (serverError_) {
                return fail("ERR_SERVER_ERROR", serverError_->error, serverError_->error);
            }

            // Nothing after a terminal frame matters; let the reader go
            if (parser_.finished()) reader.halt();

            if (streamClosed && !parser_.finished()) {
                const TransportStatus& status = reader.join();
                if (!s_.current(gen_)) return cancelled();
                if (!status.ok && !status.cancelled) {
                    const bool http = status.errorCode == "ERR_TRANSPORT_HTTP";
                    return fail(status.errorCode.empty() ? "ERR_TRANSPORT_NETWORK" : status.errorCode,
                                http ? status.message : "",
                                "HTTP " + std::to_string(status.httpStatus) + ": " + status.message);
                }
                return fail("ERR_STREAM_INCOMPLETE", "",
                            std::to_string(parser_.skippedLines()) + " malformed line(s) skipped");
            }

            if (idle) break;
        }

        s_.emit(SpeechEventType::Reset);
        LOG_PHASE("Cycle complete", true);
        return CycleResult{complete_->fullResponse, true, "ERR_NONE"};
    }

    void SpeechSession::Cycle::handleFrame(StreamFrame& frame) {
        switch (frame.type) {
            case FrameType::Text:
                streamedText_ += frame.text;
                s_.emit(SpeechEventType::ResponseChunk, frame.text);
                break;

            case FrameType::Audio: {
                LOG_TRACE("Session", "Resolving chunk " + std::to_string(*frame.chunkId) +
                                     (frame.audioId.empty() ? " (inline)" : " (audioId=" + frame.audioId + ")"));
                fetches_.push_back(std::async(std::launch::async,
                    [transport = s_.transport_, decoder = s_.decoder_, frame] {
                        return resolveChunk(frame, *transport, *decoder);
                    }));
                break;
            }

            case FrameType::Complete:
                if (frame.fullResponse.empty()) frame.fullResponse = streamedText_;
                complete_ = frame;
                announceComplete(frame);
                break;

            case FrameType::Error:
                if (frame.chunkId) {
                    ErrorManager::note("ERR_CHUNK_SYNTHESIS",
                                       "chunk " + std::to_string(*frame.chunkId) + ": " + frame.error);
                    s_.buffer_.skip(*frame.chunkId);
                } else {
                    serverError_ = frame;
                }
                break;
        }
    }

    void SpeechSession::Cycle::collectFetches() {
        for (auto it = fetches_.begin(); it != fetches_.end();) {
            if (it->wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                ++it;
                continue;
            }

            ChunkOutcome outcome = it->get();
            it = fetches_.erase(it);

            if (outcome.chunk) {
                s_.buffer_.submit(outcome.chunkId, std::move(*outcome.chunk));
            } else {
                ErrorManager::note(outcome.errorCode, outcome.detail);
                s_.buffer_.skip(outcome.chunkId);
            }
        }
    }

    void SpeechSession::Cycle::announceComplete(const StreamFrame& frame) {
        {
            std::lock_guard<std::mutex> lock(s_.historyMutex_);
            s_.history_.push_back({"user", frame.transcript});
            s_.history_.push_back({"assistant", frame.fullResponse});
        }

        s_.emit(SpeechEventType::Transcript, frame.transcript);
        s_.emit(SpeechEventType::Response, frame.fullResponse);
        s_.emit(SpeechEventType::Complete, frame.fullResponse, frame.transcript);
        LOG_PHASE("Response complete", true);
    }

    CycleResult SpeechSession::Cycle::fail(const std::string& code,
                                           const std::string& userMessage,
                                           const std::string& detail) {
        {
            std::lock_guard<std::mutex> lock(s_.pipelineMutex_);
            if (!s_.current(gen_)) return cancelled();
            s_.scheduler_.stop();
            s_.phase_ = Phase::Idle;
        }

        CycleResult result = ErrorManager::report(code, detail);
        if (!userMessage.empty()) result.message = userMessage;

        s_.emit(SpeechEventType::Error, result.message);
        s_.emit(SpeechEventType::Reset);
        LOG_PHASE("Cycle failed", false);
        return result;
    }

    CycleResult SpeechSession::Cycle::cancelled() {
        LOG_DEBUG("Session", "Cycle " + std::to_string(gen_) + " abandoned (" +
                             std::to_string(fetches_.size()) + " fetch(es) in flight)");
        CycleResult result;
        result.message = ErrorManager::getUserMessage("ERR_SESSION_CANCELLED");
        result.errorCode = "ERR_SESSION_CANCELLED";
        return result;
    }

    // ============================================================
    // SpeechSession
    // ============================================================
    SpeechSession::SpeechSession(VoiceConfig config,
                                 std::shared_ptr<VoiceTransport> transport,
                                 std::shared_ptr<AudioDecoder> decoder,
                                 std::unique_ptr<AudioOutput> output,
                                 std::shared_ptr<EventChannel> events)
        : config_(std::move(config)),
          transport_(std::move(transport)),
          decoder_(std::move(decoder)),
          events_(events ? std::move(events) : std::make_shared<EventChannel>()),
          scheduler_(buffer_, std::move(output),
                     std::chrono::milliseconds(config_.interChunkGapMs),
                     std::chrono::milliseconds(config_.retryGapMs))
    {
        scheduler_.setOnStarted([this] {
            phase_ = Phase::Speaking;
            emit(SpeechEventType::AiSpeaking);
        });
        scheduler_.setOnChunkStarted([](int chunkId, const std::string& text) {
            LOG_TRACE("Session", "Speaking chunk " + std::to_string(chunkId) + ": " + text);
        });
    }

    SpeechSession::~SpeechSession() {
        ++generation_;
        std::lock_guard<std::mutex> cycleLock(cycleMutex_);
        std::lock_guard<std::mutex> lock(pipelineMutex_);
        scheduler_.stop();
    }

    CycleResult SpeechSession::submit(const AudioClip& clip) {
        // Supersede whatever cycle is running, then wait for it to unwind
        const std::uint64_t gen = ++generation_;
        std::lock_guard<std::mutex> cycleLock(cycleMutex_);
        if (!current(gen)) {
            LOG_DEBUG("Session", "Submit superseded before it started");
            return CycleResult{ErrorManager::getUserMessage("ERR_SESSION_CANCELLED"), false, "ERR_SESSION_CANCELLED"};
        }

        // The superseded cycle exits without touching the device; silence it here
        {
            std::lock_guard<std::mutex> lock(pipelineMutex_);
            scheduler_.stop();
        }

        phase_ = Phase::Processing;
        emit(SpeechEventType::Processing);

        const double seconds = clip.durationSeconds();
        if (seconds < config_.minClipSeconds) {
            phase_ = Phase::Idle;
            emit(SpeechEventType::Reset);
            return ErrorManager::report("ERR_CLIP_TOO_SHORT", std::to_string(seconds) + "s");
        }

        if (config_.projectId.empty()) {
            phase_ = Phase::Idle;
            CycleResult result = ErrorManager::report("ERR_NO_PROJECT");
            emit(SpeechEventType::Error, result.message);
            emit(SpeechEventType::Reset);
            return result;
        }

        LOG_DEBUG("Session", "Cycle " + std::to_string(gen) + " started (" + std::to_string(seconds) + "s clip)");
        Cycle cycle(*this, gen);
        return cycle.run(clip);
    }

    std::future<CycleResult> SpeechSession::submitAsync(AudioClip clip) {
        return std::async(std::launch::async, [this, clip = std::move(clip)] {
            return submit(clip);
        });
    }

    void SpeechSession::haltPlayback(const char* reason) {
        {
            std::lock_guard<std::mutex> lock(pipelineMutex_);
            ++generation_;
            scheduler_.stop();
        }
        phase_ = Phase::Idle;
        LOG_DEBUG("Session", std::string("Playback halted (") + reason + ")");
    }

    void SpeechSession::stopAudio() {
        haltPlayback("stop");
        emit(SpeechEventType::Reset);
    }

    void SpeechSession::onSpeechStart() {
        emit(SpeechEventType::UserSpeaking);
        haltPlayback("barge-in");
    }

    void SpeechSession::onMisfire() {
        LOG_DEBUG("Session", "VAD misfire");
        emit(SpeechEventType::Reset);
    }

    void SpeechSession::clearConversation() {
        std::lock_guard<std::mutex> lock(historyMutex_);
        history_.clear();
    }

    std::vector<ConversationTurn> SpeechSession::conversation() const {
        std::lock_guard<std::mutex> lock(historyMutex_);
        return history_;
    }

    bool SpeechSession::isPlaying() const {
        std::lock_guard<std::mutex> lock(pipelineMutex_);
        return scheduler_.isActive();
    }

    void SpeechSession::emit(SpeechEventType type, const std::string& text, const std::string& transcript) {
        LOG_TRACE("Session", std::string("Event ") + toString(type) + (text.empty() ? "" : ": " + text));
        events_->push(SpeechEvent{type, text, transcript});
    }

    const char* toString(SpeechSession::Phase phase) {
        switch (phase) {
            case SpeechSession::Phase::Idle:       return "Idle";
            case SpeechSession::Phase::Processing: return "Processing";
            case SpeechSession::Phase::Speaking:   return "Speaking";
        }
        return "Unknown";
    }

} // namespace Voice
