#pragma once
#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

#include "cycle_result.hpp"
#include "voice/audio_chunk.hpp"
#include "voice/audio_decoder.hpp"
#include "voice/audio_output.hpp"
#include "voice/chunk_reorder_buffer.hpp"
#include "voice/playback_scheduler.hpp"
#include "voice/speech_events.hpp"
#include "voice/voice_config.hpp"
#include "voice/voice_transport.hpp"

namespace Voice {

    // ------------------------------------------------------------
    // SpeechSession
    // ------------------------------------------------------------
    // One capture→response cycle at a time:
    //   clip → transport.stream() → StreamFrameParser → fetch/decode tasks
    //        → ChunkReorderBuffer → PlaybackScheduler → AudioOutput
    // Lifecycle is reported on the event channel; conversation history is
    // only updated by a "complete" frame.
    //
    // submit() runs the cycle on the calling thread. stopAudio(),
    // onSpeechStart() and onMisfire() may be called from any thread.
    class SpeechSession {
    public:
        enum class Phase { Idle, Processing, Speaking };

        SpeechSession(VoiceConfig config,
                      std::shared_ptr<VoiceTransport> transport,
                      std::shared_ptr<AudioDecoder> decoder,
                      std::unique_ptr<AudioOutput> output,
                      std::shared_ptr<EventChannel> events);
        ~SpeechSession();

        SpeechSession(const SpeechSession&) = delete;
        SpeechSession& operator=(const SpeechSession&) = delete;

        // Blocks until the reply has finished playing, failed or was stopped.
        // A newer submit() supersedes a running one.
        CycleResult submit(const AudioClip& clip);
        std::future<CycleResult> submitAsync(AudioClip clip);

        // Stop playback now and invalidate the running cycle
        void stopAudio();

        // 🔹 VAD hooks
        void onSpeechStart();   // barge-in: silence the reply
        void onMisfire();       // speech start without a usable clip

        void clearConversation();
        std::vector<ConversationTurn> conversation() const;

        Phase phase() const { return phase_; }
        bool isPlaying() const;

        EventChannel& events() { return *events_; }
        const VoiceConfig& config() const { return config_; }

    private:
        class Cycle;

        // Stop device + buffers and bump the generation. Caller emits events.
        void haltPlayback(const char* reason);
        void emit(SpeechEventType type, const std::string& text = "", const std::string& transcript = "");
        bool current(std::uint64_t generation) const { return generation_ == generation; }

        VoiceConfig config_;
        std::shared_ptr<VoiceTransport> transport_;
        std::shared_ptr<AudioDecoder> decoder_;
        std::shared_ptr<EventChannel> events_;

        // Guards buffer_ and scheduler_
        mutable std::mutex pipelineMutex_;
        ChunkReorderBuffer buffer_;
        PlaybackScheduler scheduler_;

        std::atomic<std::uint64_t> generation_{0};
        std::atomic<Phase> phase_{Phase::Idle};

        mutable std::mutex historyMutex_;
        std::vector<ConversationTurn> history_;

        // Serializes submit() calls
        std::mutex cycleMutex_;
    };

    const char* toString(SpeechSession::Phase phase);

} // namespace Voice
