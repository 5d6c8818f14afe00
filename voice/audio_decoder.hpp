#pragma once
#include <optional>
#include <string>
#include "voice/audio_chunk.hpp"

namespace Voice {

    // ------------------------------------------------------------
    // AudioDecoder: encoded file bytes (wav/ogg/flac/mp3) → PCM
    // ------------------------------------------------------------
    // Called from fetch/decode tasks, so implementations must be
    // safe to use from several threads at once.
    class AudioDecoder {
    public:
        virtual ~AudioDecoder() = default;

        // nullopt if the bytes cannot be decoded
        virtual std::optional<DecodedAudio> decode(const std::string& bytes) const = 0;
    };

    class SfmlAudioDecoder : public AudioDecoder {
    public:
        std::optional<DecodedAudio> decode(const std::string& bytes) const override;
    };

    // Load an audio file and mix it down to a mono capture clip
    std::optional<AudioClip> loadClipFromFile(const std::string& path);

    // Interleaved 16-bit PCM → mono float in [-1, 1]
    AudioClip mixToMonoClip(const DecodedAudio& audio);

} // namespace Voice
