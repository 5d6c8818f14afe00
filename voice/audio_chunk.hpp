#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace Voice {

    // Decoder output: interleaved 16-bit PCM
    struct DecodedAudio {
        std::vector<std::int16_t> samples;
        unsigned sampleRate   = 0;
        unsigned channelCount = 0;

        bool empty() const { return samples.empty() || sampleRate == 0 || channelCount == 0; }

        double durationSeconds() const {
            if (empty()) return 0.0;
            return static_cast<double>(samples.size()) / channelCount / sampleRate;
        }
    };

    // One decoded fragment of the spoken reply. Moved through
    // reorder buffer → playback queue → output device, never copied.
    struct AudioChunk {
        int id = -1;
        DecodedAudio audio;
        std::string text;
    };

    // Captured utterance from the VAD front end (mono)
    struct AudioClip {
        std::vector<float> samples;
        unsigned sampleRate = 16000;

        double durationSeconds() const {
            if (sampleRate == 0) return 0.0;
            return static_cast<double>(samples.size()) / sampleRate;
        }
    };

} // namespace Voice
