#pragma once
#include <memory>
#include "voice/audio_chunk.hpp"

namespace sf {
    class SoundBuffer;
    class Sound;
}

namespace Voice {

    // ------------------------------------------------------------
    // AudioOutput: the single playback device
    // ------------------------------------------------------------
    class AudioOutput {
    public:
        virtual ~AudioOutput() = default;

        // Start playing chunk, replacing anything still held.
        // false if the device refused it (bad format, ...)
        virtual bool play(AudioChunk chunk) = 0;

        // Stop and release the current source. Idempotent, never throws.
        virtual void stop() = 0;

        // Nothing is held, or the held source played to the end
        virtual bool isFinished() const = 0;
    };

    // ------------------------------------------------------------
    // SfmlAudioOutput: one sf::Sound over one sf::SoundBuffer
    // ------------------------------------------------------------
    class SfmlAudioOutput : public AudioOutput {
    public:
        explicit SfmlAudioOutput(float volume = 100.f);
        ~SfmlAudioOutput() override;

        bool play(AudioChunk chunk) override;
        void stop() override;
        bool isFinished() const override;

    private:
        float volume_;
        std::unique_ptr<sf::SoundBuffer> buffer_;   // must outlive sound_
        std::unique_ptr<sf::Sound> sound_;
    };

} // namespace Voice
