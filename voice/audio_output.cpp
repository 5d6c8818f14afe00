#include "audio_output.hpp"
#include "logger.hpp"

#include <SFML/Audio.hpp>
#include <vector>

namespace Voice {

    static std::vector<sf::SoundChannel> channelMapFor(unsigned channelCount) {
        if (channelCount == 1) return { sf::SoundChannel::Mono };
        if (channelCount == 2) return { sf::SoundChannel::FrontLeft, sf::SoundChannel::FrontRight };
        return {};
    }

    SfmlAudioOutput::SfmlAudioOutput(float volume)
        : volume_(volume) {}

    SfmlAudioOutput::~SfmlAudioOutput() {
        stop();
    }

    bool SfmlAudioOutput::play(AudioChunk chunk) {
        stop();

        const auto& audio = chunk.audio;
        if (audio.empty()) {
            LOG_ERROR("Playback", "Chunk " + std::to_string(chunk.id) + " has no samples");
            return false;
        }

        auto channelMap = channelMapFor(audio.channelCount);
        if (channelMap.empty()) {
            LOG_ERROR("Playback", "Chunk " + std::to_string(chunk.id) + " has unsupported channel count " +
                                  std::to_string(audio.channelCount));
            return false;
        }

        try {
            auto buffer = std::make_unique<sf::SoundBuffer>();
            if (!buffer->loadFromSamples(audio.samples.data(), audio.samples.size(),
                                         audio.channelCount, audio.sampleRate, channelMap)) {
                LOG_ERROR("Playback", "SFML rejected samples of chunk " + std::to_string(chunk.id));
                return false;
            }

            auto sound = std::make_unique<sf::Sound>(*buffer);
            sound->setVolume(volume_);
            sound->play();

            LOG_DEBUG("Playback", "Playing chunk " + std::to_string(chunk.id) +
                " (duration=" + std::to_string(buffer->getDuration().asSeconds()) + "s)");

            buffer_ = std::move(buffer);
            sound_  = std::move(sound);
            return true;
        } catch (const std::exception& e) {
            LOG_ERROR("Playback", std::string("Exception: ") + e.what());
            return false;
        }
    }

    void SfmlAudioOutput::stop() {
        if (sound_) {
            sound_->stop();
            sound_.reset();
        }
        buffer_.reset();
    }

    bool SfmlAudioOutput::isFinished() const {
        return !sound_ || sound_->getStatus() == sf::SoundSource::Status::Stopped;
    }

} // namespace Voice
