#include "audio_decoder.hpp"
#include "logger.hpp"

#include <SFML/Audio.hpp>
#include <filesystem>

namespace Voice {

    static DecodedAudio copySamples(const sf::SoundBuffer& buffer) {
        DecodedAudio audio;
        const std::int16_t* data = buffer.getSamples();
        audio.samples.assign(data, data + buffer.getSampleCount());
        audio.sampleRate   = buffer.getSampleRate();
        audio.channelCount = buffer.getChannelCount();
        return audio;
    }

    std::optional<DecodedAudio> SfmlAudioDecoder::decode(const std::string& bytes) const {
        if (bytes.empty()) {
            LOG_ERROR("Decoder", "Empty payload");
            return std::nullopt;
        }

        try {
            sf::SoundBuffer buffer;
            if (!buffer.loadFromMemory(bytes.data(), bytes.size())) {
                LOG_ERROR("Decoder", "Unsupported or corrupt audio (" + std::to_string(bytes.size()) + " bytes)");
                return std::nullopt;
            }

            DecodedAudio audio = copySamples(buffer);
            if (audio.empty()) {
                LOG_ERROR("Decoder", "Decoded audio has no samples");
                return std::nullopt;
            }

            LOG_TRACE("Decoder", "Decoded " + std::to_string(audio.samples.size()) + " samples @" +
                                 std::to_string(audio.sampleRate) + "Hz x" + std::to_string(audio.channelCount));
            return audio;
        } catch (const std::exception& e) {
            LOG_ERROR("Decoder", std::string("Exception: ") + e.what());
            return std::nullopt;
        }
    }

    AudioClip mixToMonoClip(const DecodedAudio& audio) {
        AudioClip clip;
        clip.sampleRate = audio.sampleRate;
        if (audio.channelCount == 0) return clip;

        const size_t frames = audio.samples.size() / audio.channelCount;
        clip.samples.reserve(frames);

        for (size_t f = 0; f < frames; ++f) {
            float sum = 0.f;
            for (unsigned c = 0; c < audio.channelCount; ++c) {
                sum += audio.samples[f * audio.channelCount + c] / 32768.f;
            }
            clip.samples.push_back(sum / audio.channelCount);
        }
        return clip;
    }

    std::optional<AudioClip> loadClipFromFile(const std::string& path) {
        if (!std::filesystem::exists(path)) {
            LOG_ERROR("Decoder", "Clip not found: " + path);
            return std::nullopt;
        }

        try {
            sf::SoundBuffer buffer;
            if (!buffer.loadFromFile(path)) {
                LOG_ERROR("Decoder", "Could not load file: " + path);
                return std::nullopt;
            }

            AudioClip clip = mixToMonoClip(copySamples(buffer));
            LOG_DEBUG("Decoder", "Loaded clip " + path + " (" +
                                 std::to_string(clip.durationSeconds()) + "s @" +
                                 std::to_string(clip.sampleRate) + "Hz)");
            return clip;
        } catch (const std::exception& e) {
            LOG_ERROR("Decoder", std::string("Exception: ") + e.what());
            return std::nullopt;
        }
    }

} // namespace Voice
