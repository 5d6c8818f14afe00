#include "stream_frame_parser.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <cctype>
#include <climits>

namespace Voice {

    // ============================================================
    // Helpers
    // ============================================================
    static std::string_view trimView(std::string_view s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
        return s;
    }

    static std::optional<int> parseDigits(std::string_view s) {
        if (s.empty() || s.size() > 9) return std::nullopt;
        int value = 0;
        for (char c : s) {
            if (c < '0' || c > '9') return std::nullopt;
            value = value * 10 + (c - '0');
        }
        return value;
    }

    static std::string stringField(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        if (it != j.end() && it->is_string()) return it->get<std::string>();
        return {};
    }

    static std::string preview(std::string_view s) {
        constexpr size_t kMax = 120;
        if (s.size() <= kMax) return std::string(s);
        return std::string(s.substr(0, kMax)) + "...";
    }

    // Payload of one data line → frame; why is set when the payload is rejected
    static std::optional<StreamFrame> decodePayload(std::string_view payload, std::string& why) {
        auto j = nlohmann::json::parse(payload.begin(), payload.end(), nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            why = "not a JSON object";
            return std::nullopt;
        }

        std::string type = stringField(j, "type");
        StreamFrame frame;

        if (type == "text") {
            auto it = j.find("text");
            if (it == j.end() || !it->is_string()) {
                why = "text frame without text";
                return std::nullopt;
            }
            frame.type = FrameType::Text;
            frame.text = it->get<std::string>();
            return frame;
        }

        if (type == "audio" || type == "audio_ref") {
            auto idIt = j.find("chunkId");
            frame.chunkId = (idIt != j.end()) ? StreamFrameParser::parseChunkId(*idIt) : std::nullopt;
            if (!frame.chunkId) {
                why = "audio frame with missing or invalid chunkId";
                return std::nullopt;
            }

            frame.type     = FrameType::Audio;
            frame.audioUrl = stringField(j, "audioUrl");
            frame.audioId  = stringField(j, "audioId");
            frame.text     = stringField(j, "text");

            if (frame.audioUrl.empty() == frame.audioId.empty()) {
                why = "audio frame needs exactly one of audioUrl / audioId";
                return std::nullopt;
            }
            return frame;
        }

        if (type == "complete") {
            frame.type         = FrameType::Complete;
            frame.fullResponse = stringField(j, "fullResponse");
            frame.transcript   = stringField(j, "transcript");
            return frame;
        }

        if (type == "error") {
            frame.type  = FrameType::Error;
            frame.error = stringField(j, "error");
            if (frame.error.empty()) frame.error = "Stream failed";

            auto idIt = j.find("chunkId");
            if (idIt != j.end() && !idIt->is_null()) {
                frame.chunkId = StreamFrameParser::parseChunkId(*idIt);
                // Names a chunk we can't identify: never let it end the stream
                if (!frame.chunkId) {
                    why = "chunk error with invalid chunkId " + idIt->dump();
                    return std::nullopt;
                }
            }
            return frame;
        }

        why = type.empty() ? "frame without type" : "unknown frame type '" + type + "'";
        return std::nullopt;
    }

    // ============================================================
    // StreamFrameParser
    // ============================================================
    std::optional<int> StreamFrameParser::parseChunkId(const nlohmann::json& value) {
        if (value.is_number_integer()) {
            auto n = value.get<long long>();
            if (n < 0 || n > INT_MAX) return std::nullopt;
            return static_cast<int>(n);
        }
        if (value.is_string()) {
            std::string_view s = value.get_ref<const std::string&>();
            constexpr std::string_view kPrefix = "chunk_";
            if (s.substr(0, kPrefix.size()) == kPrefix) {
                s.remove_prefix(kPrefix.size());
            }
            return parseDigits(s);
        }
        return std::nullopt;
    }

    std::optional<StreamFrame> StreamFrameParser::parseLine(std::string_view line) {
        std::string why;
        line = trimView(line);

        constexpr std::string_view kData = "data:";
        if (line.substr(0, kData.size()) != kData) return std::nullopt;

        std::string_view payload = trimView(line.substr(kData.size()));
        if (payload.empty() || payload == "[DONE]") return std::nullopt;

        return decodePayload(payload, why);
    }

    void StreamFrameParser::consumeLine(std::string_view line, std::vector<StreamFrame>& out) {
        line = trimView(line);
        if (line.empty()) return;

        // SSE comment, or event:/id:/retry: fields we do not use
        constexpr std::string_view kData = "data:";
        if (line.substr(0, kData.size()) != kData) {
            LOG_TRACE("Parser", "Ignoring non-data line: " + preview(line));
            return;
        }

        std::string_view payload = trimView(line.substr(kData.size()));
        if (payload.empty() || payload == "[DONE]") return;

        std::string why;
        auto frame = decodePayload(payload, why);
        if (!frame) {
            ++skipped_;
            LOG_ERROR("Parser", "Skipping malformed frame (" + why + "): " + preview(payload));
            return;
        }

        if (frame->isTerminal()) {
            finished_ = true;
        }
        out.push_back(std::move(*frame));
    }

    std::vector<StreamFrame> StreamFrameParser::feed(std::string_view bytes) {
        std::vector<StreamFrame> frames;
        if (finished_) return frames;

        carry_.append(bytes.data(), bytes.size());

        size_t start = 0;
        while (!finished_) {
            size_t nl = carry_.find('\n', start);
            if (nl == std::string::npos) break;

            consumeLine(std::string_view(carry_).substr(start, nl - start), frames);
            start = nl + 1;
        }

        if (finished_) {
            // Anything after a terminal frame is not part of this response
            carry_.clear();
        } else {
            carry_.erase(0, start);
        }
        return frames;
    }

    std::vector<StreamFrame> StreamFrameParser::finish() {
        std::vector<StreamFrame> frames;
        if (!finished_ && !carry_.empty()) {
            consumeLine(carry_, frames);
        }
        carry_.clear();
        return frames;
    }

    void StreamFrameParser::reset() {
        carry_.clear();
        finished_ = false;
        skipped_ = 0;
    }

} // namespace Voice
