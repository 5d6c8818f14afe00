#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <nlohmann/json_fwd.hpp>

namespace Voice {

    enum class FrameType {
        Text,       // { text }
        Audio,      // "audio" | "audio_ref": { chunkId, audioUrl | audioId, text? }
        Complete,   // { fullResponse, transcript }           terminal
        Error       // { error, chunkId? }                    terminal unless chunkId
    };

    struct StreamFrame {
        FrameType type = FrameType::Text;

        std::string text;               // Text payload, or the words an Audio frame speaks
        std::optional<int> chunkId;     // Audio, and chunk-level Error
        std::string audioUrl;           // Audio: self-contained reference
        std::string audioId;            // Audio: needs a follow-up fetch
        std::string fullResponse;       // Complete
        std::string transcript;         // Complete
        std::string error;              // Error

        // Error frames that name a chunk only cancel that chunk
        bool isTerminal() const {
            return type == FrameType::Complete ||
                   (type == FrameType::Error && !chunkId.has_value());
        }
    };

    // ------------------------------------------------------------
    // StreamFrameParser
    // ------------------------------------------------------------
    // Decodes the "data: {json}\n" line stream. Bytes may be split anywhere;
    // a partial line is carried over to the next feed(). Malformed lines are
    // logged and skipped. Once a terminal frame is produced, further input is
    // ignored.
    class StreamFrameParser {
    public:
        std::vector<StreamFrame> feed(std::string_view bytes);

        // End of input: parse an unterminated last line, if any
        std::vector<StreamFrame> finish();

        bool finished() const { return finished_; }
        size_t skippedLines() const { return skipped_; }

        void reset();

        // One line without its newline. nullopt for skipped lines.
        static std::optional<StreamFrame> parseLine(std::string_view line);

        // 3, "3" and "chunk_3" all mean chunk 3
        static std::optional<int> parseChunkId(const nlohmann::json& value);

    private:
        void consumeLine(std::string_view line, std::vector<StreamFrame>& out);

        std::string carry_;
        bool finished_ = false;
        size_t skipped_ = 0;
    };

} // namespace Voice
