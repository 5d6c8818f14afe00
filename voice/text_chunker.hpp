#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace Voice {

    // ------------------------------------------------------------
    // Sentence-level chunking
    // ------------------------------------------------------------
    // Splits text at sentence terminators (. ! ? followed by whitespace or
    // end of text) and packs whole sentences into fragments of at most
    // maxChunkSize bytes. A sentence longer than maxChunkSize becomes its own
    // fragment, untruncated. Whitespace runs are collapsed to one space and a
    // final sentence without a terminator gets a '.' appended.
    std::vector<std::string> chunkText(const std::string& text, std::size_t maxChunkSize = 200);

    // Break-point cascade: sentence end, clause punctuation, before a
    // coordinating conjunction, any whitespace. For each window the first
    // pattern that has a break within targetSize wins, at its latest such
    // break; a hard cut at targetSize only when none does.
    std::vector<std::string> smartChunk(const std::string& text, std::size_t targetSize = 150);

    // Markdown → plain text for the transcript shown next to the voice button
    std::string stripMarkdownForVoice(const std::string& text);

    // ------------------------------------------------------------
    // IncrementalChunker
    // ------------------------------------------------------------
    // Cuts speakable fragments out of a response while it is still being
    // generated: once chunkSize bytes are buffered, cut after the last
    // ". " "? " "! " ", " "; " ": " within 1.5x chunkSize, else after the last
    // space past 0.7x chunkSize, else at chunkSize.
    class IncrementalChunker {
    public:
        explicit IncrementalChunker(std::size_t chunkSize = 150);

        // Append generated text, return fragments that are ready to synthesize
        std::vector<std::string> push(const std::string& text);

        // Whatever is left once generation has finished
        std::optional<std::string> finish();

        std::size_t buffered() const { return buffer_.size(); }

    private:
        std::size_t findBreak() const;

        std::size_t chunkSize_;
        std::string buffer_;
    };

} // namespace Voice
