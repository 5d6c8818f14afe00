#include "text_chunker.hpp"
#include "logger.hpp"

#include <regex>
#include <sstream>
#include <cctype>

namespace Voice {

    // ============================================================
    // Helpers
    // ============================================================
    static bool isTerminator(char c) {
        return c == '.' || c == '!' || c == '?';
    }

    static bool isSpace(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    static std::string trim(const std::string& s) {
        size_t b = 0, e = s.size();
        while (b < e && isSpace(s[b])) ++b;
        while (e > b && isSpace(s[e - 1])) --e;
        return s.substr(b, e - b);
    }

    static std::string collapseWhitespace(const std::string& text) {
        std::string out;
        out.reserve(text.size());
        bool pendingSpace = false;
        for (char c : text) {
            if (isSpace(c)) {
                pendingSpace = !out.empty();
                continue;
            }
            if (pendingSpace) {
                out.push_back(' ');
                pendingSpace = false;
            }
            out.push_back(c);
        }
        return out;
    }

    // Input is already collapsed: single spaces, no leading/trailing space
    static std::vector<std::string> splitSentences(const std::string& text) {
        std::vector<std::string> sentences;
        std::string current;

        size_t i = 0;
        while (i < text.size()) {
            if (!isTerminator(text[i])) {
                current.push_back(text[i++]);
                continue;
            }

            // Keep the whole run ("?!", "...") with its sentence
            size_t j = i;
            while (j < text.size() && isTerminator(text[j])) ++j;
            current.append(text, i, j - i);
            i = j;

            // "3.14" or "e.g" is not a sentence end
            if (i == text.size() || isSpace(text[i])) {
                std::string s = trim(current);
                if (!s.empty()) sentences.push_back(s);
                current.clear();
            }
        }

        std::string tail = trim(current);
        if (!tail.empty()) {
            sentences.push_back(tail + ".");
        }
        return sentences;
    }

    // Step back so a hard cut never lands inside a UTF-8 sequence
    static size_t codepointBoundary(const std::string& s, size_t cut) {
        size_t c = cut;
        while (c > 0 && c < s.size() && (static_cast<unsigned char>(s[c]) & 0xC0) == 0x80) {
            --c;
        }
        return c == 0 ? cut : c;
    }

    // ============================================================
    // chunkText
    // ============================================================
    std::vector<std::string> chunkText(const std::string& text, std::size_t maxChunkSize) {
        std::vector<std::string> chunks;
        std::string current;

        for (const auto& sentence : splitSentences(collapseWhitespace(text))) {
            if (!current.empty() && current.size() + 1 + sentence.size() > maxChunkSize) {
                chunks.push_back(current);
                current = sentence;
            } else {
                if (!current.empty()) current.push_back(' ');
                current += sentence;
            }
        }

        if (!current.empty()) {
            chunks.push_back(current);
        }

        LOG_TRACE("Chunker", "chunkText produced " + std::to_string(chunks.size()) +
                             " fragments (max=" + std::to_string(maxChunkSize) + ")");
        return chunks;
    }

    // ============================================================
    // smartChunk
    // ============================================================
    std::vector<std::string> smartChunk(const std::string& text, std::size_t targetSize) {
        // Priority order: sentences, clauses, conjunctions, words
        static const std::regex breakPoints[] = {
            std::regex(R"([.!?]+\s+)"),
            std::regex(R"([,;:]\s+)"),
            std::regex(R"(\s+(?=(?:and|but|or|so|yet|for|nor)\b))"),
            std::regex(R"(\s+)")
        };

        std::vector<std::string> chunks;
        if (targetSize == 0) targetSize = 1;

        std::string remaining = trim(text);

        while (remaining.size() > targetSize) {
            // Breaks past targetSize never qualify; a little slack keeps the
            // conjunction lookahead able to see the next word.
            std::string window = remaining.substr(0, targetSize + 16);
            size_t bestSplit = 0;

            for (const auto& re : breakPoints) {
                for (auto it = std::sregex_iterator(window.begin(), window.end(), re);
                     it != std::sregex_iterator(); ++it) {
                    size_t splitIndex = static_cast<size_t>(it->position(0) + it->length(0));
                    if (splitIndex <= targetSize && splitIndex > bestSplit) {
                        bestSplit = splitIndex;
                    }
                }
                if (bestSplit > 0) break;
            }

            if (bestSplit == 0) {
                bestSplit = codepointBoundary(remaining, targetSize);
            }

            std::string piece = trim(remaining.substr(0, bestSplit));
            if (!piece.empty()) chunks.push_back(piece);
            remaining = trim(remaining.substr(bestSplit));
        }

        if (!remaining.empty()) {
            chunks.push_back(remaining);
        }
        return chunks;
    }

    // ============================================================
    // stripMarkdownForVoice
    // ============================================================
    std::string stripMarkdownForVoice(const std::string& text) {
        static const std::regex bold(R"(\*\*(.*?)\*\*)");
        static const std::regex italic(R"(\*(.*?)\*)");
        static const std::regex codeBlock(R"(```[\s\S]*?```)");
        static const std::regex inlineCode(R"(`([^`]+)`)");
        static const std::regex header(R"(#{1,6}\s+)");
        static const std::regex image(R"(!\[([^\]]*)\]\([^)]+\))");
        static const std::regex link(R"(\[([^\]]+)\]\([^)]+\))");
        static const std::regex rule(R"(^-{3,}$)");
        static const std::regex bullet(R"(^\s*[-*+]\s+)");
        static const std::regex numbered(R"(^\s*\d+\.\s+)");
        static const std::regex blankRuns(R"(\n{3,})");

        std::string out = text;
        out = std::regex_replace(out, bold, "$1");
        out = std::regex_replace(out, italic, "$1");
        out = std::regex_replace(out, codeBlock, "");
        out = std::regex_replace(out, inlineCode, "$1");
        out = std::regex_replace(out, header, "");
        out = std::regex_replace(out, image, "");
        out = std::regex_replace(out, link, "$1");

        // Line-anchored rules, one line at a time
        std::istringstream lines(out);
        std::string line, joined;
        bool first = true;
        while (std::getline(lines, line)) {
            line = std::regex_replace(line, rule, "");
            line = std::regex_replace(line, bullet, "");
            line = std::regex_replace(line, numbered, "");
            if (!first) joined.push_back('\n');
            joined += line;
            first = false;
        }

        joined = std::regex_replace(joined, blankRuns, "\n\n");
        return trim(joined);
    }

    // ============================================================
    // IncrementalChunker
    // ============================================================
    IncrementalChunker::IncrementalChunker(std::size_t chunkSize)
        : chunkSize_(chunkSize == 0 ? 1 : chunkSize) {}

    std::size_t IncrementalChunker::findBreak() const {
        static const char* patterns[] = { ". ", "? ", "! ", ", ", "; ", ": " };

        const size_t limit = chunkSize_ + chunkSize_ / 2;   // 1.5x
        for (const char* p : patterns) {
            size_t idx = buffer_.rfind(p, limit - 1);
            if (idx != std::string::npos && idx > 0 && idx < limit) {
                return idx + 2;
            }
        }

        size_t space = buffer_.rfind(' ', chunkSize_);
        if (space != std::string::npos && space * 10 > chunkSize_ * 7) {
            return space + 1;
        }
        return codepointBoundary(buffer_, chunkSize_);
    }

    std::vector<std::string> IncrementalChunker::push(const std::string& text) {
        std::vector<std::string> ready;
        buffer_ += text;

        while (buffer_.size() >= chunkSize_) {
            size_t cut = findBreak();
            std::string piece = trim(buffer_.substr(0, cut));
            buffer_.erase(0, cut);
            if (!piece.empty()) ready.push_back(piece);
        }
        return ready;
    }

    std::optional<std::string> IncrementalChunker::finish() {
        std::string rest = trim(buffer_);
        buffer_.clear();
        if (rest.empty()) return std::nullopt;
        return rest;
    }

} // namespace Voice
