#include "encoding.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>

namespace encoding {

static const char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

static int decodeChar(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;   // '-' / '_' : url-safe variant
    if (c == '/' || c == '_') return 63;
    return -1;
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() &&
           text.compare(0, prefix.size(), prefix) == 0;
}

// =========================================================
// Base64
// =========================================================
std::string base64Encode(const std::string& bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16) |
                     (static_cast<uint8_t>(bytes[i + 1]) << 8) |
                      static_cast<uint8_t>(bytes[i + 2]);
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
        out.push_back(kAlphabet[n & 0x3F]);
    }

    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint8_t>(bytes[i]) << 16;
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16) |
                     (static_cast<uint8_t>(bytes[i + 1]) << 8);
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::optional<std::string> base64Decode(const std::string& text) {
    std::string out;
    out.reserve(text.size() * 3 / 4);

    uint32_t acc = 0;
    int bits = 0;
    size_t padding = 0;

    for (unsigned char c : text) {
        if (std::isspace(c)) continue;
        if (c == '=') {
            padding++;
            continue;
        }
        if (padding > 0) return std::nullopt;   // data after padding

        int v = decodeChar(c);
        if (v < 0) return std::nullopt;

        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((acc >> bits) & 0xFF));
        }
    }

    if (padding > 2) return std::nullopt;
    // Leftover of 6 bits means a truncated quantum
    if (bits >= 6) return std::nullopt;
    return out;
}

std::optional<std::string> decodeDataUrl(const std::string& url) {
    if (!startsWith(url, "data:")) return std::nullopt;

    auto comma = url.find(',');
    if (comma == std::string::npos) return std::nullopt;

    std::string meta = url.substr(5, comma - 5);
    if (meta.size() < 7 || meta.compare(meta.size() - 7, 7, ";base64") != 0) {
        return std::nullopt;
    }
    return base64Decode(url.substr(comma + 1));
}

// =========================================================
// WAV
// =========================================================
static void putLE(std::string& out, uint32_t value, int bytes) {
    for (int i = 0; i < bytes; ++i) {
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
}

std::string encodeWav(const std::vector<float>& samples, unsigned sampleRate) {
    const uint16_t channels      = 1;
    const uint16_t bitsPerSample = 16;
    const uint32_t dataBytes     = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    std::string out;
    out.reserve(44 + dataBytes);

    out += "RIFF";
    putLE(out, 36 + dataBytes, 4);
    out += "WAVE";

    out += "fmt ";
    putLE(out, 16, 4);                                           // chunk size
    putLE(out, 1, 2);                                            // PCM
    putLE(out, channels, 2);
    putLE(out, sampleRate, 4);
    putLE(out, sampleRate * channels * bitsPerSample / 8, 4);    // byte rate
    putLE(out, channels * bitsPerSample / 8, 2);                 // block align
    putLE(out, bitsPerSample, 2);

    out += "data";
    putLE(out, dataBytes, 4);

    for (float s : samples) {
        float clamped = std::clamp(s, -1.0f, 1.0f);
        auto pcm = static_cast<int16_t>(clamped < 0 ? clamped * 32768.0f : clamped * 32767.0f);
        putLE(out, static_cast<uint16_t>(pcm), 2);
    }
    return out;
}

} // namespace encoding
