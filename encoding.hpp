#pragma once
#include <string>
#include <vector>
#include <optional>

// ------------------------------------------------------------
// Byte encodings shared by the transport and the session
// ------------------------------------------------------------
namespace encoding {

    std::string base64Encode(const std::string& bytes);

    // nullopt on characters outside the base64 alphabet or bad padding.
    // Whitespace is ignored.
    std::optional<std::string> base64Decode(const std::string& text);

    // "data:<mime>;base64,<payload>" → payload bytes.
    // nullopt if url is not a base64 data URL or the payload is corrupt.
    std::optional<std::string> decodeDataUrl(const std::string& url);

    // Mono float samples in [-1, 1] → 16-bit PCM RIFF/WAVE file bytes
    std::string encodeWav(const std::vector<float>& samples, unsigned sampleRate);

    bool startsWith(const std::string& text, const std::string& prefix);

} // namespace encoding
