#include <gtest/gtest.h>

#include <cstdint>

#include "encoding.hpp"

namespace {

uint32_t readLE(const std::string& bytes, size_t offset, int width) {
    uint32_t v = 0;
    for (int i = 0; i < width; ++i) {
        v |= static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset + i])) << (8 * i);
    }
    return v;
}

} // namespace

TEST(Base64, EncodesKnownVectors) {
    EXPECT_EQ(encoding::base64Encode(""), "");
    EXPECT_EQ(encoding::base64Encode("M"), "TQ==");
    EXPECT_EQ(encoding::base64Encode("Ma"), "TWE=");
    EXPECT_EQ(encoding::base64Encode("Man"), "TWFu");
    EXPECT_EQ(encoding::base64Encode(std::string("\xff\xfe\x00", 3)), "//4A");
}

TEST(Base64, DecodesKnownVectors) {
    EXPECT_EQ(encoding::base64Decode("TWFu").value_or("?"), "Man");
    EXPECT_EQ(encoding::base64Decode("TWE=").value_or("?"), "Ma");
    EXPECT_EQ(encoding::base64Decode("TQ==").value_or("?"), "M");
    EXPECT_EQ(encoding::base64Decode("").value_or("?"), "");
}

TEST(Base64, DecodeIgnoresWhitespaceAndAcceptsUrlSafe) {
    EXPECT_EQ(encoding::base64Decode("TW\nFu\r\n").value_or("?"), "Man");
    EXPECT_EQ(encoding::base64Decode("__4A").value_or("?"), std::string("\xff\xfe\x00", 3));
    EXPECT_EQ(encoding::base64Decode("--4A").value_or("?"), std::string("\xfb\xee\x00", 3));
}

TEST(Base64, DecodeRejectsGarbage) {
    EXPECT_FALSE(encoding::base64Decode("TW*u").has_value());
    EXPECT_FALSE(encoding::base64Decode("TQ==TQ==").has_value());
    EXPECT_FALSE(encoding::base64Decode("T").has_value());
    EXPECT_FALSE(encoding::base64Decode("TQ===").has_value());
}

TEST(DataUrl, DecodesBase64Payload) {
    EXPECT_EQ(encoding::decodeDataUrl("data:audio/mpeg;base64,TWFu").value_or("?"), "Man");
    EXPECT_EQ(encoding::decodeDataUrl("data:;base64,TQ==").value_or("?"), "M");
}

TEST(DataUrl, RejectsOtherForms) {
    EXPECT_FALSE(encoding::decodeDataUrl("http://x/a.mp3").has_value());
    EXPECT_FALSE(encoding::decodeDataUrl("data:audio/mpeg,plain").has_value());
    EXPECT_FALSE(encoding::decodeDataUrl("data:audio/mpeg;base64").has_value());
    EXPECT_FALSE(encoding::decodeDataUrl("data:audio/mpeg;base64,!!!").has_value());
}

TEST(Wav, HeaderDescribesMono16BitPcm) {
    std::vector<float> samples(10, 0.f);
    std::string wav = encoding::encodeWav(samples, 16000);

    ASSERT_EQ(wav.size(), 44u + 2 * samples.size());
    EXPECT_EQ(wav.substr(0, 4), "RIFF");
    EXPECT_EQ(readLE(wav, 4, 4), 36u + 20u);
    EXPECT_EQ(wav.substr(8, 4), "WAVE");
    EXPECT_EQ(wav.substr(12, 4), "fmt ");
    EXPECT_EQ(readLE(wav, 20, 2), 1u);        // PCM
    EXPECT_EQ(readLE(wav, 22, 2), 1u);        // mono
    EXPECT_EQ(readLE(wav, 24, 4), 16000u);
    EXPECT_EQ(readLE(wav, 28, 4), 32000u);    // byte rate
    EXPECT_EQ(readLE(wav, 34, 2), 16u);
    EXPECT_EQ(wav.substr(36, 4), "data");
    EXPECT_EQ(readLE(wav, 40, 4), 20u);
}

TEST(Wav, SamplesAreClampedToInt16) {
    std::string wav = encoding::encodeWav({2.0f, -2.0f, 0.0f}, 8000);
    ASSERT_EQ(wav.size(), 50u);
    EXPECT_EQ(readLE(wav, 44, 2), 0x7FFFu);
    EXPECT_EQ(readLE(wav, 46, 2), 0x8000u);
    EXPECT_EQ(readLE(wav, 48, 2), 0u);
}

TEST(StartsWith, Basics) {
    EXPECT_TRUE(encoding::startsWith("data:x", "data:"));
    EXPECT_FALSE(encoding::startsWith("dat", "data:"));
    EXPECT_TRUE(encoding::startsWith("anything", ""));
}
