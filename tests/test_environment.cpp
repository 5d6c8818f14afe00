#include <gtest/gtest.h>

#include "logger.hpp"

namespace {

// Keep stderr readable; the code under test still logs at every level
class QuietLogs : public ::testing::Environment {
public:
    void SetUp() override {
        setConsoleLogging(false);
        setLogLevel(LogLevel::Trace);
    }
};

const auto* const kQuietLogs = ::testing::AddGlobalTestEnvironment(new QuietLogs);

} // namespace

TEST(Logger, ParsesLevelNames) {
    EXPECT_EQ(parseLogLevel("trace", LogLevel::Off), LogLevel::Trace);
    EXPECT_EQ(parseLogLevel("error", LogLevel::Off), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("off", LogLevel::Debug), LogLevel::Off);
    EXPECT_EQ(parseLogLevel("verbose", LogLevel::Debug), LogLevel::Debug);
}

TEST(Logger, LevelCanBeChangedAtRuntime) {
    const LogLevel before = logLevel();
    setLogLevel(LogLevel::Error);
    EXPECT_EQ(logLevel(), LogLevel::Error);
    LOG_DEBUG("Test", "filtered out");
    setLogLevel(before);
}
