#include <gtest/gtest.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

using namespace mathguard::utils;

TEST(LoggingTest, ParseLevels) {
    EXPECT_EQ(ParseLogLevel("DEBUG"), LogLevel::kDebug);
    EXPECT_EQ(ParseLogLevel("info"), LogLevel::kInfo);
    EXPECT_EQ(ParseLogLevel("Warning"), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("error"), LogLevel::kError);
    EXPECT_EQ(ParseLogLevel("loud", LogLevel::kError), LogLevel::kError);
}

TEST(LoggingTest, FormatsTagLevelAndSortedFields) {
    const LogMessage message{LogLevel::kWarn, "sandbox", "worker failed", {{"z", "1"}, {"a", "2"}}};
    EXPECT_EQ(FormatLogLine(message), "[sandbox] WARN worker failed a=2 z=1");
}

TEST(LoggingTest, InfoLinesOmitTheLevel) {
    const LogMessage message{LogLevel::kInfo, "tool", "start", {}};
    EXPECT_EQ(FormatLogLine(message), "[tool] start");
}

TEST(LoggingTest, ConfigRoundTrip) {
    const LogConfig saved = GetLogConfig();
    LogConfig config;
    config.min_level = LogLevel::kError;
    SetLogConfig(config);
    EXPECT_EQ(GetLogConfig().min_level, LogLevel::kError);
    SetLogConfig(saved);
}

TEST(CommonTest, Truncate) {
    EXPECT_EQ(Truncate("short", 10), "short");
    EXPECT_EQ(Truncate("abcdefgh", 3), "abc...(5 more bytes)");
}

TEST(CommonTest, Dunder) {
    EXPECT_TRUE(IsDunder("__class__"));
    EXPECT_FALSE(IsDunder("__"));
    EXPECT_FALSE(IsDunder("_private"));
    EXPECT_EQ(Join({"a", "b"}, ", "), "a, b");
}
