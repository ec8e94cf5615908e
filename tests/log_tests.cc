#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/log.h"

namespace {

using terravox::core::LogLevel;

struct CapturedLine {
    LogLevel level;
    std::string category;
    std::string message;
};

} // namespace

TEST(Log, ParseLevelAcceptsNamesAndDigits) {
    EXPECT_EQ(terravox::core::parseLogLevel("error", LogLevel::Info), LogLevel::Error);
    EXPECT_EQ(terravox::core::parseLogLevel("WARNING", LogLevel::Info), LogLevel::Warn);
    EXPECT_EQ(terravox::core::parseLogLevel("Debug", LogLevel::Info), LogLevel::Debug);
    EXPECT_EQ(terravox::core::parseLogLevel("4", LogLevel::Info), LogLevel::Trace);
    EXPECT_EQ(terravox::core::parseLogLevel("0", LogLevel::Info), LogLevel::Error);
    EXPECT_EQ(terravox::core::parseLogLevel("verbose", LogLevel::Warn), LogLevel::Warn);
    EXPECT_EQ(terravox::core::parseLogLevel("", LogLevel::Debug), LogLevel::Debug);
}

TEST(Log, LevelNames) {
    EXPECT_EQ(terravox::core::logLevelName(LogLevel::Error), "error");
    EXPECT_EQ(terravox::core::logLevelName(LogLevel::Trace), "trace");
}

TEST(Log, SinkReceivesFilteredLines) {
    std::vector<CapturedLine> lines;
    terravox::core::setLogSink([&lines](LogLevel level, std::string_view category, std::string_view message) {
        lines.push_back(CapturedLine{level, std::string(category), std::string(message)});
    });
    const LogLevel previous = terravox::core::logLevel();
    terravox::core::setLogLevel(LogLevel::Warn);

    TVX_LOGI("worldgen") << "hidden";
    TVX_LOGW("worldgen") << "kept " << 3 << "\n";
    TVX_LOGE("session") << "also kept";

    terravox::core::setLogLevel(previous);
    terravox::core::setLogSink({});

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].level, LogLevel::Warn);
    EXPECT_EQ(lines[0].category, "worldgen");
    EXPECT_EQ(lines[0].message, "kept 3");
    EXPECT_EQ(lines[1].level, LogLevel::Error);
    EXPECT_EQ(lines[1].category, "session");
}

TEST(Log, ShouldLogFollowsThreshold) {
    const LogLevel previous = terravox::core::logLevel();
    terravox::core::setLogLevel(LogLevel::Info);
    EXPECT_TRUE(terravox::core::shouldLog(LogLevel::Error));
    EXPECT_TRUE(terravox::core::shouldLog(LogLevel::Info));
    EXPECT_FALSE(terravox::core::shouldLog(LogLevel::Debug));
    terravox::core::setLogLevel(previous);
}
