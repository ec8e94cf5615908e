#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

// Core Log subsystem
// Responsible for: leveled, category-tagged line logging with an env-configurable threshold.
// Should NOT do: file rotation, structured telemetry, or buffering across lines.
namespace terravox::core {

enum class LogLevel : uint8_t {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
    Trace = 4
};

// Receives every emitted line after level filtering. The default sink prints warnings and errors to stderr
// and everything else to stdout.
using LogSink = std::function<void(LogLevel level, std::string_view category, std::string_view message)>;

void setLogLevel(LogLevel level);
[[nodiscard]] LogLevel logLevel();
[[nodiscard]] bool shouldLog(LogLevel level);
void initializeLogLevelFromEnvironment();
[[nodiscard]] LogLevel parseLogLevel(std::string_view text, LogLevel fallback);
[[nodiscard]] std::string_view logLevelName(LogLevel level);

// Passing an empty sink restores the console sink.
void setLogSink(LogSink sink);

class LogLine {
public:
    LogLine(LogLevel level, std::string_view category);
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    [[nodiscard]] std::ostream& stream();

private:
    LogLevel m_level;
    std::string m_category;
    std::ostringstream m_stream;
};

} // namespace terravox::core

#define TVX_LOG_STREAM(level, category) \
    if (!::terravox::core::shouldLog(level)) {} else ::terravox::core::LogLine((level), (category)).stream()

#define TVX_LOGE(category) TVX_LOG_STREAM(::terravox::core::LogLevel::Error, (category))
#define TVX_LOGW(category) TVX_LOG_STREAM(::terravox::core::LogLevel::Warn, (category))
#define TVX_LOGI(category) TVX_LOG_STREAM(::terravox::core::LogLevel::Info, (category))
#define TVX_LOGD(category) TVX_LOG_STREAM(::terravox::core::LogLevel::Debug, (category))
#define TVX_LOGT(category) TVX_LOG_STREAM(::terravox::core::LogLevel::Trace, (category))
