#include "core/log.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <utility>

namespace terravox::core {
namespace {

constexpr const char* kLogLevelEnvVar = "TERRAVOX_LOG_LEVEL";

struct LevelAlias {
    std::string_view text;
    LogLevel level;
};

constexpr std::array<LevelAlias, 12> kLevelAliases = {{
    {"error", LogLevel::Error},
    {"err", LogLevel::Error},
    {"0", LogLevel::Error},
    {"warn", LogLevel::Warn},
    {"warning", LogLevel::Warn},
    {"1", LogLevel::Warn},
    {"info", LogLevel::Info},
    {"2", LogLevel::Info},
    {"debug", LogLevel::Debug},
    {"3", LogLevel::Debug},
    {"trace", LogLevel::Trace},
    {"4", LogLevel::Trace},
}};

std::atomic<LogLevel> g_logLevel{LogLevel::Info};
std::once_flag g_envInitOnce;
std::mutex g_logWriteMutex;
LogSink g_logSink;

const std::chrono::steady_clock::time_point& processStart() {
    static const std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
    return start;
}

// Seconds since the first log line, e.g. "   12.345".
std::string makeUptimeStamp() {
    const auto elapsed = std::chrono::steady_clock::now() - processStart();
    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    char buffer[32]{};
    std::snprintf(
        buffer,
        sizeof(buffer),
        "%7lld.%03lld",
        static_cast<long long>(elapsedMs / 1000),
        static_cast<long long>(elapsedMs % 1000));
    return std::string(buffer);
}

void writeConsole(LogLevel level, std::string_view category, std::string_view message) {
    std::ostream& out = (level == LogLevel::Error || level == LogLevel::Warn) ? std::cerr : std::cout;
    out << "[" << makeUptimeStamp() << "]";
    if (!category.empty()) {
        out << "[" << category << "]";
    }
    if (level != LogLevel::Info) {
        out << "[" << logLevelName(level) << "]";
    }
    out << " " << message << "\n";
}

} // namespace

std::string_view logLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::Error:
        return "error";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Info:
        return "info";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Trace:
        return "trace";
    }
    return "info";
}

LogLevel parseLogLevel(std::string_view text, LogLevel fallback) {
    std::string normalized(text);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    for (const LevelAlias& alias : kLevelAliases) {
        if (alias.text == normalized) {
            return alias.level;
        }
    }
    return fallback;
}

void setLogLevel(LogLevel level) {
    // Consume the one-shot env read so it cannot override this later.
    std::call_once(g_envInitOnce, []() {});
    g_logLevel.store(level);
}

LogLevel logLevel() {
    initializeLogLevelFromEnvironment();
    return g_logLevel.load();
}

bool shouldLog(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(logLevel());
}

void initializeLogLevelFromEnvironment() {
    std::call_once(g_envInitOnce, []() {
        const char* envValue = std::getenv(kLogLevelEnvVar);
        if (envValue == nullptr || envValue[0] == '\0') {
            return;
        }
        g_logLevel.store(parseLogLevel(envValue, LogLevel::Info));
    });
}

void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_logWriteMutex);
    g_logSink = std::move(sink);
}

LogLine::LogLine(LogLevel level, std::string_view category)
    : m_level(level), m_category(category) {}

LogLine::~LogLine() {
    std::string line = m_stream.str();
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }

    std::lock_guard<std::mutex> lock(g_logWriteMutex);
    if (g_logSink) {
        g_logSink(m_level, m_category, line);
        return;
    }
    writeConsole(m_level, m_category, line);
}

std::ostream& LogLine::stream() {
    return m_stream;
}

} // namespace terravox::core
