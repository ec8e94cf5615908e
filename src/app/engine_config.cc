#include "app/engine_config.h"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string>
#include <system_error>

#include "core/log.h"

namespace terravox::app {
namespace {

std::optional<std::string_view> readEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return std::nullopt;
    }
    return std::string_view(value);
}

} // namespace

std::optional<std::uint64_t> parseUnsigned(std::string_view text) {
    std::uint64_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::int32_t> parsePositiveInt(std::string_view text) {
    std::int32_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end || value <= 0) {
        return std::nullopt;
    }
    return value;
}

std::optional<float> parsePositiveFloat(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    const std::string owned(text);
    char* parseEnd = nullptr;
    const float value = std::strtof(owned.c_str(), &parseEnd);
    if (parseEnd != owned.c_str() + owned.size() || !std::isfinite(value) || value <= 0.0f) {
        return std::nullopt;
    }
    return value;
}

void applyEnvironmentOverrides(EngineConfig& config) {
    if (const auto text = readEnv(kSeedEnvVar)) {
        if (const auto seed = parseUnsigned(*text)) {
            config.terrain.seed = *seed;
            TVX_LOGI("config") << kSeedEnvVar << "=" << *seed;
        } else {
            TVX_LOGW("config") << "ignoring " << kSeedEnvVar << "='" << *text << "' (expected unsigned integer)";
        }
    }

    if (const auto text = readEnv(kWorldRadiusEnvVar)) {
        const auto radius = parsePositiveInt(*text);
        if (radius.has_value() && *radius <= kMaxWorldRadius) {
            config.terrain.worldRadius = *radius;
            TVX_LOGI("config") << kWorldRadiusEnvVar << "=" << *radius;
        } else {
            TVX_LOGW("config") << "ignoring " << kWorldRadiusEnvVar << "='" << *text
                               << "' (expected integer in 1.." << kMaxWorldRadius << ")";
        }
    }

    if (const auto text = readEnv(kReachEnvVar)) {
        if (const auto reach = parsePositiveFloat(*text)) {
            config.pick.reachDistance = *reach;
            TVX_LOGI("config") << kReachEnvVar << "=" << *reach;
        } else {
            TVX_LOGW("config") << "ignoring " << kReachEnvVar << "='" << *text << "' (expected positive number)";
        }
    }

    if (const auto text = readEnv(kFramesEnvVar)) {
        if (const auto frames = parsePositiveInt(*text)) {
            config.demo.frames = *frames;
            TVX_LOGI("config") << kFramesEnvVar << "=" << *frames;
        } else {
            TVX_LOGW("config") << "ignoring " << kFramesEnvVar << "='" << *text << "' (expected positive integer)";
        }
    }
}

} // namespace terravox::app
