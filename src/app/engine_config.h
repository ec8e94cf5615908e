#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "sim/collision_solver.h"
#include "world/raycaster.h"
#include "world/terrain_generator.h"

// App EngineConfig subsystem
// Responsible for: collecting every component's tunables and applying environment overrides.
// Should NOT do: read files, validate gameplay invariants, or hold runtime state.
namespace terravox::app {

struct PickConfig {
    float rayStep = world::kDefaultRayStep;
    float reachDistance = 6.0f;
};

struct SessionConfig {
    float maxFrameDelta = 0.05f;
    // Spawn eye height above the spawn column's surface.
    float spawnHeightOffset = 3.0f;
    std::int32_t spawnX = 0;
    std::int32_t spawnZ = 0;
    std::int32_t minBuildHeight = 1;
    std::int32_t maxBuildHeight = 64;
    // 1-based; slot 2 holds dirt.
    int defaultHotbarSlot = 2;
};

struct DemoConfig {
    std::int32_t frames = 600;
    float fixedStepSeconds = 1.0f / 60.0f;
    std::int32_t hudLogInterval = 120;
};

struct EngineConfig {
    world::TerrainConfig terrain{};
    sim::PhysicsConfig physics{};
    PickConfig pick{};
    SessionConfig session{};
    DemoConfig demo{};
};

inline constexpr const char* kSeedEnvVar = "TERRAVOX_SEED";
inline constexpr const char* kWorldRadiusEnvVar = "TERRAVOX_WORLD_RADIUS";
inline constexpr const char* kReachEnvVar = "TERRAVOX_REACH";
inline constexpr const char* kFramesEnvVar = "TERRAVOX_FRAMES";

// Largest radius accepted from the environment; the square world holds (2 * radius)^2 columns.
inline constexpr std::int32_t kMaxWorldRadius = 4096;

[[nodiscard]] std::optional<std::uint64_t> parseUnsigned(std::string_view text);
[[nodiscard]] std::optional<std::int32_t> parsePositiveInt(std::string_view text);
[[nodiscard]] std::optional<float> parsePositiveFloat(std::string_view text);

// Unset variables keep the current value. Malformed ones are logged and ignored.
void applyEnvironmentOverrides(EngineConfig& config);

} // namespace terravox::app
