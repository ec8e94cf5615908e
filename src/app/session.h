#pragma once

#include "app/engine_config.h"
#include "core/grid3.h"
#include "core/input.h"
#include "math/math.h"
#include "sim/collision_solver.h"
#include "world/block.h"
#include "world/raycaster.h"
#include "world/surface_map.h"
#include "world/terrain_generator.h"
#include "world/visibility_batcher.h"
#include "world/voxel_store.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

// App GameSession subsystem
// Responsible for: owning the world and the player body, running one gameplay step per frame, and applying
// break/place policy.
// Should NOT do: poll devices, render, or schedule frames.
namespace terravox::app {

enum class EditOutcome : std::uint8_t {
    Applied = 0,
    NoTarget = 1,
    NothingToBreak = 2,
    Indestructible = 3,
    Occupied = 4,
    OutOfBuildRange = 5,
    IntersectsBody = 6
};

std::string_view editOutcomeName(EditOutcome outcome);

inline constexpr int kHotbarSlotCount = static_cast<int>(world::kBlockKindCount);

struct HudSnapshot {
    math::Vector3 position{};
    bool grounded = false;
    bool flying = false;
    std::size_t blockCount = 0;
    int selectedSlot = 1;
    world::BlockKind selectedKind = world::BlockKind::Dirt;
};

struct FrameReport {
    float dt = 0.0f;
    // Taken before any edit this frame. A place request is skipped when a break was applied.
    std::optional<world::PickResult> pick;
    std::optional<EditOutcome> breakOutcome;
    std::optional<EditOutcome> placeOutcome;
    HudSnapshot hud{};
};

class GameSession {
public:
    explicit GameSession(const EngineConfig& config = {});

    // Runs terrain generation and spawns the body. Only the first call does anything.
    bool generateWorld();
    // Replaces the world with a prepared store, e.g. a hand-built test scene.
    void adoptWorld(world::VoxelStore store);
    [[nodiscard]] bool worldReady() const { return m_worldReady; }

    FrameReport step(const core::InputState& input, const math::Vector3& lookDirection, float dt);

    [[nodiscard]] std::optional<world::PickResult> pick(const math::Vector3& lookDirection) const;
    EditOutcome handlePointer(core::PointerButton button, const math::Vector3& lookDirection);
    EditOutcome breakAt(const core::Cell3i& cell);
    EditOutcome placeAt(const core::Cell3i& cell, world::BlockKind kind);

    // Slots are 1-based and map to block kinds in declaration order.
    void selectHotbarSlot(int slot);
    void cycleHotbar(int direction);
    [[nodiscard]] int selectedHotbarSlot() const { return m_selectedHotbarIndex + 1; }
    [[nodiscard]] world::BlockKind selectedKind() const;

    [[nodiscard]] HudSnapshot hud() const;
    const world::InstanceBatches& instanceBatches();
    [[nodiscard]] world::SurfaceMap surfaceMap(std::int32_t halfExtent, std::int32_t scanTopY) const;

    [[nodiscard]] const world::VoxelStore& store() const { return m_store; }
    [[nodiscard]] const world::HeightMap& heights() const { return m_heights; }
    [[nodiscard]] const sim::Body& body() const { return m_body; }
    void setBody(const sim::Body& body) { m_body = body; }
    [[nodiscard]] const EngineConfig& config() const { return m_config; }
    [[nodiscard]] const world::VisibilityBatcher& batcher() const { return m_batcher; }

private:
    void spawnBody();
    EditOutcome applyPointer(core::PointerButton button, const std::optional<world::PickResult>& target);
    void notifyEdited(const core::Cell3i& cell);

    EngineConfig m_config;
    world::TerrainGenerator m_generator;
    sim::CollisionSolver m_solver;
    world::VoxelStore m_store;
    world::HeightMap m_heights;
    world::VisibilityBatcher m_batcher;
    sim::Body m_body{};
    int m_selectedHotbarIndex = 1;
    bool m_worldReady = false;
    bool m_wasToggleFlyDown = false;
};

} // namespace terravox::app
