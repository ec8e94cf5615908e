#include "app/session.h"

#include <algorithm>
#include <utility>

#include "core/log.h"

namespace terravox::app {

std::string_view editOutcomeName(EditOutcome outcome) {
    switch (outcome) {
    case EditOutcome::Applied:
        return "applied";
    case EditOutcome::NoTarget:
        return "no target";
    case EditOutcome::NothingToBreak:
        return "nothing to break";
    case EditOutcome::Indestructible:
        return "indestructible";
    case EditOutcome::Occupied:
        return "occupied";
    case EditOutcome::OutOfBuildRange:
        return "out of build range";
    case EditOutcome::IntersectsBody:
        return "intersects body";
    }
    return "unknown";
}

GameSession::GameSession(const EngineConfig& config)
    : m_config(config),
      m_generator(config.terrain),
      m_solver(config.physics),
      m_selectedHotbarIndex(std::clamp(config.session.defaultHotbarSlot, 1, kHotbarSlotCount) - 1) {}

bool GameSession::generateWorld() {
    if (m_worldReady) {
        TVX_LOGW("session") << "world already generated; ignoring regenerate request";
        return false;
    }

    world::GeneratedWorld generated = m_generator.generate();
    m_store = std::move(generated.store);
    m_heights = std::move(generated.heights);
    m_worldReady = true;
    m_batcher.invalidate();
    spawnBody();
    return true;
}

void GameSession::adoptWorld(world::VoxelStore store) {
    m_store = std::move(store);
    m_heights = world::HeightMap{};
    m_worldReady = true;
    m_batcher.invalidate();
}

void GameSession::spawnBody() {
    const std::int32_t spawnX = m_config.session.spawnX;
    const std::int32_t spawnZ = m_config.session.spawnZ;
    const std::int32_t surface = m_heights.heightAt(spawnX, spawnZ).value_or(m_generator.columnHeight(spawnX, spawnZ));

    m_body = sim::Body{};
    m_body.position = math::Vector3{
        static_cast<float>(spawnX),
        static_cast<float>(surface) + m_config.session.spawnHeightOffset,
        static_cast<float>(spawnZ)
    };

    // A tree can stand on the spawn column; lift the body clear of it.
    const float ceiling = static_cast<float>(m_config.session.maxBuildHeight) + m_config.session.spawnHeightOffset;
    while (sim::overlapsSolid(m_store, m_body.position, m_config.physics) && m_body.position.y < ceiling) {
        m_body.position.y += 1.0f;
    }

    TVX_LOGI("session") << "spawned at (" << m_body.position.x << ", " << m_body.position.y << ", "
                        << m_body.position.z << ")";
}

FrameReport GameSession::step(const core::InputState& input, const math::Vector3& lookDirection, float dt) {
    FrameReport report{};
    report.dt = std::clamp(dt, 0.0f, m_config.session.maxFrameDelta);

    if (input.toggleFlyDown && !m_wasToggleFlyDown) {
        m_body.flying = !m_body.flying;
        m_body.velocity.y = 0.0f;
        TVX_LOGI("session") << "flying " << (m_body.flying ? "enabled" : "disabled");
    }
    m_wasToggleFlyDown = input.toggleFlyDown;

    if (input.hotbarSlot >= 1 && input.hotbarSlot <= kHotbarSlotCount) {
        selectHotbarSlot(input.hotbarSlot);
    }
    if (input.hotbarScroll != 0) {
        cycleHotbar(input.hotbarScroll > 0 ? 1 : -1);
    }

    m_body = m_solver.integrate(m_body, input, lookDirection, report.dt, m_store);

    // Both edits act on the pick the frame shows; at most one of them changes the store.
    report.pick = pick(lookDirection);
    if (input.breakPressed) {
        report.breakOutcome = applyPointer(core::PointerButton::Primary, report.pick);
    }
    if (input.placePressed && report.breakOutcome != EditOutcome::Applied) {
        report.placeOutcome = applyPointer(core::PointerButton::Secondary, report.pick);
    }

    report.hud = hud();
    return report;
}

std::optional<world::PickResult> GameSession::pick(const math::Vector3& lookDirection) const {
    return world::castRay(
        m_body.position,
        lookDirection,
        m_store,
        m_config.pick.reachDistance,
        m_config.pick.rayStep
    );
}

EditOutcome GameSession::handlePointer(core::PointerButton button, const math::Vector3& lookDirection) {
    return applyPointer(button, pick(lookDirection));
}

EditOutcome GameSession::applyPointer(core::PointerButton button, const std::optional<world::PickResult>& target) {
    if (!target.has_value()) {
        return EditOutcome::NoTarget;
    }
    if (button == core::PointerButton::Primary) {
        return breakAt(target->target);
    }
    return placeAt(target->adjacent, selectedKind());
}

EditOutcome GameSession::breakAt(const core::Cell3i& cell) {
    const std::optional<world::BlockKind> existing = m_store.get(cell);
    if (!existing.has_value()) {
        return EditOutcome::NothingToBreak;
    }
    if (*existing == world::BlockKind::Bedrock) {
        return EditOutcome::Indestructible;
    }

    m_store.remove(cell);
    notifyEdited(cell);
    TVX_LOGD("session") << "broke " << world::blockKindName(*existing) << " at (" << cell.x << ", " << cell.y
                        << ", " << cell.z << ")";
    return EditOutcome::Applied;
}

EditOutcome GameSession::placeAt(const core::Cell3i& cell, world::BlockKind kind) {
    if (m_store.contains(cell)) {
        return EditOutcome::Occupied;
    }
    if (cell.y < m_config.session.minBuildHeight || cell.y > m_config.session.maxBuildHeight) {
        return EditOutcome::OutOfBuildRange;
    }
    if (sim::bodyIntersectsCell(m_body.position, cell, m_config.physics)) {
        return EditOutcome::IntersectsBody;
    }

    m_store.set(cell, kind);
    notifyEdited(cell);
    TVX_LOGD("session") << "placed " << world::blockKindName(kind) << " at (" << cell.x << ", " << cell.y << ", "
                        << cell.z << ")";
    return EditOutcome::Applied;
}

void GameSession::notifyEdited(const core::Cell3i& cell) {
    m_batcher.markDirty(cell);
}

void GameSession::selectHotbarSlot(int slot) {
    const int clampedIndex = std::clamp(slot, 1, kHotbarSlotCount) - 1;
    if (clampedIndex == m_selectedHotbarIndex) {
        return;
    }
    m_selectedHotbarIndex = clampedIndex;
    TVX_LOGI("session") << "selected hotbar slot " << (m_selectedHotbarIndex + 1) << ": "
                        << world::blockKindName(selectedKind());
}

void GameSession::cycleHotbar(int direction) {
    const int next = (m_selectedHotbarIndex + direction) % kHotbarSlotCount;
    selectHotbarSlot((next < 0 ? next + kHotbarSlotCount : next) + 1);
}

world::BlockKind GameSession::selectedKind() const {
    return world::kAllBlockKinds[static_cast<std::size_t>(m_selectedHotbarIndex)];
}

HudSnapshot GameSession::hud() const {
    HudSnapshot snapshot{};
    snapshot.position = m_body.position;
    snapshot.grounded = m_body.grounded;
    snapshot.flying = m_body.flying;
    snapshot.blockCount = m_store.size();
    snapshot.selectedSlot = selectedHotbarSlot();
    snapshot.selectedKind = selectedKind();
    return snapshot;
}

const world::InstanceBatches& GameSession::instanceBatches() {
    return m_batcher.batches(m_store);
}

world::SurfaceMap GameSession::surfaceMap(std::int32_t halfExtent, std::int32_t scanTopY) const {
    return world::sampleSurfaceMap(
        m_store,
        core::roundToCell(m_body.position.x),
        core::roundToCell(m_body.position.z),
        halfExtent,
        scanTopY
    );
}

} // namespace terravox::app
