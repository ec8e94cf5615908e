#pragma once

#include "core/grid3.h"
#include "core/input.h"
#include "math/math.h"
#include "world/voxel_store.h"

// Simulation CollisionSolver subsystem
// Responsible for: integrating a body's velocity from move intent and resolving it against voxels axis by axis.
// Should NOT do: own the voxel store, read devices, or decide camera look.
namespace terravox::sim {

struct PhysicsConfig {
    float walkSpeed = 6.0f;
    float sprintMultiplier = 1.6f;
    float flySpeed = 16.0f;
    float gravity = 28.0f;
    float jumpImpulse = 9.0f;
    float terminalFallSpeed = 40.0f;
    // Fraction of the velocity error left after one second of smoothing.
    float velocityDecayBase = 0.001f;
    float bodyRadius = 0.3f;
    // Eye to feet.
    float bodyHeight = 1.6f;
    // Eye to top of the head.
    float headClearance = 0.1f;
    float floorClampY = 1.0f;
    float maxSubstepDistance = 0.45f;
};

// Body position is the eye point.
struct Body {
    math::Vector3 position{};
    math::Vector3 velocity{};
    bool flying = false;
    bool grounded = false;
};

struct BodyBounds {
    math::Vector3 min{};
    math::Vector3 max{};
};

BodyBounds bodyBoundsAt(const math::Vector3& eye, const PhysicsConfig& config);

// Strict overlap between the body box and the unit cube centered on `cell`.
bool bodyIntersectsCell(const math::Vector3& eye, const core::Cell3i& cell, const PhysicsConfig& config);

// Samples the 3x3x3 cells around the body and reports any solid one that overlaps the box.
bool overlapsSolid(const world::VoxelStore& store, const math::Vector3& eye, const PhysicsConfig& config);

class CollisionSolver {
public:
    explicit CollisionSolver(const PhysicsConfig& config = {}) : m_config(config) {}

    [[nodiscard]] Body integrate(
        const Body& body,
        const core::InputState& input,
        const math::Vector3& lookDirection,
        float dt,
        const world::VoxelStore& store
    ) const;

    [[nodiscard]] const PhysicsConfig& config() const { return m_config; }

private:
    void applyMoveIntent(Body& body, const core::InputState& input, const math::Vector3& lookDirection, float dt) const;
    void resolveMovement(Body& body, float dt, const world::VoxelStore& store) const;

    PhysicsConfig m_config;
};

} // namespace terravox::sim
