#include "sim/collision_solver.h"

#include <algorithm>
#include <cmath>

namespace terravox::sim {
namespace {

float approachFactor(float decayBase, float dt) {
    return 1.0f - std::pow(decayBase, dt);
}

} // namespace

BodyBounds bodyBoundsAt(const math::Vector3& eye, const PhysicsConfig& config) {
    return BodyBounds{
        math::Vector3{eye.x - config.bodyRadius, eye.y - config.bodyHeight, eye.z - config.bodyRadius},
        math::Vector3{eye.x + config.bodyRadius, eye.y + config.headClearance, eye.z + config.bodyRadius}
    };
}

bool bodyIntersectsCell(const math::Vector3& eye, const core::Cell3i& cell, const PhysicsConfig& config) {
    const BodyBounds body = bodyBoundsAt(eye, config);
    const math::Vector3 center = core::toVector3(cell);
    return body.max.x > center.x - 0.5f && body.min.x < center.x + 0.5f &&
           body.max.y > center.y - 0.5f && body.min.y < center.y + 0.5f &&
           body.max.z > center.z - 0.5f && body.min.z < center.z + 0.5f;
}

bool overlapsSolid(const world::VoxelStore& store, const math::Vector3& eye, const PhysicsConfig& config) {
    const float r = config.bodyRadius;
    for (int dx = -1; dx <= 1; ++dx) {
        for (int dy = 0; dy <= 2; ++dy) {
            for (int dz = -1; dz <= 1; ++dz) {
                const core::Cell3i cell{
                    core::roundToCell(eye.x + (static_cast<float>(dx) * r)),
                    core::roundToCell(eye.y - config.bodyHeight + static_cast<float>(dy)),
                    core::roundToCell(eye.z + (static_cast<float>(dz) * r))
                };
                if (!world::isSolid(store.get(cell))) {
                    continue;
                }
                if (bodyIntersectsCell(eye, cell, config)) {
                    return true;
                }
            }
        }
    }
    return false;
}

void CollisionSolver::applyMoveIntent(
    Body& body,
    const core::InputState& input,
    const math::Vector3& lookDirection,
    float dt
) const {
    const float moveForwardInput = std::clamp(input.moveForward, -1.0f, 1.0f);
    const float moveStrafeInput = std::clamp(input.moveStrafe, -1.0f, 1.0f);

    float speed = m_config.walkSpeed;
    if (body.flying) {
        speed = m_config.flySpeed;
    } else if (input.sprint) {
        speed = m_config.walkSpeed * m_config.sprintMultiplier;
    }

    const math::Vector3 forward = math::normalize(math::Vector3{lookDirection.x, 0.0f, lookDirection.z});
    const math::Vector3 right = math::cross(forward, math::Vector3{0.0f, 1.0f, 0.0f});
    math::Vector3 moveDirection = (forward * moveForwardInput) + (right * moveStrafeInput);
    moveDirection.y = 0.0f;
    moveDirection = math::normalize(moveDirection);

    const float blend = approachFactor(m_config.velocityDecayBase, dt);
    body.velocity.x += ((moveDirection.x * speed) - body.velocity.x) * blend;
    body.velocity.z += ((moveDirection.z * speed) - body.velocity.z) * blend;

    if (body.flying) {
        float targetVelocityY = moveForwardInput * lookDirection.y * speed;
        if (input.jump) {
            targetVelocityY += speed;
        }
        if (input.descend) {
            targetVelocityY -= speed;
        }
        body.velocity.y += (targetVelocityY - body.velocity.y) * blend;
        return;
    }

    body.velocity.y = std::max(body.velocity.y - (m_config.gravity * dt), -m_config.terminalFallSpeed);
    if (input.jump && body.grounded) {
        body.velocity.y = m_config.jumpImpulse;
        body.grounded = false;
    }
}

void CollisionSolver::resolveMovement(Body& body, float dt, const world::VoxelStore& store) const {
    const math::Vector3 total = body.velocity * dt;
    const float maxDelta = std::max({std::fabs(total.x), std::fabs(total.y), std::fabs(total.z)});
    const float substepLimit = std::max(m_config.maxSubstepDistance, 1e-3f);
    const int steps = std::max(1, static_cast<int>(std::ceil(maxDelta / substepLimit)));
    const math::Vector3 stepDelta = total / static_cast<float>(steps);

    bool blockedX = false;
    bool blockedY = false;
    bool blockedZ = false;

    for (int step = 0; step < steps; ++step) {
        if (!blockedX) {
            math::Vector3 candidate = body.position;
            candidate.x += stepDelta.x;
            if (overlapsSolid(store, candidate, m_config)) {
                blockedX = true;
                body.velocity.x = 0.0f;
            } else {
                body.position = candidate;
            }
        }

        if (!blockedZ) {
            math::Vector3 candidate = body.position;
            candidate.z += stepDelta.z;
            if (overlapsSolid(store, candidate, m_config)) {
                blockedZ = true;
                body.velocity.z = 0.0f;
            } else {
                body.position = candidate;
            }
        }

        if (!blockedY) {
            math::Vector3 candidate = body.position;
            candidate.y += stepDelta.y;
            if (overlapsSolid(store, candidate, m_config)) {
                blockedY = true;
                if (body.velocity.y < 0.0f) {
                    body.grounded = true;
                }
                body.velocity.y = 0.0f;
            } else {
                body.position = candidate;
                body.grounded = false;
            }
        }
    }
}

Body CollisionSolver::integrate(
    const Body& body,
    const core::InputState& input,
    const math::Vector3& lookDirection,
    float dt,
    const world::VoxelStore& store
) const {
    Body next = body;
    if (dt <= 0.0f) {
        return next;
    }

    applyMoveIntent(next, input, lookDirection, dt);
    resolveMovement(next, dt, store);

    if (next.position.y < m_config.floorClampY) {
        next.position.y = m_config.floorClampY;
        next.velocity.y = 0.0f;
        next.grounded = true;
    }
    return next;
}

} // namespace terravox::sim
