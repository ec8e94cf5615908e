#pragma once

#include "core/grid3.h"
#include "math/math.h"
#include "world/voxel_store.h"

#include <optional>

// World Raycaster subsystem
// Responsible for: marching a ray through the voxel store and reporting the first solid voxel and its face.
// Should NOT do: decide what to do with the hit (break/place policy) or own a camera.
namespace terravox::world {

struct PickResult {
    core::Cell3i target{};
    // The empty cell in front of the hit face; placement goes here.
    core::Cell3i adjacent{};
    core::Cell3i normal{};

    bool operator==(const PickResult&) const = default;
};

inline constexpr float kDefaultRayStep = 0.05f;

// Fixed-step march: the probe advances by `step` along the normalized direction and the store is queried
// each time the rounded cell changes. Water does not stop the ray.
std::optional<PickResult> castRay(
    const math::Vector3& origin,
    const math::Vector3& direction,
    const VoxelStore& store,
    float maxDistance,
    float step = kDefaultRayStep
);

// Largest-magnitude axis of `delta`, negated. Ties resolve x, then y, then z.
core::Cell3i faceNormalFromStep(const core::Cell3i& delta);

} // namespace terravox::world
