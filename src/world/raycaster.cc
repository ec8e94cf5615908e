#include "world/raycaster.h"

#include <cmath>
#include <cstdint>
#include <cstdlib>

namespace terravox::world {
namespace {

std::int32_t signOf(std::int32_t value) {
    return (value > 0) ? 1 : ((value < 0) ? -1 : 0);
}

} // namespace

core::Cell3i faceNormalFromStep(const core::Cell3i& delta) {
    const std::int32_t ax = std::abs(delta.x);
    const std::int32_t ay = std::abs(delta.y);
    const std::int32_t az = std::abs(delta.z);
    if (ax >= ay && ax >= az) {
        return core::Cell3i{-signOf(delta.x), 0, 0};
    }
    if (ay >= az) {
        return core::Cell3i{0, -signOf(delta.y), 0};
    }
    return core::Cell3i{0, 0, -signOf(delta.z)};
}

std::optional<PickResult> castRay(
    const math::Vector3& origin,
    const math::Vector3& direction,
    const VoxelStore& store,
    float maxDistance,
    float step
) {
    if (step <= 0.0f || maxDistance <= 0.0f) {
        return std::nullopt;
    }
    const math::Vector3 unitDirection = math::normalize(direction);
    if (math::lengthSquared(unitDirection) <= 0.0f) {
        return std::nullopt;
    }

    const math::Vector3 stepDelta = unitDirection * step;
    const auto stepCount = static_cast<std::int32_t>(std::ceil(maxDistance / step));

    math::Vector3 probe = origin;
    core::Cell3i previous = core::cellAt(origin);
    for (std::int32_t i = 0; i < stepCount; ++i) {
        probe += stepDelta;
        const core::Cell3i current = core::cellAt(probe);
        if (current == previous) {
            continue;
        }

        if (isSolid(store.get(current))) {
            const core::Cell3i normal = faceNormalFromStep(current - previous);
            return PickResult{current, current + normal, normal};
        }
        previous = current;
    }
    return std::nullopt;
}

} // namespace terravox::world
