#include "world/surface_map.h"

#include <algorithm>

namespace terravox::world {

std::optional<BlockKind> SurfaceMap::topAt(std::int32_t x, std::int32_t z) const {
    const std::int32_t localX = x - originX;
    const std::int32_t localZ = z - originZ;
    if (localX < 0 || localZ < 0 || localX >= side || localZ >= side) {
        return std::nullopt;
    }
    return tops[static_cast<std::size_t>(localX) + (static_cast<std::size_t>(side) * static_cast<std::size_t>(localZ))];
}

SurfaceMap sampleSurfaceMap(
    const VoxelStore& store,
    std::int32_t centerX,
    std::int32_t centerZ,
    std::int32_t halfExtent,
    std::int32_t scanTopY
) {
    SurfaceMap map{};
    const std::int32_t extent = std::max(halfExtent, 0);
    map.originX = centerX - extent;
    map.originZ = centerZ - extent;
    map.side = (2 * extent) + 1;
    map.tops.resize(static_cast<std::size_t>(map.side) * static_cast<std::size_t>(map.side));

    for (std::int32_t localZ = 0; localZ < map.side; ++localZ) {
        for (std::int32_t localX = 0; localX < map.side; ++localX) {
            const std::int32_t x = map.originX + localX;
            const std::int32_t z = map.originZ + localZ;
            std::optional<BlockKind> top;
            for (std::int32_t y = scanTopY; y >= 0; --y) {
                top = store.get(x, y, z);
                if (top.has_value()) {
                    break;
                }
            }
            map.tops[static_cast<std::size_t>(localX) + (static_cast<std::size_t>(map.side) * static_cast<std::size_t>(localZ))] = top;
        }
    }
    return map;
}

} // namespace terravox::world
