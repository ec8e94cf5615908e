#pragma once

#include "world/block.h"
#include "world/voxel_store.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

// World SurfaceMap subsystem
// Responsible for: sampling the topmost block of each column in a square window for an overview map.
// Should NOT do: pick colors, render the map, or track the body.
namespace terravox::world {

// Top-down view of a square window of columns, row-major with z as the row.
struct SurfaceMap {
    std::int32_t originX = 0;
    std::int32_t originZ = 0;
    std::int32_t side = 0;
    std::vector<std::optional<BlockKind>> tops;

    [[nodiscard]] std::optional<BlockKind> topAt(std::int32_t x, std::int32_t z) const;
};

// For every column within `halfExtent` of the center, the first block found scanning down from `scanTopY` to 0.
SurfaceMap sampleSurfaceMap(
    const VoxelStore& store,
    std::int32_t centerX,
    std::int32_t centerZ,
    std::int32_t halfExtent,
    std::int32_t scanTopY
);

} // namespace terravox::world
