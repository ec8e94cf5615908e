#pragma once

#include "core/grid3.h"
#include "world/block.h"
#include "world/voxel_store.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

// World VisibilityBatcher subsystem
// Responsible for: face-exposure culling and grouping exposed voxels into per-kind instance batches.
// Should NOT do: flood-fill occlusion, build vertex data, or mutate the store.
namespace terravox::world {

// Indexed by blockKindIndex(kind). Each list is sorted by Cell3i order (y, then z, then x).
using InstanceBatches = std::array<std::vector<core::Cell3i>, kBlockKindCount>;

// True when any of the six face neighbors is empty or a translucent kind.
bool isExposed(const VoxelStore& store, const core::Cell3i& cell);

InstanceBatches computeInstanceBatches(const VoxelStore& store);

std::size_t totalInstanceCount(const InstanceBatches& batches);

// Memoizes the last batches on (store address, store revision).
class VisibilityBatcher {
public:
    const InstanceBatches& batches(const VoxelStore& store);

    // Edit notification: the next batches() call recomputes and the touched region is tracked until then.
    void markDirty(const core::Cell3i& cell);
    void invalidate();

    [[nodiscard]] bool isDirty() const { return m_dirty; }
    [[nodiscard]] const core::CellAabb& pendingDirtyRegion() const { return m_pendingDirtyRegion; }
    [[nodiscard]] std::uint64_t recomputeCount() const { return m_recomputeCount; }

private:
    InstanceBatches m_batches{};
    const VoxelStore* m_store = nullptr;
    std::uint64_t m_revision = 0;
    bool m_dirty = true;
    core::CellAabb m_pendingDirtyRegion{};
    std::uint64_t m_recomputeCount = 0;
};

} // namespace terravox::world
