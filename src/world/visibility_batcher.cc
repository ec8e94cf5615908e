#include "world/visibility_batcher.h"

#include <algorithm>

namespace terravox::world {

bool isExposed(const VoxelStore& store, const core::Cell3i& cell) {
    for (const core::Dir6 dir : core::kAllDir6) {
        const std::optional<BlockKind> neighbor = store.get(core::neighborCell(cell, dir));
        if (!neighbor.has_value() || !occludesNeighbors(*neighbor)) {
            return true;
        }
    }
    return false;
}

InstanceBatches computeInstanceBatches(const VoxelStore& store) {
    InstanceBatches batches{};
    for (const auto& [cell, kind] : store) {
        if (isExposed(store, cell)) {
            batches[blockKindIndex(kind)].push_back(cell);
        }
    }
    // Hash iteration order is unspecified; sorting makes the output reproducible.
    for (std::vector<core::Cell3i>& batch : batches) {
        std::sort(batch.begin(), batch.end());
    }
    return batches;
}

std::size_t totalInstanceCount(const InstanceBatches& batches) {
    std::size_t total = 0;
    for (const std::vector<core::Cell3i>& batch : batches) {
        total += batch.size();
    }
    return total;
}

const InstanceBatches& VisibilityBatcher::batches(const VoxelStore& store) {
    if (!m_dirty && m_store == &store && m_revision == store.revision()) {
        return m_batches;
    }

    m_batches = computeInstanceBatches(store);
    m_store = &store;
    m_revision = store.revision();
    m_dirty = false;
    m_pendingDirtyRegion = core::CellAabb{};
    ++m_recomputeCount;
    return m_batches;
}

void VisibilityBatcher::markDirty(const core::Cell3i& cell) {
    m_dirty = true;
    // Neighbors can change exposure too.
    m_pendingDirtyRegion.includeCell(cell + core::Cell3i{-1, -1, -1});
    m_pendingDirtyRegion.includeCell(cell + core::Cell3i{1, 1, 1});
}

void VisibilityBatcher::invalidate() {
    m_dirty = true;
}

} // namespace terravox::world
