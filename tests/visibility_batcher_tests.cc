#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <vector>

#include "core/grid3.h"
#include "world/block.h"
#include "world/visibility_batcher.h"
#include "world/voxel_store.h"

namespace {

using terravox::core::Cell3i;
using terravox::world::blockKindIndex;
using terravox::world::BlockKind;
using terravox::world::computeInstanceBatches;
using terravox::world::InstanceBatches;
using terravox::world::isExposed;
using terravox::world::VisibilityBatcher;
using terravox::world::VoxelStore;

VoxelStore makeSolidCube(BlockKind kind) {
    VoxelStore store;
    for (int y = -1; y <= 1; ++y) {
        for (int z = -1; z <= 1; ++z) {
            for (int x = -1; x <= 1; ++x) {
                store.set(x, y, z, kind);
            }
        }
    }
    return store;
}

} // namespace

TEST(VisibilityBatcher, IsolatedBlockIsExposed) {
    VoxelStore store;
    store.set(4, 4, 4, BlockKind::Stone);
    EXPECT_TRUE(isExposed(store, Cell3i{4, 4, 4}));
}

TEST(VisibilityBatcher, FullyEnclosedBlockIsHidden) {
    const VoxelStore store = makeSolidCube(BlockKind::Stone);
    EXPECT_FALSE(isExposed(store, Cell3i{0, 0, 0}));
    EXPECT_TRUE(isExposed(store, Cell3i{1, 0, 0}));
    EXPECT_TRUE(isExposed(store, Cell3i{-1, -1, -1}));

    const InstanceBatches batches = computeInstanceBatches(store);
    EXPECT_EQ(batches[blockKindIndex(BlockKind::Stone)].size(), 26u);
    EXPECT_EQ(terravox::world::totalInstanceCount(batches), 26u);
}

TEST(VisibilityBatcher, TranslucentNeighborExposesBlock) {
    constexpr std::array<BlockKind, 3> kTranslucent = {BlockKind::Water, BlockKind::Glass, BlockKind::Leaves};
    for (const BlockKind neighborKind : kTranslucent) {
        VoxelStore store = makeSolidCube(BlockKind::Dirt);
        store.set(0, 1, 0, neighborKind);
        EXPECT_TRUE(isExposed(store, Cell3i{0, 0, 0})) << terravox::world::blockKindName(neighborKind);
    }

    VoxelStore store = makeSolidCube(BlockKind::Dirt);
    store.set(0, 1, 0, BlockKind::Wood);
    EXPECT_FALSE(isExposed(store, Cell3i{0, 0, 0}));
}

TEST(VisibilityBatcher, BatchesGroupByKindInSortedOrder) {
    VoxelStore store;
    store.set(2, 0, 0, BlockKind::Grass);
    store.set(-3, 0, 5, BlockKind::Grass);
    store.set(0, 1, -7, BlockKind::Grass);
    store.set(9, -2, 9, BlockKind::Glass);

    const InstanceBatches batches = computeInstanceBatches(store);
    const std::vector<Cell3i>& grass = batches[blockKindIndex(BlockKind::Grass)];
    ASSERT_EQ(grass.size(), 3u);
    EXPECT_EQ(grass[0], (Cell3i{2, 0, 0}));
    EXPECT_EQ(grass[1], (Cell3i{-3, 0, 5}));
    EXPECT_EQ(grass[2], (Cell3i{0, 1, -7}));
    EXPECT_TRUE(std::is_sorted(grass.begin(), grass.end()));

    ASSERT_EQ(batches[blockKindIndex(BlockKind::Glass)].size(), 1u);
    EXPECT_TRUE(batches[blockKindIndex(BlockKind::Stone)].empty());
}

TEST(VisibilityBatcher, MemoizesOnStoreRevision) {
    VoxelStore store = makeSolidCube(BlockKind::Stone);
    VisibilityBatcher batcher;

    const std::size_t first = terravox::world::totalInstanceCount(batcher.batches(store));
    EXPECT_EQ(first, 26u);
    EXPECT_EQ(batcher.recomputeCount(), 1u);

    static_cast<void>(batcher.batches(store));
    EXPECT_EQ(batcher.recomputeCount(), 1u);

    store.remove(1, 0, 0);
    const InstanceBatches& afterEdit = batcher.batches(store);
    EXPECT_EQ(batcher.recomputeCount(), 2u);
    // The center is now visible through the hole.
    EXPECT_EQ(terravox::world::totalInstanceCount(afterEdit), 26u);
    const std::vector<Cell3i>& stone = afterEdit[blockKindIndex(BlockKind::Stone)];
    EXPECT_TRUE(std::binary_search(stone.begin(), stone.end(), Cell3i{0, 0, 0}));
}

TEST(VisibilityBatcher, DifferentStoreAtSameRevisionRecomputes) {
    VoxelStore a;
    VoxelStore b;
    a.set(0, 0, 0, BlockKind::Sand);
    b.set(5, 5, 5, BlockKind::Glass);
    ASSERT_EQ(a.revision(), b.revision());

    VisibilityBatcher batcher;
    EXPECT_EQ(batcher.batches(a)[blockKindIndex(BlockKind::Sand)].size(), 1u);
    EXPECT_EQ(batcher.batches(b)[blockKindIndex(BlockKind::Sand)].size(), 0u);
    EXPECT_EQ(batcher.recomputeCount(), 2u);
}

TEST(VisibilityBatcher, DirtyNotificationForcesRecomputeAndTracksRegion) {
    VoxelStore store = makeSolidCube(BlockKind::Stone);
    VisibilityBatcher batcher;
    static_cast<void>(batcher.batches(store));
    EXPECT_FALSE(batcher.isDirty());
    EXPECT_TRUE(batcher.pendingDirtyRegion().empty());

    batcher.markDirty(Cell3i{5, 0, 0});
    EXPECT_TRUE(batcher.isDirty());
    EXPECT_TRUE(batcher.pendingDirtyRegion().contains(Cell3i{5, 0, 0}));
    EXPECT_TRUE(batcher.pendingDirtyRegion().contains(Cell3i{4, -1, 1}));
    EXPECT_TRUE(batcher.pendingDirtyRegion().contains(Cell3i{6, 1, -1}));
    EXPECT_FALSE(batcher.pendingDirtyRegion().contains(Cell3i{7, 0, 0}));

    static_cast<void>(batcher.batches(store));
    EXPECT_EQ(batcher.recomputeCount(), 2u);
    EXPECT_FALSE(batcher.isDirty());
    EXPECT_TRUE(batcher.pendingDirtyRegion().empty());
}
