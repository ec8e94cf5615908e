#include <cmath>
#include <cstdint>
#include <iostream>
#include <optional>
#include <set>

#include "core/grid3.h"
#include "math/math.h"
#include "world/block.h"
#include "world/surface_map.h"
#include "world/voxel_store.h"

namespace {

int g_failures = 0;

void expectTrue(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[foundation test] FAIL: " << message << '\n';
        ++g_failures;
    }
}

void expectNear(float actual, float expected, float epsilon, const char* message) {
    if (std::fabs(actual - expected) > epsilon) {
        std::cerr << "[foundation test] FAIL: " << message
                  << " (expected " << expected
                  << ", got " << actual << ")\n";
        ++g_failures;
    }
}

void testGridPrimitives() {
    using terravox::core::Cell3i;
    using terravox::core::Dir6;

    const Cell3i start{10, 5, -2};
    expectTrue(terravox::core::neighborCell(start, Dir6::PosX) == Cell3i{11, 5, -2}, "PosX neighbor offset");
    expectTrue(terravox::core::neighborCell(start, Dir6::NegZ) == Cell3i{10, 5, -3}, "NegZ neighbor offset");

    std::set<Cell3i> neighbors;
    for (const Dir6 dir : terravox::core::kAllDir6) {
        neighbors.insert(terravox::core::neighborCell(start, dir));
    }
    expectTrue(neighbors.size() == 6u, "Six distinct face neighbors");

    expectTrue(terravox::core::roundToCell(0.49f) == 0, "0.49 rounds to 0");
    expectTrue(terravox::core::roundToCell(0.5f) == 1, "0.5 rounds up");
    expectTrue(terravox::core::roundToCell(-0.5f) == 0, "-0.5 rounds up to 0");
    expectTrue(terravox::core::roundToCell(-0.51f) == -1, "-0.51 rounds to -1");
    expectTrue(terravox::core::cellAt(terravox::math::Vector3{1.4f, -2.6f, 7.5f}) == Cell3i{1, -3, 8}, "Point to cell");

    expectTrue(Cell3i{9, 0, 9} < Cell3i{0, 1, 0}, "Order is y-major");
    expectTrue(Cell3i{9, 1, 0} < Cell3i{0, 1, 1}, "Order compares z before x");
    expectTrue(Cell3i{-1, 1, 1} < Cell3i{0, 1, 1}, "Order falls back to x");

    terravox::core::CellAabb dirty{};
    expectTrue(dirty.empty(), "Default AABB is empty");
    dirty.includeCell(Cell3i{0, 0, 0});
    dirty.includeCell(Cell3i{2, 1, 0});
    expectTrue(dirty.valid, "AABB valid after include");
    expectTrue(dirty.contains(Cell3i{1, 1, 0}), "AABB contains interior cell");
    expectTrue(!dirty.contains(Cell3i{3, 0, 0}), "AABB max is exclusive");
}

void testVectorMath() {
    using terravox::math::Vector3;

    const Vector3 forward = terravox::math::directionFromYawPitch(0.0f, 0.0f);
    expectNear(forward.x, 1.0f, 1e-5f, "Yaw 0 faces +X");
    const Vector3 side = terravox::math::directionFromYawPitch(90.0f, 0.0f);
    expectNear(side.z, 1.0f, 1e-5f, "Yaw 90 faces +Z");
    const Vector3 down = terravox::math::directionFromYawPitch(30.0f, -90.0f);
    expectNear(down.y, -1.0f, 1e-5f, "Pitch -90 looks straight down");

    const Vector3 right = terravox::math::cross(Vector3{1.0f, 0.0f, 0.0f}, Vector3{0.0f, 1.0f, 0.0f});
    expectNear(right.z, 1.0f, 1e-6f, "Forward x up points right");

    const Vector3 zero = terravox::math::normalize(Vector3{});
    expectTrue(zero == Vector3{}, "Normalizing zero stays zero");
}

void testBlockProperties() {
    using terravox::world::BlockKind;

    expectTrue(!terravox::world::isSolid(BlockKind::Water), "Water is not solid");
    expectTrue(terravox::world::isSolid(BlockKind::Glass), "Glass is solid");
    expectTrue(!terravox::world::isSolid(std::optional<BlockKind>{}), "Empty cell is not solid");
    expectTrue(!terravox::world::occludesNeighbors(BlockKind::Leaves), "Leaves let faces show");
    expectTrue(terravox::world::occludesNeighbors(BlockKind::Wood), "Wood hides faces");
    for (std::size_t i = 0; i < terravox::world::kBlockKindCount; ++i) {
        expectTrue(terravox::world::blockKindIndex(terravox::world::kAllBlockKinds[i]) == i, "Kind order matches index");
    }
}

void testSurfaceMapScan() {
    using terravox::world::BlockKind;

    terravox::world::VoxelStore store;
    store.set(0, 0, 0, BlockKind::Bedrock);
    store.set(0, 3, 0, BlockKind::Grass);
    store.set(1, 20, 0, BlockKind::Leaves);
    store.set(-1, 1, 1, BlockKind::Water);

    const terravox::world::SurfaceMap map = terravox::world::sampleSurfaceMap(store, 0, 0, 1, 10);
    expectTrue(map.side == 3, "Surface map side");
    expectTrue(map.tops.size() == 9u, "Surface map cell count");
    expectTrue(map.topAt(0, 0) == BlockKind::Grass, "Highest block wins");
    expectTrue(!map.topAt(1, 0).has_value(), "Blocks above the scan start are ignored");
    expectTrue(map.topAt(-1, 1) == BlockKind::Water, "Water shows on the surface map");
    expectTrue(!map.topAt(2, 0).has_value(), "Outside the window is empty");
}

} // namespace

int main() {
    testGridPrimitives();
    testVectorMath();
    testBlockProperties();
    testSurfaceMapScan();

    if (g_failures != 0) {
        std::cerr << "[foundation test] " << g_failures << " failures\n";
        return 1;
    }
    std::cout << "[foundation test] all checks passed\n";
    return 0;
}
