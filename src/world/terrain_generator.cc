#include "world/terrain_generator.h"

#include <algorithm>
#include <chrono>
#include <cmath>

#include "core/log.h"
#include "core/rng.h"

namespace terravox::world {
namespace {

enum class NoiseChannel : std::uint32_t {
    Elevation = 0,
    Biome = 1,
    Feature = 2
};

// Channels draw consecutive outputs of one stream seeded from the world seed.
std::uint32_t channelSeed(std::uint64_t worldSeed, NoiseChannel channel) {
    core::Pcg32 rng(core::mixSeed(worldSeed));
    std::uint32_t value = rng.nextU32();
    for (std::uint32_t i = 0; i < static_cast<std::uint32_t>(channel); ++i) {
        value = rng.nextU32();
    }
    return value;
}

} // namespace

std::string_view biomeName(Biome biome) {
    switch (biome) {
    case Biome::Desert:
        return "desert";
    case Biome::Plains:
        return "plains";
    case Biome::Forest:
        return "forest";
    }
    return "unknown";
}

HeightMap::HeightMap(std::int32_t radius)
    : m_radius(std::max(radius, 0)),
      m_heights((2 * static_cast<std::size_t>(m_radius)) * (2 * static_cast<std::size_t>(m_radius)), 0) {}

bool HeightMap::inBounds(std::int32_t x, std::int32_t z) const {
    return x >= -m_radius && x < m_radius && z >= -m_radius && z < m_radius;
}

std::size_t HeightMap::linearIndex(std::int32_t x, std::int32_t z) const {
    const std::size_t side = 2 * static_cast<std::size_t>(m_radius);
    return static_cast<std::size_t>(x + m_radius) + (side * static_cast<std::size_t>(z + m_radius));
}

std::optional<std::int32_t> HeightMap::heightAt(std::int32_t x, std::int32_t z) const {
    if (!inBounds(x, z)) {
        return std::nullopt;
    }
    return m_heights[linearIndex(x, z)];
}

void HeightMap::setHeight(std::int32_t x, std::int32_t z, std::int32_t height) {
    if (!inBounds(x, z)) {
        return;
    }
    m_heights[linearIndex(x, z)] = height;
}

TerrainGenerator::TerrainGenerator(const TerrainConfig& config)
    : m_config(config),
      m_elevation(channelSeed(config.seed, NoiseChannel::Elevation)),
      m_biome(channelSeed(config.seed, NoiseChannel::Biome)),
      m_feature(channelSeed(config.seed, NoiseChannel::Feature)) {}

std::int32_t TerrainGenerator::columnHeight(std::int32_t x, std::int32_t z) const {
    const double fx = static_cast<double>(x);
    const double fz = static_cast<double>(z);
    const double elevation = m_elevation.fbm(
        fx * m_config.elevationFrequency,
        fz * m_config.elevationFrequency,
        m_config.elevationFbm
    );
    const double mountain = m_elevation.fbm(
        (fx * m_config.mountainFrequency) + m_config.mountainOffset,
        (fz * m_config.mountainFrequency) + m_config.mountainOffset,
        m_config.mountainFbm
    );
    const double height = (m_config.elevationAmplitude * elevation) + m_config.baseHeight +
                          (std::max(0.0, mountain) * m_config.mountainAmplitude);
    return static_cast<std::int32_t>(std::floor(height));
}

Biome TerrainGenerator::classifyBiome(std::int32_t x, std::int32_t z) const {
    const float value = m_biome.sample(
        (static_cast<double>(x) * m_config.biomeFrequency) + m_config.biomeOffset,
        (static_cast<double>(z) * m_config.biomeFrequency) + m_config.biomeOffset
    );
    if (value < m_config.desertThreshold) {
        return Biome::Desert;
    }
    if (value > m_config.forestThreshold) {
        return Biome::Forest;
    }
    return Biome::Plains;
}

bool TerrainGenerator::wantsTree(std::int32_t x, std::int32_t z, Biome biome) const {
    if (biome == Biome::Desert) {
        return false;
    }
    const float value = m_feature.sample(
        (static_cast<double>(x) * m_config.featureFrequency) + m_config.featureOffset,
        (static_cast<double>(z) * m_config.featureFrequency) + m_config.featureOffset
    );
    const float threshold = (biome == Biome::Forest) ? m_config.forestTreeThreshold : m_config.plainsTreeThreshold;
    return value > threshold;
}

std::int32_t TerrainGenerator::trunkHeight(std::int32_t x, std::int32_t z) const {
    const float value = m_feature.sample(
        static_cast<double>(x) * m_config.trunkNoiseScale,
        static_cast<double>(z) * m_config.trunkNoiseScale
    );
    const auto variance = static_cast<std::int32_t>(
        std::floor(std::fabs(value) * static_cast<float>(m_config.trunkHeightVariance))
    );
    // |value| == 1 would otherwise add one extra block.
    return m_config.trunkBaseHeight + std::min(variance, std::max(m_config.trunkHeightVariance - 1, 0));
}

void TerrainGenerator::fillColumn(
    VoxelStore& store,
    std::int32_t x,
    std::int32_t z,
    std::int32_t height,
    Biome biome
) const {
    const bool desert = biome == Biome::Desert;
    store.set(x, 0, z, BlockKind::Bedrock);
    for (std::int32_t y = 1; y <= height; ++y) {
        BlockKind kind = BlockKind::Stone;
        if (y == height) {
            kind = desert ? BlockKind::Sand : BlockKind::Grass;
        } else if (y >= height - m_config.dirtDepth) {
            kind = desert ? BlockKind::Sand : BlockKind::Dirt;
        }
        store.set(x, y, z, kind);
    }
}

void TerrainGenerator::plantTree(VoxelStore& store, std::int32_t x, std::int32_t z, std::int32_t groundHeight) const {
    const std::int32_t trunk = trunkHeight(x, z);
    const std::int32_t baseY = groundHeight + 1;
    for (std::int32_t y = 0; y < trunk; ++y) {
        store.set(x, baseY + y, z, BlockKind::Wood);
    }

    const std::int32_t radius = m_config.leafRadius;
    const std::int32_t leafCenterY = baseY + trunk - 1;
    const float maxDistance = static_cast<float>(radius) + 0.5f;
    for (std::int32_t ly = -1; ly <= radius; ++ly) {
        for (std::int32_t lz = -radius; lz <= radius; ++lz) {
            for (std::int32_t lx = -radius; lx <= radius; ++lx) {
                const float distance = std::sqrt(static_cast<float>((lx * lx) + (ly * ly) + (lz * lz)));
                if (distance > maxDistance) {
                    continue;
                }
                const core::Cell3i cell{x + lx, leafCenterY + ly, z + lz};
                if (store.get(cell) == BlockKind::Wood) {
                    continue;
                }
                store.set(cell, BlockKind::Leaves);
            }
        }
    }
    store.set(x, leafCenterY + radius + 1, z, BlockKind::Leaves);
}

GeneratedWorld TerrainGenerator::generate() const {
    return generate(m_config.worldRadius);
}

GeneratedWorld TerrainGenerator::generate(std::int32_t worldRadius) const {
    using Clock = std::chrono::steady_clock;
    const auto start = Clock::now();

    GeneratedWorld result{};
    const std::int32_t radius = std::max(worldRadius, 0);
    result.heights = HeightMap(radius);
    const std::size_t side = static_cast<std::size_t>(2 * radius);
    result.store.reserve(side * side * static_cast<std::size_t>(m_config.baseHeight + m_config.seaLevel));

    std::vector<TreeSite> treeSites;
    for (std::int32_t x = -radius; x < radius; ++x) {
        for (std::int32_t z = -radius; z < radius; ++z) {
            const std::int32_t height = columnHeight(x, z);
            const Biome biome = classifyBiome(x, z);
            fillColumn(result.store, x, z, height, biome);
            result.heights.setHeight(x, z, height);

            if (height < m_config.seaLevel) {
                for (std::int32_t y = std::max(height + 1, 1); y <= m_config.seaLevel; ++y) {
                    result.store.set(x, y, z, BlockKind::Water);
                }
                result.heights.setHeight(x, z, m_config.seaLevel);
                continue;
            }

            if (wantsTree(x, z, biome)) {
                treeSites.push_back(TreeSite{x, z, height});
            }
        }
    }

    for (const TreeSite& site : treeSites) {
        plantTree(result.store, site.x, site.z, site.groundHeight);
    }
    result.treeCount = treeSites.size();

    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
    TVX_LOGI("worldgen") << "generated radius=" << radius
                         << " seed=" << m_config.seed
                         << " blocks=" << result.store.size()
                         << " trees=" << result.treeCount
                         << " in " << elapsedMs << " ms";
    return result;
}

} // namespace terravox::world
