#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "core/noise_field.h"
#include "world/voxel_store.h"

// World TerrainGenerator subsystem
// Responsible for: building the initial voxel set (terrain columns, water, trees) from seeded noise.
// Should NOT do: mutate the world after generation, spawn the player, or derive render batches.
namespace terravox::world {

struct TerrainConfig {
    std::uint64_t seed = 1337;
    // Columns x, z in [-worldRadius, worldRadius).
    std::int32_t worldRadius = 64;
    std::int32_t seaLevel = 5;

    double elevationFrequency = 0.015;
    core::FbmParams elevationFbm{4, 2.0, 0.5};
    double elevationAmplitude = 6.0;
    double baseHeight = 8.0;

    double mountainFrequency = 0.0075;
    double mountainOffset = 100.0;
    core::FbmParams mountainFbm{3, 2.0, 0.6};
    double mountainAmplitude = 8.0;

    double biomeFrequency = 0.008;
    double biomeOffset = 500.0;
    float desertThreshold = -0.25f;
    float forestThreshold = 0.2f;

    double featureFrequency = 0.5;
    double featureOffset = 1000.0;
    float forestTreeThreshold = 0.7f;
    float plainsTreeThreshold = 0.88f;

    std::int32_t dirtDepth = 3;

    double trunkNoiseScale = 7.3;
    std::int32_t trunkBaseHeight = 4;
    std::int32_t trunkHeightVariance = 3;
    std::int32_t leafRadius = 2;
};

enum class Biome : std::uint8_t {
    Desert = 0,
    Plains = 1,
    Forest = 2
};

std::string_view biomeName(Biome biome);

// Dense per-column surface heights over the generated square.
class HeightMap {
public:
    HeightMap() = default;
    explicit HeightMap(std::int32_t radius);

    [[nodiscard]] std::optional<std::int32_t> heightAt(std::int32_t x, std::int32_t z) const;
    void setHeight(std::int32_t x, std::int32_t z, std::int32_t height);

    [[nodiscard]] std::int32_t radius() const { return m_radius; }
    [[nodiscard]] std::size_t columnCount() const { return m_heights.size(); }

    bool operator==(const HeightMap&) const = default;

private:
    [[nodiscard]] bool inBounds(std::int32_t x, std::int32_t z) const;
    [[nodiscard]] std::size_t linearIndex(std::int32_t x, std::int32_t z) const;

    std::int32_t m_radius = 0;
    std::vector<std::int32_t> m_heights;
};

struct GeneratedWorld {
    VoxelStore store;
    HeightMap heights;
    std::size_t treeCount = 0;
};

class TerrainGenerator {
public:
    explicit TerrainGenerator(const TerrainConfig& config);

    [[nodiscard]] GeneratedWorld generate() const;
    [[nodiscard]] GeneratedWorld generate(std::int32_t worldRadius) const;

    // Raw terrain height of a column, before water levelling.
    [[nodiscard]] std::int32_t columnHeight(std::int32_t x, std::int32_t z) const;
    [[nodiscard]] Biome classifyBiome(std::int32_t x, std::int32_t z) const;
    [[nodiscard]] bool wantsTree(std::int32_t x, std::int32_t z, Biome biome) const;
    [[nodiscard]] std::int32_t trunkHeight(std::int32_t x, std::int32_t z) const;

    // Trunk from groundHeight + 1 upward, then a leaf ball around the trunk top that never replaces wood.
    void plantTree(VoxelStore& store, std::int32_t x, std::int32_t z, std::int32_t groundHeight) const;

    [[nodiscard]] const TerrainConfig& config() const { return m_config; }
    [[nodiscard]] const core::NoiseField& elevationNoise() const { return m_elevation; }
    [[nodiscard]] const core::NoiseField& biomeNoise() const { return m_biome; }
    [[nodiscard]] const core::NoiseField& featureNoise() const { return m_feature; }

private:
    struct TreeSite {
        std::int32_t x = 0;
        std::int32_t z = 0;
        std::int32_t groundHeight = 0;
    };

    void fillColumn(VoxelStore& store, std::int32_t x, std::int32_t z, std::int32_t height, Biome biome) const;

    TerrainConfig m_config;
    core::NoiseField m_elevation;
    core::NoiseField m_biome;
    core::NoiseField m_feature;
};

} // namespace terravox::world
