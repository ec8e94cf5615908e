#pragma once

#include <array>
#include <cmath>
#include <compare>
#include <cstddef>
#include <cstdint>

#include "math/math.h"

// Core Grid subsystem
// Responsible for: defining deterministic integer-grid primitives shared by world and simulation code.
// Should NOT do: own voxel storage, apply gameplay rules, or know about block kinds.
namespace terravox::core {

struct Cell3i {
    std::int32_t x = 0;
    std::int32_t y = 0;
    std::int32_t z = 0;

    constexpr Cell3i() = default;
    constexpr Cell3i(std::int32_t xIn, std::int32_t yIn, std::int32_t zIn) : x(xIn), y(yIn), z(zIn) {}

    constexpr bool operator==(const Cell3i&) const = default;

    // Total order: y-major, then z, then x. Sorted cell lists walk the world layer by layer.
    constexpr std::strong_ordering operator<=>(const Cell3i& rhs) const {
        if (const auto cmp = y <=> rhs.y; cmp != 0) {
            return cmp;
        }
        if (const auto cmp = z <=> rhs.z; cmp != 0) {
            return cmp;
        }
        return x <=> rhs.x;
    }

    constexpr Cell3i operator+(const Cell3i& rhs) const {
        return Cell3i{x + rhs.x, y + rhs.y, z + rhs.z};
    }

    constexpr Cell3i operator-(const Cell3i& rhs) const {
        return Cell3i{x - rhs.x, y - rhs.y, z - rhs.z};
    }

    constexpr Cell3i operator-() const {
        return Cell3i{-x, -y, -z};
    }

    constexpr Cell3i& operator+=(const Cell3i& rhs) {
        x += rhs.x;
        y += rhs.y;
        z += rhs.z;
        return *this;
    }
};

struct Cell3iHash {
    std::size_t operator()(const Cell3i& cell) const noexcept {
        std::uint64_t h = 0xcbf29ce484222325ULL;
        h ^= static_cast<std::uint32_t>(cell.x) * 0x8da6b343u;
        h = (h << 21u) | (h >> 43u);
        h ^= static_cast<std::uint32_t>(cell.y) * 0xd8163841u;
        h = (h << 21u) | (h >> 43u);
        h ^= static_cast<std::uint32_t>(cell.z) * 0xcb1ab31fu;
        h ^= (h >> 29u);
        h *= 0xbf58476d1ce4e5b9ULL;
        h ^= (h >> 32u);
        return static_cast<std::size_t>(h);
    }
};

// Nearest lattice point for a world coordinate. Voxel (x, y, z) spans [x - 0.5, x + 0.5) on each axis.
inline std::int32_t roundToCell(float value) {
    return static_cast<std::int32_t>(std::floor(value + 0.5f));
}

inline Cell3i cellAt(const math::Vector3& point) {
    return Cell3i{roundToCell(point.x), roundToCell(point.y), roundToCell(point.z)};
}

inline constexpr math::Vector3 toVector3(const Cell3i& cell) {
    return math::Vector3{static_cast<float>(cell.x), static_cast<float>(cell.y), static_cast<float>(cell.z)};
}

struct CellAabb {
    Cell3i minInclusive{};
    Cell3i maxExclusive{};
    bool valid = false;

    constexpr bool empty() const {
        if (!valid) {
            return true;
        }
        return maxExclusive.x <= minInclusive.x ||
               maxExclusive.y <= minInclusive.y ||
               maxExclusive.z <= minInclusive.z;
    }

    constexpr bool contains(const Cell3i& cell) const {
        if (!valid || empty()) {
            return false;
        }
        return cell.x >= minInclusive.x && cell.x < maxExclusive.x &&
               cell.y >= minInclusive.y && cell.y < maxExclusive.y &&
               cell.z >= minInclusive.z && cell.z < maxExclusive.z;
    }

    constexpr void includeCell(const Cell3i& cell) {
        if (!valid) {
            minInclusive = cell;
            maxExclusive = cell + Cell3i{1, 1, 1};
            valid = true;
            return;
        }

        if (cell.x < minInclusive.x) minInclusive.x = cell.x;
        if (cell.y < minInclusive.y) minInclusive.y = cell.y;
        if (cell.z < minInclusive.z) minInclusive.z = cell.z;

        const Cell3i cellMax = cell + Cell3i{1, 1, 1};
        if (cellMax.x > maxExclusive.x) maxExclusive.x = cellMax.x;
        if (cellMax.y > maxExclusive.y) maxExclusive.y = cellMax.y;
        if (cellMax.z > maxExclusive.z) maxExclusive.z = cellMax.z;
    }
};

enum class Dir6 : std::uint8_t {
    PosX = 0,
    NegX = 1,
    PosY = 2,
    NegY = 3,
    PosZ = 4,
    NegZ = 5
};

inline constexpr std::array<Dir6, 6> kAllDir6 = {
    Dir6::PosX,
    Dir6::NegX,
    Dir6::PosY,
    Dir6::NegY,
    Dir6::PosZ,
    Dir6::NegZ
};

inline constexpr Cell3i dirToOffset(Dir6 dir) {
    switch (dir) {
    case Dir6::PosX: return Cell3i{1, 0, 0};
    case Dir6::NegX: return Cell3i{-1, 0, 0};
    case Dir6::PosY: return Cell3i{0, 1, 0};
    case Dir6::NegY: return Cell3i{0, -1, 0};
    case Dir6::PosZ: return Cell3i{0, 0, 1};
    case Dir6::NegZ: return Cell3i{0, 0, -1};
    }
    return Cell3i{0, 0, 0};
}

inline constexpr Cell3i neighborCell(const Cell3i& cell, Dir6 dir) {
    return cell + dirToOffset(dir);
}

} // namespace terravox::core
