#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

// World Block subsystem
// Responsible for: the closed set of block kinds and their per-kind properties.
// Should NOT do: store blocks, decide gameplay policy, or hold render materials.
namespace terravox::world {

enum class BlockKind : std::uint8_t {
    Grass = 0,
    Dirt = 1,
    Stone = 2,
    Wood = 3,
    Leaves = 4,
    Sand = 5,
    Glass = 6,
    Water = 7,
    Bedrock = 8
};

inline constexpr std::size_t kBlockKindCount = 9;

inline constexpr std::array<BlockKind, kBlockKindCount> kAllBlockKinds = {
    BlockKind::Grass,
    BlockKind::Dirt,
    BlockKind::Stone,
    BlockKind::Wood,
    BlockKind::Leaves,
    BlockKind::Sand,
    BlockKind::Glass,
    BlockKind::Water,
    BlockKind::Bedrock
};

inline constexpr std::size_t blockKindIndex(BlockKind kind) {
    return static_cast<std::size_t>(kind);
}

// Translucent kinds let the faces of their neighbors show through.
inline constexpr bool occludesNeighbors(BlockKind kind) {
    switch (kind) {
    case BlockKind::Glass:
    case BlockKind::Water:
    case BlockKind::Leaves:
        return false;
    default:
        return true;
    }
}

// Water can be looked and walked through; everything else stops rays and bodies.
inline constexpr bool isSolid(BlockKind kind) {
    return kind != BlockKind::Water;
}

inline constexpr bool isSolid(std::optional<BlockKind> kind) {
    return kind.has_value() && isSolid(*kind);
}

inline constexpr std::string_view blockKindName(BlockKind kind) {
    switch (kind) {
    case BlockKind::Grass:
        return "grass";
    case BlockKind::Dirt:
        return "dirt";
    case BlockKind::Stone:
        return "stone";
    case BlockKind::Wood:
        return "wood";
    case BlockKind::Leaves:
        return "leaves";
    case BlockKind::Sand:
        return "sand";
    case BlockKind::Glass:
        return "glass";
    case BlockKind::Water:
        return "water";
    case BlockKind::Bedrock:
        return "bedrock";
    }
    return "unknown";
}

} // namespace terravox::world
