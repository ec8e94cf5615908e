#pragma once

#include "core/grid3.h"
#include "world/block.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>

// World VoxelStore subsystem
// Responsible for: the sparse cell -> block kind map that is the single source of truth for the world.
// Should NOT do: validate coordinates, enforce gameplay policy (bedrock, placement), or derive render data.
namespace terravox::world {

class VoxelStore {
public:
    using Map = std::unordered_map<core::Cell3i, BlockKind, core::Cell3iHash>;
    using const_iterator = Map::const_iterator;

    // Absent cells are air; that is never an error.
    [[nodiscard]] std::optional<BlockKind> get(const core::Cell3i& cell) const;
    [[nodiscard]] std::optional<BlockKind> get(std::int32_t x, std::int32_t y, std::int32_t z) const;
    [[nodiscard]] bool contains(const core::Cell3i& cell) const;

    void set(const core::Cell3i& cell, BlockKind kind);
    void set(std::int32_t x, std::int32_t y, std::int32_t z, BlockKind kind);

    // Returns the kind that was removed, if any.
    std::optional<BlockKind> remove(const core::Cell3i& cell);
    std::optional<BlockKind> remove(std::int32_t x, std::int32_t y, std::int32_t z);

    void reserve(std::size_t count);

    [[nodiscard]] std::size_t size() const { return m_blocks.size(); }
    [[nodiscard]] bool empty() const { return m_blocks.empty(); }

    // Bumped by every mutation that changes content. Two reads with the same revision see the same world.
    [[nodiscard]] std::uint64_t revision() const { return m_revision; }

    [[nodiscard]] const_iterator begin() const { return m_blocks.begin(); }
    [[nodiscard]] const_iterator end() const { return m_blocks.end(); }

    // Content equality; revisions are history, not content.
    [[nodiscard]] bool operator==(const VoxelStore& rhs) const { return m_blocks == rhs.m_blocks; }

private:
    Map m_blocks;
    std::uint64_t m_revision = 0;
};

} // namespace terravox::world
