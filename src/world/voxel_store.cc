#include "world/voxel_store.h"

namespace terravox::world {

std::optional<BlockKind> VoxelStore::get(const core::Cell3i& cell) const {
    const auto it = m_blocks.find(cell);
    if (it == m_blocks.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<BlockKind> VoxelStore::get(std::int32_t x, std::int32_t y, std::int32_t z) const {
    return get(core::Cell3i{x, y, z});
}

bool VoxelStore::contains(const core::Cell3i& cell) const {
    return m_blocks.find(cell) != m_blocks.end();
}

void VoxelStore::set(const core::Cell3i& cell, BlockKind kind) {
    const auto [it, inserted] = m_blocks.try_emplace(cell, kind);
    if (!inserted) {
        if (it->second == kind) {
            return;
        }
        it->second = kind;
    }
    ++m_revision;
}

void VoxelStore::set(std::int32_t x, std::int32_t y, std::int32_t z, BlockKind kind) {
    set(core::Cell3i{x, y, z}, kind);
}

std::optional<BlockKind> VoxelStore::remove(const core::Cell3i& cell) {
    const auto it = m_blocks.find(cell);
    if (it == m_blocks.end()) {
        return std::nullopt;
    }
    const BlockKind removed = it->second;
    m_blocks.erase(it);
    ++m_revision;
    return removed;
}

std::optional<BlockKind> VoxelStore::remove(std::int32_t x, std::int32_t y, std::int32_t z) {
    return remove(core::Cell3i{x, y, z});
}

void VoxelStore::reserve(std::size_t count) {
    m_blocks.reserve(count);
}

} // namespace terravox::world
