#pragma once

#include "isovoxel/core/types.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

// Dense per-cell voxel storage, one slot per grid cell addressed by cellKey(x, y).
class VoxelStore {
public:
    VoxelStore();

    void clear() noexcept;

    // Validation order: coordinate, height, color. On failure nothing is written.
    EngineError upsert(std::int32_t x, std::int32_t y, std::int32_t height, const Color& color) noexcept;
    EngineError upsert(std::int32_t x, std::int32_t y, std::int32_t height, std::string_view hexColor) noexcept;

    // Returns true if a voxel was present. Out-of-grid cells are never present.
    bool remove(std::int32_t x, std::int32_t y) noexcept;

    bool has(std::int32_t x, std::int32_t y) const noexcept;
    std::optional<Voxel> get(std::int32_t x, std::int32_t y) const noexcept;

    std::size_t size() const noexcept { return count_; }
    bool empty() const noexcept { return count_ == 0; }

    // All voxels in ascending cellKey order.
    std::vector<Voxel> voxels() const;

    // Replace the whole content. Entries outside the grid or with invalid height are skipped.
    void loadSnapshot(const std::vector<Voxel>& voxels) noexcept;

    bool operator==(const VoxelStore& other) const noexcept;
    bool operator!=(const VoxelStore& other) const noexcept { return !(*this == other); }

private:
    struct Slot {
        bool occupied;
        Voxel voxel;
    };

    std::array<Slot, kGridCellCount> slots_;
    std::size_t count_ = 0;
};
