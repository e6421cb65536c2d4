#include "isovoxel/entity/voxel_store.h"
#include "isovoxel/color/color_math.h"
#include "isovoxel/core/logging.h"

VoxelStore::VoxelStore() {
    clear();
}

void VoxelStore::clear() noexcept {
    for (auto& slot : slots_) {
        slot.occupied = false;
        slot.voxel = Voxel{0, 0, 0, Color{0, 0, 0}};
    }
    count_ = 0;
}

EngineError VoxelStore::upsert(std::int32_t x, std::int32_t y, std::int32_t height, const Color& color) noexcept {
    if (!isCellInGrid(x, y)) return EngineError::InvalidCoordinate;
    if (!isValidHeight(height)) return EngineError::InvalidHeight;

    Slot& slot = slots_[cellKey(x, y)];
    if (!slot.occupied) {
        slot.occupied = true;
        count_++;
    }
    slot.voxel = Voxel{x, y, height, color};
    return EngineError::Ok;
}

EngineError VoxelStore::upsert(std::int32_t x, std::int32_t y, std::int32_t height, std::string_view hexColor) noexcept {
    if (!isCellInGrid(x, y)) return EngineError::InvalidCoordinate;
    if (!isValidHeight(height)) return EngineError::InvalidHeight;
    Color color{};
    const EngineError err = isovoxel::parseColor(hexColor, color);
    if (err != EngineError::Ok) return err;
    return upsert(x, y, height, color);
}

bool VoxelStore::remove(std::int32_t x, std::int32_t y) noexcept {
    if (!isCellInGrid(x, y)) return false;
    Slot& slot = slots_[cellKey(x, y)];
    if (!slot.occupied) return false;
    slot.occupied = false;
    count_--;
    return true;
}

bool VoxelStore::has(std::int32_t x, std::int32_t y) const noexcept {
    if (!isCellInGrid(x, y)) return false;
    return slots_[cellKey(x, y)].occupied;
}

std::optional<Voxel> VoxelStore::get(std::int32_t x, std::int32_t y) const noexcept {
    if (!isCellInGrid(x, y)) return std::nullopt;
    const Slot& slot = slots_[cellKey(x, y)];
    if (!slot.occupied) return std::nullopt;
    return slot.voxel;
}

std::vector<Voxel> VoxelStore::voxels() const {
    std::vector<Voxel> out;
    out.reserve(count_);
    for (const auto& slot : slots_) {
        if (slot.occupied) out.push_back(slot.voxel);
    }
    return out;
}

void VoxelStore::loadSnapshot(const std::vector<Voxel>& voxels) noexcept {
    clear();
    for (const Voxel& v : voxels) {
        const EngineError err = upsert(v.x, v.y, v.height, v.color);
        if (err != EngineError::Ok) {
            ISOVOXEL_LOG_WARN("loadSnapshot: dropped voxel (%d,%d) h=%d err=%u",
                v.x, v.y, v.height, static_cast<unsigned>(err));
        }
    }
}

bool VoxelStore::operator==(const VoxelStore& other) const noexcept {
    if (count_ != other.count_) return false;
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        const Slot& a = slots_[i];
        const Slot& b = other.slots_[i];
        if (a.occupied != b.occupied) return false;
        if (a.occupied && a.voxel != b.voxel) return false;
    }
    return true;
}
