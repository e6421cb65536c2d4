// engine_edit.cpp - voxel edit operations and undo/redo for VoxelEngine.

#include "isovoxel/engine.h"
#include "isovoxel/color/color_math.h"
#include "isovoxel/core/logging.h"

void VoxelEngine::commitEdit(double startMs) {
    historyManager_.save();
    generation++;
    lastApplyMs = static_cast<float>(isovoxel::nowMs() - startMs);
}

EngineError VoxelEngine::upsertVoxel(std::int32_t x, std::int32_t y, std::int32_t height, std::string_view color) {
    clearError();
    Color parsed{};
    // Coordinate and height are reported before a malformed color.
    if (isCellInGrid(x, y) && isValidHeight(height)) {
        const EngineError err = isovoxel::parseColor(color, parsed);
        if (err != EngineError::Ok) {
            ISOVOXEL_LOG_WARN("upsertVoxel(%d,%d): invalid color '%.*s'", x, y, static_cast<int>(color.size()), color.data());
            setError(err);
            return err;
        }
    }
    return upsertVoxel(x, y, height, parsed);
}

EngineError VoxelEngine::upsertVoxel(std::int32_t x, std::int32_t y, std::int32_t height, const Color& color) {
    clearError();
    const double t0 = isovoxel::nowMs();
    const EngineError err = store_.upsert(x, y, height, color);
    if (err != EngineError::Ok) {
        ISOVOXEL_LOG_WARN("upsertVoxel(%d,%d,h=%d) rejected: err=%u", x, y, height, static_cast<unsigned>(err));
        setError(err);
        return err;
    }
    commitEdit(t0);
    return EngineError::Ok;
}

EngineError VoxelEngine::paintCell(std::int32_t x, std::int32_t y) {
    return upsertVoxel(x, y, brushHeight_, brushColor_);
}

bool VoxelEngine::removeVoxel(std::int32_t x, std::int32_t y) {
    clearError();
    const double t0 = isovoxel::nowMs();
    if (!store_.remove(x, y)) return false;
    commitEdit(t0);
    return true;
}

void VoxelEngine::clear() {
    clearError();
    const double t0 = isovoxel::nowMs();
    store_.clear();
    commitEdit(t0);
}

void VoxelEngine::undo() {
    clearError();
    if (historyManager_.undo()) generation++;
}

void VoxelEngine::redo() {
    clearError();
    if (historyManager_.redo()) generation++;
}
