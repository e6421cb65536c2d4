// engine.cpp holds construction and editor state; edits, rendering and
// diagnostics live under isovoxel/impl/.
#include "isovoxel/engine.h"
#include "isovoxel/color/color_math.h"
#include "isovoxel/color/palette.h"
#include "isovoxel/render/face_generator.h"
#include "isovoxel/core/logging.h"

#include <algorithm>

VoxelEngine::VoxelEngine()
    : historyManager_(store_)
{
    lastError = EngineError::Ok;
}

void VoxelEngine::reset() noexcept {
    store_.clear();
    historyManager_.clear();
    brushColor_ = kDefaultBrushColor;
    brushHeight_ = kDefaultBrushHeight;
    lightingAngle_ = kDefaultLightingAngle;
    lastError = EngineError::Ok;
    generation++;
}

EngineError VoxelEngine::setBrushColor(std::string_view color) {
    clearError();
    Color parsed{};
    const EngineError err = isovoxel::parseColor(color, parsed);
    if (err != EngineError::Ok) {
        ISOVOXEL_LOG_WARN("setBrushColor: rejected '%.*s'", static_cast<int>(color.size()), color.data());
        setError(err);
        return err;
    }
    brushColor_ = parsed;
    return EngineError::Ok;
}

EngineError VoxelEngine::selectPaletteColor(std::uint32_t slot) {
    clearError();
    Color c{};
    const EngineError err = isovoxel::paletteColor(slot, c);
    if (err != EngineError::Ok) {
        setError(err);
        return err;
    }
    brushColor_ = c;
    return EngineError::Ok;
}

EngineError VoxelEngine::setBrushHeight(std::int32_t height) {
    clearError();
    if (!isValidHeight(height)) {
        ISOVOXEL_LOG_WARN("setBrushHeight: %d outside [%d,%d]", height, kMinVoxelHeight, kMaxVoxelHeight);
        setError(EngineError::InvalidHeight);
        return EngineError::InvalidHeight;
    }
    brushHeight_ = height;
    return EngineError::Ok;
}

void VoxelEngine::setLightingAngle(float degrees) noexcept {
    lightingAngle_ = isovoxel::wrapAngleDegrees(degrees);
}

void VoxelEngine::stepLightingAngle(float deltaDegrees) noexcept {
    lightingAngle_ = isovoxel::wrapAngleDegrees(lightingAngle_ + deltaDegrees);
}

void VoxelEngine::stepBrushHeight(std::int32_t delta) noexcept {
    const std::int64_t next = static_cast<std::int64_t>(brushHeight_) + delta;
    brushHeight_ = static_cast<std::int32_t>(std::clamp<std::int64_t>(next, kMinVoxelHeight, kMaxVoxelHeight));
}
