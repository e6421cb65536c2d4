#include "isovoxel/interaction/interaction_session.h"
#include "isovoxel/engine.h"
#include "isovoxel/core/logging.h"

InteractionSession::InteractionSession(VoxelEngine& engine)
    : engine_(engine) {}

EngineError InteractionSession::beginStroke(StrokeMode mode, std::int32_t x, std::int32_t y) {
    stroke_ = StrokeState{};
    if (mode == StrokeMode::None) return EngineError::InvalidOperation;
    stroke_.mode = mode;
    return applyCell(x, y);
}

EngineError InteractionSession::continueStroke(std::int32_t x, std::int32_t y) {
    if (stroke_.mode == StrokeMode::None) return EngineError::Ok;
    if (stroke_.hasLastCell && stroke_.lastX == x && stroke_.lastY == y) return EngineError::Ok;
    return applyCell(x, y);
}

void InteractionSession::endStroke() noexcept {
    if (stroke_.mode != StrokeMode::None) {
        ISOVOXEL_LOG_DEBUG("stroke ended after %u cells", stroke_.appliedCount);
    }
    stroke_ = StrokeState{};
}

EngineError InteractionSession::applyCell(std::int32_t x, std::int32_t y) {
    // Pointer can leave the grid mid-drag; the stroke stays alive.
    if (!isCellInGrid(x, y)) return EngineError::InvalidCoordinate;

    EngineError err = EngineError::Ok;
    switch (stroke_.mode) {
        case StrokeMode::Paint:
            err = engine_.paintCell(x, y);
            break;
        case StrokeMode::Erase:
            engine_.removeVoxel(x, y);
            break;
        case StrokeMode::None:
            return EngineError::InvalidOperation;
    }
    if (err != EngineError::Ok) return err;

    stroke_.hasLastCell = true;
    stroke_.lastX = x;
    stroke_.lastY = y;
    stroke_.appliedCount++;
    return EngineError::Ok;
}
