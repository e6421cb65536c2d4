#pragma once

#include "isovoxel/interaction/interaction_types.h"
#include "isovoxel/core/types.h"
#include <cstdint>

class VoxelEngine;

// Drag-paint session. Owned by the input surface, one per pointer; the engine
// never reads pointer state itself.
//
// Each cell the stroke enters is applied as its own edit (and history step).
// Revisiting the cell the stroke is currently on does nothing.
class InteractionSession {
public:
    explicit InteractionSession(VoxelEngine& engine);

    // ==============================================================================
    // State Query
    // ==============================================================================
    bool isStrokeActive() const noexcept { return stroke_.mode != StrokeMode::None; }
    StrokeMode getMode() const noexcept { return stroke_.mode; }
    bool hasLastCell() const noexcept { return stroke_.hasLastCell; }
    std::int32_t getLastCellX() const noexcept { return stroke_.lastX; }
    std::int32_t getLastCellY() const noexcept { return stroke_.lastY; }
    std::uint32_t getAppliedCellCount() const noexcept { return stroke_.appliedCount; }

    // ==============================================================================
    // Stroke API
    // ==============================================================================
    // Starts a stroke and applies it to the first cell. Replaces any active stroke.
    EngineError beginStroke(StrokeMode mode, std::int32_t x, std::int32_t y);
    // No-op (Ok) without an active stroke or when (x, y) is the last visited cell.
    EngineError continueStroke(std::int32_t x, std::int32_t y);
    void endStroke() noexcept;

private:
    VoxelEngine& engine_;

    struct StrokeState {
        StrokeMode mode = StrokeMode::None;
        bool hasLastCell = false;
        std::int32_t lastX = 0;
        std::int32_t lastY = 0;
        std::uint32_t appliedCount = 0;
    };

    StrokeState stroke_;

    EngineError applyCell(std::int32_t x, std::int32_t y);
};
