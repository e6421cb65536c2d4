#pragma once

#include "isovoxel/engine.h"

class VoxelEngineTestAccessor {
public:
    static const VoxelStore& store(const VoxelEngine& engine) {
        return engine.store_;
    }

    static const HistoryManager& history(const VoxelEngine& engine) {
        return engine.historyManager_;
    }

    static EngineError lastError(const VoxelEngine& engine) {
        return engine.lastError;
    }

    static float lastApplyMs(const VoxelEngine& engine) {
        return engine.lastApplyMs;
    }
};
