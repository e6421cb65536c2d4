#pragma once

#include "isovoxel/core/types.h"
#include <vector>

// Full copy of the voxel store at one point in the edit history.
struct VoxelSnapshot {
    std::vector<Voxel> voxels; // ascending cellKey order
    double timestampMs = 0.0;
};

// A single entry in the undo/redo stack
struct HistoryEntry {
    VoxelSnapshot snapshot;
};
