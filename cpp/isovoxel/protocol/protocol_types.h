#pragma once

#include <cstdint>

namespace isovoxel::protocol {

// =============================================================================
// Document Digest
// =============================================================================

struct DocumentDigest {
    std::uint32_t lo;
    std::uint32_t hi;
};

// =============================================================================
// History Metadata
// =============================================================================

struct HistoryMeta {
    std::uint32_t depth;
    std::int32_t cursor; // -1 when nothing has been recorded
    std::uint32_t generation;
    bool canUndo;
    bool canRedo;
};

// =============================================================================
// Engine Stats
// =============================================================================

struct EngineStats {
    std::uint32_t generation;
    std::uint32_t voxelCount;
    std::uint32_t historyDepth;
    std::uint32_t lastSceneFaceCount;
    float lastComposeMs;
    float lastApplyMs;
};

} // namespace isovoxel::protocol
