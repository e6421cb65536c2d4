// engine_digest.cpp - document digest and stats for VoxelEngine.

#include "isovoxel/engine.h"

using isovoxel::kDigestOffset;
using isovoxel::hashU32;

VoxelEngine::DocumentDigest VoxelEngine::getDocumentDigest() const noexcept {
    std::uint64_t h = kDigestOffset;

    h = hashU32(h, 0x4C58564Fu); // "OVXL" marker
    h = hashU32(h, kDigestVersion);
    h = hashU32(h, static_cast<std::uint32_t>(kGridSize));

    // Walk the grid directly so the digest does not allocate.
    h = hashU32(h, static_cast<std::uint32_t>(store_.size()));
    for (std::int32_t x = 0; x < kGridSize; ++x) {
        for (std::int32_t y = 0; y < kGridSize; ++y) {
            const auto v = store_.get(x, y);
            if (!v) continue;
            h = hashU32(h, static_cast<std::uint32_t>(cellKey(x, y)));
            h = hashU32(h, static_cast<std::uint32_t>(v->height));
            h = hashU32(h, (static_cast<std::uint32_t>(v->color.r) << 16)
                | (static_cast<std::uint32_t>(v->color.g) << 8)
                | static_cast<std::uint32_t>(v->color.b));
        }
    }

    DocumentDigest digest{};
    digest.lo = static_cast<std::uint32_t>(h & 0xFFFFFFFFull);
    digest.hi = static_cast<std::uint32_t>((h >> 32) & 0xFFFFFFFFull);
    return digest;
}

VoxelEngine::EngineStats VoxelEngine::getStats() const noexcept {
    EngineStats stats{};
    stats.generation = generation;
    stats.voxelCount = static_cast<std::uint32_t>(store_.size());
    stats.historyDepth = static_cast<std::uint32_t>(historyManager_.getHistorySize());
    stats.lastSceneFaceCount = lastSceneFaceCount;
    stats.lastComposeMs = lastComposeMs;
    stats.lastApplyMs = lastApplyMs;
    return stats;
}
