#pragma once

#include "isovoxel/core/util.h"
#include "isovoxel/core/types.h"

#include "isovoxel/entity/voxel_store.h"
#include "isovoxel/history/history_manager.h"
#include "isovoxel/protocol/protocol_types.h"
#include "isovoxel/render/scene_types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Everything a deferred render needs, captured synchronously. A Store copy
// plus the angle; safe to hand across an async boundary.
struct RenderInput {
    std::vector<Voxel> voxels;
    float lightingAngle;
};

/**
 * One editing session: the voxel store, its undo/redo history and the brush /
 * lighting editor state. Single-threaded; every call runs to completion.
 *
 * Mutations report failures through EngineError (also kept in lastError) and
 * leave the store and history untouched when they fail.
 */
class VoxelEngine {
    friend class VoxelEngineTestAccessor;
public:
    using DocumentDigest = isovoxel::protocol::DocumentDigest;
    using HistoryMeta = isovoxel::protocol::HistoryMeta;
    using EngineStats = isovoxel::protocol::EngineStats;

    static constexpr std::uint32_t kDigestVersion = 1;

    VoxelEngine();

    VoxelEngine(const VoxelEngine&) = delete;
    VoxelEngine& operator=(const VoxelEngine&) = delete;

    // Drops voxels, history and editor state back to defaults. Not undoable.
    void reset() noexcept;

    // ==============================================================================
    // Edits (each successful one records a history snapshot)
    // ==============================================================================
    EngineError upsertVoxel(std::int32_t x, std::int32_t y, std::int32_t height, std::string_view color);
    EngineError upsertVoxel(std::int32_t x, std::int32_t y, std::int32_t height, const Color& color);
    // Records history only when a voxel was actually removed.
    bool removeVoxel(std::int32_t x, std::int32_t y);
    // Always records, even on an already-empty store.
    void clear();
    // Upsert with the current brush color and height.
    EngineError paintCell(std::int32_t x, std::int32_t y);

    void undo();
    void redo();
    bool canUndo() const noexcept { return historyManager_.canUndo(); }
    bool canRedo() const noexcept { return historyManager_.canRedo(); }
    HistoryMeta getHistoryMeta() const noexcept { return historyManager_.getMeta(); }

    // ==============================================================================
    // Queries
    // ==============================================================================
    bool hasVoxel(std::int32_t x, std::int32_t y) const noexcept { return store_.has(x, y); }
    std::optional<Voxel> getVoxel(std::int32_t x, std::int32_t y) const noexcept { return store_.get(x, y); }
    std::size_t getVoxelCount() const noexcept { return store_.size(); }
    std::vector<Voxel> getVoxels() const { return store_.voxels(); }

    // ==============================================================================
    // Editor state
    // ==============================================================================
    EngineError setBrushColor(std::string_view color);
    void setBrushColor(const Color& color) noexcept { brushColor_ = color; }
    // 1-based palette slot (number-key shortcut).
    EngineError selectPaletteColor(std::uint32_t slot);
    EngineError setBrushHeight(std::int32_t height);
    void setLightingAngle(float degrees) noexcept;
    // Rotate by a signed step, result wrapped to [0, 360).
    void stepLightingAngle(float deltaDegrees) noexcept;
    // Keyboard height step; clamps to [kMinVoxelHeight, kMaxVoxelHeight] instead of failing.
    void stepBrushHeight(std::int32_t delta) noexcept;

    const Color& getBrushColor() const noexcept { return brushColor_; }
    std::int32_t getBrushHeight() const noexcept { return brushHeight_; }
    float getLightingAngle() const noexcept { return lightingAngle_; }

    // ==============================================================================
    // Rendering (pure reads)
    // ==============================================================================
    isovoxel::Scene renderScene(float lightingAngle) const;
    isovoxel::Scene renderScene() const { return renderScene(lightingAngle_); }
    std::string renderSvg(float lightingAngle, bool optimize) const;
    RenderInput captureRenderInput() const;

    // ==============================================================================
    // Diagnostics
    // ==============================================================================
    DocumentDigest getDocumentDigest() const noexcept;
    EngineStats getStats() const noexcept;
    EngineError getLastError() const noexcept { return lastError; }
    std::uint32_t getGeneration() const noexcept { return generation; }

private:
    VoxelStore store_;
    HistoryManager historyManager_;

    Color brushColor_{kDefaultBrushColor};
    std::int32_t brushHeight_{kDefaultBrushHeight};
    float lightingAngle_{kDefaultLightingAngle};

    std::uint32_t generation{0};
    float lastApplyMs{0.0f};
    mutable float lastComposeMs{0.0f};
    mutable std::uint32_t lastSceneFaceCount{0};

    // Error handling
    mutable EngineError lastError{EngineError::Ok};
    void clearError() const { lastError = EngineError::Ok; }
    void setError(EngineError err) const { lastError = err; }

    void commitEdit(double startMs);
};
