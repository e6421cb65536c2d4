#pragma once

#include "isovoxel/history/history_types.h"
#include "isovoxel/protocol/protocol_types.h"
#include <vector>
#include <cstdint>
#include <cstddef>

class VoxelStore;

// Linear, bounded, branch-discarding undo/redo over full store snapshots.
//
// index_ points at the snapshot matching the current store; -1 means nothing
// has been recorded yet. Invariant: -1 <= index_ < size().
class HistoryManager {
public:
    explicit HistoryManager(VoxelStore& store);

    bool canUndo() const noexcept;
    bool canRedo() const noexcept;

    // Record the current store. Drops any redo branch first; when the cap is
    // exceeded the oldest entry is evicted and index_ stays put.
    void save();

    // No-ops at either end.
    bool undo();
    bool redo();

    void clear();

    std::uint32_t getGeneration() const noexcept { return historyGeneration_; }
    void setSuppressed(bool suppressed) { suppressed_ = suppressed; }
    std::size_t getHistorySize() const noexcept { return history_.size(); }
    std::int32_t getIndex() const noexcept { return index_; }
    const HistoryEntry* entryAt(std::size_t i) const noexcept;
    isovoxel::protocol::HistoryMeta getMeta() const noexcept;

private:
    void pushHistoryEntry(HistoryEntry&& entry);
    void applyHistoryEntry(const HistoryEntry& entry);

    VoxelStore& store_;

    std::vector<HistoryEntry> history_;
    std::int32_t index_ = -1;
    std::uint32_t historyGeneration_ = 0;
    bool suppressed_ = false;
};
