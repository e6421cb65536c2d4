#include "isovoxel/history/history_manager.h"
#include "isovoxel/entity/voxel_store.h"
#include "isovoxel/core/logging.h"
#include "isovoxel/core/util.h"

HistoryManager::HistoryManager(VoxelStore& store)
    : store_(store) {}

void HistoryManager::clear() {
    history_.clear();
    index_ = -1;
    historyGeneration_++;
}

bool HistoryManager::canUndo() const noexcept {
    return index_ > 0;
}

bool HistoryManager::canRedo() const noexcept {
    return index_ < static_cast<std::int32_t>(history_.size()) - 1;
}

void HistoryManager::save() {
    if (suppressed_) return;
    HistoryEntry entry{};
    entry.snapshot.voxels = store_.voxels();
    entry.snapshot.timestampMs = isovoxel::nowMs();
    pushHistoryEntry(std::move(entry));
}

void HistoryManager::pushHistoryEntry(HistoryEntry&& entry) {
    const std::size_t keep = static_cast<std::size_t>(index_ + 1);
    if (keep < history_.size()) {
        history_.erase(history_.begin() + static_cast<std::ptrdiff_t>(keep), history_.end());
    }
    history_.push_back(std::move(entry));

    if (history_.size() > kMaxHistoryEntries) {
        history_.erase(history_.begin());
        ISOVOXEL_LOG_DEBUG("history: evicted oldest entry (cap %zu)", kMaxHistoryEntries);
    } else {
        index_++;
    }
    historyGeneration_++;
}

bool HistoryManager::undo() {
    if (index_ <= 0) return false;
    index_--;
    applyHistoryEntry(history_[static_cast<std::size_t>(index_)]);
    historyGeneration_++;
    return true;
}

bool HistoryManager::redo() {
    if (index_ >= static_cast<std::int32_t>(history_.size()) - 1) return false;
    index_++;
    applyHistoryEntry(history_[static_cast<std::size_t>(index_)]);
    historyGeneration_++;
    return true;
}

void HistoryManager::applyHistoryEntry(const HistoryEntry& entry) {
    const bool wasSuppressed = suppressed_;
    suppressed_ = true;
    store_.loadSnapshot(entry.snapshot.voxels);
    suppressed_ = wasSuppressed;
}

const HistoryEntry* HistoryManager::entryAt(std::size_t i) const noexcept {
    if (i >= history_.size()) return nullptr;
    return &history_[i];
}

isovoxel::protocol::HistoryMeta HistoryManager::getMeta() const noexcept {
    isovoxel::protocol::HistoryMeta meta{};
    meta.depth = static_cast<std::uint32_t>(history_.size());
    meta.cursor = index_;
    meta.generation = historyGeneration_;
    meta.canUndo = canUndo();
    meta.canRedo = canRedo();
    return meta;
}
