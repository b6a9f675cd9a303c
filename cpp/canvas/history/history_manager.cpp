#include "canvas/history/history_manager.h"

#include "canvas/core/logging.h"

#include <utility>

namespace canvas {

HistoryManager::HistoryManager(std::size_t maxDepth)
    : maxDepth_(maxDepth) {}

bool HistoryManager::execute(Command cmd) {
    if (!cmd.execute || !cmd.undo) {
        CANVAS_LOG_WARN("[history] rejected command '%s' without execute/undo", cmd.description.c_str());
        return false;
    }
    cmd.execute();
    undoStack_.push_back(std::move(cmd));
    redoStack_.clear();
    enforceDepth();
    generation_++;
    return true;
}

bool HistoryManager::undo() {
    if (undoStack_.empty()) return false;
    Command cmd = std::move(undoStack_.back());
    undoStack_.pop_back();
    cmd.undo();
    redoStack_.push_back(std::move(cmd));
    generation_++;
    return true;
}

bool HistoryManager::redo() {
    if (redoStack_.empty()) return false;
    Command cmd = std::move(redoStack_.back());
    redoStack_.pop_back();
    cmd.execute();
    undoStack_.push_back(std::move(cmd));
    generation_++;
    return true;
}

std::string HistoryManager::undoDescription() const {
    return undoStack_.empty() ? std::string() : undoStack_.back().description;
}

std::string HistoryManager::redoDescription() const {
    return redoStack_.empty() ? std::string() : redoStack_.back().description;
}

void HistoryManager::clear() {
    undoStack_.clear();
    redoStack_.clear();
    generation_++;
}

void HistoryManager::setMaxDepth(std::size_t maxDepth) {
    maxDepth_ = maxDepth;
    enforceDepth();
}

void HistoryManager::enforceDepth() {
    if (maxDepth_ == 0 || undoStack_.size() <= maxDepth_) return;
    const std::size_t excess = undoStack_.size() - maxDepth_;
    undoStack_.erase(undoStack_.begin(), undoStack_.begin() + static_cast<std::ptrdiff_t>(excess));
}

} // namespace canvas
