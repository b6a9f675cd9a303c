#pragma once

#include "canvas/history/history_types.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace canvas {

// Linear undo/redo history. A newly executed command discards the redo branch.
class HistoryManager {
public:
    // maxDepth == 0 keeps every entry; otherwise the oldest undo entries are dropped.
    explicit HistoryManager(std::size_t maxDepth = 0);

    // Runs cmd.execute() and records it. Commands without both closures are rejected.
    bool execute(Command cmd);

    // No-ops (returning false) when the respective stack is empty.
    bool undo();
    bool redo();

    bool canUndo() const noexcept { return !undoStack_.empty(); }
    bool canRedo() const noexcept { return !redoStack_.empty(); }

    // Empty when nothing to undo/redo.
    std::string undoDescription() const;
    std::string redoDescription() const;

    void clear();

    void setMaxDepth(std::size_t maxDepth);
    std::size_t getMaxDepth() const noexcept { return maxDepth_; }
    std::size_t getUndoSize() const noexcept { return undoStack_.size(); }
    std::size_t getRedoSize() const noexcept { return redoStack_.size(); }
    std::uint32_t getGeneration() const noexcept { return generation_; }

private:
    void enforceDepth();

    std::vector<Command> undoStack_;
    std::vector<Command> redoStack_;
    std::size_t maxDepth_ = 0;
    std::uint32_t generation_ = 0;
};

} // namespace canvas
