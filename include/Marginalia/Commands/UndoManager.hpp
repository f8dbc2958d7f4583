#pragma once
#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <Marginalia/Commands/Command.hpp>

namespace Marginalia {

struct UndoManagerOptions {
    size_t maxSize = 100;
    std::function<void(const CommandPtr&)> onExecute;
    std::function<void(const CommandPtr&)> onUndo;
    std::function<void(const CommandPtr&)> onRedo;
    std::function<void()> onStateChange;
};

struct UndoManagerState {
    bool canUndo = false;
    bool canRedo = false;
    std::optional<std::string> undoDescription;
    std::optional<std::string> redoDescription;
    size_t undoStackSize = 0;
    size_t redoStackSize = 0;
};

// Bounded undo/redo history. execute, undo and redo are mutually exclusive: calling one
// from inside a running command throws instead of corrupting the stacks.
class UndoManager {
public:
    explicit UndoManager(UndoManagerOptions options = {});

    // Runs the command, records it and drops the redo history. Oldest entries are evicted past maxSize.
    void execute(const CommandPtr& command);
    // false when there is nothing to undo. A command that throws goes back on its stack.
    bool undo();
    bool redo();

    bool canUndo() const { return !undoStack_.empty(); }
    bool canRedo() const { return !redoStack_.empty(); }
    std::optional<std::string> getUndoDescription() const;
    std::optional<std::string> getRedoDescription() const;

    void clear();
    UndoManagerState getState() const;

    size_t getUndoStackSize() const { return undoStack_.size(); }
    size_t getRedoStackSize() const { return redoStack_.size(); }
    // oldest first
    std::vector<CommandPtr> getUndoStack() const { return std::vector<CommandPtr>(undoStack_.begin(), undoStack_.end()); }
    std::vector<CommandPtr> getRedoStack() const { return redoStack_; }

    size_t undoMultiple(size_t count);
    size_t redoMultiple(size_t count);
    // Undoes until the next command to undo has the given type (which stays applied).
    size_t undoUntilType(const std::string& type);
    // Undoes everything down to and including the oldest command tagged with groupId.
    size_t undoGroup(const std::string& groupId);

    bool isInProgress() const { return isExecuting_; }
    void setOptions(UndoManagerOptions options);
    const UndoManagerOptions& options() const { return options_; }

private:
    std::deque<CommandPtr> undoStack_;
    std::vector<CommandPtr> redoStack_;
    UndoManagerOptions options_;
    bool isExecuting_ = false;

    void notifyStateChange();
};

} // namespace Marginalia
