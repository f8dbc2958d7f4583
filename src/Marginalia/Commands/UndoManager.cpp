#include <Marginalia/Commands/UndoManager.hpp>
#include <stdexcept>
#include <plog/Log.h>

namespace Marginalia {

namespace {
// Clears the re-entrancy flag however the guarded call exits.
struct ExecutingGuard {
    bool& flag;
    explicit ExecutingGuard(bool& f) : flag(f) { flag = true; }
    ~ExecutingGuard(){ flag = false; }
};
}

UndoManager::UndoManager(UndoManagerOptions options) : options_(std::move(options)) {}

void UndoManager::notifyStateChange(){
    if(options_.onStateChange) options_.onStateChange();
}

void UndoManager::execute(const CommandPtr& command){
    if(isExecuting_) throw std::logic_error("Cannot execute while another command is executing");
    {
        ExecutingGuard guard(isExecuting_);
        command->execute();
        undoStack_.push_back(command);
        redoStack_.clear();
        while(undoStack_.size() > options_.maxSize){
            PLOGD << "[Undo] evicting oldest command: " << undoStack_.front()->description();
            undoStack_.pop_front();
        }
    }
    PLOGI << "[Undo] executed " << command->description();
    if(options_.onExecute) options_.onExecute(command);
    notifyStateChange();
}

bool UndoManager::undo(){
    if(isExecuting_) throw std::logic_error("Cannot undo while another command is executing");
    if(undoStack_.empty()) return false;
    CommandPtr command = undoStack_.back();
    undoStack_.pop_back();
    {
        ExecutingGuard guard(isExecuting_);
        try {
            command->undo();
        } catch(const std::exception& e){
            PLOGE << "[Undo] undo failed for " << command->description() << ": " << e.what();
            undoStack_.push_back(command);
            throw;
        }
        redoStack_.push_back(command);
    }
    PLOGI << "[Undo] undid " << command->description();
    if(options_.onUndo) options_.onUndo(command);
    notifyStateChange();
    return true;
}

bool UndoManager::redo(){
    if(isExecuting_) throw std::logic_error("Cannot redo while another command is executing");
    if(redoStack_.empty()) return false;
    CommandPtr command = redoStack_.back();
    redoStack_.pop_back();
    {
        ExecutingGuard guard(isExecuting_);
        try {
            command->execute();
        } catch(const std::exception& e){
            PLOGE << "[Undo] redo failed for " << command->description() << ": " << e.what();
            redoStack_.push_back(command);
            throw;
        }
        undoStack_.push_back(command);
    }
    PLOGI << "[Undo] redid " << command->description();
    if(options_.onRedo) options_.onRedo(command);
    notifyStateChange();
    return true;
}

std::optional<std::string> UndoManager::getUndoDescription() const {
    if(undoStack_.empty()) return std::nullopt;
    return undoStack_.back()->description();
}

std::optional<std::string> UndoManager::getRedoDescription() const {
    if(redoStack_.empty()) return std::nullopt;
    return redoStack_.back()->description();
}

void UndoManager::clear(){
    undoStack_.clear();
    redoStack_.clear();
    notifyStateChange();
}

UndoManagerState UndoManager::getState() const {
    UndoManagerState s;
    s.canUndo = canUndo();
    s.canRedo = canRedo();
    s.undoDescription = getUndoDescription();
    s.redoDescription = getRedoDescription();
    s.undoStackSize = undoStack_.size();
    s.redoStackSize = redoStack_.size();
    return s;
}

size_t UndoManager::undoMultiple(size_t count){
    size_t undone = 0;
    for(size_t i = 0; i < count && undo(); ++i) ++undone;
    return undone;
}

size_t UndoManager::redoMultiple(size_t count){
    size_t redone = 0;
    for(size_t i = 0; i < count && redo(); ++i) ++redone;
    return redone;
}

size_t UndoManager::undoUntilType(const std::string& type){
    size_t undone = 0;
    while(canUndo() && undoStack_.back()->type() != type){
        undo();
        ++undone;
    }
    return undone;
}

size_t UndoManager::undoGroup(const std::string& groupId){
    // deepest tagged position decides how far to unwind
    size_t depth = 0;
    for(size_t i = 0; i < undoStack_.size(); ++i){
        auto g = undoStack_[i]->groupId();
        if(g && *g == groupId){ depth = undoStack_.size() - i; break; }
    }
    return undoMultiple(depth);
}

void UndoManager::setOptions(UndoManagerOptions options){
    options_ = std::move(options);
    while(undoStack_.size() > options_.maxSize) undoStack_.pop_front();
}

} // namespace Marginalia
