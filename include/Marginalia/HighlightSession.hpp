#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <Marginalia/Commands/Command.hpp>
#include <Marginalia/Commands/UndoManager.hpp>
#include <Marginalia/EngineConfig.hpp>
#include <Marginalia/HighlightManagerStateMachine.hpp>
#include <Marginalia/SuggestionStore.hpp>
#include <Marginalia/Tools/ToolExecutor.hpp>
#include <Marginalia/Types.hpp>

namespace Marginalia {

struct HighlightSessionOptions {
    size_t maxUndoSize = 100;
    OverlapStrategy overlapStrategy = OverlapStrategy::KeepFirst;
    std::function<void(ManagerState)> onStateChange;
    std::function<void(const std::vector<SuggestionHighlight>&)> onSuggestionsChange;
    // Receives every side effect after the session has acted on it.
    std::function<void(const SideEffect&)> onSideEffect;

    static HighlightSessionOptions fromConfig(const EngineConfig& config);
};

// One review over one document: drives the manager state machine, owns the suggestion
// store and the undo history, and reaches the document only through the accessors.
class HighlightSession {
public:
    HighlightSession(DocumentGetter getDocument, DocumentUpdater setDocument, HighlightSessionOptions options = {});
    ~HighlightSession();

    HighlightSession(const HighlightSession&) = delete;
    HighlightSession& operator=(const HighlightSession&) = delete;

    ManagerState state() const { return context_.state; }
    const HighlightManagerContext& context() const { return context_; }
    const std::optional<std::string>& error() const { return context_.errorMessage; }
    bool isBusy() const { return Marginalia::isBusy(context_.state); }
    bool canInteract() const { return canInteractWithSuggestions(context_.state); }

    const StoreStatePtr& storeState() const { return store_.getState(); }
    SuggestionStore& store() { return store_; }
    UndoManager& undoManager() { return undo_; }
    size_t suggestionCount() const { return selectSuggestionCount(*store_.getState()); }

    void requestReview();
    // Keeps at most maxSuggestions inputs; overlapping ones are rejected by the store.
    // Returns how many suggestions were accepted.
    size_t setReviewResults(std::vector<SuggestionHighlight> suggestions);
    void setReviewError(const std::string& error);
    // Runs agent tool calls as one review. Each highlight enters the store as soon as it is
    // produced; the review then completes with what the store kept, so later calls and
    // finish_review see the same suggestions the session ends with.
    ToolCallResults runToolCalls(const std::vector<ToolCall>& calls, ToolExecutorOptions options = {});

    // Throws SuggestionNotFoundError for an unknown id. A failing command moves the
    // session to Error and the exception is rethrown.
    void acceptSuggestion(const std::string& id);
    void dismissSuggestion(const std::string& id);
    void dismissAllSuggestions();

    void setActiveSuggestion(std::optional<std::string> id);
    std::optional<SuggestionHighlight> getSuggestionAtPoint(int64_t point) const;
    std::optional<PositionedSuggestion> activeSuggestion() const;
    std::vector<PositionedSuggestion> positionedSuggestions() const;

    // Drops every suggestion and the undo history.
    void clearAll();

    bool undo();
    bool redo();
    bool canUndo() const { return undo_.canUndo(); }
    bool canRedo() const { return undo_.canRedo(); }
    std::optional<std::string> getUndoDescription() const { return undo_.getUndoDescription(); }
    std::optional<std::string> getRedoDescription() const { return undo_.getRedoDescription(); }

    // Shifts suggestions for an edit the user already made to the document.
    void handleTextChange(int64_t editStart, int64_t deleteCount, int64_t insertLength);
    void handleTextChange(const std::string& oldText, const std::string& newText);

    void recover();

    // Live contexts for a ToolExecutor: each call snapshots the current document and store.
    ContextProvider toolContextProvider(std::optional<AbortSignal> abortSignal = std::nullopt) const;

private:
    void send(const ManagerEvent& event);
    void handleSideEffect(const SideEffect& effect);
    void runCommand(const CommandPtr& command);
    StoreUpdater storeUpdater();

    DocumentGetter getDocument_;
    DocumentUpdater setDocument_;
    HighlightSessionOptions options_;
    HighlightManagerContext context_;
    SuggestionStore store_;
    UndoManager undo_;
    SuggestionStore::Unsubscribe unsubscribe_;
};

} // namespace Marginalia
