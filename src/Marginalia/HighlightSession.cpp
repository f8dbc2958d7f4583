#include <Marginalia/HighlightSession.hpp>
#include <Marginalia/Commands/AcceptSuggestionCommand.hpp>
#include <Marginalia/Commands/DismissSuggestionCommand.hpp>
#include <Marginalia/Errors.hpp>
#include <Marginalia/FeatureFlags.hpp>
#include <Marginalia/LineMap.hpp>
#include <Marginalia/Tools/ToolRegistry.hpp>
#include <plog/Log.h>

namespace Marginalia {

HighlightSessionOptions HighlightSessionOptions::fromConfig(const EngineConfig& config){
    HighlightSessionOptions o;
    o.maxUndoSize = config.undoMaxSize;
    o.overlapStrategy = config.overlapStrategy;
    return o;
}

static UndoManagerOptions undoOptionsFor(size_t maxSize){
    UndoManagerOptions o;
    o.maxSize = maxSize;
    return o;
}

HighlightSession::HighlightSession(DocumentGetter getDocument, DocumentUpdater setDocument, HighlightSessionOptions options)
    : getDocument_(std::move(getDocument)),
      setDocument_(std::move(setDocument)),
      options_(std::move(options)),
      context_(createInitialContext()),
      undo_(undoOptionsFor(options_.maxUndoSize))
{
    unsubscribe_ = store_.subscribe([this](const StoreStatePtr& s){
        debugLog("Store", "version " + std::to_string(s->version), nlohmann::json{{"count", s->highlights.size()}});
        if(options_.onSuggestionsChange) options_.onSuggestionsChange(selectAllSuggestions(*s));
    });
}

HighlightSession::~HighlightSession(){
    if(unsubscribe_) unsubscribe_();
}

StoreUpdater HighlightSession::storeUpdater(){
    return [this](const StoreAction& action){ store_.dispatch(action); };
}

void HighlightSession::send(const ManagerEvent& event){
    const ManagerState prev = context_.state;
    const TransitionResult result = highlightManagerTransition(prev, event);
    context_ = applyTransitionToContext(context_, event);
    debugLog("Manager", std::string("Event: ") + toString(event.type),
             nlohmann::json{{"from", toString(prev)}, {"to", toString(result.state)}});

    if(result.state == prev && result.sideEffects.empty()){
        PLOGD << "[Session] " << toString(event.type) << " ignored in " << toString(prev);
    }
    for(const auto& effect : result.sideEffects) handleSideEffect(effect);
    if(result.state != prev && options_.onStateChange) options_.onStateChange(result.state);
}

void HighlightSession::handleSideEffect(const SideEffect& effect){
    debugLog("Manager", std::string("Side effect: ") + toString(effect.type));
    switch(effect.type){
        case SideEffectType::StartReview:
            PLOGI << "[Session] review started";
            break;
        case SideEffectType::CancelReview:
            PLOGI << "[Session] review cancelled";
            break;
        case SideEffectType::LogError:
            PLOGE << "[Session] " << effect.error;
            break;
        case SideEffectType::ClearAllSuggestions:
            // no-op when the operation that raised the event already emptied the store
            if(selectHasAnySuggestions(*store_.getState())) store_.dispatch(StoreAction::removeAll());
            break;
        case SideEffectType::ApplySuggestion:
        case SideEffectType::RemoveSuggestion:
        case SideEffectType::UpdatePositions:
            break;
    }
    if(options_.onSideEffect) options_.onSideEffect(effect);
}

void HighlightSession::runCommand(const CommandPtr& command){
    if(getFeatureFlags().undoRedoEnabled){
        undo_.execute(command);
    } else {
        command->execute();
    }
}

void HighlightSession::requestReview(){
    send(ManagerEvent::requestReview());
}

size_t HighlightSession::setReviewResults(std::vector<SuggestionHighlight> suggestions){
    const int64_t maxSuggestions = getFeatureFlags().maxSuggestions;
    if(maxSuggestions >= 0 && suggestions.size() > static_cast<size_t>(maxSuggestions)){
        PLOGW << "[Session] keeping " << maxSuggestions << " of " << suggestions.size() << " suggestions";
        suggestions.resize(static_cast<size_t>(maxSuggestions));
    }

    store_.dispatch(StoreAction::setAll(std::move(suggestions), options_.overlapStrategy));
    const StoreStatePtr& s = store_.getState();
    if(!s->lastRejectedIds.empty()){
        PLOGD << "[Session] " << s->lastRejectedIds.size() << " overlapping suggestion(s) rejected";
    }
    std::vector<SuggestionHighlight> accepted = selectAllSuggestions(*s);
    const size_t count = accepted.size();
    send(ManagerEvent::reviewComplete(std::move(accepted)));
    PLOGI << "[Session] review produced " << count << " suggestion(s)";
    return count;
}

void HighlightSession::setReviewError(const std::string& error){
    send(ManagerEvent::reviewFailed(error));
}

void HighlightSession::acceptSuggestion(const std::string& id){
    StoreStatePtr current = store_.getState();
    const SuggestionHighlight* suggestion = selectSuggestionById(*current, id);
    if(!suggestion) throw SuggestionNotFoundError(id);

    auto command = createAcceptSuggestionCommand(*suggestion, setDocument_, storeUpdater(), getDocument_, current);
    send(ManagerEvent::acceptSuggestion(id));
    try{
        runCommand(command);
    } catch(const std::exception& e){
        PLOGE << "[Session] accept of " << id << " failed: " << e.what();
        send(ManagerEvent::reviewFailed(e.what()));
        throw;
    }
    PLOGI << "[Session] accepted " << id;
    send(ManagerEvent::applyComplete(static_cast<int64_t>(suggestionCount())));
}

void HighlightSession::dismissSuggestion(const std::string& id){
    StoreStatePtr current = store_.getState();
    const SuggestionHighlight* suggestion = selectSuggestionById(*current, id);
    if(!suggestion) throw SuggestionNotFoundError(id);

    runCommand(createDismissSuggestionCommand(*suggestion, storeUpdater(), current));
    PLOGI << "[Session] dismissed " << id;
    send(ManagerEvent::suggestionsUpdated(static_cast<int64_t>(suggestionCount())));
}

void HighlightSession::dismissAllSuggestions(){
    StoreStatePtr current = store_.getState();
    if(!selectHasAnySuggestions(*current)) return;
    runCommand(createDismissAllSuggestionsCommand(storeUpdater(), current));
    PLOGI << "[Session] dismissed all suggestions";
    send(ManagerEvent::clearAll());
}

void HighlightSession::setActiveSuggestion(std::optional<std::string> id){
    store_.dispatch(StoreAction::setActive(std::move(id)));
}

std::optional<SuggestionHighlight> HighlightSession::getSuggestionAtPoint(int64_t point) const {
    return selectSuggestionAtPoint(*store_.getState(), point);
}

std::optional<PositionedSuggestion> HighlightSession::activeSuggestion() const {
    const SuggestionHighlight* active = selectActiveSuggestion(*store_.getState());
    if(!active) return std::nullopt;
    LineMap lineMap(getDocument_());
    const LineColumn pos = lineMap.offsetToLineColumn(active->range.start());
    return toPositionedSuggestion(*active, pos.line, pos.column);
}

std::vector<PositionedSuggestion> HighlightSession::positionedSuggestions() const {
    const auto& all = selectAllSuggestions(*store_.getState());
    std::vector<PositionedSuggestion> out;
    if(all.empty()) return out;
    LineMap lineMap(getDocument_());
    out.reserve(all.size());
    for(const auto& s : all){
        const LineColumn pos = lineMap.offsetToLineColumn(s.range.start());
        out.push_back(toPositionedSuggestion(s, pos.line, pos.column));
    }
    return out;
}

void HighlightSession::clearAll(){
    store_.dispatch(StoreAction::removeAll());
    send(ManagerEvent::clearAll());
    undo_.clear();
}

bool HighlightSession::undo(){
    if(!undo_.undo()) return false;
    if(context_.state == ManagerState::HasSuggestions){
        send(ManagerEvent::suggestionsUpdated(static_cast<int64_t>(suggestionCount())));
    }
    return true;
}

bool HighlightSession::redo(){
    if(!undo_.redo()) return false;
    if(context_.state == ManagerState::HasSuggestions){
        send(ManagerEvent::suggestionsUpdated(static_cast<int64_t>(suggestionCount())));
    }
    return true;
}

void HighlightSession::handleTextChange(int64_t editStart, int64_t deleteCount, int64_t insertLength){
    store_.dispatch(StoreAction::applyEdit(editStart, deleteCount, insertLength));
    send(ManagerEvent::textChanged(editStart, deleteCount, insertLength));
    send(ManagerEvent::suggestionsUpdated(static_cast<int64_t>(suggestionCount())));
}

void HighlightSession::handleTextChange(const std::string& oldText, const std::string& newText){
    auto edit = computeTextEdit(oldText, newText);
    if(!edit) return;
    handleTextChange(edit->offset, edit->deleteCount, edit->insertLength());
}

void HighlightSession::recover(){
    send(ManagerEvent::recover());
}

ToolCallResults HighlightSession::runToolCalls(const std::vector<ToolCall>& calls, ToolExecutorOptions options){
    requestReview();
    if(context_.state != ManagerState::Reviewing){
        PLOGW << "[Session] tool calls ignored in state " << toString(context_.state);
        return {};
    }

    auto forward = std::move(options.onToolExecuted);
    options.onToolExecuted = [this, forward](const ToolCallResult& r){
        if(r.toolName == "highlight_text" && r.result.success){
            store_.dispatch(StoreAction::add(r.result.value.get<SuggestionHighlight>()));
        }
        if(forward) forward(r);
    };

    ToolExecutor executor(createDefaultToolRegistry(), toolContextProvider(), options);
    ToolCallResults results = executor.executeBatch(calls);
    setReviewResults(selectAllSuggestions(*store_.getState()));
    return results;
}

ContextProvider HighlightSession::toolContextProvider(std::optional<AbortSignal> abortSignal) const {
    return [this, abortSignal](){
        return createToolContext(getDocument_(), store_.getState(), abortSignal);
    };
}

} // namespace Marginalia
