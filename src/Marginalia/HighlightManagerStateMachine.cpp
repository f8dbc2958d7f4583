#include <Marginalia/HighlightManagerStateMachine.hpp>
#include <Marginalia/Errors.hpp>

namespace Marginalia {

using MS = ManagerState;
using ET = ManagerEventType;

ManagerEvent ManagerEvent::requestReview(){ ManagerEvent e; e.type = ET::RequestReview; return e; }
ManagerEvent ManagerEvent::reviewComplete(std::vector<SuggestionHighlight> suggestions){
    ManagerEvent e; e.type = ET::ReviewComplete; e.suggestions = std::move(suggestions); return e;
}
ManagerEvent ManagerEvent::reviewFailed(std::string error){ ManagerEvent e; e.type = ET::ReviewFailed; e.error = std::move(error); return e; }
ManagerEvent ManagerEvent::acceptSuggestion(std::string id){ ManagerEvent e; e.type = ET::AcceptSuggestion; e.id = std::move(id); return e; }
ManagerEvent ManagerEvent::dismissSuggestion(std::string id){ ManagerEvent e; e.type = ET::DismissSuggestion; e.id = std::move(id); return e; }
ManagerEvent ManagerEvent::applyComplete(int64_t remaining){ ManagerEvent e; e.type = ET::ApplyComplete; e.remainingSuggestions = remaining; return e; }
ManagerEvent ManagerEvent::clearAll(){ ManagerEvent e; e.type = ET::ClearAll; return e; }
ManagerEvent ManagerEvent::textChanged(int64_t editStart, int64_t deleteCount, int64_t insertLength){
    ManagerEvent e; e.type = ET::TextChanged; e.editStart = editStart; e.deleteCount = deleteCount; e.insertLength = insertLength; return e;
}
ManagerEvent ManagerEvent::suggestionsUpdated(int64_t remaining){ ManagerEvent e; e.type = ET::SuggestionsUpdated; e.remainingSuggestions = remaining; return e; }
ManagerEvent ManagerEvent::recover(){ ManagerEvent e; e.type = ET::Recover; return e; }

const char* toString(ManagerState s){
    switch(s){
        case MS::Idle: return "IDLE";
        case MS::Reviewing: return "REVIEWING";
        case MS::HasSuggestions: return "HAS_SUGGESTIONS";
        case MS::Applying: return "APPLYING";
        case MS::Error: return "ERROR";
    }
    return "UNKNOWN";
}

const char* toString(ManagerEventType t){
    switch(t){
        case ET::RequestReview: return "REQUEST_REVIEW";
        case ET::ReviewComplete: return "REVIEW_COMPLETE";
        case ET::ReviewFailed: return "REVIEW_FAILED";
        case ET::AcceptSuggestion: return "ACCEPT_SUGGESTION";
        case ET::DismissSuggestion: return "DISMISS_SUGGESTION";
        case ET::ApplyComplete: return "APPLY_COMPLETE";
        case ET::ClearAll: return "CLEAR_ALL";
        case ET::TextChanged: return "TEXT_CHANGED";
        case ET::SuggestionsUpdated: return "SUGGESTIONS_UPDATED";
        case ET::Recover: return "RECOVER";
    }
    return "UNKNOWN";
}

const char* toString(SideEffectType t){
    switch(t){
        case SideEffectType::StartReview: return "START_REVIEW";
        case SideEffectType::CancelReview: return "CANCEL_REVIEW";
        case SideEffectType::ApplySuggestion: return "APPLY_SUGGESTION";
        case SideEffectType::RemoveSuggestion: return "REMOVE_SUGGESTION";
        case SideEffectType::ClearAllSuggestions: return "CLEAR_ALL_SUGGESTIONS";
        case SideEffectType::UpdatePositions: return "UPDATE_POSITIONS";
        case SideEffectType::LogError: return "LOG_ERROR";
    }
    return "UNKNOWN";
}

std::optional<ManagerState> parseManagerState(const std::string& s){
    for(MS st : allManagerStates()) if(s == toString(st)) return st;
    return std::nullopt;
}

const std::vector<ManagerState>& allManagerStates(){
    static const std::vector<MS> states = {MS::Idle, MS::Reviewing, MS::HasSuggestions, MS::Applying, MS::Error};
    return states;
}

static SideEffect effect(SideEffectType type){
    SideEffect e; e.type = type; return e;
}

static SideEffect effectWithId(SideEffectType type, const std::string& id){
    SideEffect e; e.type = type; e.id = id; return e;
}

static SideEffect logError(const std::string& error){
    SideEffect e; e.type = SideEffectType::LogError; e.error = error; return e;
}

// nullopt marks an undefined (state, event) pair
static std::optional<TransitionResult> lookup(ManagerState current, const ManagerEvent& ev){
    switch(current){
        case MS::Idle:
            if(ev.type == ET::RequestReview) return TransitionResult{MS::Reviewing, {effect(SideEffectType::StartReview)}};
            return std::nullopt;

        case MS::Reviewing:
            switch(ev.type){
                case ET::ReviewComplete: return TransitionResult{ev.suggestions.empty() ? MS::Idle : MS::HasSuggestions, {}};
                case ET::ReviewFailed: return TransitionResult{MS::Error, {logError(ev.error)}};
                case ET::ClearAll: return TransitionResult{MS::Idle, {effect(SideEffectType::CancelReview)}};
                default: return std::nullopt;
            }

        case MS::HasSuggestions:
            switch(ev.type){
                case ET::AcceptSuggestion: return TransitionResult{MS::Applying, {effectWithId(SideEffectType::ApplySuggestion, ev.id)}};
                case ET::DismissSuggestion: return TransitionResult{MS::HasSuggestions, {effectWithId(SideEffectType::RemoveSuggestion, ev.id)}};
                case ET::SuggestionsUpdated: return TransitionResult{ev.remainingSuggestions > 0 ? MS::HasSuggestions : MS::Idle, {}};
                case ET::ClearAll: return TransitionResult{MS::Idle, {effect(SideEffectType::ClearAllSuggestions)}};
                case ET::TextChanged: {
                    SideEffect e = effect(SideEffectType::UpdatePositions);
                    e.editStart = ev.editStart;
                    e.deleteCount = ev.deleteCount;
                    e.insertLength = ev.insertLength;
                    return TransitionResult{MS::HasSuggestions, {e}};
                }
                case ET::RequestReview:
                    return TransitionResult{MS::Reviewing, {effect(SideEffectType::ClearAllSuggestions), effect(SideEffectType::StartReview)}};
                default: return std::nullopt;
            }

        case MS::Applying:
            switch(ev.type){
                case ET::ApplyComplete: return TransitionResult{ev.remainingSuggestions > 0 ? MS::HasSuggestions : MS::Idle, {}};
                case ET::ReviewFailed: return TransitionResult{MS::Error, {logError(ev.error)}};
                default: return std::nullopt;
            }

        case MS::Error:
            if(ev.type == ET::Recover || ev.type == ET::ClearAll) return TransitionResult{MS::Idle, {effect(SideEffectType::ClearAllSuggestions)}};
            return std::nullopt;
    }
    return std::nullopt;
}

TransitionResult highlightManagerTransition(ManagerState current, const ManagerEvent& event){
    auto r = lookup(current, event);
    if(!r) return TransitionResult{current, {}};
    return *r;
}

ManagerState getNextState(ManagerState current, const ManagerEvent& event){
    return highlightManagerTransition(current, event).state;
}

std::vector<ManagerEventType> getValidEvents(ManagerState s){
    switch(s){
        case MS::Idle: return {ET::RequestReview};
        case MS::Reviewing: return {ET::ReviewComplete, ET::ReviewFailed, ET::ClearAll};
        case MS::HasSuggestions: return {ET::AcceptSuggestion, ET::DismissSuggestion, ET::SuggestionsUpdated, ET::ClearAll, ET::TextChanged, ET::RequestReview};
        case MS::Applying: return {ET::ApplyComplete, ET::ReviewFailed};
        case MS::Error: return {ET::Recover, ET::ClearAll};
    }
    return {};
}

bool canTransition(ManagerState current, ManagerEventType event){
    for(ET t : getValidEvents(current)) if(t == event) return true;
    return false;
}

void validateTransition(ManagerState current, ManagerEventType event){
    if(canTransition(current, event)) return;
    throw StateTransitionError(std::string("Invalid state transition: cannot apply ") + toString(event) + " from " + toString(current),
                               toString(current), toString(event));
}

std::string getStateDescription(ManagerState s){
    switch(s){
        case MS::Idle: return "No active suggestions. Ready to start a review.";
        case MS::Reviewing: return "AI is analyzing the document and generating suggestions.";
        case MS::HasSuggestions: return "Suggestions are available for review.";
        case MS::Applying: return "Applying a suggestion to the document.";
        case MS::Error: return "An error occurred. Recovery required.";
    }
    return std::string();
}

std::string getEventDescription(ManagerEventType t){
    switch(t){
        case ET::RequestReview: return "User asked for a review of the document.";
        case ET::ReviewComplete: return "The agent finished producing suggestions.";
        case ET::ReviewFailed: return "The review or an apply step failed.";
        case ET::AcceptSuggestion: return "User accepted a suggestion.";
        case ET::DismissSuggestion: return "User dismissed a suggestion.";
        case ET::ApplyComplete: return "An accepted suggestion was written into the document.";
        case ET::ClearAll: return "All suggestions were cleared.";
        case ET::TextChanged: return "The document text was edited.";
        case ET::SuggestionsUpdated: return "The set of remaining suggestions changed.";
        case ET::Recover: return "User acknowledged an error.";
    }
    return std::string();
}

bool canInteractWithSuggestions(ManagerState s){ return s == MS::HasSuggestions; }
bool canStartReview(ManagerState s){ return s == MS::Idle || s == MS::HasSuggestions; }
bool isBusy(ManagerState s){ return s == MS::Reviewing || s == MS::Applying; }
bool isError(ManagerState s){ return s == MS::Error; }

HighlightManagerContext createInitialContext(){
    HighlightManagerContext ctx;
    ctx.lastTransitionAt = currentTimeMillis();
    return ctx;
}

HighlightManagerContext applyTransitionToContext(const HighlightManagerContext& ctx, const ManagerEvent& event){
    const TransitionResult result = highlightManagerTransition(ctx.state, event);
    HighlightManagerContext next;
    next.state = result.state;
    next.errorMessage = ctx.errorMessage;
    if(event.type == ET::ReviewFailed) next.errorMessage = event.error;
    else if(result.state != MS::Error) next.errorMessage.reset();
    next.isProcessing = isBusy(result.state);
    next.lastTransitionAt = currentTimeMillis();
    return next;
}

} // namespace Marginalia
