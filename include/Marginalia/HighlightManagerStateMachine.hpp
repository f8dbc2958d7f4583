#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <Marginalia/Types.hpp>

namespace Marginalia {

// Session-level lifecycle of one review over a document.
enum class ManagerState { Idle, Reviewing, HasSuggestions, Applying, Error };

enum class ManagerEventType {
    RequestReview,
    ReviewComplete,
    ReviewFailed,
    AcceptSuggestion,
    DismissSuggestion,
    ApplyComplete,
    ClearAll,
    TextChanged,
    SuggestionsUpdated,
    Recover
};

struct ManagerEvent {
    ManagerEventType type = ManagerEventType::Recover;
    std::vector<SuggestionHighlight> suggestions; // ReviewComplete
    std::string error;                            // ReviewFailed
    std::string id;                               // AcceptSuggestion, DismissSuggestion
    int64_t remainingSuggestions = 0;             // ApplyComplete, SuggestionsUpdated
    int64_t editStart = 0;                        // TextChanged
    int64_t deleteCount = 0;
    int64_t insertLength = 0;

    static ManagerEvent requestReview();
    static ManagerEvent reviewComplete(std::vector<SuggestionHighlight> suggestions);
    static ManagerEvent reviewFailed(std::string error);
    static ManagerEvent acceptSuggestion(std::string id);
    static ManagerEvent dismissSuggestion(std::string id);
    static ManagerEvent applyComplete(int64_t remaining);
    static ManagerEvent clearAll();
    static ManagerEvent textChanged(int64_t editStart, int64_t deleteCount, int64_t insertLength);
    static ManagerEvent suggestionsUpdated(int64_t remaining);
    static ManagerEvent recover();
};

// Work the caller must carry out after a transition. The machine never performs it.
enum class SideEffectType { StartReview, CancelReview, ApplySuggestion, RemoveSuggestion, ClearAllSuggestions, UpdatePositions, LogError };

struct SideEffect {
    SideEffectType type = SideEffectType::StartReview;
    std::string id;     // ApplySuggestion, RemoveSuggestion
    std::string error;  // LogError
    int64_t editStart = 0;
    int64_t deleteCount = 0;
    int64_t insertLength = 0;

    bool operator==(const SideEffect& o) const {
        return type == o.type && id == o.id && error == o.error && editStart == o.editStart
            && deleteCount == o.deleteCount && insertLength == o.insertLength;
    }
};

struct TransitionResult {
    ManagerState state = ManagerState::Idle;
    std::vector<SideEffect> sideEffects;
};

const char* toString(ManagerState s);
const char* toString(ManagerEventType t);
const char* toString(SideEffectType t);
std::optional<ManagerState> parseManagerState(const std::string& s);
const std::vector<ManagerState>& allManagerStates();

// Undefined pairs keep the state and produce no effects.
TransitionResult highlightManagerTransition(ManagerState current, const ManagerEvent& event);
ManagerState getNextState(ManagerState current, const ManagerEvent& event);
bool canTransition(ManagerState current, ManagerEventType event);
// Throws StateTransitionError for an undefined pair.
void validateTransition(ManagerState current, ManagerEventType event);
std::vector<ManagerEventType> getValidEvents(ManagerState s);

std::string getStateDescription(ManagerState s);
std::string getEventDescription(ManagerEventType t);

bool canInteractWithSuggestions(ManagerState s);
bool canStartReview(ManagerState s);
bool isBusy(ManagerState s);
bool isError(ManagerState s);

struct HighlightManagerContext {
    ManagerState state = ManagerState::Idle;
    std::optional<std::string> errorMessage;
    bool isProcessing = false;
    int64_t lastTransitionAt = 0;
};

HighlightManagerContext createInitialContext();
// A failure event always records its message; any transition landing outside Error clears it.
HighlightManagerContext applyTransitionToContext(const HighlightManagerContext& ctx, const ManagerEvent& event);

} // namespace Marginalia
