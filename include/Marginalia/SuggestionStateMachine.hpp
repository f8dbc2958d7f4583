#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Marginalia {

// Lifecycle of a single suggestion.
enum class SuggestionState {
    Pending,     // agent still producing it
    Ready,
    Active,      // focused by the user
    Inactive,
    Adjusted,    // moved by a text edit, awaiting revalidation
    Validated,
    Invalidated, // terminal
    Accepted,
    Completed,   // terminal
    Dismissed    // terminal
};

enum class SuggestionEvent {
    ReviewComplete,
    UserActivates,
    UserDeactivates,
    UserAccepts,
    UserDismisses,
    TextEdit,
    ValidationSuccess,
    ValidationFailure,
    TextApplied,
    TextChangedTooMuch
};

const char* toString(SuggestionState s);
const char* toString(SuggestionEvent e);

const std::vector<SuggestionState>& allSuggestionStates();
const std::vector<SuggestionEvent>& allSuggestionEvents();

bool isTerminalState(SuggestionState s);
// Ready, Active, Inactive, Adjusted or Validated
bool isActiveState(SuggestionState s);

// Events accepted from a state, paired with the state each leads to, in table order.
const std::vector<std::pair<SuggestionEvent, SuggestionState>>& suggestionTransitions(SuggestionState s);

// Undefined (state, event) pairs leave the state unchanged.
SuggestionState suggestionTransition(SuggestionState current, SuggestionEvent event);
bool canTransition(SuggestionState current, SuggestionEvent event);
std::vector<SuggestionEvent> getValidEvents(SuggestionState s);
std::vector<SuggestionState> getPossibleNextStates(SuggestionState s);

// Throws StateTransitionError for an undefined pair.
void validateTransition(SuggestionState current, SuggestionEvent event);

std::string getStateDescription(SuggestionState s);
std::string getEventDescription(SuggestionEvent e);

struct SuggestionWithState {
    std::string id;
    SuggestionState state = SuggestionState::Pending;
    int64_t stateEnteredAt = 0; // epoch ms
    std::optional<SuggestionState> previousState;

    bool operator==(const SuggestionWithState& o) const {
        return id == o.id && state == o.state && stateEnteredAt == o.stateEnteredAt && previousState == o.previousState;
    }
};

SuggestionWithState createSuggestionState(const std::string& id);
// Returns s untouched (same timestamp) when the event does not apply.
SuggestionWithState applySuggestionTransition(const SuggestionWithState& s, SuggestionEvent event);

std::vector<SuggestionWithState> batchTransition(const std::vector<SuggestionWithState>& items, SuggestionEvent event);
std::vector<SuggestionWithState> filterByState(const std::vector<SuggestionWithState>& items, const std::vector<SuggestionState>& states);
std::map<SuggestionState, int> countByState(const std::vector<SuggestionWithState>& items);

} // namespace Marginalia
