#include <Marginalia/SuggestionStateMachine.hpp>
#include <Marginalia/Errors.hpp>
#include <Marginalia/Types.hpp>
#include <algorithm>

namespace Marginalia {

using S = SuggestionState;
using E = SuggestionEvent;

const char* toString(SuggestionState s){
    switch(s){
        case S::Pending: return "PENDING";
        case S::Ready: return "READY";
        case S::Active: return "ACTIVE";
        case S::Inactive: return "INACTIVE";
        case S::Adjusted: return "ADJUSTED";
        case S::Validated: return "VALIDATED";
        case S::Invalidated: return "INVALIDATED";
        case S::Accepted: return "ACCEPTED";
        case S::Completed: return "COMPLETED";
        case S::Dismissed: return "DISMISSED";
    }
    return "UNKNOWN";
}

const char* toString(SuggestionEvent e){
    switch(e){
        case E::ReviewComplete: return "REVIEW_COMPLETE";
        case E::UserActivates: return "USER_ACTIVATES";
        case E::UserDeactivates: return "USER_DEACTIVATES";
        case E::UserAccepts: return "USER_ACCEPTS";
        case E::UserDismisses: return "USER_DISMISSES";
        case E::TextEdit: return "TEXT_EDIT";
        case E::ValidationSuccess: return "VALIDATION_SUCCESS";
        case E::ValidationFailure: return "VALIDATION_FAILURE";
        case E::TextApplied: return "TEXT_APPLIED";
        case E::TextChangedTooMuch: return "TEXT_CHANGED_TOO_MUCH";
    }
    return "UNKNOWN";
}

const std::vector<SuggestionState>& allSuggestionStates(){
    static const std::vector<S> states = {
        S::Pending, S::Ready, S::Active, S::Inactive, S::Adjusted,
        S::Validated, S::Invalidated, S::Accepted, S::Completed, S::Dismissed
    };
    return states;
}

const std::vector<SuggestionEvent>& allSuggestionEvents(){
    static const std::vector<E> events = {
        E::ReviewComplete, E::UserActivates, E::UserDeactivates, E::UserAccepts, E::UserDismisses,
        E::TextEdit, E::ValidationSuccess, E::ValidationFailure, E::TextApplied, E::TextChangedTooMuch
    };
    return events;
}

bool isTerminalState(SuggestionState s){
    return s == S::Completed || s == S::Dismissed || s == S::Invalidated;
}

bool isActiveState(SuggestionState s){
    return s == S::Ready || s == S::Active || s == S::Inactive || s == S::Adjusted || s == S::Validated;
}

const std::vector<std::pair<SuggestionEvent, SuggestionState>>& suggestionTransitions(SuggestionState s){
    using Table = std::vector<std::pair<E, S>>;
    static const Table pending = {{E::ReviewComplete, S::Ready}, {E::UserDismisses, S::Dismissed}};
    static const Table ready = {{E::UserActivates, S::Active}, {E::TextEdit, S::Adjusted}, {E::UserDismisses, S::Dismissed}};
    static const Table active = {{E::UserDeactivates, S::Inactive}, {E::UserAccepts, S::Accepted},
                                 {E::UserDismisses, S::Dismissed}, {E::TextEdit, S::Adjusted}};
    static const Table inactive = {{E::UserActivates, S::Active}, {E::TextEdit, S::Adjusted}, {E::UserDismisses, S::Dismissed}};
    static const Table adjusted = {{E::ValidationSuccess, S::Validated}, {E::ValidationFailure, S::Invalidated},
                                   {E::TextChangedTooMuch, S::Invalidated}, {E::UserDismisses, S::Dismissed}};
    static const Table validated = {{E::UserActivates, S::Active}, {E::UserDeactivates, S::Inactive}, {E::TextEdit, S::Adjusted},
                                    {E::UserDismisses, S::Dismissed}, {E::UserAccepts, S::Accepted}};
    static const Table accepted = {{E::TextApplied, S::Completed}};
    static const Table terminal = {};

    switch(s){
        case S::Pending: return pending;
        case S::Ready: return ready;
        case S::Active: return active;
        case S::Inactive: return inactive;
        case S::Adjusted: return adjusted;
        case S::Validated: return validated;
        case S::Accepted: return accepted;
        case S::Invalidated:
        case S::Completed:
        case S::Dismissed: return terminal;
    }
    return terminal;
}

SuggestionState suggestionTransition(SuggestionState current, SuggestionEvent event){
    for(const auto& t : suggestionTransitions(current)){
        if(t.first == event) return t.second;
    }
    return current;
}

bool canTransition(SuggestionState current, SuggestionEvent event){
    const auto& table = suggestionTransitions(current);
    return std::any_of(table.begin(), table.end(), [event](const std::pair<E, S>& t){ return t.first == event; });
}

std::vector<SuggestionEvent> getValidEvents(SuggestionState s){
    std::vector<E> out;
    for(const auto& t : suggestionTransitions(s)) out.push_back(t.first);
    return out;
}

std::vector<SuggestionState> getPossibleNextStates(SuggestionState s){
    std::vector<S> out;
    for(const auto& t : suggestionTransitions(s)) out.push_back(t.second);
    return out;
}

void validateTransition(SuggestionState current, SuggestionEvent event){
    if(canTransition(current, event)) return;
    throw StateTransitionError(std::string("Invalid state transition: cannot apply ") + toString(event) + " from " + toString(current),
                               toString(current), toString(event));
}

std::string getStateDescription(SuggestionState s){
    switch(s){
        case S::Pending: return "AI is analyzing and generating this suggestion";
        case S::Ready: return "Suggestion is ready for review";
        case S::Active: return "User is viewing this suggestion";
        case S::Inactive: return "Suggestion exists but is not currently focused";
        case S::Adjusted: return "Suggestion positions have been updated after a text edit";
        case S::Validated: return "Suggestion is still valid after adjustment";
        case S::Invalidated: return "Suggestion is no longer valid due to text changes";
        case S::Accepted: return "User has accepted this suggestion";
        case S::Completed: return "Suggestion has been fully applied to the document";
        case S::Dismissed: return "User has dismissed this suggestion";
    }
    return std::string();
}

std::string getEventDescription(SuggestionEvent e){
    switch(e){
        case E::ReviewComplete: return "AI has finished generating the suggestion";
        case E::UserActivates: return "User clicked or focused on the suggestion";
        case E::UserDeactivates: return "User clicked away or unfocused the suggestion";
        case E::UserAccepts: return "User accepted the suggested change";
        case E::UserDismisses: return "User rejected the suggestion";
        case E::TextEdit: return "Document text was edited";
        case E::ValidationSuccess: return "Suggestion text still matches after edit";
        case E::ValidationFailure: return "Suggestion text no longer matches after edit";
        case E::TextApplied: return "The suggested text change was applied to the document";
        case E::TextChangedTooMuch: return "The text changed too much to keep the suggestion";
    }
    return std::string();
}

SuggestionWithState createSuggestionState(const std::string& id){
    return SuggestionWithState{id, S::Pending, currentTimeMillis(), std::nullopt};
}

SuggestionWithState applySuggestionTransition(const SuggestionWithState& s, SuggestionEvent event){
    const S next = suggestionTransition(s.state, event);
    if(next == s.state) return s;
    return SuggestionWithState{s.id, next, currentTimeMillis(), s.state};
}

std::vector<SuggestionWithState> batchTransition(const std::vector<SuggestionWithState>& items, SuggestionEvent event){
    std::vector<SuggestionWithState> out;
    out.reserve(items.size());
    for(const auto& s : items) out.push_back(applySuggestionTransition(s, event));
    return out;
}

std::vector<SuggestionWithState> filterByState(const std::vector<SuggestionWithState>& items, const std::vector<SuggestionState>& states){
    std::vector<SuggestionWithState> out;
    for(const auto& s : items){
        if(std::find(states.begin(), states.end(), s.state) != states.end()) out.push_back(s);
    }
    return out;
}

std::map<SuggestionState, int> countByState(const std::vector<SuggestionWithState>& items){
    std::map<S, int> counts;
    for(const auto& s : items) counts[s.state]++;
    return counts;
}

} // namespace Marginalia
