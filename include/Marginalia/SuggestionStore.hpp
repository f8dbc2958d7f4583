#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <Marginalia/RangeIndex.hpp>
#include <Marginalia/Types.hpp>

namespace Marginalia {

struct SuggestionStoreState {
    RangeIndex<SuggestionHighlight> highlights;
    std::optional<std::string> activeId; // always names an item in highlights
    int64_t version = 0;                 // bumped on every effective change
    std::vector<std::string> lastRejectedIds;

    bool operator==(const SuggestionStoreState& o) const {
        return highlights == o.highlights && activeId == o.activeId && version == o.version && lastRejectedIds == o.lastRejectedIds;
    }
    bool operator!=(const SuggestionStoreState& o) const { return !(*this == o); }
};

// States are shared and never mutated; a reducer that changes nothing hands back the same pointer.
using StoreStatePtr = std::shared_ptr<const SuggestionStoreState>;

// Partial update for UPDATE_HIGHLIGHT. The id is never updatable.
struct HighlightUpdate {
    std::optional<Range> range;
    std::optional<SuggestionCategory> category;
    std::optional<Priority> priority;
    std::optional<nlohmann::json> metadata;
    std::optional<std::string> originalText;
    std::optional<std::string> observation;
    std::optional<std::string> suggestedRevision;
    std::optional<double> confidence;
};

enum class StoreActionType { SetAll, Add, Remove, RemoveAll, SetActive, ApplyEdit, UpdateHighlight, Restore };

const char* toString(StoreActionType t);

struct StoreAction {
    StoreActionType type = StoreActionType::RemoveAll;

    std::vector<SuggestionHighlight> highlights;          // SetAll
    OverlapStrategy strategy = OverlapStrategy::KeepFirst; // SetAll
    SuggestionHighlight highlight;                        // Add
    std::string id;                                       // Remove, UpdateHighlight
    std::optional<std::string> activeId;                  // SetActive
    int64_t editStart = 0;                                // ApplyEdit
    int64_t deleteCount = 0;
    int64_t insertLength = 0;
    HighlightUpdate updates;                              // UpdateHighlight
    StoreStatePtr state;                                  // Restore

    static StoreAction setAll(std::vector<SuggestionHighlight> items, OverlapStrategy strategy = OverlapStrategy::KeepFirst);
    static StoreAction add(SuggestionHighlight item);
    static StoreAction remove(std::string id);
    static StoreAction removeAll();
    static StoreAction setActive(std::optional<std::string> id);
    static StoreAction applyEdit(int64_t editStart, int64_t deleteCount, int64_t insertLength);
    static StoreAction update(std::string id, HighlightUpdate updates);
    static StoreAction restore(StoreStatePtr state);
};

StoreStatePtr createInitialState();

// Pure transition function. Returns the input pointer itself for genuine no-ops.
StoreStatePtr suggestionStoreReducer(const StoreStatePtr& state, const StoreAction& action);

// Selectors
const std::vector<SuggestionHighlight>& selectAllSuggestions(const SuggestionStoreState& s);
const SuggestionHighlight* selectActiveSuggestion(const SuggestionStoreState& s);
const SuggestionHighlight* selectSuggestionById(const SuggestionStoreState& s, const std::string& id);
size_t selectSuggestionCount(const SuggestionStoreState& s);
bool selectHasSuggestion(const SuggestionStoreState& s, const std::string& id);
std::optional<SuggestionHighlight> selectSuggestionAtPoint(const SuggestionStoreState& s, int64_t point);
std::vector<SuggestionHighlight> selectSuggestionsInRange(const SuggestionStoreState& s, int64_t start, int64_t end);
const std::vector<std::string>& selectRejectedIds(const SuggestionStoreState& s);
bool selectHasAnySuggestions(const SuggestionStoreState& s);
bool selectIsActive(const SuggestionStoreState& s, const std::string& id);

// Holder for use outside a reactive UI: keeps the current state and notifies listeners on change.
class SuggestionStore {
public:
    using Listener = std::function<void(const StoreStatePtr&)>;
    using Unsubscribe = std::function<void()>;

    explicit SuggestionStore(StoreStatePtr initial = nullptr);

    const StoreStatePtr& getState() const { return state_; }
    void dispatch(const StoreAction& action);

    // The returned callable detaches the listener; it must not outlive the store.
    Unsubscribe subscribe(Listener listener);
    size_t listenerCount() const { return listeners_.size(); }

    StoreStatePtr snapshot() const { return state_; }
    void restore(StoreStatePtr snapshot);

private:
    StoreStatePtr state_;
    std::map<uint64_t, Listener> listeners_;
    uint64_t nextListenerId_ = 1;
};

} // namespace Marginalia
