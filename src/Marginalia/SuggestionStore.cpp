#include <Marginalia/SuggestionStore.hpp>
#include <plog/Log.h>

namespace Marginalia {

const char* toString(StoreActionType t){
    switch(t){
        case StoreActionType::SetAll: return "SET_ALL";
        case StoreActionType::Add: return "ADD";
        case StoreActionType::Remove: return "REMOVE";
        case StoreActionType::RemoveAll: return "REMOVE_ALL";
        case StoreActionType::SetActive: return "SET_ACTIVE";
        case StoreActionType::ApplyEdit: return "APPLY_EDIT";
        case StoreActionType::UpdateHighlight: return "UPDATE_HIGHLIGHT";
        case StoreActionType::Restore: return "RESTORE";
    }
    return "UNKNOWN";
}

StoreAction StoreAction::setAll(std::vector<SuggestionHighlight> items, OverlapStrategy strategy){
    StoreAction a; a.type = StoreActionType::SetAll; a.highlights = std::move(items); a.strategy = strategy; return a;
}
StoreAction StoreAction::add(SuggestionHighlight item){
    StoreAction a; a.type = StoreActionType::Add; a.highlight = std::move(item); return a;
}
StoreAction StoreAction::remove(std::string id){
    StoreAction a; a.type = StoreActionType::Remove; a.id = std::move(id); return a;
}
StoreAction StoreAction::removeAll(){
    StoreAction a; a.type = StoreActionType::RemoveAll; return a;
}
StoreAction StoreAction::setActive(std::optional<std::string> id){
    StoreAction a; a.type = StoreActionType::SetActive; a.activeId = std::move(id); return a;
}
StoreAction StoreAction::applyEdit(int64_t editStart, int64_t deleteCount, int64_t insertLength){
    StoreAction a; a.type = StoreActionType::ApplyEdit; a.editStart = editStart; a.deleteCount = deleteCount; a.insertLength = insertLength; return a;
}
StoreAction StoreAction::update(std::string id, HighlightUpdate updates){
    StoreAction a; a.type = StoreActionType::UpdateHighlight; a.id = std::move(id); a.updates = std::move(updates); return a;
}
StoreAction StoreAction::restore(StoreStatePtr state){
    StoreAction a; a.type = StoreActionType::Restore; a.state = std::move(state); return a;
}

StoreStatePtr createInitialState(){
    return std::make_shared<const SuggestionStoreState>();
}

static SuggestionHighlight applyUpdate(const SuggestionHighlight& existing, const HighlightUpdate& u){
    SuggestionHighlight out = existing;
    if(u.range) out.range = *u.range;
    if(u.category) out.category = *u.category;
    if(u.priority) out.priority = *u.priority;
    if(u.metadata) out.metadata = *u.metadata;
    if(u.originalText) out.originalText = *u.originalText;
    if(u.observation) out.observation = *u.observation;
    if(u.suggestedRevision) out.suggestedRevision = *u.suggestedRevision;
    if(u.confidence) out.confidence = *u.confidence;
    return out;
}

StoreStatePtr suggestionStoreReducer(const StoreStatePtr& state, const StoreAction& action){
    switch(action.type){
        case StoreActionType::SetAll: {
            auto result = RangeIndex<SuggestionHighlight>::fromArray(action.highlights, action.strategy);
            auto next = std::make_shared<SuggestionStoreState>();
            next->highlights = std::move(result.index);
            next->version = state->version + 1;
            for(const auto& r : result.rejected) next->lastRejectedIds.push_back(r.id);
            if(!next->lastRejectedIds.empty()){
                PLOGD << "[Store] SET_ALL rejected " << next->lastRejectedIds.size() << " overlapping suggestion(s)";
            }
            return next;
        }

        case StoreActionType::Add: {
            auto next = std::make_shared<SuggestionStoreState>(*state);
            try {
                next->highlights = state->highlights.add(action.highlight);
            } catch(const OverlapError& e){
                PLOGD << "[Store] " << e.what();
                next->lastRejectedIds = {action.highlight.id};
                return next;
            }
            next->version = state->version + 1;
            next->lastRejectedIds.clear();
            return next;
        }

        case StoreActionType::Remove: {
            if(!state->highlights.has(action.id)) return state;
            auto next = std::make_shared<SuggestionStoreState>(*state);
            next->highlights.remove(action.id);
            if(next->activeId == action.id) next->activeId.reset();
            next->version = state->version + 1;
            next->lastRejectedIds.clear();
            return next;
        }

        case StoreActionType::RemoveAll: {
            auto next = std::make_shared<SuggestionStoreState>();
            next->version = state->version + 1;
            return next;
        }

        case StoreActionType::SetActive: {
            if(action.activeId && !state->highlights.has(*action.activeId)) return state;
            if(state->activeId == action.activeId) return state;
            auto next = std::make_shared<SuggestionStoreState>(*state);
            next->activeId = action.activeId;
            next->version = state->version + 1;
            return next;
        }

        case StoreActionType::ApplyEdit: {
            auto next = std::make_shared<SuggestionStoreState>();
            next->highlights = state->highlights.applyEdit(action.editStart, action.deleteCount, action.insertLength);
            if(state->activeId && next->highlights.has(*state->activeId)) next->activeId = state->activeId;
            next->version = state->version + 1;
            return next;
        }

        case StoreActionType::UpdateHighlight: {
            const SuggestionHighlight* existing = state->highlights.get(action.id);
            if(!existing) return state;
            const SuggestionHighlight updated = applyUpdate(*existing, action.updates);

            auto next = std::make_shared<SuggestionStoreState>(*state);
            next->lastRejectedIds.clear();
            next->version = state->version + 1;

            if(action.updates.range && *action.updates.range != existing->range){
                auto without = state->highlights.clone();
                without.remove(action.id);
                try {
                    next->highlights = without.add(updated);
                } catch(const OverlapError& e){
                    PLOGD << "[Store] range update rejected: " << e.what();
                    return state;
                }
                return next;
            }

            std::vector<SuggestionHighlight> all = state->highlights.getAll();
            for(auto& h : all) if(h.id == action.id) h = updated;
            next->highlights = RangeIndex<SuggestionHighlight>::fromArray(all, OverlapStrategy::KeepFirst).index;
            return next;
        }

        case StoreActionType::Restore:
            return action.state ? action.state : createInitialState();
    }
    return state;
}

const std::vector<SuggestionHighlight>& selectAllSuggestions(const SuggestionStoreState& s){ return s.highlights.getAll(); }

const SuggestionHighlight* selectActiveSuggestion(const SuggestionStoreState& s){
    if(!s.activeId) return nullptr;
    return s.highlights.get(*s.activeId);
}

const SuggestionHighlight* selectSuggestionById(const SuggestionStoreState& s, const std::string& id){ return s.highlights.get(id); }
size_t selectSuggestionCount(const SuggestionStoreState& s){ return s.highlights.size(); }
bool selectHasSuggestion(const SuggestionStoreState& s, const std::string& id){ return s.highlights.has(id); }

std::optional<SuggestionHighlight> selectSuggestionAtPoint(const SuggestionStoreState& s, int64_t point){
    auto hits = s.highlights.queryPoint(point);
    if(hits.empty()) return std::nullopt;
    return hits.front();
}

std::vector<SuggestionHighlight> selectSuggestionsInRange(const SuggestionStoreState& s, int64_t start, int64_t end){
    return s.highlights.queryRange(Range(start, end));
}

const std::vector<std::string>& selectRejectedIds(const SuggestionStoreState& s){ return s.lastRejectedIds; }
bool selectHasAnySuggestions(const SuggestionStoreState& s){ return !s.highlights.isEmpty(); }
bool selectIsActive(const SuggestionStoreState& s, const std::string& id){ return s.activeId && *s.activeId == id; }

SuggestionStore::SuggestionStore(StoreStatePtr initial)
    : state_(initial ? std::move(initial) : createInitialState()) {}

void SuggestionStore::dispatch(const StoreAction& action){
    StoreStatePtr next = suggestionStoreReducer(state_, action);
    if(next == state_){
        PLOGV << "[Store] " << toString(action.type) << " was a no-op";
        return;
    }
    state_ = std::move(next);
    // copy so a listener may unsubscribe while being notified
    auto listeners = listeners_;
    for(auto& kv : listeners) kv.second(state_);
}

SuggestionStore::Unsubscribe SuggestionStore::subscribe(Listener listener){
    const uint64_t id = nextListenerId_++;
    listeners_[id] = std::move(listener);
    return [this, id](){ listeners_.erase(id); };
}

void SuggestionStore::restore(StoreStatePtr snapshot){
    dispatch(StoreAction::restore(std::move(snapshot)));
}

} // namespace Marginalia
