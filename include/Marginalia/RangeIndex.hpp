#pragma once
#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <Marginalia/Errors.hpp>
#include <Marginalia/Range.hpp>
#include <Marginalia/Types.hpp>

namespace Marginalia {

// How fromArray settles inputs that overlap each other.
enum class OverlapStrategy {
    KeepFirst,          // the item reached first by the sweep stays, later ones are rejected
    KeepHigherPriority, // a strictly higher priority evicts the active items it overlaps
    RejectAll           // every item that starts inside another is rejected
};

inline const char* toString(OverlapStrategy s){
    switch(s){
        case OverlapStrategy::KeepFirst: return "keep-first";
        case OverlapStrategy::KeepHigherPriority: return "keep-higher-priority";
        case OverlapStrategy::RejectAll: return "reject-all";
    }
    return "keep-first";
}

inline std::optional<OverlapStrategy> parseOverlapStrategy(const std::string& s){
    if(s == "keep-first") return OverlapStrategy::KeepFirst;
    if(s == "keep-higher-priority") return OverlapStrategy::KeepHigherPriority;
    if(s == "reject-all") return OverlapStrategy::RejectAll;
    return std::nullopt;
}

template<typename T> class RangeIndex;

template<typename T>
struct FromArrayResult {
    RangeIndex<T> index;
    std::vector<T> rejected;
    // id -> ids it collided with during the sweep
    std::map<std::string, std::vector<std::string>> overlapGroups;
};

namespace detail {

// One endpoint of an item's range. At equal positions ends sort before starts so that
// adjacent ranges never collide.
struct SweepEvent {
    int64_t pos;
    int kind; // 0 = end, 1 = start
    size_t order;
};

template<typename T>
std::vector<SweepEvent> buildSweepEvents(const std::vector<T>& items, const std::vector<size_t>& candidates){
    std::vector<SweepEvent> events;
    events.reserve(candidates.size() * 2);
    for(size_t idx : candidates){
        const Range& r = items[idx].range;
        events.push_back({r.start(), 1, idx});
        events.push_back({r.end(), 0, idx});
    }
    std::stable_sort(events.begin(), events.end(), [](const SweepEvent& a, const SweepEvent& b){
        if(a.pos != b.pos) return a.pos < b.pos;
        if(a.kind != b.kind) return a.kind < b.kind;
        return a.order < b.order;
    });
    return events;
}

} // namespace detail

// Overlap-free, id-keyed collection of ranged items kept sorted by start offset.
// T must expose `std::string id`, `Range range` and `Priority priority`.
// Mutating operations other than remove() return a new index and leave this one untouched.
template<typename T>
class RangeIndex {
public:
    using const_iterator = typename std::vector<T>::const_iterator;

    RangeIndex() = default;

    static RangeIndex empty(){ return RangeIndex(); }

    // Bulk-build from unsorted input. Items are swept in start order; equal starts keep input order,
    // so under KeepFirst the earlier input wins. A repeated id is rejected outright.
    static FromArrayResult<T> fromArray(const std::vector<T>& items, OverlapStrategy strategy = OverlapStrategy::KeepFirst){
        FromArrayResult<T> result;
        if(items.empty()) return result;

        std::vector<size_t> candidates;
        std::vector<bool> accepted(items.size(), false);
        std::vector<bool> rejected(items.size(), false);
        std::vector<size_t> rejectOrder;
        {
            std::unordered_set<std::string> seen;
            for(size_t i = 0; i < items.size(); ++i){
                if(!seen.insert(items[i].id).second){ rejected[i] = true; rejectOrder.push_back(i); continue; }
                candidates.push_back(i);
            }
        }

        std::vector<size_t> active; // insertion ordered
        for(const auto& ev : detail::buildSweepEvents(items, candidates)){
            const T& item = items[ev.order];
            if(ev.kind != 1){
                active.erase(std::remove(active.begin(), active.end(), ev.order), active.end());
                continue;
            }
            // empty ranges are checked against the active set but never join it
            if(active.empty()){
                if(!item.range.empty()) active.push_back(ev.order);
                accepted[ev.order] = true;
                continue;
            }

            auto& group = result.overlapGroups[item.id];
            for(size_t a : active){
                group.push_back(items[a].id);
                result.overlapGroups[items[a].id].push_back(item.id);
            }

            bool keepNew = false;
            if(strategy == OverlapStrategy::KeepHigherPriority){
                keepNew = true;
                const int newPriority = priorityValue(item.priority);
                for(size_t a : active){
                    if(priorityValue(items[a].priority) >= newPriority){ keepNew = false; break; }
                }
            }

            if(!keepNew){
                rejected[ev.order] = true;
                rejectOrder.push_back(ev.order);
                continue;
            }

            std::vector<size_t> survivors;
            for(size_t a : active){
                if(rangeOverlaps(items[a].range, item.range)){
                    accepted[a] = false;
                    rejected[a] = true;
                    rejectOrder.push_back(a);
                } else {
                    survivors.push_back(a);
                }
            }
            if(!item.range.empty()) survivors.push_back(ev.order);
            active.swap(survivors);
            accepted[ev.order] = true;
        }

        for(size_t i : rejectOrder) result.rejected.push_back(items[i]);

        std::vector<T> kept;
        for(size_t i = 0; i < items.size(); ++i) if(accepted[i]) kept.push_back(items[i]);
        std::stable_sort(kept.begin(), kept.end(), [](const T& a, const T& b){ return compareRangesByStart(a.range, b.range) < 0; });
        result.index.items_ = std::move(kept);
        result.index.rebuildIdIndex();
        return result;
    }

    // nullptr when the id is unknown
    const T* get(const std::string& id) const {
        auto it = idIndex_.find(id);
        return it == idIndex_.end() ? nullptr : &items_[it->second];
    }

    bool has(const std::string& id) const { return idIndex_.count(id) > 0; }

    // In-place removal; returns false when the id is unknown.
    bool remove(const std::string& id){
        auto it = idIndex_.find(id);
        if(it == idIndex_.end()) return false;
        items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(it->second));
        rebuildIdIndex();
        return true;
    }

    const std::vector<T>& getAll() const { return items_; }
    size_t size() const { return items_.size(); }
    bool isEmpty() const { return items_.empty(); }
    const_iterator begin() const { return items_.begin(); }
    const_iterator end() const { return items_.end(); }

    // Items whose range contains point.
    std::vector<T> queryPoint(int64_t point) const {
        std::vector<T> out;
        // rightmost item starting at or before point
        auto it = std::upper_bound(items_.begin(), items_.end(), point,
            [](int64_t p, const T& item){ return p < item.range.start(); });
        while(it != items_.begin()){
            --it;
            if(it->range.empty()) continue;
            if(it->range.end() <= point) break;
            if(rangeContainsPoint(it->range, point)) out.push_back(*it);
        }
        return out;
    }

    // Items overlapping q, in start order.
    std::vector<T> queryRange(const Range& q) const {
        std::vector<T> out;
        // first item that could reach into q
        size_t left = 0;
        size_t right = items_.size();
        while(left < right){
            size_t mid = left + (right - left) / 2;
            if(items_[mid].range.end() <= q.start()) left = mid + 1;
            else right = mid;
        }
        for(size_t i = left; i < items_.size(); ++i){
            if(items_[i].range.start() >= q.end()) break;
            if(rangeOverlaps(items_[i].range, q)) out.push_back(items_[i]);
        }
        return out;
    }

    // Maps every range through rangeApplyEdit, dropping the items the edit consumed.
    RangeIndex applyEdit(int64_t editStart, int64_t deleteCount, int64_t insertLength) const {
        RangeIndex out;
        out.items_.reserve(items_.size());
        for(const auto& item : items_){
            auto moved = rangeApplyEdit(item.range, editStart, deleteCount, insertLength);
            if(!moved) continue;
            T copy = item;
            copy.range = *moved;
            out.items_.push_back(std::move(copy));
        }
        out.rebuildIdIndex();
        return out;
    }

    RangeIndex clone() const { return *this; }

    std::vector<std::string> wouldOverlap(const Range& r) const {
        std::vector<std::string> ids;
        for(const auto& item : queryRange(r)) ids.push_back(item.id);
        return ids;
    }

    // Throws OverlapError naming every item the new one would collide with.
    RangeIndex add(const T& item) const {
        auto overlapping = queryRange(item.range);
        if(!overlapping.empty()){
            std::string msg = "Cannot add item " + item.id + ": overlaps with ";
            std::vector<Range> ranges;
            std::vector<std::string> ids;
            for(size_t i = 0; i < overlapping.size(); ++i){
                if(i) msg += ", ";
                msg += overlapping[i].id;
                ranges.push_back(overlapping[i].range);
                ids.push_back(overlapping[i].id);
            }
            throw OverlapError(msg, item.range, std::move(ranges), std::move(ids));
        }
        RangeIndex out;
        out.items_ = items_;
        // equal starts order by end, so an empty range sits before a non-empty one
        auto pos = std::upper_bound(out.items_.begin(), out.items_.end(), item,
            [](const T& a, const T& b){ return compareRangesByStart(a.range, b.range) < 0; });
        out.items_.insert(pos, item);
        out.rebuildIdIndex();
        return out;
    }

    template<typename Pred>
    RangeIndex filter(Pred pred) const {
        RangeIndex out;
        for(const auto& item : items_) if(pred(item)) out.items_.push_back(item);
        out.rebuildIdIndex();
        return out;
    }

    template<typename Pred>
    const T* find(Pred pred) const {
        for(const auto& item : items_) if(pred(item)) return &item;
        return nullptr;
    }

    template<typename Pred>
    bool some(Pred pred) const { return std::any_of(items_.begin(), items_.end(), pred); }

    template<typename Pred>
    bool every(Pred pred) const { return std::all_of(items_.begin(), items_.end(), pred); }

    std::vector<std::string> getIds() const {
        std::vector<std::string> ids;
        ids.reserve(items_.size());
        for(const auto& item : items_) ids.push_back(item.id);
        return ids;
    }

    bool operator==(const RangeIndex& o) const { return items_ == o.items_; }
    bool operator!=(const RangeIndex& o) const { return !(*this == o); }

private:
    std::vector<T> items_;
    std::unordered_map<std::string, size_t> idIndex_;

    void rebuildIdIndex(){
        idIndex_.clear();
        for(size_t i = 0; i < items_.size(); ++i) idIndex_[items_[i].id] = i;
    }
};

// Every pairwise overlap among items, reported in both directions.
template<typename T>
std::map<std::string, std::vector<std::string>> detectOverlaps(const std::vector<T>& items){
    std::map<std::string, std::vector<std::string>> overlaps;
    if(items.size() < 2) return overlaps;
    std::vector<size_t> all(items.size());
    for(size_t i = 0; i < items.size(); ++i) all[i] = i;
    std::vector<size_t> active;
    for(const auto& ev : detail::buildSweepEvents(items, all)){
        if(ev.kind != 1){
            active.erase(std::remove(active.begin(), active.end(), ev.order), active.end());
            continue;
        }
        for(size_t a : active){
            overlaps[items[ev.order].id].push_back(items[a].id);
            overlaps[items[a].id].push_back(items[ev.order].id);
        }
        if(!items[ev.order].range.empty()) active.push_back(ev.order);
    }
    return overlaps;
}

} // namespace Marginalia
