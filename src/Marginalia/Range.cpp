#include <Marginalia/Range.hpp>
#include <Marginalia/Errors.hpp>
#include <algorithm>

namespace Marginalia {

Range::Range(int64_t start, int64_t end) : start_(start), end_(end) {
    if(start < 0){
        throw RangeValidationError("Invalid range: start must be non-negative, got " + std::to_string(start), start, end);
    }
    if(end < start){
        throw RangeValidationError("Invalid range: end (" + std::to_string(end) + ") must be >= start (" + std::to_string(start) + ")", start, end);
    }
}

std::string Range::toString() const {
    return "[" + std::to_string(start_) + ", " + std::to_string(end_) + ")";
}

Range createRange(int64_t start, int64_t end){
    return Range(start, end);
}

bool isValidRange(int64_t start, int64_t end){
    return start >= 0 && end >= start;
}

int compareRangesByStart(const Range& a, const Range& b){
    if(a.start() != b.start()) return a.start() < b.start() ? -1 : 1;
    if(a.end() != b.end()) return a.end() < b.end() ? -1 : 1;
    return 0;
}

std::optional<Range> rangeApplyEdit(const Range& range, int64_t editStart, int64_t deleteCount, int64_t insertLength){
    const int64_t editEnd = editStart + deleteCount;
    const int64_t delta = insertLength - deleteCount;

    // 1. entirely before the edit
    if(range.end() <= editStart) return range;

    // 2. entirely after the edit
    if(range.start() >= editEnd) return Range(range.start() + delta, range.end() + delta);

    // 3. entirely inside the deleted region
    if(range.start() >= editStart && range.end() <= editEnd) return std::nullopt;

    // 4. edit entirely inside the range
    if(range.start() <= editStart && range.end() >= editEnd) return Range(range.start(), range.end() + delta);

    // 5. tail of the range was deleted
    if(range.start() < editStart && range.end() <= editEnd){
        if(editStart <= range.start()) return std::nullopt;
        return Range(range.start(), editStart);
    }

    // 6. head of the range was deleted
    if(range.start() >= editStart && range.start() < editEnd && range.end() > editEnd){
        const int64_t newStart = editStart + insertLength;
        const int64_t newEnd = range.end() + delta;
        if(newEnd <= newStart) return std::nullopt;
        return Range(newStart, newEnd);
    }

    return range;
}

std::optional<Range> rangeIntersection(const Range& a, const Range& b){
    if(!rangeOverlaps(a, b)) return std::nullopt;
    return Range(std::max(a.start(), b.start()), std::min(a.end(), b.end()));
}

std::optional<Range> rangeUnion(const Range& a, const Range& b){
    if(a.end() < b.start() || b.end() < a.start()) return std::nullopt;
    return Range(std::min(a.start(), b.start()), std::max(a.end(), b.end()));
}

} // namespace Marginalia
