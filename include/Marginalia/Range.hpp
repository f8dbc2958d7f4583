#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace Marginalia {

// Half-open character interval [start, end).
// Always valid: construction throws RangeValidationError when start < 0 or end < start.
class Range {
public:
    Range() = default;
    Range(int64_t start, int64_t end);

    int64_t start() const { return start_; }
    int64_t end() const { return end_; }
    int64_t length() const { return end_ - start_; }
    bool empty() const { return start_ == end_; }

    bool operator==(const Range& o) const { return start_ == o.start_ && end_ == o.end_; }
    bool operator!=(const Range& o) const { return !(*this == o); }

    std::string toString() const;

private:
    int64_t start_ = 0;
    int64_t end_ = 0;
};

Range createRange(int64_t start, int64_t end);
bool isValidRange(int64_t start, int64_t end);

inline int64_t rangeLength(const Range& r) { return r.length(); }

// Adjacent ranges ([0,10) and [10,20)) never overlap.
inline bool rangeOverlaps(const Range& a, const Range& b) { return a.start() < b.end() && b.start() < a.end(); }
inline bool rangeContains(const Range& outer, const Range& inner) { return outer.start() <= inner.start() && outer.end() >= inner.end(); }
inline bool rangeContainsPoint(const Range& r, int64_t point) { return point >= r.start() && point < r.end(); }

// Negative when a sorts before b; ties on start are broken by end.
int compareRangesByStart(const Range& a, const Range& b);

// Maps a range through a text edit that deleted deleteCount characters at editStart and inserted insertLength.
// Returns nullopt when the edit consumed the range.
std::optional<Range> rangeApplyEdit(const Range& range, int64_t editStart, int64_t deleteCount, int64_t insertLength);

// Overlapping part of a and b, nullopt when they do not overlap.
std::optional<Range> rangeIntersection(const Range& a, const Range& b);
// Smallest range covering a and b, nullopt when there is a gap between them. Adjacent ranges merge.
std::optional<Range> rangeUnion(const Range& a, const Range& b);

} // namespace Marginalia
