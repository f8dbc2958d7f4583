#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <Marginalia/Range.hpp>

namespace Marginalia {

// search and selection are reserved for non-suggestion highlights
enum class HighlightCategory { Clarity, Grammar, Style, Structure, Economy, Search, Selection };
enum class SuggestionCategory { Clarity, Grammar, Style, Structure, Economy };

// Decides which highlight wins an overlap under the keep-higher-priority strategy.
enum class Priority { Critical, High, Medium, Low, Background };

const char* toString(HighlightCategory c);
const char* toString(SuggestionCategory c);
const char* toString(Priority p);
std::optional<HighlightCategory> parseHighlightCategory(const std::string& s);
std::optional<SuggestionCategory> parseSuggestionCategory(const std::string& s);
std::optional<Priority> parsePriority(const std::string& s);

const std::vector<std::string>& suggestionCategoryNames();
HighlightCategory toHighlightCategory(SuggestionCategory c);

// critical 100, high 75, medium 50, low 25, background 0
int priorityValue(Priority p);
// Positive when a outranks b.
inline int comparePriority(Priority a, Priority b) { return priorityValue(a) - priorityValue(b); }

struct Highlight {
    std::string id;
    Range range;
    HighlightCategory category = HighlightCategory::Clarity;
    Priority priority = Priority::Medium;
    nlohmann::json metadata; // null when absent

    bool operator==(const Highlight& o) const {
        return id == o.id && range == o.range && category == o.category && priority == o.priority && metadata == o.metadata;
    }
    bool operator!=(const Highlight& o) const { return !(*this == o); }
};

// An AI-proposed edit anchored to the text it targets.
struct SuggestionHighlight {
    std::string id;
    Range range;
    SuggestionCategory category = SuggestionCategory::Clarity;
    Priority priority = Priority::Medium;
    nlohmann::json metadata;
    std::string originalText;
    std::string observation;
    std::string suggestedRevision;
    std::optional<double> confidence; // [0, 1]

    Highlight toHighlight() const { return Highlight{id, range, toHighlightCategory(category), priority, metadata}; }

    bool operator==(const SuggestionHighlight& o) const {
        return id == o.id && range == o.range && category == o.category && priority == o.priority
            && metadata == o.metadata && originalText == o.originalText && observation == o.observation
            && suggestedRevision == o.suggestedRevision && confidence == o.confidence;
    }
    bool operator!=(const SuggestionHighlight& o) const { return !(*this == o); }
};

// 1-indexed
struct LineColumn {
    int64_t line = 1;
    int64_t column = 1;
    bool operator==(const LineColumn& o) const { return line == o.line && column == o.column; }
};

struct PositionedSuggestion : SuggestionHighlight {
    int64_t lineNumber = 1;
    int64_t columnNumber = 1;
};

PositionedSuggestion toPositionedSuggestion(const SuggestionHighlight& s, int64_t lineNumber, int64_t columnNumber);

struct DocumentStats {
    int64_t characterCount = 0;
    int64_t wordCount = 0;
    int64_t lineCount = 0;
    int64_t paragraphCount = 0;
};

template<typename T>
struct ValidationResult {
    bool valid = false;
    std::optional<T> value;
    std::vector<std::string> errors;
};

// "suggestion-<ms>-<random>"
std::string createSuggestionId();
// "<prefix>-<ms>-<random>"
std::string generateId(const std::string& prefix);
int64_t currentTimeMillis();

void to_json(nlohmann::json& j, const Range& r);
void from_json(const nlohmann::json& j, Range& r);
void to_json(nlohmann::json& j, const SuggestionHighlight& s);
void from_json(const nlohmann::json& j, SuggestionHighlight& s);
void to_json(nlohmann::json& j, const PositionedSuggestion& s);

} // namespace Marginalia
