#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <Marginalia/Range.hpp>

namespace Marginalia {

// Base for every error raised by the suggestion engine.
// code() is stable for programmatic handling; recoverable() tells the caller whether retrying makes sense.
class HighlightError : public std::runtime_error {
public:
    HighlightError(const std::string& message, std::string code, bool recoverable)
        : std::runtime_error(message), code_(std::move(code)), recoverable_(recoverable) {}

    const std::string& code() const { return code_; }
    bool recoverable() const { return recoverable_; }

private:
    std::string code_;
    bool recoverable_;
};

class RangeValidationError : public HighlightError {
public:
    RangeValidationError(const std::string& message, int64_t start, int64_t end)
        : HighlightError(message, "RANGE_VALIDATION", true), start_(start), end_(end) {}

    int64_t start() const { return start_; }
    int64_t end() const { return end_; }

private:
    int64_t start_;
    int64_t end_;
};

class OverlapError : public HighlightError {
public:
    OverlapError(const std::string& message, const Range& newRange,
                 std::vector<Range> existingRanges, std::vector<std::string> existingIds)
        : HighlightError(message, "OVERLAP", true), newRange_(newRange),
          existingRanges_(std::move(existingRanges)), existingIds_(std::move(existingIds)) {}

    const Range& newRange() const { return newRange_; }
    const std::vector<Range>& existingRanges() const { return existingRanges_; }
    const std::vector<std::string>& existingIds() const { return existingIds_; }

private:
    Range newRange_;
    std::vector<Range> existingRanges_;
    std::vector<std::string> existingIds_;
};

class ToolExecutionError : public HighlightError {
public:
    ToolExecutionError(const std::string& message, std::string toolName, nlohmann::json params, bool recoverable = true)
        : HighlightError(message, "TOOL_EXECUTION", recoverable), toolName_(std::move(toolName)), params_(std::move(params)) {}

    const std::string& toolName() const { return toolName_; }
    const nlohmann::json& params() const { return params_; }

private:
    std::string toolName_;
    nlohmann::json params_;
};

// Raised only by the strict validateTransition entry points; plain transitions are no-ops instead.
class StateTransitionError : public HighlightError {
public:
    StateTransitionError(const std::string& message, std::string currentState, std::string event)
        : HighlightError(message, "STATE_TRANSITION", false), currentState_(std::move(currentState)), event_(std::move(event)) {}

    const std::string& currentState() const { return currentState_; }
    const std::string& event() const { return event_; }

private:
    std::string currentState_;
    std::string event_;
};

class SuggestionNotFoundError : public HighlightError {
public:
    explicit SuggestionNotFoundError(const std::string& suggestionId)
        : HighlightError("Suggestion not found: " + suggestionId, "SUGGESTION_NOT_FOUND", true), suggestionId_(suggestionId) {}

    const std::string& suggestionId() const { return suggestionId_; }

private:
    std::string suggestionId_;
};

class DocumentError : public HighlightError {
public:
    explicit DocumentError(const std::string& message)
        : HighlightError(message, "DOCUMENT_ERROR", true) {}
};

} // namespace Marginalia
