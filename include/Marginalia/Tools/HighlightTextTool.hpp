#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <Marginalia/Types.hpp>
#include <Marginalia/Tools/ToolTypes.hpp>

namespace Marginalia {

struct HighlightTextParams {
    int64_t lineNumber = 1;   // 1-indexed
    int64_t startColumn = 0;  // 0-indexed, inclusive
    int64_t endColumn = 0;    // 0-indexed, exclusive
    std::string originalText;
    SuggestionCategory suggestionType = SuggestionCategory::Clarity;
    std::string observation;
    std::string suggestedRevision;
    std::optional<double> confidence;
};

// Turns a line/column proposal into a SuggestionHighlight. When the columns are off but
// the text occurs elsewhere on the same line, the highlight is placed there instead.
class HighlightTextTool : public TypedTool<HighlightTextParams, SuggestionHighlight> {
public:
    HighlightTextTool();

    std::optional<HighlightTextParams> parse(const nlohmann::json& args, std::string* outError = nullptr) const override;
    ToolResult<SuggestionHighlight> run(const HighlightTextParams& params, const ToolContext& ctx) const override;
};

nlohmann::json createHighlightParams(int64_t lineNumber, int64_t startColumn, int64_t endColumn,
                                     const std::string& originalText, SuggestionCategory suggestionType,
                                     const std::string& observation, const std::string& suggestedRevision,
                                     std::optional<double> confidence = std::nullopt);

} // namespace Marginalia
