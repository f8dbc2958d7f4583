#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <Marginalia/Types.hpp>
#include <Marginalia/Tools/ToolTypes.hpp>

namespace Marginalia {

struct ExtendedDocumentStats : DocumentStats {
    int64_t averageLineLength = 0; // rounded
    int64_t maxLineLength = 0;
    int64_t minLineLength = 0;     // over non-empty lines, 0 if there are none
    int64_t emptyLineCount = 0;
    int64_t estimatedReadingTimeMinutes = 0;
};

struct GetDocumentStatsParams {
    bool includeLineDetails = false; // accepted, currently unused
};

void to_json(nlohmann::json& j, const ExtendedDocumentStats& s);

// Whitespace-separated words; paragraphs are runs of lines separated by blank lines.
int64_t countWords(const std::string& text);
int64_t countParagraphs(const std::string& text);
ExtendedDocumentStats computeDocumentStats(const DocumentContext& doc);

class GetDocumentStatsTool : public TypedTool<GetDocumentStatsParams, ExtendedDocumentStats> {
public:
    static constexpr int64_t kWordsPerMinute = 225;

    GetDocumentStatsTool();

    std::optional<GetDocumentStatsParams> parse(const nlohmann::json& args, std::string* outError = nullptr) const override;
    ToolResult<ExtendedDocumentStats> run(const GetDocumentStatsParams& params, const ToolContext& ctx) const override;
};

} // namespace Marginalia
