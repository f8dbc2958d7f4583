#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <Marginalia/Tools/ToolTypes.hpp>

namespace Marginalia {

struct LineContentResult {
    int64_t lineNumber = 1;
    std::string content; // without the newline
    int64_t length = 0;
    int64_t startOffset = 0;
    int64_t endOffset = 0;
};

struct GetLineContentParams {
    int64_t lineNumber = 1;
    std::optional<int64_t> contextLines;
};

// A single line, or the line with its neighbours when context was requested.
struct GetLineContentResult {
    LineContentResult mainLine;
    bool withContext = false;
    std::vector<LineContentResult> before;
    std::vector<LineContentResult> after;
};

void to_json(nlohmann::json& j, const LineContentResult& r);
void to_json(nlohmann::json& j, const GetLineContentResult& r);

class GetLineContentTool : public TypedTool<GetLineContentParams, GetLineContentResult> {
public:
    GetLineContentTool();

    std::optional<GetLineContentParams> parse(const nlohmann::json& args, std::string* outError = nullptr) const override;
    ToolResult<GetLineContentResult> run(const GetLineContentParams& params, const ToolContext& ctx) const override;
};

} // namespace Marginalia
