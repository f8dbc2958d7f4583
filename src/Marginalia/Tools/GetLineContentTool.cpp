#include <Marginalia/Tools/GetLineContentTool.hpp>
#include <Marginalia/Commands/Command.hpp>
#include <algorithm>

namespace Marginalia {

static const int64_t kMaxContextLines = 10;

static const char* kDescription =
    "Retrieve the content of a specific line from the document.\n"
    "\n"
    "Use this tool to:\n"
    "- Verify the exact text before creating a highlight\n"
    "- Get context around a line you're analyzing\n"
    "- Check the length and position of text\n"
    "\n"
    "Parameters:\n"
    "- line_number: 1-indexed line number (first line is 1)\n"
    "- context_lines: (optional) number of surrounding lines to include\n"
    "\n"
    "Returns line content, length, and character offsets.";

static ToolParameterSchema buildSchema(){
    ToolParameterSchema s;
    ParameterSchema line;
    line.type = "number";
    line.description = "The 1-indexed line number to retrieve";
    line.minimum = 1;
    line.required = true;
    ParameterSchema context;
    context.type = "number";
    context.description = "Optional: number of surrounding lines to include (e.g., 2 means 2 lines before and 2 after)";
    context.minimum = 0;
    context.maximum = static_cast<double>(kMaxContextLines);
    s.properties = {{"line_number", line}, {"context_lines", context}};
    s.required = {"line_number"};
    return s;
}

static LineContentResult lineResult(const DocumentContext& doc, int64_t lineNumber){
    LineContentResult r;
    r.lineNumber = lineNumber;
    r.content = doc.lines[static_cast<size_t>(lineNumber - 1)];
    r.length = static_cast<int64_t>(r.content.size());
    r.startOffset = doc.lineMap.lineColumnToOffset(LineColumn{lineNumber, 1});
    r.endOffset = r.startOffset + r.length;
    return r;
}

void to_json(nlohmann::json& j, const LineContentResult& r){
    j = {
        {"lineNumber", r.lineNumber},
        {"content", r.content},
        {"length", r.length},
        {"startOffset", r.startOffset},
        {"endOffset", r.endOffset}
    };
}

void to_json(nlohmann::json& j, const GetLineContentResult& r){
    if(!r.withContext){
        to_json(j, r.mainLine);
        return;
    }
    j = {{"mainLine", r.mainLine}, {"before", r.before}, {"after", r.after}};
}

GetLineContentTool::GetLineContentTool()
    : TypedTool("get_line_content", kDescription, buildSchema(), ToolAccess::ReadOnly) {}

std::optional<GetLineContentParams> GetLineContentTool::parse(const nlohmann::json& args, std::string* outError) const {
    using namespace validators;
    std::string err;
    if(!isObject(args)) err = "arguments must be an object";
    else if(!args.contains("line_number") || !isPositiveInteger(args["line_number"])) err = "line_number must be a positive integer";
    else if(!isOptional(args, "context_lines", isNonNegativeInteger)) err = "context_lines must be a non-negative integer";
    if(!err.empty()){
        if(outError) *outError = err;
        return std::nullopt;
    }

    GetLineContentParams p;
    p.lineNumber = asInteger(args["line_number"]);
    if(args.contains("context_lines") && !args["context_lines"].is_null()){
        p.contextLines = std::min<int64_t>(asInteger(args["context_lines"]), kMaxContextLines);
    }
    return p;
}

ToolResult<GetLineContentResult> GetLineContentTool::run(const GetLineContentParams& params, const ToolContext& ctx) const {
    const DocumentContext& doc = ctx.document;
    const int64_t lineCount = static_cast<int64_t>(doc.lines.size());
    if(params.lineNumber < 1 || params.lineNumber > lineCount){
        return toolFailure<GetLineContentResult>("Line " + std::to_string(params.lineNumber) + " does not exist. Document has "
            + std::to_string(lineCount) + " lines.", true, std::string("LINE_OUT_OF_BOUNDS"));
    }

    GetLineContentResult result;
    result.mainLine = lineResult(doc, params.lineNumber);
    const int64_t ctxLines = params.contextLines.value_or(0);
    if(ctxLines == 0){
        const std::string msg = "Line " + std::to_string(params.lineNumber) + ": \"" + truncateText(result.mainLine.content, 50)
            + "\" (" + std::to_string(result.mainLine.length) + " chars)";
        return toolSuccess(result, msg);
    }

    result.withContext = true;
    for(int64_t i = std::max<int64_t>(1, params.lineNumber - ctxLines); i < params.lineNumber; ++i){
        result.before.push_back(lineResult(doc, i));
    }
    for(int64_t i = params.lineNumber + 1; i <= std::min(lineCount, params.lineNumber + ctxLines); ++i){
        result.after.push_back(lineResult(doc, i));
    }
    const std::string msg = "Line " + std::to_string(params.lineNumber) + " with " + std::to_string(result.before.size())
        + " lines before and " + std::to_string(result.after.size()) + " lines after";
    return toolSuccess(result, msg);
}

} // namespace Marginalia
