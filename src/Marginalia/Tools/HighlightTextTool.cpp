#include <Marginalia/Tools/HighlightTextTool.hpp>
#include <Marginalia/Commands/Command.hpp>

namespace Marginalia {

static const char* kDescription =
    "Highlight a specific portion of text with a suggestion for improvement.\n"
    "\n"
    "Guidelines:\n"
    "- line_number is 1-indexed (first line is 1)\n"
    "- start_column and end_column are 0-indexed within the line\n"
    "- original_text MUST exactly match the text at the specified position\n"
    "- suggestion_type must be one of: clarity, grammar, style, structure, economy\n"
    "- observation explains WHY the text needs attention\n"
    "- suggested_revision is the improved version of the text\n"
    "- confidence (optional) is 0-1 indicating how confident you are\n"
    "\n"
    "The tool will attempt to find the text if the columns are slightly off, but the\n"
    "original_text must appear somewhere on the specified line.";

static ToolParameterSchema buildSchema(){
    ToolParameterSchema s;
    ParameterSchema p;

    p = {}; p.type = "number"; p.description = "The 1-indexed line number where the text begins"; p.minimum = 1; p.required = true;
    s.properties.emplace_back("line_number", p);
    p = {}; p.type = "number"; p.description = "The 0-indexed column where the highlight starts within the line"; p.minimum = 0; p.required = true;
    s.properties.emplace_back("start_column", p);
    p = {}; p.type = "number"; p.description = "The 0-indexed column where the highlight ends within the line"; p.minimum = 1; p.required = true;
    s.properties.emplace_back("end_column", p);
    p = {}; p.type = "string"; p.description = "The exact text being highlighted (must match document content)"; p.minLength = 1; p.required = true;
    s.properties.emplace_back("original_text", p);
    p = {}; p.type = "string"; p.description = "The category of suggestion"; p.enumValues = suggestionCategoryNames(); p.required = true;
    s.properties.emplace_back("suggestion_type", p);
    p = {}; p.type = "string"; p.description = "Explanation of why this text needs attention"; p.required = true;
    s.properties.emplace_back("observation", p);
    p = {}; p.type = "string"; p.description = "The improved version of the text"; p.required = true;
    s.properties.emplace_back("suggested_revision", p);
    p = {}; p.type = "number"; p.description = "Confidence level 0-1 indicating how confident you are (optional)"; p.minimum = 0; p.maximum = 1;
    s.properties.emplace_back("confidence", p);

    s.required = {"line_number", "start_column", "end_column", "original_text", "suggestion_type", "observation", "suggested_revision"};
    return s;
}

static bool fail(std::string* outError, const std::string& msg){
    if(outError) *outError = msg;
    return false;
}

HighlightTextTool::HighlightTextTool()
    : TypedTool("highlight_text", kDescription, buildSchema(), ToolAccess::Mutating) {}

std::optional<HighlightTextParams> HighlightTextTool::parse(const nlohmann::json& args, std::string* outError) const {
    using namespace validators;
    auto reject = [&](const std::string& msg) -> std::optional<HighlightTextParams> { fail(outError, msg); return std::nullopt; };

    if(!isObject(args)) return reject("arguments must be an object");
    if(!args.contains("line_number") || !isPositiveInteger(args["line_number"])) return reject("line_number must be a positive integer");
    if(!args.contains("start_column") || !isNonNegativeInteger(args["start_column"])) return reject("start_column must be a non-negative integer");
    if(!args.contains("end_column") || !isNonNegativeInteger(args["end_column"])) return reject("end_column must be a non-negative integer");
    if(asInteger(args["end_column"]) <= asInteger(args["start_column"])) return reject("end_column must be greater than start_column");
    if(!args.contains("original_text") || !isNonEmptyString(args["original_text"])) return reject("original_text must be a non-empty string");
    if(!args.contains("suggestion_type") || !isOneOf(args["suggestion_type"], suggestionCategoryNames())) return reject("suggestion_type is not a known category");
    if(!args.contains("observation") || !args["observation"].is_string()) return reject("observation must be a string");
    if(!args.contains("suggested_revision") || !args["suggested_revision"].is_string()) return reject("suggested_revision must be a string");
    if(!isOptional(args, "confidence", isNormalizedNumber)) return reject("confidence must be a number between 0 and 1");

    HighlightTextParams p;
    p.lineNumber = asInteger(args["line_number"]);
    p.startColumn = asInteger(args["start_column"]);
    p.endColumn = asInteger(args["end_column"]);
    p.originalText = args["original_text"].get<std::string>();
    p.suggestionType = *parseSuggestionCategory(args["suggestion_type"].get<std::string>());
    p.observation = args["observation"].get<std::string>();
    p.suggestedRevision = args["suggested_revision"].get<std::string>();
    if(args.contains("confidence") && !args["confidence"].is_null()) p.confidence = args["confidence"].get<double>();
    return p;
}

ToolResult<SuggestionHighlight> HighlightTextTool::run(const HighlightTextParams& params, const ToolContext& ctx) const {
    const DocumentContext& doc = ctx.document;
    const int64_t lineCount = static_cast<int64_t>(doc.lines.size());
    const int64_t lineIndex = params.lineNumber - 1;
    if(lineIndex < 0 || lineIndex >= lineCount){
        return toolFailure<SuggestionHighlight>("Line " + std::to_string(params.lineNumber) + " does not exist. Document has "
            + std::to_string(lineCount) + " lines.", true, std::string("LINE_OUT_OF_BOUNDS"));
    }

    const std::string& line = doc.lines[static_cast<size_t>(lineIndex)];
    const int64_t lineLen = static_cast<int64_t>(line.size());
    if(params.startColumn < 0 || params.startColumn >= lineLen){
        return toolFailure<SuggestionHighlight>("Start column " + std::to_string(params.startColumn) + " is out of bounds. Line "
            + std::to_string(params.lineNumber) + " has " + std::to_string(lineLen) + " characters (0-" + std::to_string(lineLen - 1) + ").",
            true, std::string("COLUMN_OUT_OF_BOUNDS"));
    }
    if(params.endColumn > lineLen){
        return toolFailure<SuggestionHighlight>("End column " + std::to_string(params.endColumn) + " is out of bounds. Line "
            + std::to_string(params.lineNumber) + " has " + std::to_string(lineLen) + " characters.",
            true, std::string("COLUMN_OUT_OF_BOUNDS"));
    }

    const int64_t lineStart = doc.lineMap.lineColumnToOffset(LineColumn{params.lineNumber, 1});
    const int64_t startOffset = lineStart + params.startColumn;
    const int64_t endOffset = lineStart + params.endColumn;
    const std::string actual = doc.content.substr(static_cast<size_t>(startOffset), static_cast<size_t>(endOffset - startOffset));

    SuggestionHighlight h;
    h.id = createSuggestionId();
    h.category = params.suggestionType;
    h.priority = Priority::Medium;
    h.originalText = params.originalText;
    h.observation = params.observation;
    h.suggestedRevision = params.suggestedRevision;
    h.confidence = params.confidence;

    const std::string shown = truncateText(params.originalText, 30);
    const std::string lineStr = std::to_string(params.lineNumber);

    if(actual == params.originalText){
        h.range = Range(startOffset, endOffset);
        return toolSuccess(h, "Highlighted \"" + shown + "\" at line " + lineStr + ", columns "
            + std::to_string(params.startColumn) + "-" + std::to_string(params.endColumn) + ".");
    }

    const size_t found = line.find(params.originalText);
    if(found == std::string::npos){
        return toolFailure<SuggestionHighlight>("Text \"" + params.originalText + "\" not found at line " + lineStr + ", columns "
            + std::to_string(params.startColumn) + "-" + std::to_string(params.endColumn) + ". Found \"" + actual + "\" instead. "
            + "The text also doesn't appear elsewhere on line " + lineStr + ".", true, std::string("TEXT_MISMATCH"));
    }

    const int64_t foundCol = static_cast<int64_t>(found);
    const int64_t textLen = static_cast<int64_t>(params.originalText.size());
    h.range = Range(lineStart + foundCol, lineStart + foundCol + textLen);
    return toolSuccess(h, "Highlighted \"" + shown + "\" at adjusted position (line " + lineStr + ", columns "
        + std::to_string(foundCol) + "-" + std::to_string(foundCol + textLen) + "). Note: Original position was "
        + std::to_string(params.startColumn) + "-" + std::to_string(params.endColumn) + ".");
}

nlohmann::json createHighlightParams(int64_t lineNumber, int64_t startColumn, int64_t endColumn,
                                     const std::string& originalText, SuggestionCategory suggestionType,
                                     const std::string& observation, const std::string& suggestedRevision,
                                     std::optional<double> confidence){
    nlohmann::json j = {
        {"line_number", lineNumber},
        {"start_column", startColumn},
        {"end_column", endColumn},
        {"original_text", originalText},
        {"suggestion_type", toString(suggestionType)},
        {"observation", observation},
        {"suggested_revision", suggestedRevision}
    };
    if(confidence) j["confidence"] = *confidence;
    return j;
}

} // namespace Marginalia
