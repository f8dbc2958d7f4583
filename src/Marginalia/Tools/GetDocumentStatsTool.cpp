#include <Marginalia/Tools/GetDocumentStatsTool.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace Marginalia {

static const char* kDescription =
    "Get statistics about the document being analyzed.\n"
    "\n"
    "Returns:\n"
    "- characterCount: Total number of characters\n"
    "- wordCount: Total number of words\n"
    "- lineCount: Total number of lines\n"
    "- paragraphCount: Number of paragraphs\n"
    "- averageLineLength: Average characters per line\n"
    "- maxLineLength: Longest line in characters\n"
    "- minLineLength: Shortest non-empty line\n"
    "- emptyLineCount: Number of empty lines\n"
    "- estimatedReadingTimeMinutes: Approximate reading time\n"
    "\n"
    "Use this tool at the start of a review to understand document size and structure.";

static bool isSpace(char c){ return std::isspace(static_cast<unsigned char>(c)) != 0; }

static bool isBlank(const std::string& s){
    return std::all_of(s.begin(), s.end(), isSpace);
}

int64_t countWords(const std::string& text){
    int64_t words = 0;
    bool inWord = false;
    for(char c : text){
        if(isSpace(c)){ inWord = false; continue; }
        if(!inWord){ ++words; inWord = true; }
    }
    return words;
}

int64_t countParagraphs(const std::string& text){
    int64_t paragraphs = 0;
    bool inParagraph = false;
    size_t pos = 0;
    while(pos <= text.size()){
        size_t nl = text.find('\n', pos);
        if(nl == std::string::npos) nl = text.size();
        if(isBlank(text.substr(pos, nl - pos))){
            inParagraph = false;
        } else if(!inParagraph){
            ++paragraphs;
            inParagraph = true;
        }
        pos = nl + 1;
    }
    return paragraphs;
}

ExtendedDocumentStats computeDocumentStats(const DocumentContext& doc){
    ExtendedDocumentStats s;
    s.characterCount = static_cast<int64_t>(doc.content.size());
    s.wordCount = countWords(doc.content);
    s.lineCount = static_cast<int64_t>(doc.lines.size());
    s.paragraphCount = countParagraphs(doc.content);

    int64_t total = 0;
    std::optional<int64_t> minLen;
    for(const auto& line : doc.lines){
        const int64_t len = static_cast<int64_t>(line.size());
        total += len;
        if(len == 0){
            ++s.emptyLineCount;
            continue;
        }
        s.maxLineLength = std::max(s.maxLineLength, len);
        minLen = minLen ? std::min(*minLen, len) : len;
    }
    s.minLineLength = minLen.value_or(0);
    if(s.lineCount > 0) s.averageLineLength = static_cast<int64_t>(std::llround(static_cast<double>(total) / static_cast<double>(s.lineCount)));
    s.estimatedReadingTimeMinutes = (s.wordCount + GetDocumentStatsTool::kWordsPerMinute - 1) / GetDocumentStatsTool::kWordsPerMinute;
    return s;
}

void to_json(nlohmann::json& j, const ExtendedDocumentStats& s){
    j = {
        {"characterCount", s.characterCount},
        {"wordCount", s.wordCount},
        {"lineCount", s.lineCount},
        {"paragraphCount", s.paragraphCount},
        {"averageLineLength", s.averageLineLength},
        {"maxLineLength", s.maxLineLength},
        {"minLineLength", s.minLineLength},
        {"emptyLineCount", s.emptyLineCount},
        {"estimatedReadingTimeMinutes", s.estimatedReadingTimeMinutes}
    };
}

static ToolParameterSchema buildSchema(){
    ToolParameterSchema s;
    ParameterSchema details;
    details.type = "boolean";
    details.description = "Include detailed line-by-line statistics (reserved for future use)";
    details.defaultValue = false;
    s.properties = {{"include_line_details", details}};
    return s;
}

GetDocumentStatsTool::GetDocumentStatsTool()
    : TypedTool("get_document_stats", kDescription, buildSchema(), ToolAccess::ReadOnly) {}

std::optional<GetDocumentStatsParams> GetDocumentStatsTool::parse(const nlohmann::json& args, std::string* outError) const {
    GetDocumentStatsParams p;
    if(args.is_null()) return p;
    if(!args.is_object()){
        if(outError) *outError = "arguments must be an object";
        return std::nullopt;
    }
    if(args.contains("include_line_details") && !args["include_line_details"].is_null()){
        if(!args["include_line_details"].is_boolean()){
            if(outError) *outError = "include_line_details must be a boolean";
            return std::nullopt;
        }
        p.includeLineDetails = args["include_line_details"].get<bool>();
    }
    return p;
}

ToolResult<ExtendedDocumentStats> GetDocumentStatsTool::run(const GetDocumentStatsParams&, const ToolContext& ctx) const {
    ExtendedDocumentStats s = computeDocumentStats(ctx.document);
    const std::string msg = "Document: " + std::to_string(s.wordCount) + " words, " + std::to_string(s.lineCount) + " lines, "
        + std::to_string(s.paragraphCount) + " paragraphs (~" + std::to_string(s.estimatedReadingTimeMinutes) + " min read)";
    return toolSuccess(s, msg);
}

} // namespace Marginalia
