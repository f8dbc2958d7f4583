#include <Marginalia/Tools/FinishReviewTool.hpp>
#include <Marginalia/Types.hpp>

namespace Marginalia {

static const char* kDescription =
    "Signal that the document review is complete.\n"
    "\n"
    "Call this tool when you have finished analyzing the document and creating all suggestions.\n"
    "\n"
    "Parameters:\n"
    "- summary: (optional) A brief summary of your findings\n"
    "- status: (optional) 'completed', 'partial', or 'no_issues_found'\n"
    "\n"
    "If status is not provided, it will be inferred:\n"
    "- 'no_issues_found' if no suggestions were created\n"
    "- 'completed' otherwise\n"
    "\n"
    "Use status 'partial' if you weren't able to fully analyze the document (e.g., document was very long).";

static const std::vector<std::string> kStatusNames = {"completed", "partial", "no_issues_found"};

const char* toString(ReviewStatus s){
    switch(s){
        case ReviewStatus::Completed: return "completed";
        case ReviewStatus::Partial: return "partial";
        case ReviewStatus::NoIssuesFound: return "no_issues_found";
    }
    return "completed";
}

std::optional<ReviewStatus> parseReviewStatus(const std::string& s){
    if(s == "completed") return ReviewStatus::Completed;
    if(s == "partial") return ReviewStatus::Partial;
    if(s == "no_issues_found") return ReviewStatus::NoIssuesFound;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const FinishReviewResult& r){
    j = {
        {"suggestionCount", r.suggestionCount},
        {"summary", r.summary ? nlohmann::json(*r.summary) : nlohmann::json(nullptr)},
        {"status", toString(r.status)},
        {"finishedAt", r.finishedAt}
    };
}

static ToolParameterSchema buildSchema(){
    ToolParameterSchema s;
    ParameterSchema summary;
    summary.type = "string";
    summary.description = "Optional summary of the review findings";
    ParameterSchema status;
    status.type = "string";
    status.description = "Review completion status";
    status.enumValues = kStatusNames;
    s.properties = {{"summary", summary}, {"status", status}};
    return s;
}

FinishReviewTool::FinishReviewTool()
    : TypedTool("finish_review", kDescription, buildSchema(), ToolAccess::ReadOnly) {}

std::optional<FinishReviewParams> FinishReviewTool::parse(const nlohmann::json& args, std::string* outError) const {
    FinishReviewParams p;
    if(args.is_null()) return p;
    auto reject = [&](const char* msg) -> std::optional<FinishReviewParams> {
        if(outError) *outError = msg;
        return std::nullopt;
    };
    if(!args.is_object()) return reject("arguments must be an object");
    if(args.contains("summary") && !args["summary"].is_null()){
        if(!args["summary"].is_string()) return reject("summary must be a string");
        p.summary = args["summary"].get<std::string>();
    }
    if(args.contains("status") && !args["status"].is_null()){
        if(!validators::isOneOf(args["status"], kStatusNames)) return reject("status must be completed, partial or no_issues_found");
        p.status = parseReviewStatus(args["status"].get<std::string>());
    }
    return p;
}

ToolResult<FinishReviewResult> FinishReviewTool::run(const FinishReviewParams& params, const ToolContext& ctx) const {
    FinishReviewResult r;
    r.suggestionCount = ctx.store ? static_cast<int64_t>(ctx.store->highlights.size()) : 0;
    r.summary = params.summary;
    r.finishedAt = currentTimeMillis();
    if(params.status) r.status = *params.status;
    else r.status = r.suggestionCount == 0 ? ReviewStatus::NoIssuesFound : ReviewStatus::Completed;

    const std::string count = std::to_string(r.suggestionCount);
    const std::string plural = r.suggestionCount == 1 ? "" : "s";
    std::string msg;
    switch(r.status){
        case ReviewStatus::Completed:
            msg = "Review completed with " + count + " suggestion" + plural + ".";
            break;
        case ReviewStatus::Partial:
            msg = "Partial review completed with " + count + " suggestion" + plural + ". Some areas may not have been fully analyzed.";
            break;
        case ReviewStatus::NoIssuesFound:
            msg = "Review completed. No issues found in the document.";
            break;
    }
    if(params.summary && !params.summary->empty()) msg += " Summary: " + *params.summary;
    return toolSuccess(r, msg);
}

} // namespace Marginalia
