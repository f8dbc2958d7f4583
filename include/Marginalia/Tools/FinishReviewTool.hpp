#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <Marginalia/Tools/ToolTypes.hpp>

namespace Marginalia {

enum class ReviewStatus { Completed, Partial, NoIssuesFound };

const char* toString(ReviewStatus s);
std::optional<ReviewStatus> parseReviewStatus(const std::string& s);

struct FinishReviewParams {
    std::optional<std::string> summary;
    std::optional<ReviewStatus> status;
};

struct FinishReviewResult {
    int64_t suggestionCount = 0;
    std::optional<std::string> summary;
    ReviewStatus status = ReviewStatus::Completed;
    int64_t finishedAt = 0; // ms since epoch
};

void to_json(nlohmann::json& j, const FinishReviewResult& r);

// Reports the end of a review. Without an explicit status it is inferred from the store:
// no_issues_found when empty, completed otherwise.
class FinishReviewTool : public TypedTool<FinishReviewParams, FinishReviewResult> {
public:
    FinishReviewTool();

    std::optional<FinishReviewParams> parse(const nlohmann::json& args, std::string* outError = nullptr) const override;
    ToolResult<FinishReviewResult> run(const FinishReviewParams& params, const ToolContext& ctx) const override;
};

} // namespace Marginalia
