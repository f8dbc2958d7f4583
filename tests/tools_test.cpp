#include <gtest/gtest.h>
#include <Marginalia/Tools/FinishReviewTool.hpp>
#include <Marginalia/Tools/GetDocumentStatsTool.hpp>
#include <Marginalia/Tools/GetLineContentTool.hpp>
#include <Marginalia/Tools/HighlightTextTool.hpp>
#include <Marginalia/Tools/ToolRegistry.hpp>

using namespace Marginalia;

namespace {

nlohmann::json highlightArgs(int64_t line, int64_t start, int64_t end, const std::string& text){
    return createHighlightParams(line, start, end, text, SuggestionCategory::Style, "Weak wording", "Better");
}

StoreStatePtr storeWith(size_t count){
    std::vector<SuggestionHighlight> items;
    for(size_t i = 0; i < count; ++i){
        SuggestionHighlight s;
        s.id = "s" + std::to_string(i);
        s.range = Range(static_cast<int64_t>(i) * 10, static_cast<int64_t>(i) * 10 + 3);
        s.originalText = "abc";
        items.push_back(s);
    }
    return suggestionStoreReducer(createInitialState(), StoreAction::setAll(items));
}

} // namespace

TEST(HighlightTextToolTest, ExactPositionProducesHighlight) {
    HighlightTextTool tool;
    auto ctx = createToolContext("The fox", createInitialState());
    auto r = tool.run(*tool.parse(highlightArgs(1, 0, 3, "The")), ctx);
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.value.range, Range(0, 3));
    EXPECT_EQ(r.value.category, SuggestionCategory::Style);
    EXPECT_EQ(r.value.originalText, "The");
    EXPECT_EQ(r.message, "Highlighted \"The\" at line 1, columns 0-3.");
}

TEST(HighlightTextToolTest, OffsetsAccountForEarlierLines) {
    HighlightTextTool tool;
    auto ctx = createToolContext("first line\nThe fox", createInitialState());
    auto r = tool.run(*tool.parse(highlightArgs(2, 4, 7, "fox")), ctx);
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.value.range, Range(15, 18));
}

TEST(HighlightTextToolTest, AdjustsWhenColumnsAreOff) {
    HighlightTextTool tool;
    auto ctx = createToolContext("The quick fox", createInitialState());
    auto r = tool.run(*tool.parse(highlightArgs(1, 0, 3, "fox")), ctx);
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.value.range, Range(10, 13));
    EXPECT_EQ(r.message, "Highlighted \"fox\" at adjusted position (line 1, columns 10-13). Note: Original position was 0-3.");
}

TEST(HighlightTextToolTest, ReportsBoundsAndMismatchCodes) {
    HighlightTextTool tool;
    auto ctx = createToolContext("The fox", createInitialState());

    auto line = tool.execute(highlightArgs(3, 0, 3, "The"), ctx);
    EXPECT_FALSE(line.success);
    EXPECT_EQ(line.code, std::optional<std::string>("LINE_OUT_OF_BOUNDS"));
    EXPECT_EQ(line.error, "Line 3 does not exist. Document has 1 lines.");

    auto start = tool.execute(highlightArgs(1, 7, 8, "x"), ctx);
    EXPECT_EQ(start.code, std::optional<std::string>("COLUMN_OUT_OF_BOUNDS"));
    EXPECT_EQ(start.error, "Start column 7 is out of bounds. Line 1 has 7 characters (0-6).");

    auto end = tool.execute(highlightArgs(1, 4, 9, "fox"), ctx);
    EXPECT_EQ(end.code, std::optional<std::string>("COLUMN_OUT_OF_BOUNDS"));

    auto mismatch = tool.execute(highlightArgs(1, 0, 3, "cat"), ctx);
    EXPECT_EQ(mismatch.code, std::optional<std::string>("TEXT_MISMATCH"));
    EXPECT_TRUE(mismatch.recoverable);
    EXPECT_NE(mismatch.error.find("Found \"The\" instead"), std::string::npos);
}

TEST(HighlightTextToolTest, RejectsMalformedArguments) {
    HighlightTextTool tool;
    std::string err;
    auto args = highlightArgs(1, 3, 3, "x");
    EXPECT_FALSE(tool.validate(args, &err));
    EXPECT_EQ(err, "end_column must be greater than start_column");

    args = highlightArgs(1, 0, 3, "The");
    args["suggestion_type"] = "tone";
    EXPECT_FALSE(tool.validate(args));

    args = highlightArgs(1, 0, 3, "The");
    args["confidence"] = 1.5;
    EXPECT_FALSE(tool.validate(args));

    args = highlightArgs(1, 0, 3, "The");
    args["line_number"] = 1.0;
    args["confidence"] = 0.8;
    EXPECT_TRUE(tool.validate(args));

    auto r = tool.execute(nlohmann::json::array(), createToolContext("The fox", createInitialState()));
    EXPECT_EQ(r.code, std::optional<std::string>("INVALID_PARAMS"));
}

TEST(HighlightTextToolTest, ColumnsBeyondInt64AreRejected) {
    HighlightTextTool tool;
    auto ctx = createToolContext("The fox", createInitialState());

    auto args = highlightArgs(1, 0, 3, "The");
    args["end_column"] = 1e20;
    EXPECT_FALSE(tool.validate(args));
    auto huge = tool.execute(args, ctx);
    EXPECT_FALSE(huge.success);
    EXPECT_EQ(huge.code, std::optional<std::string>("INVALID_PARAMS"));

    args["end_column"] = uint64_t(18000000000000000000ull);
    EXPECT_EQ(tool.execute(args, ctx).code, std::optional<std::string>("INVALID_PARAMS"));

    args["end_column"] = int64_t(9000000000000000000);
    auto wide = tool.execute(args, ctx);
    EXPECT_FALSE(wide.success);
    EXPECT_EQ(wide.code, std::optional<std::string>("COLUMN_OUT_OF_BOUNDS"));
    EXPECT_EQ(wide.error, "End column 9000000000000000000 is out of bounds. Line 1 has 7 characters.");
}

TEST(GetLineContentToolTest, SingleLine) {
    GetLineContentTool tool;
    auto ctx = createToolContext("alpha\nbeta\ngamma", createInitialState());
    auto r = tool.execute({{"line_number", 2}}, ctx);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.value["content"], "beta");
    EXPECT_EQ(r.value["startOffset"], 6);
    EXPECT_EQ(r.value["endOffset"], 10);
    EXPECT_EQ(r.message, "Line 2: \"beta\" (4 chars)");
}

TEST(GetLineContentToolTest, ContextIsClippedAtDocumentEdges) {
    GetLineContentTool tool;
    auto ctx = createToolContext("alpha\nbeta\ngamma", createInitialState());
    auto r = tool.execute({{"line_number", 1}, {"context_lines", 2}}, ctx);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.value["mainLine"]["content"], "alpha");
    EXPECT_TRUE(r.value["before"].empty());
    EXPECT_EQ(r.value["after"].size(), 2u);
    EXPECT_EQ(r.message, "Line 1 with 0 lines before and 2 lines after");

    auto missing = tool.execute({{"line_number", 9}}, ctx);
    EXPECT_EQ(missing.code, std::optional<std::string>("LINE_OUT_OF_BOUNDS"));
}

TEST(GetLineContentToolTest, ContextLinesAreBounded) {
    GetLineContentTool tool;
    auto ctx = createToolContext("alpha\nbeta\ngamma", createInitialState());

    auto huge = tool.execute({{"line_number", 2}, {"context_lines", 1e300}}, ctx);
    EXPECT_FALSE(huge.success);
    EXPECT_EQ(huge.code, std::optional<std::string>("INVALID_PARAMS"));

    auto params = tool.parse({{"line_number", 2}, {"context_lines", 500}});
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params->contextLines, std::optional<int64_t>(10));

    auto wide = tool.execute({{"line_number", 2}, {"context_lines", int64_t(9000000000000000000)}}, ctx);
    ASSERT_TRUE(wide.success);
    EXPECT_EQ(wide.value["before"].size(), 1u);
    EXPECT_EQ(wide.value["after"].size(), 1u);
}

TEST(GetDocumentStatsToolTest, EmptyDocument) {
    GetDocumentStatsTool tool;
    auto r = tool.execute(nullptr, createToolContext("", createInitialState()));
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.value["wordCount"], 0);
    EXPECT_EQ(r.value["lineCount"], 1);
    EXPECT_EQ(r.value["paragraphCount"], 0);
    EXPECT_EQ(r.value["estimatedReadingTimeMinutes"], 0);
}

TEST(GetDocumentStatsToolTest, CountsWordsLinesAndParagraphs) {
    auto doc = createDocumentContext("One two three.\nFour five.\n\nSix\n");
    ExtendedDocumentStats s = computeDocumentStats(doc);
    EXPECT_EQ(s.wordCount, 6);
    EXPECT_EQ(s.lineCount, 5);
    EXPECT_EQ(s.paragraphCount, 2);
    EXPECT_EQ(s.emptyLineCount, 2);
    EXPECT_EQ(s.maxLineLength, 14);
    EXPECT_EQ(s.minLineLength, 3);
    EXPECT_EQ(s.estimatedReadingTimeMinutes, 1);
}

TEST(GetDocumentStatsToolTest, RejectsNonBooleanDetailsFlag) {
    GetDocumentStatsTool tool;
    EXPECT_TRUE(tool.validate(nlohmann::json::object()));
    EXPECT_FALSE(tool.validate({{"include_line_details", "yes"}}));
}

TEST(FinishReviewToolTest, InfersStatusFromStore) {
    FinishReviewTool tool;
    auto none = tool.execute(nlohmann::json::object(), createToolContext("text", createInitialState()));
    ASSERT_TRUE(none.success);
    EXPECT_EQ(none.value["status"], "no_issues_found");
    EXPECT_EQ(none.message, "Review completed. No issues found in the document.");

    auto one = tool.execute(nlohmann::json::object(), createToolContext("text", storeWith(1)));
    EXPECT_EQ(one.value["status"], "completed");
    EXPECT_EQ(one.message, "Review completed with 1 suggestion.");
}

TEST(FinishReviewToolTest, ExplicitStatusAndSummary) {
    FinishReviewTool tool;
    auto r = tool.execute({{"status", "partial"}, {"summary", "Tight prose."}}, createToolContext("text", storeWith(2)));
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.value["suggestionCount"], 2);
    EXPECT_EQ(r.message, "Partial review completed with 2 suggestions. Some areas may not have been fully analyzed. Summary: Tight prose.");

    EXPECT_FALSE(tool.validate({{"status", "done"}}));
    EXPECT_EQ(parseReviewStatus("no_issues_found"), std::optional<ReviewStatus>(ReviewStatus::NoIssuesFound));
}

TEST(ToolRegistryTest, DefaultRegistryHasAllTools) {
    ToolRegistry registry = createDefaultToolRegistry();
    EXPECT_EQ(registry.getNames(), DEFAULT_TOOL_NAMES);
    EXPECT_TRUE(registry.validateRequired(DEFAULT_TOOL_NAMES).valid);
    EXPECT_EQ(registry.get("highlight_text")->access(), ToolAccess::Mutating);
    EXPECT_EQ(registry.get("get_line_content")->access(), ToolAccess::ReadOnly);
    EXPECT_EQ(registry.get("nope"), nullptr);
}

TEST(ToolRegistryTest, DuplicateRegistrationThrows) {
    ToolRegistry registry;
    registry.registerTool(std::make_shared<FinishReviewTool>());
    EXPECT_THROW(registry.registerTool(std::make_shared<FinishReviewTool>()), std::invalid_argument);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(ToolRegistryTest, SubsetAndMissingTools) {
    ToolRegistry registry = createDefaultToolRegistry();
    ToolRegistry reading = registry.subset({"get_line_content", "get_document_stats", "unknown"});
    EXPECT_EQ(reading.size(), 2u);

    RequiredToolsCheck check = reading.validateRequired({"highlight_text", "get_line_content"});
    EXPECT_FALSE(check.valid);
    EXPECT_EQ(check.missing, std::vector<std::string>{"highlight_text"});

    EXPECT_TRUE(registry.unregister("finish_review"));
    EXPECT_FALSE(registry.unregister("finish_review"));
    EXPECT_EQ(registry.size(), 3u);
}

TEST(ToolRegistryTest, ProviderFormatListsRequiredParameters) {
    ToolRegistry registry = createDefaultToolRegistry();
    nlohmann::json provider = registry.toProviderFormat();
    ASSERT_EQ(provider.size(), 4u);
    const nlohmann::json& highlight = provider[0];
    EXPECT_EQ(highlight["name"], "highlight_text");
    EXPECT_EQ(highlight["parameters"]["type"], "object");
    EXPECT_EQ(highlight["parameters"]["properties"]["suggestion_type"]["enum"].size(), 5u);
    EXPECT_EQ(highlight["parameters"]["required"].size(), 7u);
}
