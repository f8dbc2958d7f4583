#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <Marginalia/Tools/ToolExecutor.hpp>
#include <Marginalia/Tools/HighlightTextTool.hpp>

using namespace Marginalia;

namespace {

ToolParameterSchema emptySchema(){ return ToolParameterSchema{}; }

// Sleeps for args["ms"] milliseconds, then echoes its arguments.
class SleepTool : public TypedTool<nlohmann::json, nlohmann::json> {
public:
    SleepTool() : TypedTool("sleep", "Sleeps", emptySchema(), ToolAccess::ReadOnly) {}

    std::optional<nlohmann::json> parse(const nlohmann::json& args, std::string* outError = nullptr) const override {
        if(!args.is_object() || !args.contains("ms") || !args["ms"].is_number_integer()){
            if(outError) *outError = "ms must be an integer";
            return std::nullopt;
        }
        return args;
    }

    ToolResult<nlohmann::json> run(const nlohmann::json& params, const ToolContext&) const override {
        std::this_thread::sleep_for(std::chrono::milliseconds(params["ms"].get<int64_t>()));
        return toolSuccess(params, "slept");
    }
};

class ThrowingTool : public TypedTool<nlohmann::json, nlohmann::json> {
public:
    ThrowingTool() : TypedTool("explode", "Throws", emptySchema(), ToolAccess::ReadOnly) {}

    std::optional<nlohmann::json> parse(const nlohmann::json& args, std::string* = nullptr) const override { return args; }

    ToolResult<nlohmann::json> run(const nlohmann::json&, const ToolContext&) const override {
        throw std::runtime_error("boom");
    }
};

ToolRegistry testRegistry(){
    ToolRegistry registry = createDefaultToolRegistry();
    registry.registerTool(std::make_shared<SleepTool>());
    registry.registerTool(std::make_shared<ThrowingTool>());
    return registry;
}

ContextProvider documentProvider(const std::string& doc){
    return [doc]{ return createToolContext(doc, createInitialState()); };
}

ToolCall call(const std::string& id, const std::string& name, nlohmann::json args = nlohmann::json::object()){
    return ToolCall{id, name, std::move(args)};
}

} // namespace

TEST(ToolExecutorTest, ExecutesRegisteredTool) {
    ToolExecutor executor(testRegistry(), documentProvider("alpha\nbeta"));
    ToolCallResult r = executor.execute(call("c1", "get_line_content", {{"line_number", 2}}));
    EXPECT_EQ(r.callId, "c1");
    EXPECT_EQ(r.toolName, "get_line_content");
    ASSERT_TRUE(r.result.success);
    EXPECT_EQ(r.result.value["content"], "beta");
    EXPECT_GE(r.durationMs, 0);
}

TEST(ToolExecutorTest, UnknownToolListsAvailableTools) {
    ToolExecutor executor(createDefaultToolRegistry(), documentProvider("x"));
    ToolCallResult r = executor.execute(call("c1", "rewrite_everything"));
    EXPECT_FALSE(r.result.success);
    EXPECT_FALSE(r.result.recoverable);
    EXPECT_EQ(r.result.code, std::optional<std::string>("UNKNOWN_TOOL"));
    EXPECT_EQ(r.result.error, "Unknown tool: rewrite_everything. Available tools: highlight_text, get_line_content, get_document_stats, finish_review");
}

TEST(ToolExecutorTest, InvalidParametersAreRecoverable) {
    ToolExecutor executor(createDefaultToolRegistry(), documentProvider("x"));
    ToolCallResult r = executor.execute(call("c1", "get_line_content", {{"line_number", 0}}));
    EXPECT_EQ(r.result.code, std::optional<std::string>("INVALID_PARAMS"));
    EXPECT_TRUE(r.result.recoverable);
    EXPECT_EQ(r.result.error, "Invalid parameters for tool \"get_line_content\": {\"line_number\":0}");
}

TEST(ToolExecutorTest, AbortedSignalStopsBeforeRunning) {
    AbortSignal signal;
    signal.abort();
    ToolExecutor executor(createDefaultToolRegistry(), [signal]{ return createToolContext("x", createInitialState(), signal); });
    ToolCallResult r = executor.execute(call("c1", "get_document_stats"));
    EXPECT_EQ(r.result.code, std::optional<std::string>("ABORTED"));
    EXPECT_EQ(r.result.error, "Tool execution was aborted");
}

TEST(ToolExecutorTest, SlowToolTimesOut) {
    ToolExecutorOptions opts;
    opts.timeoutMs = 20;
    ToolExecutor executor(testRegistry(), documentProvider("x"), opts);
    ToolCallResult r = executor.execute(call("c1", "sleep", {{"ms", 500}}));
    EXPECT_EQ(r.result.code, std::optional<std::string>("TIMEOUT"));
    EXPECT_TRUE(r.result.recoverable);
    EXPECT_EQ(r.result.error, "Tool execution timed out after 20ms");
    EXPECT_LT(r.durationMs, 500);
}

TEST(ToolExecutorTest, ThrowingToolBecomesExecutionError) {
    for(int64_t timeout : {int64_t(0), int64_t(1000)}){
        ToolExecutorOptions opts;
        opts.timeoutMs = timeout;
        ToolExecutor executor(testRegistry(), documentProvider("x"), opts);
        ToolCallResult r = executor.execute(call("c1", "explode"));
        EXPECT_EQ(r.result.code, std::optional<std::string>("EXECUTION_ERROR"));
        EXPECT_FALSE(r.result.recoverable);
        EXPECT_EQ(r.result.error, "boom");
    }
}

TEST(ToolExecutorTest, BatchKeepsOrderAndReportsEachCall) {
    std::vector<std::string> seen;
    ToolExecutorOptions opts;
    opts.onToolExecuted = [&](const ToolCallResult& r){ seen.push_back(r.callId); };
    ToolExecutor executor(testRegistry(), documentProvider("The fox"), opts);

    ToolCallResults results = executor.executeBatch({
        call("a", "get_document_stats"),
        call("b", "nope"),
        call("c", "highlight_text", createHighlightParams(1, 4, 7, "fox", SuggestionCategory::Economy, "o", "r"))
    });
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].callId, "a");
    EXPECT_EQ(results[2].callId, "c");
    EXPECT_TRUE(findResult(results, "c")->result.success);
    EXPECT_EQ(findResult(results, "missing"), nullptr);
    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b", "c"}));

    BatchStats stats = calculateBatchStats(results);
    EXPECT_EQ(stats.total, 3u);
    EXPECT_EQ(stats.successful, 2u);
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(extractFailedResults(results).front().callId, "b");
    EXPECT_EQ(extractSuccessfulResults(results).size(), 2u);
}

TEST(ToolExecutorTest, BatchStopsOnFirstFailureWhenAsked) {
    ToolExecutorOptions opts;
    opts.continueOnError = false;
    ToolExecutor executor(testRegistry(), documentProvider("x"), opts);
    ToolCallResults results = executor.executeBatch({call("a", "nope"), call("b", "get_document_stats")});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].callId, "a");
}

TEST(ToolExecutorTest, BatchReplacesDuplicateCallIds) {
    ToolExecutor executor(testRegistry(), documentProvider("x"));
    ToolCallResults results = executor.executeBatch({call("a", "nope"), call("a", "get_document_stats")});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].result.success);
}

TEST(ToolExecutorTest, ParallelRunsReadOnlyToolsOnly) {
    ToolExecutor executor(testRegistry(), documentProvider("The fox"));
    ToolCallResults results = executor.executeParallel({
        call("a", "get_line_content", {{"line_number", 1}}),
        call("b", "highlight_text", createHighlightParams(1, 0, 3, "The", SuggestionCategory::Style, "o", "r")),
        call("c", "sleep", {{"ms", 5}})
    });
    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].result.success);
    EXPECT_EQ(results[1].result.code, std::optional<std::string>("MUTATING_TOOL_IN_PARALLEL"));
    EXPECT_FALSE(results[1].result.recoverable);
    EXPECT_TRUE(results[2].result.success);
}

TEST(ToolExecutorTest, ValidateChecksToolAndArguments) {
    ToolExecutor executor(createDefaultToolRegistry(), documentProvider("x"));
    EXPECT_TRUE(executor.validate(call("a", "get_document_stats")).valid);
    ToolCallValidation unknown = executor.validate(call("a", "nope"));
    EXPECT_FALSE(unknown.valid);
    EXPECT_EQ(unknown.error, std::optional<std::string>("Unknown tool: nope"));
    EXPECT_FALSE(executor.validate(call("a", "get_line_content")).valid);
}

TEST(ToolExecutorTest, ToolCallAcceptsEncodedArguments) {
    nlohmann::json raw = {{"id", "c1"}, {"name", "get_line_content"}, {"arguments", "{\"line_number\": 1}"}};
    ToolCall parsed = raw.get<ToolCall>();
    EXPECT_EQ(parsed.arguments["line_number"], 1);
}

TEST(ToolExecutorTest, StatsOfEmptyBatch) {
    BatchStats stats = calculateBatchStats({});
    EXPECT_EQ(stats.total, 0u);
    EXPECT_EQ(stats.averageDurationMs, 0);
    EXPECT_EQ(toJson(stats)["total"], 0);
}
