#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <Marginalia/Tools/ToolRegistry.hpp>
#include <Marginalia/Tools/ToolTypes.hpp>

namespace Marginalia {

using ContextProvider = std::function<ToolContext()>;

struct ToolExecutorOptions {
    // <= 0 runs the tool inline without a deadline
    int64_t timeoutMs = 30000;
    bool continueOnError = true;
    std::function<void(const ToolCallResult&)> onToolExecuted;
};

// Results keyed by call id, in the order the calls were first seen.
using ToolCallResults = std::vector<ToolCallResult>;

const ToolCallResult* findResult(const ToolCallResults& results, const std::string& callId);

struct ToolCallValidation {
    bool valid = true;
    std::optional<std::string> error;
};

struct BatchStats {
    size_t total = 0;
    size_t successful = 0;
    size_t failed = 0;
    int64_t totalDurationMs = 0;
    int64_t averageDurationMs = 0;
};

// Runs tool calls against a registry. Every failure mode comes back as a ToolResult
// failure; nothing thrown by a tool escapes execute().
class ToolExecutor {
public:
    ToolExecutor(ToolRegistry registry, ContextProvider provider, ToolExecutorOptions options = {});

    ToolCallResult execute(const ToolCall& call);
    // Sequential. Stops after the first failure when continueOnError is false.
    ToolCallResults executeBatch(const std::vector<ToolCall>& calls);
    // Concurrent. Only read-only tools are run; mutating ones fail with MUTATING_TOOL_IN_PARALLEL.
    ToolCallResults executeParallel(const std::vector<ToolCall>& calls);

    ToolCallValidation validate(const ToolCall& call) const;

    const ToolRegistry& getRegistry() const { return registry_; }
    void setContextProvider(ContextProvider provider) { provider_ = std::move(provider); }
    void setOptions(ToolExecutorOptions options) { options_ = std::move(options); }
    const ToolExecutorOptions& options() const { return options_; }

private:
    JsonToolResult executeInternal(const ToolCall& call);
    JsonToolResult runWithTimeout(const ToolPtr& tool, const nlohmann::json& args, const ToolContext& ctx);
    void notifyExecuted(const ToolCallResult& result);

    ToolRegistry registry_;
    ContextProvider provider_;
    ToolExecutorOptions options_;
    std::mutex callbackMutex_;
};

BatchStats calculateBatchStats(const ToolCallResults& results);
std::vector<ToolCallResult> extractSuccessfulResults(const ToolCallResults& results);
std::vector<ToolCallResult> extractFailedResults(const ToolCallResults& results);

nlohmann::json toJson(const BatchStats& stats);

} // namespace Marginalia
