#include <Marginalia/Tools/ToolExecutor.hpp>
#include <chrono>
#include <cmath>
#include <future>
#include <stdexcept>
#include <memory>
#include <thread>
#include <plog/Log.h>

namespace Marginalia {

static int64_t elapsedMs(std::chrono::steady_clock::time_point since){
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count();
}

static std::string joinNames(const std::vector<std::string>& names){
    std::string out;
    for(size_t i = 0; i < names.size(); ++i){
        if(i) out += ", ";
        out += names[i];
    }
    return out;
}

static void storeResult(ToolCallResults& results, ToolCallResult result){
    for(auto& r : results){
        if(r.callId == result.callId){ r = std::move(result); return; }
    }
    results.push_back(std::move(result));
}

const ToolCallResult* findResult(const ToolCallResults& results, const std::string& callId){
    for(const auto& r : results) if(r.callId == callId) return &r;
    return nullptr;
}

ToolExecutor::ToolExecutor(ToolRegistry registry, ContextProvider provider, ToolExecutorOptions options)
    : registry_(std::move(registry)), provider_(std::move(provider)), options_(std::move(options)) {}

void ToolExecutor::notifyExecuted(const ToolCallResult& result){
    if(!options_.onToolExecuted) return;
    std::lock_guard<std::mutex> lock(callbackMutex_);
    options_.onToolExecuted(result);
}

ToolCallResult ToolExecutor::execute(const ToolCall& call){
    auto start = std::chrono::steady_clock::now();
    ToolCallResult out;
    out.callId = call.id;
    out.toolName = call.name;
    try {
        out.result = executeInternal(call);
    } catch(const std::exception& e){
        out.result = toolFailure(e.what(), false, std::string("EXECUTION_ERROR"));
    }
    out.durationMs = elapsedMs(start);
    if(!out.result.success){
        PLOGW << "[Tools] " << call.name << " (" << call.id << ") failed: " << out.result.error;
    } else {
        PLOGD << "[Tools] " << call.name << " (" << call.id << ") ok in " << out.durationMs << "ms";
    }
    notifyExecuted(out);
    return out;
}

JsonToolResult ToolExecutor::executeInternal(const ToolCall& call){
    ToolPtr tool = registry_.get(call.name);
    if(!tool){
        return toolFailure("Unknown tool: " + call.name + ". Available tools: " + joinNames(registry_.getNames()),
                           false, std::string("UNKNOWN_TOOL"));
    }
    if(!tool->validate(call.arguments)){
        return toolFailure("Invalid parameters for tool \"" + call.name + "\": " + call.arguments.dump(),
                           true, std::string("INVALID_PARAMS"));
    }

    if(!provider_) throw std::runtime_error("No context provider configured");
    ToolContext ctx = provider_();
    if(ctx.abortSignal && ctx.abortSignal->aborted()){
        return toolFailure("Tool execution was aborted", false, std::string("ABORTED"));
    }
    return runWithTimeout(tool, call.arguments, ctx);
}

JsonToolResult ToolExecutor::runWithTimeout(const ToolPtr& tool, const nlohmann::json& args, const ToolContext& ctx){
    if(options_.timeoutMs <= 0) return tool->execute(args, ctx);

    // The worker owns copies of everything it touches so a timed-out tool can finish on its own.
    auto task = std::make_shared<std::packaged_task<JsonToolResult()>>([tool, args, ctx](){
        return tool->execute(args, ctx);
    });
    std::future<JsonToolResult> fut = task->get_future();
    std::thread([task](){ (*task)(); }).detach();

    if(fut.wait_for(std::chrono::milliseconds(options_.timeoutMs)) != std::future_status::ready){
        PLOGW << "[Tools] " << tool->name() << " timed out after " << options_.timeoutMs << "ms";
        return toolFailure("Tool execution timed out after " + std::to_string(options_.timeoutMs) + "ms",
                           true, std::string("TIMEOUT"));
    }
    return fut.get();
}

ToolCallResults ToolExecutor::executeBatch(const std::vector<ToolCall>& calls){
    ToolCallResults results;
    for(const auto& call : calls){
        ToolCallResult r = execute(call);
        bool failed = !r.result.success;
        storeResult(results, std::move(r));
        if(failed && !options_.continueOnError){
            PLOGD << "[Tools] batch stopped at " << call.id;
            break;
        }
    }
    return results;
}

ToolCallResults ToolExecutor::executeParallel(const std::vector<ToolCall>& calls){
    std::vector<std::future<ToolCallResult>> pending;
    std::vector<std::optional<ToolCallResult>> refused(calls.size());
    pending.reserve(calls.size());

    for(size_t i = 0; i < calls.size(); ++i){
        const ToolCall& call = calls[i];
        ToolPtr tool = registry_.get(call.name);
        if(tool && tool->access() == ToolAccess::Mutating){
            ToolCallResult r;
            r.callId = call.id;
            r.toolName = call.name;
            r.result = toolFailure("Tool \"" + call.name + "\" modifies state and cannot run in parallel",
                                   false, std::string("MUTATING_TOOL_IN_PARALLEL"));
            PLOGW << "[Tools] refused parallel call to " << call.name;
            notifyExecuted(r);
            refused[i] = std::move(r);
            pending.emplace_back();
            continue;
        }
        pending.push_back(std::async(std::launch::async, [this, call](){ return execute(call); }));
    }

    ToolCallResults results;
    for(size_t i = 0; i < calls.size(); ++i){
        if(refused[i]) storeResult(results, std::move(*refused[i]));
        else storeResult(results, pending[i].get());
    }
    return results;
}

ToolCallValidation ToolExecutor::validate(const ToolCall& call) const {
    ToolPtr tool = registry_.get(call.name);
    if(!tool) return {false, "Unknown tool: " + call.name};
    if(!tool->validate(call.arguments)) return {false, "Invalid parameters for tool \"" + call.name + "\""};
    return {true, std::nullopt};
}

BatchStats calculateBatchStats(const ToolCallResults& results){
    BatchStats s;
    s.total = results.size();
    for(const auto& r : results){
        if(r.result.success) ++s.successful;
        else ++s.failed;
        s.totalDurationMs += r.durationMs;
    }
    if(s.total > 0){
        s.averageDurationMs = static_cast<int64_t>(std::llround(static_cast<double>(s.totalDurationMs) / static_cast<double>(s.total)));
    }
    return s;
}

std::vector<ToolCallResult> extractSuccessfulResults(const ToolCallResults& results){
    std::vector<ToolCallResult> out;
    for(const auto& r : results) if(r.result.success) out.push_back(r);
    return out;
}

std::vector<ToolCallResult> extractFailedResults(const ToolCallResults& results){
    std::vector<ToolCallResult> out;
    for(const auto& r : results) if(!r.result.success) out.push_back(r);
    return out;
}

nlohmann::json toJson(const BatchStats& stats){
    return {
        {"total", stats.total},
        {"successful", stats.successful},
        {"failed", stats.failed},
        {"totalDurationMs", stats.totalDurationMs},
        {"averageDurationMs", stats.averageDurationMs}
    };
}

} // namespace Marginalia
