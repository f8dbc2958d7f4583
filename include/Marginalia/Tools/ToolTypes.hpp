#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include <Marginalia/LineMap.hpp>
#include <Marginalia/SuggestionStore.hpp>

namespace Marginalia {

// JSON-schema fragment describing one tool argument.
struct ParameterSchema {
    std::string type; // string, number, integer, boolean, array, object
    std::string description;
    std::vector<std::string> enumValues;
    bool required = false;
    std::optional<double> minimum;
    std::optional<double> maximum;
    std::optional<int64_t> minLength;
    std::optional<int64_t> maxLength;
    std::shared_ptr<ParameterSchema> items;
    nlohmann::json defaultValue; // null when absent

    nlohmann::json toJson() const;
};

struct ToolParameterSchema {
    std::vector<std::pair<std::string, ParameterSchema>> properties; // declaration order
    std::vector<std::string> required;
    bool additionalProperties = false;

    nlohmann::json toJson() const;
};

// Shared cancellation flag; copies observe the same state.
class AbortSignal {
public:
    AbortSignal() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
    bool aborted() const { return flag_->load(); }
    void abort() { flag_->store(true); }
private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

struct DocumentContext {
    std::string content;
    std::vector<std::string> lines;
    LineMap lineMap;
};

// Snapshot handed to a tool for one execution.
struct ToolContext {
    DocumentContext document;
    StoreStatePtr store;
    std::optional<AbortSignal> abortSignal;
};

DocumentContext createDocumentContext(const std::string& content);
ToolContext createToolContext(const std::string& content, StoreStatePtr store, std::optional<AbortSignal> abortSignal = std::nullopt);

// Either success {value, message} or failure {error, recoverable, code}.
template<typename T>
struct ToolResult {
    bool success = false;
    T value{};
    std::string message;
    std::string error;
    bool recoverable = true;
    std::optional<std::string> code;

    bool ok() const { return success; }
};

template<typename T>
ToolResult<T> toolSuccess(T value, std::string message){
    ToolResult<T> r;
    r.success = true;
    r.value = std::move(value);
    r.message = std::move(message);
    return r;
}

template<typename T = nlohmann::json>
ToolResult<T> toolFailure(std::string error, bool recoverable = true, std::optional<std::string> code = std::nullopt){
    ToolResult<T> r;
    r.success = false;
    r.error = std::move(error);
    r.recoverable = recoverable;
    r.code = std::move(code);
    return r;
}

using JsonToolResult = ToolResult<nlohmann::json>;
nlohmann::json toJson(const JsonToolResult& r);

// Whether a tool may change the store. Only read-only tools may run in parallel.
enum class ToolAccess { ReadOnly, Mutating };

// Type-erased tool as seen by the registry and the executor.
struct ToolDefinition {
    virtual ~ToolDefinition() = default;

    virtual const std::string& name() const = 0;
    virtual const std::string& description() const = 0;
    virtual const ToolParameterSchema& parameters() const = 0;
    virtual ToolAccess access() const = 0;

    // Argument check run before execute; a tool is never executed with arguments that fail it.
    virtual bool validate(const nlohmann::json& args, std::string* outError = nullptr) const = 0;
    virtual JsonToolResult execute(const nlohmann::json& args, const ToolContext& ctx) const = 0;
};

using ToolPtr = std::shared_ptr<const ToolDefinition>;

// Bridges a strongly typed tool to ToolDefinition: arguments are parsed into Params once,
// results are serialized through to_json(Result).
template<typename Params, typename Result>
class TypedTool : public ToolDefinition {
public:
    TypedTool(std::string name, std::string description, ToolParameterSchema parameters, ToolAccess access)
        : name_(std::move(name)), description_(std::move(description)), parameters_(std::move(parameters)), access_(access) {}

    const std::string& name() const override { return name_; }
    const std::string& description() const override { return description_; }
    const ToolParameterSchema& parameters() const override { return parameters_; }
    ToolAccess access() const override { return access_; }

    bool validate(const nlohmann::json& args, std::string* outError = nullptr) const override {
        return parse(args, outError).has_value();
    }

    JsonToolResult execute(const nlohmann::json& args, const ToolContext& ctx) const override {
        std::string err;
        auto params = parse(args, &err);
        if(!params) return toolFailure("Invalid parameters for tool \"" + name_ + "\": " + err, true, std::string("INVALID_PARAMS"));
        ToolResult<Result> r = run(*params, ctx);
        if(!r.success) return toolFailure(r.error, r.recoverable, r.code);
        return toolSuccess(nlohmann::json(r.value), r.message);
    }

    virtual std::optional<Params> parse(const nlohmann::json& args, std::string* outError = nullptr) const = 0;
    virtual ToolResult<Result> run(const Params& params, const ToolContext& ctx) const = 0;

private:
    std::string name_;
    std::string description_;
    ToolParameterSchema parameters_;
    ToolAccess access_;
};

struct ToolCall {
    std::string id;
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

struct ToolCallResult {
    std::string callId;
    std::string toolName;
    JsonToolResult result;
    int64_t durationMs = 0;
};

void from_json(const nlohmann::json& j, ToolCall& c);
void to_json(nlohmann::json& j, const ToolCallResult& r);

// {name, description, parameters: {type: "object", properties, required}}
nlohmann::json toProviderFormat(const ToolDefinition& tool);

// Argument checks shared by the tool parsers. Integral floats such as 3.0 count as integers.
namespace validators {
bool isInteger(const nlohmann::json& v);
// reads a value that passed isInteger
int64_t asInteger(const nlohmann::json& v);
bool isPositiveInteger(const nlohmann::json& v);
bool isNonNegativeInteger(const nlohmann::json& v);
bool isNonEmptyString(const nlohmann::json& v);
bool isNormalizedNumber(const nlohmann::json& v);
bool isOneOf(const nlohmann::json& v, const std::vector<std::string>& allowed);
bool isObject(const nlohmann::json& v);
bool isArray(const nlohmann::json& v);
// true when key is absent (or null) or check passes on its value
template<typename Check>
bool isOptional(const nlohmann::json& args, const char* key, Check check){
    if(!args.contains(key) || args[key].is_null()) return true;
    return check(args[key]);
}
} // namespace validators

} // namespace Marginalia
