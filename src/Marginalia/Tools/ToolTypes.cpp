#include <Marginalia/Tools/ToolTypes.hpp>
#include <cmath>
#include <limits>

namespace Marginalia {

nlohmann::json ParameterSchema::toJson() const {
    nlohmann::json j = {{"type", type}, {"description", description}};
    if(!enumValues.empty()) j["enum"] = enumValues;
    if(minimum) j["minimum"] = *minimum;
    if(maximum) j["maximum"] = *maximum;
    if(minLength) j["minLength"] = *minLength;
    if(maxLength) j["maxLength"] = *maxLength;
    if(items) j["items"] = items->toJson();
    if(!defaultValue.is_null()) j["default"] = defaultValue;
    return j;
}

nlohmann::json ToolParameterSchema::toJson() const {
    nlohmann::json props = nlohmann::json::object();
    for(const auto& p : properties) props[p.first] = p.second.toJson();
    return {{"type", "object"}, {"properties", props}, {"required", required}, {"additionalProperties", additionalProperties}};
}

DocumentContext createDocumentContext(const std::string& content){
    LineMap lineMap(content);
    std::vector<std::string> lines;
    lines.reserve(static_cast<size_t>(lineMap.getLineCount()));
    for(int64_t i = 1; i <= lineMap.getLineCount(); ++i) lines.push_back(lineMap.getLine(i));
    return DocumentContext{content, std::move(lines), std::move(lineMap)};
}

ToolContext createToolContext(const std::string& content, StoreStatePtr store, std::optional<AbortSignal> abortSignal){
    return ToolContext{createDocumentContext(content), store ? std::move(store) : createInitialState(), std::move(abortSignal)};
}

nlohmann::json toJson(const JsonToolResult& r){
    if(r.success) return {{"success", true}, {"value", r.value}, {"message", r.message}};
    nlohmann::json j = {{"success", false}, {"error", r.error}, {"recoverable", r.recoverable}};
    if(r.code) j["code"] = *r.code;
    return j;
}

void from_json(const nlohmann::json& j, ToolCall& c){
    c.id = j.at("id").get<std::string>();
    c.name = j.at("name").get<std::string>();
    c.arguments = j.contains("arguments") ? j["arguments"] : nlohmann::json::object();
    // some providers send arguments as an encoded JSON string
    if(c.arguments.is_string()) c.arguments = nlohmann::json::parse(c.arguments.get<std::string>());
}

void to_json(nlohmann::json& j, const ToolCallResult& r){
    j = {{"callId", r.callId}, {"toolName", r.toolName}, {"result", toJson(r.result)}, {"durationMs", r.durationMs}};
}

nlohmann::json toProviderFormat(const ToolDefinition& tool){
    nlohmann::json props = nlohmann::json::object();
    for(const auto& p : tool.parameters().properties) props[p.first] = p.second.toJson();
    return {
        {"name", tool.name()},
        {"description", tool.description()},
        {"parameters", {{"type", "object"}, {"properties", props}, {"required", tool.parameters().required}}}
    };
}

namespace validators {

// Integral doubles must fit int64_t: [-2^63, 2^63).
bool isInteger(const nlohmann::json& v){
    if(v.is_number_unsigned()) return v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    if(v.is_number_integer()) return true;
    if(!v.is_number_float()) return false;
    const double d = v.get<double>();
    return std::isfinite(d) && std::floor(d) == d && d >= -9223372036854775808.0 && d < 9223372036854775808.0;
}

int64_t asInteger(const nlohmann::json& v){
    if(v.is_number_integer()) return v.get<int64_t>();
    return static_cast<int64_t>(v.get<double>());
}

bool isPositiveInteger(const nlohmann::json& v){ return isInteger(v) && v.get<double>() > 0; }
bool isNonNegativeInteger(const nlohmann::json& v){ return isInteger(v) && v.get<double>() >= 0; }
bool isNonEmptyString(const nlohmann::json& v){ return v.is_string() && !v.get<std::string>().empty(); }
bool isNormalizedNumber(const nlohmann::json& v){ return v.is_number() && v.get<double>() >= 0.0 && v.get<double>() <= 1.0; }

bool isOneOf(const nlohmann::json& v, const std::vector<std::string>& allowed){
    if(!v.is_string()) return false;
    const auto& s = v.get_ref<const std::string&>();
    for(const auto& a : allowed) if(a == s) return true;
    return false;
}

bool isObject(const nlohmann::json& v){ return v.is_object(); }
bool isArray(const nlohmann::json& v){ return v.is_array(); }

} // namespace validators

} // namespace Marginalia
