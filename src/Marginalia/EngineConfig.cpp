#include <Marginalia/EngineConfig.hpp>
#include <fstream>
#include <sstream>
#include <plog/Log.h>

namespace Marginalia {

static std::optional<EngineConfig> configError(std::string* outError, const std::string& msg){
    PLOGE << "[Config] " << msg;
    if(outError) *outError = msg;
    return std::nullopt;
}

std::optional<EngineConfig> EngineConfig::fromJson(const nlohmann::json& j, std::string* outError){
    EngineConfig cfg;
    if(j.is_null()) return cfg;
    if(!j.is_object()) return configError(outError, "config root must be an object");

    if(j.contains("undo")){
        const auto& u = j["undo"];
        if(!u.is_object()) return configError(outError, "undo must be an object");
        if(u.contains("maxSize")){
            if(!u["maxSize"].is_number_integer() || u["maxSize"].get<int64_t>() < 1) return configError(outError, "undo.maxSize must be a positive integer");
            cfg.undoMaxSize = static_cast<size_t>(u["maxSize"].get<int64_t>());
        }
    }

    if(j.contains("executor")){
        const auto& e = j["executor"];
        if(!e.is_object()) return configError(outError, "executor must be an object");
        if(e.contains("timeoutMs")){
            if(!e["timeoutMs"].is_number_integer()) return configError(outError, "executor.timeoutMs must be an integer");
            cfg.toolTimeoutMs = e["timeoutMs"].get<int64_t>();
        }
        if(e.contains("continueOnError")){
            if(!e["continueOnError"].is_boolean()) return configError(outError, "executor.continueOnError must be a boolean");
            cfg.continueOnError = e["continueOnError"].get<bool>();
        }
    }

    if(j.contains("overlapStrategy")){
        if(!j["overlapStrategy"].is_string()) return configError(outError, "overlapStrategy must be a string");
        auto s = parseOverlapStrategy(j["overlapStrategy"].get<std::string>());
        if(!s) return configError(outError, "unknown overlapStrategy: " + j["overlapStrategy"].get<std::string>());
        cfg.overlapStrategy = *s;
    }

    if(j.contains("featureFlags")){
        std::string err;
        cfg.featureFlags = featureFlagUpdateFromJson(j["featureFlags"], &err);
        if(!err.empty()) return configError(outError, "featureFlags: " + err);
    }
    return cfg;
}

std::optional<EngineConfig> EngineConfig::loadFile(const std::string& path, std::string* outError){
    std::ifstream in(path);
    if(!in) return configError(outError, "cannot open config file: " + path);
    std::stringstream ss;
    ss << in.rdbuf();
    nlohmann::json j;
    try{
        j = nlohmann::json::parse(ss.str());
    } catch(const nlohmann::json::parse_error& e){
        return configError(outError, "invalid JSON in " + path + ": " + e.what());
    }
    PLOGD << "[Config] loaded " << path;
    return fromJson(j, outError);
}

nlohmann::json EngineConfig::toJson() const {
    return {
        {"undo", {{"maxSize", undoMaxSize}}},
        {"executor", {{"timeoutMs", toolTimeoutMs}, {"continueOnError", continueOnError}}},
        {"overlapStrategy", toString(overlapStrategy)}
    };
}

} // namespace Marginalia
