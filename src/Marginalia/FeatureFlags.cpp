#include <Marginalia/FeatureFlags.hpp>
#include <cstdlib>
#include <mutex>
#include <plog/Log.h>

namespace Marginalia {

static std::mutex s_flagsMutex;
static FeatureFlagConfig s_config;
static std::optional<bool> s_runtimeOverride;
static std::optional<bool> s_storedOverride;

static std::optional<bool> envOverride(){
    const char* env = std::getenv(kNewHighlightManagerEnvVar);
    if(!env) return std::nullopt;
    const std::string v(env);
    if(v == "true") return true;
    if(v == "false") return false;
    return std::nullopt;
}

static bool resolveNewHighlightManagerLocked(){
    if(s_runtimeOverride) return *s_runtimeOverride;
    if(s_storedOverride) return *s_storedOverride;
    if(auto env = envOverride()) return *env;
    return false;
}

static void applyUpdateLocked(const FeatureFlagUpdate& u){
    if(u.newHighlightManager){
        s_config.newHighlightManager = *u.newHighlightManager;
        s_runtimeOverride = u.newHighlightManager;
    }
    if(u.debugLogging) s_config.debugLogging = *u.debugLogging;
    if(u.performanceMetrics) s_config.performanceMetrics = *u.performanceMetrics;
    if(u.maxSuggestions) s_config.maxSuggestions = *u.maxSuggestions;
    if(u.undoRedoEnabled) s_config.undoRedoEnabled = *u.undoRedoEnabled;
}

bool isNewHighlightManagerEnabled(){
    std::lock_guard<std::mutex> lock(s_flagsMutex);
    return resolveNewHighlightManagerLocked();
}

void setHighlightManagerOverride(std::optional<bool> enabled){
    std::lock_guard<std::mutex> lock(s_flagsMutex);
    s_runtimeOverride = enabled;
}

std::optional<bool> getHighlightManagerOverride(){
    std::lock_guard<std::mutex> lock(s_flagsMutex);
    return s_runtimeOverride;
}

void clearHighlightManagerOverride(){
    std::lock_guard<std::mutex> lock(s_flagsMutex);
    s_runtimeOverride.reset();
}

void setStoredHighlightManagerOverride(std::optional<bool> enabled){
    std::lock_guard<std::mutex> lock(s_flagsMutex);
    s_storedOverride = enabled;
}

std::optional<bool> getStoredHighlightManagerOverride(){
    std::lock_guard<std::mutex> lock(s_flagsMutex);
    return s_storedOverride;
}

FeatureFlagConfig getFeatureFlags(){
    std::lock_guard<std::mutex> lock(s_flagsMutex);
    FeatureFlagConfig c = s_config;
    c.newHighlightManager = resolveNewHighlightManagerLocked();
    return c;
}

void setFeatureFlags(const FeatureFlagUpdate& update){
    std::lock_guard<std::mutex> lock(s_flagsMutex);
    applyUpdateLocked(update);
}

void resetFeatureFlags(){
    std::lock_guard<std::mutex> lock(s_flagsMutex);
    s_config = FeatureFlagConfig{};
    s_runtimeOverride.reset();
}

void enableAllExperimentalFeatures(){
    FeatureFlagUpdate u;
    u.newHighlightManager = true;
    u.debugLogging = true;
    u.performanceMetrics = true;
    u.undoRedoEnabled = true;
    setFeatureFlags(u);
    PLOGI << "[Flags] experimental features enabled";
}

void enableProductionFeatures(){
    FeatureFlagUpdate u;
    u.newHighlightManager = false;
    u.debugLogging = false;
    u.performanceMetrics = false;
    u.undoRedoEnabled = true;
    setFeatureFlags(u);
}

bool isDebugEnabled(){
    std::lock_guard<std::mutex> lock(s_flagsMutex);
    return s_config.debugLogging;
}

void debugLog(const std::string& category, const std::string& message, const nlohmann::json& data){
    if(!isDebugEnabled()) return;
    if(data.is_null()){
        PLOGD << "[Highlight:" << category << "] " << message;
    } else {
        PLOGD << "[Highlight:" << category << "] " << message << " " << data.dump();
    }
}

static nlohmann::json optionalBool(const std::optional<bool>& v){
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

nlohmann::json debugFlags(){
    std::lock_guard<std::mutex> lock(s_flagsMutex);
    const char* env = std::getenv(kNewHighlightManagerEnvVar);
    FeatureFlagConfig merged = s_config;
    merged.newHighlightManager = resolveNewHighlightManagerLocked();
    return {
        {"runtimeOverride", optionalBool(s_runtimeOverride)},
        {"storedOverride", optionalBool(s_storedOverride)},
        {"environment", env ? nlohmann::json(env) : nlohmann::json(nullptr)},
        {"environmentValue", optionalBool(envOverride())},
        {"resolved", merged.newHighlightManager},
        {"config", merged}
    };
}

FeatureFlagUpdate featureFlagUpdateFromJson(const nlohmann::json& j, std::string* outError){
    FeatureFlagUpdate u;
    if(!j.is_object()){
        if(outError) *outError = "featureFlags must be an object";
        return u;
    }
    auto readBool = [&](const char* key, std::optional<bool>& dst){
        if(!j.contains(key)) return;
        if(j[key].is_boolean()) dst = j[key].get<bool>();
        else if(outError) *outError = std::string(key) + " must be a boolean";
    };
    readBool("newHighlightManager", u.newHighlightManager);
    readBool("debugLogging", u.debugLogging);
    readBool("performanceMetrics", u.performanceMetrics);
    readBool("undoRedoEnabled", u.undoRedoEnabled);
    if(j.contains("maxSuggestions")){
        if(j["maxSuggestions"].is_number_integer() && j["maxSuggestions"].get<int64_t>() >= 0) u.maxSuggestions = j["maxSuggestions"].get<int64_t>();
        else if(outError) *outError = "maxSuggestions must be a non-negative integer";
    }
    return u;
}

void to_json(nlohmann::json& j, const FeatureFlagConfig& c){
    j = {
        {"newHighlightManager", c.newHighlightManager},
        {"debugLogging", c.debugLogging},
        {"performanceMetrics", c.performanceMetrics},
        {"maxSuggestions", c.maxSuggestions},
        {"undoRedoEnabled", c.undoRedoEnabled}
    };
}

} // namespace Marginalia
