#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace Marginalia {

// Read by isNewHighlightManagerEnabled when no override is set. Only "true" and "false" count.
constexpr const char* kNewHighlightManagerEnvVar = "MARGINALIA_NEW_HIGHLIGHT_MANAGER";

struct FeatureFlagConfig {
    bool newHighlightManager = false;
    bool debugLogging = false;
    bool performanceMetrics = false;
    int64_t maxSuggestions = 100;
    bool undoRedoEnabled = true;
};

// Fields left unset keep their current value.
struct FeatureFlagUpdate {
    std::optional<bool> newHighlightManager;
    std::optional<bool> debugLogging;
    std::optional<bool> performanceMetrics;
    std::optional<int64_t> maxSuggestions;
    std::optional<bool> undoRedoEnabled;
};

// Runtime override, then stored override, then the environment, then false.
bool isNewHighlightManagerEnabled();

void setHighlightManagerOverride(std::optional<bool> enabled);
std::optional<bool> getHighlightManagerOverride();
void clearHighlightManagerOverride();

// Process-wide stand-in for a persisted preference.
void setStoredHighlightManagerOverride(std::optional<bool> enabled);
std::optional<bool> getStoredHighlightManagerOverride();

FeatureFlagConfig getFeatureFlags();
// Setting newHighlightManager also sets the runtime override.
void setFeatureFlags(const FeatureFlagUpdate& update);
// Restores defaults and clears the runtime override. The stored override is kept.
void resetFeatureFlags();
void enableAllExperimentalFeatures();
void enableProductionFeatures();
bool isDebugEnabled();

// Emits at debug level only while debugLogging is on.
void debugLog(const std::string& category, const std::string& message, const nlohmann::json& data = nullptr);

// Every resolution layer plus the merged config.
nlohmann::json debugFlags();

FeatureFlagUpdate featureFlagUpdateFromJson(const nlohmann::json& j, std::string* outError = nullptr);
void to_json(nlohmann::json& j, const FeatureFlagConfig& c);

} // namespace Marginalia
