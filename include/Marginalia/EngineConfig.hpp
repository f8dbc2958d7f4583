#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <Marginalia/FeatureFlags.hpp>
#include <Marginalia/RangeIndex.hpp>

namespace Marginalia {

// Engine tunables. JSON layout:
//   {"undo": {"maxSize": 100},
//    "executor": {"timeoutMs": 30000, "continueOnError": true},
//    "overlapStrategy": "keep-first",
//    "featureFlags": {"debugLogging": true, ...}}
// Every key is optional.
struct EngineConfig {
    size_t undoMaxSize = 100;
    int64_t toolTimeoutMs = 30000;
    bool continueOnError = true;
    OverlapStrategy overlapStrategy = OverlapStrategy::KeepFirst;
    FeatureFlagUpdate featureFlags;

    // nullopt and outError set on the first malformed key.
    static std::optional<EngineConfig> fromJson(const nlohmann::json& j, std::string* outError = nullptr);
    static std::optional<EngineConfig> loadFile(const std::string& path, std::string* outError = nullptr);

    nlohmann::json toJson() const;
};

} // namespace Marginalia
