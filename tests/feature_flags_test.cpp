#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <Marginalia/EngineConfig.hpp>
#include <Marginalia/FeatureFlags.hpp>

using namespace Marginalia;

namespace {

class FeatureFlagsTest : public ::testing::Test {
protected:
    void SetUp() override { clean(); }
    void TearDown() override { clean(); }

    static void clean(){
        resetFeatureFlags();
        setStoredHighlightManagerOverride(std::nullopt);
        unsetenv(kNewHighlightManagerEnvVar);
    }
};

} // namespace

TEST_F(FeatureFlagsTest, DefaultsToDisabled) {
    EXPECT_FALSE(isNewHighlightManagerEnabled());
    FeatureFlagConfig c = getFeatureFlags();
    EXPECT_EQ(c.maxSuggestions, 100);
    EXPECT_TRUE(c.undoRedoEnabled);
    EXPECT_FALSE(c.debugLogging);
}

TEST_F(FeatureFlagsTest, EnvironmentOnlyAcceptsExactBooleans) {
    setenv(kNewHighlightManagerEnvVar, "true", 1);
    EXPECT_TRUE(isNewHighlightManagerEnabled());
    setenv(kNewHighlightManagerEnvVar, "1", 1);
    EXPECT_FALSE(isNewHighlightManagerEnabled());
    EXPECT_TRUE(debugFlags()["environmentValue"].is_null());
}

TEST_F(FeatureFlagsTest, OverridesTakePrecedenceInOrder) {
    setenv(kNewHighlightManagerEnvVar, "true", 1);
    setStoredHighlightManagerOverride(false);
    EXPECT_FALSE(isNewHighlightManagerEnabled());

    setHighlightManagerOverride(true);
    EXPECT_TRUE(isNewHighlightManagerEnabled());
    EXPECT_EQ(getHighlightManagerOverride(), std::optional<bool>(true));

    clearHighlightManagerOverride();
    EXPECT_FALSE(isNewHighlightManagerEnabled());

    setStoredHighlightManagerOverride(std::nullopt);
    EXPECT_TRUE(isNewHighlightManagerEnabled());
}

TEST_F(FeatureFlagsTest, SetFeatureFlagsUpdatesOnlyGivenFields) {
    FeatureFlagUpdate u;
    u.maxSuggestions = 5;
    u.newHighlightManager = true;
    setFeatureFlags(u);

    FeatureFlagConfig c = getFeatureFlags();
    EXPECT_EQ(c.maxSuggestions, 5);
    EXPECT_TRUE(c.newHighlightManager);
    EXPECT_TRUE(c.undoRedoEnabled);
    EXPECT_EQ(getHighlightManagerOverride(), std::optional<bool>(true));
}

TEST_F(FeatureFlagsTest, ResetKeepsStoredOverride) {
    setStoredHighlightManagerOverride(true);
    setHighlightManagerOverride(false);
    resetFeatureFlags();
    EXPECT_FALSE(getHighlightManagerOverride().has_value());
    EXPECT_TRUE(isNewHighlightManagerEnabled());
}

TEST_F(FeatureFlagsTest, Presets) {
    enableAllExperimentalFeatures();
    EXPECT_TRUE(isDebugEnabled());
    EXPECT_TRUE(getFeatureFlags().performanceMetrics);
    EXPECT_TRUE(isNewHighlightManagerEnabled());

    enableProductionFeatures();
    EXPECT_FALSE(isDebugEnabled());
    EXPECT_FALSE(isNewHighlightManagerEnabled());
    EXPECT_TRUE(getFeatureFlags().undoRedoEnabled);
}

TEST_F(FeatureFlagsTest, DebugFlagsReportsEveryLayer) {
    setStoredHighlightManagerOverride(true);
    nlohmann::json d = debugFlags();
    EXPECT_TRUE(d["runtimeOverride"].is_null());
    EXPECT_EQ(d["storedOverride"], true);
    EXPECT_EQ(d["resolved"], true);
    EXPECT_EQ(d["config"]["maxSuggestions"], 100);
}

TEST_F(FeatureFlagsTest, UpdateFromJsonReportsBadTypes) {
    std::string err;
    FeatureFlagUpdate u = featureFlagUpdateFromJson({{"debugLogging", true}, {"maxSuggestions", 3}}, &err);
    EXPECT_TRUE(err.empty());
    EXPECT_EQ(u.debugLogging, std::optional<bool>(true));
    EXPECT_EQ(u.maxSuggestions, std::optional<int64_t>(3));
    EXPECT_FALSE(u.undoRedoEnabled.has_value());

    featureFlagUpdateFromJson({{"undoRedoEnabled", "yes"}}, &err);
    EXPECT_EQ(err, "undoRedoEnabled must be a boolean");
}

TEST(EngineConfigTest, EmptyObjectGivesDefaults) {
    auto cfg = EngineConfig::fromJson(nlohmann::json::object());
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->undoMaxSize, 100u);
    EXPECT_EQ(cfg->toolTimeoutMs, 30000);
    EXPECT_TRUE(cfg->continueOnError);
    EXPECT_EQ(cfg->overlapStrategy, OverlapStrategy::KeepFirst);
}

TEST(EngineConfigTest, ReadsNestedSections) {
    nlohmann::json j = {
        {"undo", {{"maxSize", 10}}},
        {"executor", {{"timeoutMs", 500}, {"continueOnError", false}}},
        {"featureFlags", {{"maxSuggestions", 7}}}
    };
    auto cfg = EngineConfig::fromJson(j);
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->undoMaxSize, 10u);
    EXPECT_EQ(cfg->toolTimeoutMs, 500);
    EXPECT_FALSE(cfg->continueOnError);
    EXPECT_EQ(cfg->featureFlags.maxSuggestions, std::optional<int64_t>(7));
    EXPECT_EQ(cfg->toJson()["undo"]["maxSize"], 10);
}

TEST(EngineConfigTest, RejectsMalformedValues) {
    std::string err;
    EXPECT_FALSE(EngineConfig::fromJson({{"undo", {{"maxSize", 0}}}}, &err).has_value());
    EXPECT_EQ(err, "undo.maxSize must be a positive integer");

    EXPECT_FALSE(EngineConfig::fromJson({{"overlapStrategy", "shuffle"}}, &err).has_value());
    EXPECT_EQ(err, "unknown overlapStrategy: shuffle");

    EXPECT_FALSE(EngineConfig::fromJson(nlohmann::json::array(), &err).has_value());
    EXPECT_FALSE(EngineConfig::fromJson({{"featureFlags", {{"debugLogging", 1}}}}, &err).has_value());
}

TEST(EngineConfigTest, LoadFileHandlesMissingAndBrokenFiles) {
    std::string err;
    EXPECT_FALSE(EngineConfig::loadFile("/nonexistent/marginalia.json", &err).has_value());
    EXPECT_EQ(err, "cannot open config file: /nonexistent/marginalia.json");

    const std::string path = ::testing::TempDir() + "marginalia_broken.json";
    {
        std::ofstream out(path);
        out << "{\"undo\": ";
    }
    EXPECT_FALSE(EngineConfig::loadFile(path, &err).has_value());
    EXPECT_EQ(err.rfind("invalid JSON in", 0), 0u);

    {
        std::ofstream out(path);
        out << "{\"executor\": {\"timeoutMs\": 0}}";
    }
    auto cfg = EngineConfig::loadFile(path, &err);
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->toolTimeoutMs, 0);
    std::remove(path.c_str());
}
