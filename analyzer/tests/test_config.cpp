#include <gtest/gtest.h>

#include "config.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

#include <cstdlib>

namespace {

using test_helpers::TempFile;

TEST(ConfigTest, DefaultsAreValid) {
    Config config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_DOUBLE_EQ(config.stage1_min_odds, 1.05);
    EXPECT_DOUBLE_EQ(config.stage1_max_odds, 1.25);
    EXPECT_DOUBLE_EQ(config.stage1_min_model_prob, 0.75);
    EXPECT_DOUBLE_EQ(config.stage1_min_edge, 0.02);
    EXPECT_DOUBLE_EQ(config.stage1_min_ev, -0.05);
    EXPECT_EQ(config.max_recommended_legs, 20);
}

TEST(ConfigTest, WeightsMustSumToOne) {
    Config config;
    config.weight_probability = 0.5;
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(ConfigTest, RejectsInvertedOddsBand) {
    Config config;
    config.stage1_min_odds = 1.30;
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(ConfigTest, RejectsLegCapAboveTwenty) {
    Config config;
    config.max_recommended_legs = 21;
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(ConfigTest, RejectsUnboundedSearch) {
    Config config;
    config.parlay_top_k = 50;
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(ConfigTest, LoadOverridesAndExtendsRivalries) {
    TempFile file("legscout_config_load.json", R"({
        "log_level": "debug",
        "stage1_max_odds": 1.30,
        "rivalry_penalty": 0.08,
        "consistency_window": 6,
        "unknown_key": "ignored",
        "rivalries": [
            {"sport": "mixed_martial_arts", "team_a": "Fighter One", "team_b": "Fighter Two", "name": "Trilogy"},
            {"sport": "croquet", "team_a": "A", "team_b": "B"}
        ]
    })");

    Config config;
    config.load(file.path());
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_DOUBLE_EQ(config.stage1_max_odds, 1.30);
    EXPECT_DOUBLE_EQ(config.rivalry_penalty, 0.08);
    EXPECT_EQ(config.consistency_window, 6);
    EXPECT_DOUBLE_EQ(config.stage1_min_odds, 1.05);
    ASSERT_EQ(config.rivalries.size(), 1u);
    EXPECT_EQ(config.rivalries[0].name, "Trilogy");
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, LoadFailures) {
    Config config;
    EXPECT_THROW(config.load("/nonexistent/legscout.json"), ConfigError);

    TempFile garbage("legscout_config_garbage.json", "{ nope");
    EXPECT_THROW(config.load(garbage.path()), ConfigError);

    TempFile wrong_type("legscout_config_type.json", R"({"max_recommended_legs": "twenty"})");
    EXPECT_THROW(config.load(wrong_type.path()), ConfigError);
}

TEST(ConfigTest, EnvironmentOverridesEndpoints) {
    setenv("LOG_LEVEL", "warn", 1);
    setenv("HEALTH_PORT", "9191", 1);
    setenv("MODEL_PATH", "/models/nba.json", 1);

    Config config;
    config.load_from_env();
    EXPECT_EQ(config.log_level, "warn");
    EXPECT_EQ(config.health_port, 9191);
    EXPECT_EQ(config.model_path, "/models/nba.json");

    unsetenv("LOG_LEVEL");
    unsetenv("HEALTH_PORT");
    unsetenv("MODEL_PATH");
}

}  // namespace
