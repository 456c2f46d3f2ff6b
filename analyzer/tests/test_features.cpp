#include <gtest/gtest.h>

#include "errors.hpp"
#include "features.hpp"
#include "test_helpers.hpp"

#include <string>

namespace {

using test_helpers::make_candidate;

double number(const FeatureMap& features, const std::string& name) {
    auto value = numeric_feature(features, name);
    EXPECT_TRUE(value.has_value()) << name;
    return value.value_or(-1.0);
}

TEST(OddsDerivedFeatureProviderTest, ShortPriceFavourite) {
    OddsDerivedFeatureProvider provider;
    auto features = provider.lookup(make_candidate("evt", 1.10));

    EXPECT_DOUBLE_EQ(number(features, "win_rate"), 0.75);
    EXPECT_DOUBLE_EQ(number(features, "recent_form"), 0.75);
    EXPECT_DOUBLE_EQ(number(features, "is_favorite"), 1.0);
    EXPECT_DOUBLE_EQ(number(features, "is_home"), 1.0);
    EXPECT_DOUBLE_EQ(number(features, "ranking_diff"), -20.0);
    EXPECT_DOUBLE_EQ(number(features, "win_streak"), 1.0);
    EXPECT_NEAR(number(features, "consistency"), 0.65 + (1.0 / 1.10) * 0.2, 1e-9);
}

TEST(OddsDerivedFeatureProviderTest, Underdog) {
    OddsDerivedFeatureProvider provider;
    auto c = make_candidate("evt", 3.0);
    c.selection = c.away_team;
    auto features = provider.lookup(c);

    EXPECT_DOUBLE_EQ(number(features, "win_rate"), 0.42);
    EXPECT_DOUBLE_EQ(number(features, "is_favorite"), 0.0);
    EXPECT_DOUBLE_EQ(number(features, "is_home"), 0.0);
    EXPECT_DOUBLE_EQ(number(features, "ranking_diff"), 10.0);
    EXPECT_DOUBLE_EQ(number(features, "win_streak"), 0.0);
}

TEST(WithFeaturesTest, NeverOverwritesSuppliedValues) {
    OddsDerivedFeatureProvider provider;
    auto c = make_candidate("evt", 1.10);
    c.context_features["win_rate"] = 0.91;
    c.context_features["injury"] = std::string("none");

    auto enriched = with_features(c, provider);
    EXPECT_DOUBLE_EQ(number(enriched.context_features, "win_rate"), 0.91);
    EXPECT_DOUBLE_EQ(number(enriched.context_features, "recent_form"), 0.75);
    EXPECT_EQ(std::get<std::string>(enriched.context_features.at("injury")), "none");
    EXPECT_EQ(c.context_features.size(), 2u);
}

TEST(ModelFeatureRowTest, OrderAndScaling) {
    auto c = make_candidate("evt", 1.25);
    c.context_features["win_rate"] = 0.7;
    c.context_features["recent_form"] = 0.6;
    c.context_features["ranking_diff"] = -20.0;

    auto row = model_feature_row(c);
    ASSERT_EQ(row.size(), model_feature_names().size());
    EXPECT_EQ(model_feature_names().front(), "win_rate");
    EXPECT_EQ(model_feature_names().back(), "implied_prob");

    EXPECT_DOUBLE_EQ(*row[0], 0.7);
    EXPECT_DOUBLE_EQ(*row[1], 0.6);
    EXPECT_DOUBLE_EQ(*row[2], 1.0);   // derived from odds
    EXPECT_DOUBLE_EQ(*row[3], 1.0);   // derived from home team
    EXPECT_DOUBLE_EQ(*row[4], -0.2);
    EXPECT_DOUBLE_EQ(*row[5], 0.8);
}

TEST(ModelFeatureRowTest, MissingFeaturesAreEmpty) {
    auto row = model_feature_row(make_candidate("evt", 1.25));
    EXPECT_FALSE(row[0].has_value());
    EXPECT_FALSE(row[1].has_value());
    EXPECT_FALSE(row[4].has_value());
    EXPECT_TRUE(row[5].has_value());
}

TEST(FeatureAsNumberTest, BooleanWordsAndFailures) {
    EXPECT_DOUBLE_EQ(feature_as_number("is_home", std::string("Yes")), 1.0);
    EXPECT_DOUBLE_EQ(feature_as_number("is_home", std::string(" away ")), 0.0);
    EXPECT_DOUBLE_EQ(feature_as_number("win_rate", 0.4), 0.4);
    EXPECT_THROW(feature_as_number("win_rate", std::string("hot")), DataQualityError);
}

}  // namespace
