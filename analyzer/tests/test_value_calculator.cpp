#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "value_calculator.hpp"

#include <cmath>

namespace {

constexpr double kEps = 1e-9;

TEST(ValueCalculatorTest, ImpliedProbabilityIsReciprocalOfOdds) {
    for (double odds : {1.01, 1.05, 1.15, 1.25, 2.0, 3.5, 10.0}) {
        EXPECT_NEAR(implied_probability(odds), 1.0 / odds, kEps) << "odds " << odds;
    }
}

TEST(ValueCalculatorTest, ExpectedValueAndEdgeFormulas) {
    for (double odds : {1.05, 1.20, 1.80}) {
        for (double p : {0.5, 0.8, 0.95}) {
            EXPECT_NEAR(expected_value(p, odds), p * odds - 1.0, kEps);
            EXPECT_NEAR(edge(p, odds), p - 1.0 / odds, kEps);
        }
    }
}

TEST(ValueCalculatorTest, NegativeEdgeFavourite) {
    // 1.15 with an 80% model: implied 0.8696, edge -0.0696, EV -0.08
    EXPECT_NEAR(implied_probability(1.15), 0.869565, 1e-6);
    EXPECT_NEAR(edge(0.80, 1.15), -0.069565, 1e-6);
    EXPECT_NEAR(expected_value(0.80, 1.15), -0.08, 1e-9);
}

TEST(ValueCalculatorTest, ValueRatingBands) {
    EXPECT_EQ(value_rating(0.15), 5);
    EXPECT_EQ(value_rating(0.10), 5);
    EXPECT_EQ(value_rating(0.07), 4);
    EXPECT_EQ(value_rating(0.05), 3);
    EXPECT_EQ(value_rating(0.03), 2);
    EXPECT_EQ(value_rating(0.01), 1);
    EXPECT_EQ(value_rating(-0.20), 1);
}

TEST(ValueCalculatorTest, ConfidenceTiers) {
    Config config;
    EXPECT_EQ(confidence_tier(config, 0.90, 0.06), ConfidenceTier::High);
    EXPECT_EQ(confidence_tier(config, 0.90, 0.03), ConfidenceTier::Medium);
    EXPECT_EQ(confidence_tier(config, 0.80, 0.10), ConfidenceTier::Medium);
    EXPECT_EQ(confidence_tier(config, 0.70, 0.10), ConfidenceTier::Low);
    EXPECT_EQ(confidence_tier(config, 0.95, 0.00), ConfidenceTier::Low);
}

TEST(ValueCalculatorTest, ScoreCandidateFillsEveryMetric) {
    Config config;
    auto scored = test_helpers::make_scored(config, "evt", 1.20, 0.90);

    EXPECT_DOUBLE_EQ(scored.model_probability, 0.90);
    EXPECT_NEAR(scored.implied_probability, 1.0 / 1.20, kEps);
    EXPECT_NEAR(scored.edge, 0.90 - 1.0 / 1.20, kEps);
    EXPECT_NEAR(scored.expected_value, 0.08, kEps);
    EXPECT_EQ(scored.value_rating, 4);
    EXPECT_EQ(scored.confidence_tier, ConfidenceTier::High);
    EXPECT_FALSE(scored.composite_score.has_value());
    EXPECT_FALSE(scored.rivalry_flag);
}

}  // namespace
