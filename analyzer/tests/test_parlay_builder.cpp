#include <gtest/gtest.h>

#include "parlay_builder.hpp"
#include "test_helpers.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace {

using test_helpers::make_leg;

// Legs in descending score order with the given odds
std::vector<RecommendedLeg> legs_with_odds(const std::vector<double>& odds) {
    std::vector<RecommendedLeg> legs;
    for (std::size_t i = 0; i < odds.size(); ++i) {
        legs.push_back(make_leg("evt" + std::to_string(i), odds[i], 10.0 - static_cast<double>(i)));
    }
    return legs;
}

std::vector<double> odds_of(const Parlay& parlay) {
    std::vector<double> odds;
    for (const auto& leg : parlay.legs) {
        odds.push_back(leg.scored.candidate.decimal_odds);
    }
    return odds;
}

class ParlayBuilderTest : public ::testing::Test {
protected:
    Config config;
};

TEST_F(ParlayBuilderTest, ShortPricedLegsFallBackToClosestCombination) {
    ParlayBuilder builder(config);
    auto parlay = builder.build(legs_with_odds({1.20, 1.15, 1.10, 1.22, 1.18}), 2.0, 4);

    // No four of these reach 2.0; the closest is 1.20 x 1.15 x 1.22 x 1.18
    ASSERT_TRUE(parlay.has_value());
    EXPECT_EQ(odds_of(*parlay), (std::vector<double>{1.20, 1.15, 1.22, 1.18}));
    EXPECT_NEAR(parlay->combined_odds, 1.986648, 1e-9);
    EXPECT_GE(parlay->combined_odds, 2.0 * config.parlay_min_fraction);
    EXPECT_LE(parlay->combined_odds, 2.0 * (1.0 + config.parlay_tolerance));
    EXPECT_EQ(parlay->leg_count(), 4u);
}

TEST_F(ParlayBuilderTest, GreedyTakesHighestScoringLegsThatReachTarget) {
    ParlayBuilder builder(config);
    auto parlay = builder.build(legs_with_odds({1.50, 1.40, 1.30}), 2.0, 4);

    ASSERT_TRUE(parlay.has_value());
    EXPECT_EQ(odds_of(*parlay), (std::vector<double>{1.50, 1.40}));
    EXPECT_NEAR(parlay->combined_odds, 2.10, 1e-12);
    EXPECT_DOUBLE_EQ(parlay->target_odds, 2.0);
}

TEST_F(ParlayBuilderTest, GreedyBacktracksPastOvershoot) {
    ParlayBuilder builder(config);
    // 1.6 x 1.5 = 2.4 overshoots the 2.2 ceiling
    auto parlay = builder.build(legs_with_odds({1.60, 1.50, 1.30}), 2.0, 4);

    ASSERT_TRUE(parlay.has_value());
    EXPECT_EQ(odds_of(*parlay), (std::vector<double>{1.60, 1.30}));
}

TEST_F(ParlayBuilderTest, NeverCombinesLegsFromTheSameEvent) {
    ParlayBuilder builder(config);
    std::vector<RecommendedLeg> legs = {
        make_leg("same", 1.50, 10.0),
        make_leg("same", 1.40, 9.0),
        make_leg("other", 1.35, 8.0),
    };
    legs[1].scored.candidate.selection = "Other side";

    auto parlay = builder.build(legs, 2.0, 4);
    ASSERT_TRUE(parlay.has_value());
    ASSERT_EQ(parlay->leg_count(), 2u);
    EXPECT_EQ(parlay->legs[0].scored.candidate.event_id, "same");
    EXPECT_EQ(parlay->legs[1].scored.candidate.event_id, "other");
    EXPECT_NEAR(parlay->combined_odds, 2.025, 1e-12);
}

TEST_F(ParlayBuilderTest, UsesScoreOrderNotInputOrder) {
    ParlayBuilder builder(config);
    std::vector<RecommendedLeg> legs = {
        make_leg("low", 1.45, 1.0),
        make_leg("high", 1.50, 9.0),
        make_leg("mid", 1.40, 5.0),
    };

    auto parlay = builder.build(legs, 2.0, 4);
    ASSERT_TRUE(parlay.has_value());
    EXPECT_EQ(parlay->legs[0].scored.candidate.event_id, "high");
    EXPECT_EQ(parlay->legs[1].scored.candidate.event_id, "mid");
}

TEST_F(ParlayBuilderTest, ReportsCombinedProbabilityAndReturn) {
    ParlayBuilder builder(config);
    std::vector<RecommendedLeg> legs = {
        make_leg("a", 1.50, 10.0, 0.80),
        make_leg("b", 1.40, 9.0, 0.90),
    };

    auto parlay = builder.build(legs, 2.0, 2);
    ASSERT_TRUE(parlay.has_value());
    EXPECT_NEAR(parlay->combined_probability, 0.72, 1e-12);
    EXPECT_NEAR(parlay->total_composite_score, 19.0, 1e-12);
    EXPECT_NEAR(parlay->potential_return(10.0), 21.0, 1e-9);
}

TEST_F(ParlayBuilderTest, SingleLegAllowedWhenMaxLegsIsOne) {
    ParlayBuilder builder(config);
    auto parlay = builder.build(legs_with_odds({2.05, 1.20}), 2.0, 1);
    ASSERT_TRUE(parlay.has_value());
    EXPECT_EQ(odds_of(*parlay), (std::vector<double>{2.05}));
}

TEST_F(ParlayBuilderTest, InfeasibleTargetReturnsNothing) {
    ParlayBuilder builder(config);
    EXPECT_FALSE(builder.build(legs_with_odds({1.05, 1.06, 1.07}), 3.0, 4).has_value());
}

TEST_F(ParlayBuilderTest, EmptyInputReturnsNothing) {
    ParlayBuilder builder(config);
    EXPECT_FALSE(builder.build({}, 2.0, 4).has_value());
}

TEST_F(ParlayBuilderTest, RejectsInvalidArguments) {
    ParlayBuilder builder(config);
    auto legs = legs_with_odds({1.5, 1.4});
    EXPECT_THROW(builder.build(legs, 1.0, 4), std::invalid_argument);
    EXPECT_THROW(builder.build(legs, 0.5, 4), std::invalid_argument);
    EXPECT_THROW(builder.build(legs, 2.0, 0), std::invalid_argument);
    EXPECT_THROW(builder.build({}, 1.0, 4), std::invalid_argument);
}

TEST_F(ParlayBuilderTest, IdenticalInputsGiveIdenticalParlays) {
    ParlayBuilder builder(config);
    auto legs = legs_with_odds({1.20, 1.15, 1.10, 1.22, 1.18, 1.12, 1.24, 1.08});

    auto first = builder.build(legs, 2.5, 5);
    auto second = builder.build(legs, 2.5, 5);
    ASSERT_EQ(first.has_value(), second.has_value());
    if (first) {
        ASSERT_EQ(first->leg_count(), second->leg_count());
        for (std::size_t i = 0; i < first->leg_count(); ++i) {
            EXPECT_EQ(first->legs[i].scored.candidate.event_id, second->legs[i].scored.candidate.event_id);
        }
        EXPECT_DOUBLE_EQ(first->combined_odds, second->combined_odds);
    }
}

TEST_F(ParlayBuilderTest, ResultRespectsFloorAndCeiling) {
    ParlayBuilder builder(config);
    auto legs = legs_with_odds({1.25, 1.21, 1.19, 1.17, 1.13, 1.11, 1.09, 1.06});

    for (double target : {1.5, 2.0, 2.5, 3.0, 4.0}) {
        for (int max_legs = 1; max_legs <= 6; ++max_legs) {
            auto parlay = builder.build(legs, target, max_legs);
            if (!parlay) {
                continue;
            }
            EXPECT_LE(parlay->leg_count(), static_cast<std::size_t>(max_legs));
            EXPECT_GE(parlay->combined_odds, target * config.parlay_min_fraction - 1e-9);
            EXPECT_LE(parlay->combined_odds, target * (1.0 + config.parlay_tolerance) + 1e-9);
        }
    }
}

}  // namespace
