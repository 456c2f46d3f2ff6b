#include <gtest/gtest.h>

#include "stage1_filter.hpp"
#include "test_helpers.hpp"

#include <vector>

namespace {

using test_helpers::fixed_now;
using test_helpers::make_candidate;
using test_helpers::make_scored;

class Stage1FilterTest : public ::testing::Test {
protected:
    Config config;
};

TEST_F(Stage1FilterTest, NegativeEdgeFavouriteFails) {
    Stage1Filter filter(config);
    auto scored = make_scored(config, "evt", 1.15, 0.80);
    EXPECT_FALSE(filter.passes(scored, fixed_now()));
}

TEST_F(Stage1FilterTest, PositiveEdgeFavouritePasses) {
    Stage1Filter filter(config);
    // implied 0.8333, edge 0.0467, EV 0.056
    auto scored = make_scored(config, "evt", 1.20, 0.88);
    EXPECT_NEAR(scored.edge, 0.0467, 1e-4);
    EXPECT_TRUE(filter.passes(scored, fixed_now()));
}

TEST_F(Stage1FilterTest, ProbabilityAboveFloorIsNotEnoughWithoutEdge) {
    Stage1Filter filter(config);
    // 0.82 clears the probability floor but sits below the 0.8333 implied line
    auto scored = make_scored(config, "evt", 1.20, 0.82);
    EXPECT_LT(scored.edge, 0.0);
    EXPECT_FALSE(filter.passes(scored, fixed_now()));
}

TEST_F(Stage1FilterTest, OddsBandIsClosed) {
    Stage1Filter filter(config);
    EXPECT_TRUE(filter.passes(make_scored(config, "low", 1.05, 0.98), fixed_now()));
    EXPECT_TRUE(filter.passes(make_scored(config, "high", 1.25, 0.85), fixed_now()));
    EXPECT_FALSE(filter.passes(make_scored(config, "short", 1.04, 0.99), fixed_now()));
    EXPECT_FALSE(filter.passes(make_scored(config, "long", 1.26, 0.90), fixed_now()));
}

TEST_F(Stage1FilterTest, ProbabilityFloor) {
    config.stage1_max_odds = 1.50;
    Stage1Filter filter(config);
    // Edge and EV are fine at 1.45 but the model is below 75%
    auto scored = make_scored(config, "evt", 1.45, 0.74);
    EXPECT_GT(scored.edge, config.stage1_min_edge);
    EXPECT_FALSE(filter.passes(scored, fixed_now()));
}

TEST_F(Stage1FilterTest, EventsOutsideHorizonFail) {
    Stage1Filter filter(config);
    auto past = score_candidate(config, make_candidate("past", 1.20, -2), 0.90);
    auto far = score_candidate(config, make_candidate("far", 1.20, 24 * 8), 0.90);
    auto soon = score_candidate(config, make_candidate("soon", 1.20, 2), 0.90);

    EXPECT_FALSE(filter.passes(past, fixed_now()));
    EXPECT_FALSE(filter.passes(far, fixed_now()));
    EXPECT_TRUE(filter.passes(soon, fixed_now()));
}

TEST_F(Stage1FilterTest, ApplyKeepsSurvivorsInInputOrder) {
    Stage1Filter filter(config);
    std::vector<ScoredCandidate> pool = {
        make_scored(config, "a", 1.20, 0.90),
        make_scored(config, "b", 1.15, 0.80),
        make_scored(config, "c", 1.10, 0.97),
    };

    auto survivors = filter.apply(pool, fixed_now());
    ASSERT_EQ(survivors.size(), 2u);
    EXPECT_EQ(survivors[0].candidate.event_id, "a");
    EXPECT_EQ(survivors[1].candidate.event_id, "c");
    EXPECT_TRUE(filter.apply({}, fixed_now()).empty());
}

TEST_F(Stage1FilterTest, TighteningThresholdsNeverAddsSurvivors) {
    std::vector<ScoredCandidate> pool;
    int id = 0;
    for (double odds = 1.02; odds <= 1.30; odds += 0.02) {
        for (double p = 0.70; p <= 0.99; p += 0.01) {
            pool.push_back(make_scored(config, "evt" + std::to_string(id++), odds, p));
        }
    }

    auto count = [&](const Config& c) { return Stage1Filter(c).apply(pool, fixed_now()).size(); };
    const std::size_t baseline = count(config);
    ASSERT_GT(baseline, 0u);

    Config tighter_odds = config;
    tighter_odds.stage1_max_odds = 1.15;
    EXPECT_LE(count(tighter_odds), baseline);

    Config tighter_prob = config;
    tighter_prob.stage1_min_model_prob = 0.90;
    EXPECT_LE(count(tighter_prob), baseline);

    Config tighter_edge = config;
    tighter_edge.stage1_min_edge = 0.05;
    EXPECT_LE(count(tighter_edge), baseline);

    Config tighter_ev = config;
    tighter_ev.stage1_min_ev = 0.05;
    EXPECT_LE(count(tighter_ev), baseline);

    Config tighter_horizon = config;
    tighter_horizon.max_event_days_ahead = 1;
    EXPECT_LE(count(tighter_horizon), baseline);
}

}  // namespace
