#include <gtest/gtest.h>

#include "command_handler.hpp"
#include "test_helpers.hpp"

#include <memory>
#include <string>
#include <vector>

namespace {

using json = nlohmann::json;
using test_helpers::FixedEstimator;
using test_helpers::fixed_now;
using test_helpers::make_candidate;

CommandRequest request(const std::string& cmd, json args = json::object()) {
    CommandRequest req;
    req.cmd = cmd;
    req.corr_id = "corr-" + cmd;
    req.args = std::move(args);
    return req;
}

class CommandHandlerTest : public ::testing::Test {
protected:
    CommandHandlerTest()
        : pipeline(config, std::make_shared<FixedEstimator>(0.92), pool, nullptr, [] { return fixed_now(); }) {
        std::vector<BetCandidate> candidates;
        for (int i = 0; i < 6; ++i) {
            candidates.push_back(make_candidate("evt" + std::to_string(i), 1.20));
        }
        pool.replace(candidates, fixed_now());
    }

    Config config;
    CandidatePool pool;
    Pipeline pipeline;
};

TEST_F(CommandHandlerTest, RecommendedLegs) {
    CommandHandler handler(config, pipeline);
    auto reply = handler.handle(request("recommended_legs", {{"limit", 3}}));

    EXPECT_TRUE(reply.ok);
    EXPECT_EQ(reply.corr_id, "corr-recommended_legs");
    EXPECT_EQ(reply.data["count"], 3);
    ASSERT_EQ(reply.data["legs"].size(), 3u);
    EXPECT_EQ(reply.data["legs"][0]["rank"], 1);
    EXPECT_FALSE(reply.data["legs"][0]["rationale"].get<std::string>().empty());
    EXPECT_FALSE(reply.ts.empty());
}

TEST_F(CommandHandlerTest, BuildParlayWithStake) {
    CommandHandler handler(config, pipeline);
    auto reply = handler.handle(request("build_parlay", {{"target_odds", 2.0}, {"max_legs", 4}, {"stake", 20.0}}));

    ASSERT_TRUE(reply.ok);
    const auto& parlay = reply.data["parlay"];
    ASSERT_TRUE(parlay.is_object());
    EXPECT_EQ(parlay["leg_count"], 4);
    EXPECT_NEAR(parlay["potential_return"].get<double>(), 20.0 * 1.2 * 1.2 * 1.2 * 1.2, 1e-9);
}

TEST_F(CommandHandlerTest, InfeasibleParlayIsStillOk) {
    CommandHandler handler(config, pipeline);
    auto reply = handler.handle(request("build_parlay", {{"target_odds", 50.0}, {"max_legs", 2}}));

    EXPECT_TRUE(reply.ok);
    EXPECT_TRUE(reply.data["parlay"].is_null());
}

TEST_F(CommandHandlerTest, BadArgumentsBecomeErrorReplies) {
    CommandHandler handler(config, pipeline);

    auto bad_target = handler.handle(request("build_parlay", {{"target_odds", 1.0}}));
    EXPECT_FALSE(bad_target.ok);
    EXPECT_NE(bad_target.message.find("target_odds"), std::string::npos);

    auto bad_sport = handler.handle(request("value_bets", {{"sport", "curling"}}));
    EXPECT_FALSE(bad_sport.ok);

    auto bad_type = handler.handle(request("recommended_legs", {{"limit", "lots"}}));
    EXPECT_FALSE(bad_type.ok);

    auto unknown = handler.handle(request("launch"));
    EXPECT_FALSE(unknown.ok);
    EXPECT_EQ(unknown.corr_id, "corr-launch");
}

TEST_F(CommandHandlerTest, ValueBetsAndStats) {
    CommandHandler handler(config, pipeline);

    auto bets = handler.handle(request("value_bets", {{"sport", "basketball"}, {"limit", 2}}));
    ASSERT_TRUE(bets.ok);
    EXPECT_EQ(bets.data["count"], 2);

    handler.handle(request("recommended_legs"));
    auto stats = handler.handle(request("pipeline_stats"));
    ASSERT_TRUE(stats.ok);
    EXPECT_EQ(stats.data["candidates_in"], 6);
    EXPECT_EQ(stats.data["final_legs_count"], 6);

    auto summary = handler.handle(request("summary"));
    ASSERT_TRUE(summary.ok);
    EXPECT_EQ(summary.data["recommended_legs_count"], 6);
}

TEST_F(CommandHandlerTest, Refresh) {
    CommandHandler without(config, pipeline);
    EXPECT_FALSE(without.handle(request("refresh")).ok);

    int calls = 0;
    CommandHandler with(config, pipeline, [&calls]() -> std::size_t {
        ++calls;
        return 42;
    });
    auto reply = with.handle(request("refresh"));
    EXPECT_TRUE(reply.ok);
    EXPECT_EQ(reply.data["candidates"], 42);
    EXPECT_EQ(calls, 1);
}

TEST(CommandRequestTest, FromJsonRequiresCmdAndCorrId) {
    auto ok = CommandRequest::from_json(json{{"cmd", "summary"}, {"corr_id", "c1"}});
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok->cmd, "summary");
    EXPECT_TRUE(ok->args.is_object());

    EXPECT_FALSE(CommandRequest::from_json(json{{"cmd", "summary"}}));
    EXPECT_FALSE(CommandRequest::from_json(json{{"cmd", 7}, {"corr_id", "c1"}}));
    EXPECT_FALSE(CommandRequest::from_json(json::array()));
}

}  // namespace
