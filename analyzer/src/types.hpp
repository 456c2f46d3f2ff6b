#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class Sport {
    Basketball,
    AmericanFootball,
    MixedMartialArts,
    RugbyLeague
};

enum class MarketType {
    Moneyline,
    Spread,
    Totals,
    // Basketball props
    PlayerPointsOverUnder,
    PlayerReboundsOverUnder,
    PlayerAssistsOverUnder,
    PlayerThreesOverUnder,
    PlayerBlocksOverUnder,
    PlayerStealsOverUnder,
    PlayerPraOverUnder,
    PlayerDoubleDouble,
    AlternatePlayerPoints,
    AlternatePlayerRebounds,
    AlternatePlayerAssists,
    AlternatePlayerThrees,
    // American football props
    PlayerPassTdsOverUnder,
    PlayerPassYardsOverUnder,
    PlayerRushYardsOverUnder,
    PlayerReceivingYardsOverUnder,
    PlayerReceptionsOverUnder,
    PlayerPassCompletionsOverUnder,
    PlayerPassAttemptsOverUnder,
    PlayerRushAttemptsOverUnder,
    PlayerAnytimeTouchdown,
    PlayerFirstTouchdown,
    AlternatePlayerPassYards,
    AlternatePlayerRushYards,
    AlternatePlayerReceivingYards,
    // Combat sports
    MethodOfVictory,
    TotalRounds,
    // Rugby league
    AnytimeTryscorer
};

enum class ConfidenceTier {
    Low,
    Medium,
    High
};

std::string to_string(Sport sport);
std::string to_string(MarketType market);
std::string to_string(ConfidenceTier tier);

std::optional<Sport> sport_from_string(const std::string& value);
std::optional<MarketType> market_type_from_string(const std::string& value);

// True if the market is on the sport's allow-list
bool is_market_allowed(Sport sport, MarketType market);

// Numeric or categorical estimator input
using FeatureValue = std::variant<double, std::string>;
using FeatureMap = std::map<std::string, FeatureValue>;

struct BetCandidate {
    Sport sport = Sport::Basketball;
    MarketType market_type = MarketType::Moneyline;
    std::string event_id;
    std::chrono::system_clock::time_point event_start_time;
    std::string selection;
    std::string home_team;
    std::string away_team;
    std::string bookmaker;
    std::optional<double> line;
    double decimal_odds = 0.0;
    FeatureMap context_features;
    // Relevant statistic over recent games, most recent first
    std::vector<double> recent_samples;
};

struct ScoredCandidate {
    BetCandidate candidate;

    double model_probability = 0.0;
    double implied_probability = 0.0;
    double edge = 0.0;
    double expected_value = 0.0;
    int value_rating = 1;
    ConfidenceTier confidence_tier = ConfidenceTier::Low;

    // Stage 2 fields
    bool rivalry_flag = false;
    std::string rivalry_name;
    double consistency_score = 0.0;
    double adjustment = 0.0;
    std::optional<double> composite_score;
};

struct RecommendedLeg {
    ScoredCandidate scored;
    int rank = 0;
    std::string rationale;
};

struct Parlay {
    std::vector<RecommendedLeg> legs;
    double combined_odds = 1.0;
    double combined_probability = 0.0;
    double total_composite_score = 0.0;
    double target_odds = 0.0;

    std::size_t leg_count() const { return legs.size(); }
    double potential_return(double stake) const { return stake * combined_odds; }
};

struct PipelineStats {
    std::size_t candidates_in = 0;
    std::size_t rejected_invalid = 0;
    std::size_t survivors_stage1 = 0;
    std::size_t final_legs_count = 0;
    std::chrono::system_clock::time_point last_run;
};

struct PipelineSummary {
    std::size_t candidates_analyzed = 0;
    std::size_t recommended_legs_count = 0;
    std::map<std::string, std::size_t> sports_breakdown;
    double average_odds = 0.0;
    double average_model_probability = 0.0;
    double average_expected_value = 0.0;
    double average_composite_score = 0.0;
    double sample_four_leg_odds = 1.0;
    std::size_t rivalry_legs_included = 0;
    std::vector<RecommendedLeg> legs;
};

// Numeric feature lookup; categorical values are not numbers
std::optional<double> numeric_feature(const FeatureMap& features, const std::string& name);
