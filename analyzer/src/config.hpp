#pragma once

#include "types.hpp"
#include <string>
#include <vector>

struct RivalryEntry {
    Sport sport = Sport::Basketball;
    std::string team_a;
    std::string team_b;
    std::string name;
};

struct Config {
    // Service configuration
    std::string service_name = "legscout_analyzer";
    std::string log_level = "info";

    // Redis configuration
    std::string redis_url = "tcp://127.0.0.1:6379";
    std::string stream_req = "legscout.cmd.requests";
    std::string stream_rep = "legscout.cmd.replies";
    std::string consumer_group = "analyzer_group";

    // Health endpoint
    std::string health_host = "0.0.0.0";
    int health_port = 8090;

    // Inputs
    std::string snapshot_path = "cached_odds_data.json";
    std::string model_path;  // empty -> heuristic estimator
    int snapshot_reload_seconds = 300;

    // Event window
    int max_event_days_ahead = 7;

    // Stage 1 thresholds (closed bounds)
    double stage1_min_odds = 1.05;
    double stage1_max_odds = 1.25;
    double stage1_min_model_prob = 0.75;
    double stage1_min_edge = 0.02;
    double stage1_min_ev = -0.05;

    // Composite score weights (must sum to 1.0) and term scales
    double weight_probability = 0.4;
    double weight_expected_value = 0.3;
    double weight_edge = 0.2;
    double weight_consistency = 0.1;
    double scale_expected_value = 20.0;
    double scale_edge = 10.0;
    double scale_consistency = 100.0;

    // Stage 2 penalties and bonuses
    double rivalry_penalty = 0.056;
    double streak_bonus = 0.02;
    int streak_bonus_min_wins = 3;
    int opponent_streak_max = -2;
    int consistency_window = 10;
    double consistency_fallback = 0.5;
    int max_recommended_legs = 20;
    std::vector<RivalryEntry> rivalries;

    // Confidence tiers
    double tier_high_min_prob = 0.85;
    double tier_high_min_edge = 0.05;
    double tier_medium_min_prob = 0.75;
    double tier_medium_min_edge = 0.02;

    // Value bets
    double min_ev_threshold = 0.02;

    // Estimator
    double fallback_probability = 0.5;

    // Parlay builder
    double default_target_odds = 2.0;
    int default_max_legs = 4;
    int parlay_min_legs = 2;
    double parlay_tolerance = 0.10;
    double parlay_min_fraction = 0.90;
    int parlay_top_k = 10;
    int parlay_backtrack_budget = 10000;

    // Load from a JSON file; missing keys keep their defaults
    void load(const std::string& path);

    // Environment overrides for service endpoints and paths
    void load_from_env();

    void validate() const;
};
