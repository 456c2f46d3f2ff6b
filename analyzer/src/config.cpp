#include "config.hpp"
#include "errors.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {
    std::string get_env(const char* name, const std::string& default_value) {
        const char* value = std::getenv(name);
        return value ? value : default_value;
    }

    int get_env_int(const char* name, int default_value) {
        const char* value = std::getenv(name);
        if (value) {
            try {
                return std::stoi(value);
            } catch (const std::exception&) {
                spdlog::warn("Invalid integer value for {}: {}", name, value);
            }
        }
        return default_value;
    }

    template <typename T>
    void read(const json& j, const char* key, T& field) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            field = it->get<T>();
        }
    }
}

void Config::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError(fmt::format("Cannot open config file {}", path));
    }

    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw ConfigError(fmt::format("Malformed config file {}: {}", path, e.what()));
    }

    try {
        read(j, "service_name", service_name);
        read(j, "log_level", log_level);

        read(j, "redis_url", redis_url);
        read(j, "stream_req", stream_req);
        read(j, "stream_rep", stream_rep);
        read(j, "consumer_group", consumer_group);

        read(j, "health_host", health_host);
        read(j, "health_port", health_port);

        read(j, "snapshot_path", snapshot_path);
        read(j, "model_path", model_path);
        read(j, "snapshot_reload_seconds", snapshot_reload_seconds);

        read(j, "max_event_days_ahead", max_event_days_ahead);

        read(j, "stage1_min_odds", stage1_min_odds);
        read(j, "stage1_max_odds", stage1_max_odds);
        read(j, "stage1_min_model_prob", stage1_min_model_prob);
        read(j, "stage1_min_edge", stage1_min_edge);
        read(j, "stage1_min_ev", stage1_min_ev);

        read(j, "weight_probability", weight_probability);
        read(j, "weight_expected_value", weight_expected_value);
        read(j, "weight_edge", weight_edge);
        read(j, "weight_consistency", weight_consistency);
        read(j, "scale_expected_value", scale_expected_value);
        read(j, "scale_edge", scale_edge);
        read(j, "scale_consistency", scale_consistency);

        read(j, "rivalry_penalty", rivalry_penalty);
        read(j, "streak_bonus", streak_bonus);
        read(j, "streak_bonus_min_wins", streak_bonus_min_wins);
        read(j, "opponent_streak_max", opponent_streak_max);
        read(j, "consistency_window", consistency_window);
        read(j, "consistency_fallback", consistency_fallback);
        read(j, "max_recommended_legs", max_recommended_legs);

        read(j, "tier_high_min_prob", tier_high_min_prob);
        read(j, "tier_high_min_edge", tier_high_min_edge);
        read(j, "tier_medium_min_prob", tier_medium_min_prob);
        read(j, "tier_medium_min_edge", tier_medium_min_edge);

        read(j, "min_ev_threshold", min_ev_threshold);
        read(j, "fallback_probability", fallback_probability);

        read(j, "default_target_odds", default_target_odds);
        read(j, "default_max_legs", default_max_legs);
        read(j, "parlay_min_legs", parlay_min_legs);
        read(j, "parlay_tolerance", parlay_tolerance);
        read(j, "parlay_min_fraction", parlay_min_fraction);
        read(j, "parlay_top_k", parlay_top_k);
        read(j, "parlay_backtrack_budget", parlay_backtrack_budget);

        if (j.contains("rivalries")) {
            for (const auto& entry : j.at("rivalries")) {
                auto sport = sport_from_string(entry.at("sport").get<std::string>());
                if (!sport) {
                    spdlog::warn("Ignoring rivalry with unknown sport: {}", entry.dump());
                    continue;
                }
                RivalryEntry rivalry;
                rivalry.sport = *sport;
                rivalry.team_a = entry.at("team_a").get<std::string>();
                rivalry.team_b = entry.at("team_b").get<std::string>();
                rivalry.name = entry.value("name", rivalry.team_a + " v " + rivalry.team_b);
                rivalries.push_back(rivalry);
            }
        }
    } catch (const json::exception& e) {
        throw ConfigError(fmt::format("Invalid value in config file {}: {}", path, e.what()));
    }
}

void Config::load_from_env() {
    service_name = get_env("SERVICE_NAME", service_name);
    log_level = get_env("LOG_LEVEL", log_level);

    redis_url = get_env("REDIS_URL", redis_url);
    stream_req = get_env("STREAM_REQ", stream_req);
    stream_rep = get_env("STREAM_REP", stream_rep);

    health_host = get_env("HEALTH_HOST", health_host);
    health_port = get_env_int("HEALTH_PORT", health_port);

    snapshot_path = get_env("SNAPSHOT_PATH", snapshot_path);
    model_path = get_env("MODEL_PATH", model_path);
    snapshot_reload_seconds = get_env_int("SNAPSHOT_RELOAD_SECONDS", snapshot_reload_seconds);
}

void Config::validate() const {
    double weight_sum = weight_probability + weight_expected_value + weight_edge + weight_consistency;
    if (std::abs(weight_sum - 1.0) > 1e-9) {
        throw ConfigError(fmt::format("Composite weights must sum to 1.0 (got {:.4f})", weight_sum));
    }

    if (stage1_min_odds <= 1.0 || stage1_max_odds < stage1_min_odds) {
        throw ConfigError("Stage 1 odds band must satisfy 1.0 < min <= max");
    }

    if (stage1_min_model_prob < 0.0 || stage1_min_model_prob > 1.0) {
        throw ConfigError("stage1_min_model_prob must be within [0, 1]");
    }

    if (max_event_days_ahead < 1) {
        throw ConfigError("max_event_days_ahead must be at least 1");
    }

    if (max_recommended_legs < 1 || max_recommended_legs > 20) {
        throw ConfigError("max_recommended_legs must be between 1 and 20");
    }

    if (consistency_window < 2) {
        throw ConfigError("consistency_window must be at least 2");
    }

    if (rivalry_penalty < 0.0 || streak_bonus < 0.0) {
        throw ConfigError("rivalry_penalty and streak_bonus must be non-negative");
    }

    if (fallback_probability < 0.0 || fallback_probability > 1.0) {
        throw ConfigError("fallback_probability must be within [0, 1]");
    }

    if (parlay_min_fraction <= 0.0 || parlay_min_fraction > 1.0) {
        throw ConfigError("parlay_min_fraction must be within (0, 1]");
    }

    if (parlay_tolerance < 0.0) {
        throw ConfigError("parlay_tolerance must be non-negative");
    }

    if (parlay_top_k < 2 || parlay_top_k > 20) {
        throw ConfigError("parlay_top_k must be between 2 and 20");
    }

    if (parlay_min_legs < 1 || default_max_legs < 1) {
        throw ConfigError("Parlay leg counts must be at least 1");
    }

    if (parlay_backtrack_budget < 1) {
        throw ConfigError("parlay_backtrack_budget must be positive");
    }

    if (health_port <= 0 || health_port > 65535) {
        throw ConfigError("health_port must be between 1 and 65535");
    }

    spdlog::info("Configuration validated successfully");
}
