#include "scoring.hpp"
#include "features.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

LegScorer::LegScorer(const Config& config) : config_(config), rivalries_(config) {}

double LegScorer::consistency_score(const BetCandidate& candidate) const {
    std::size_t window = std::min(candidate.recent_samples.size(),
                                  static_cast<std::size_t>(config_.consistency_window));
    if (window < 2) {
        auto supplied = numeric_feature(candidate.context_features, "consistency");
        if (supplied && std::isfinite(*supplied)) {
            return std::min(1.0, std::max(0.0, *supplied));
        }
        spdlog::debug("Data quality: {} has no recent sample window, consistency {:.2f}",
                      candidate.selection, config_.consistency_fallback);
        return config_.consistency_fallback;
    }

    double sum = 0.0;
    for (std::size_t i = 0; i < window; ++i) {
        sum += candidate.recent_samples[i];
    }
    double mean = sum / static_cast<double>(window);

    double squared = 0.0;
    for (std::size_t i = 0; i < window; ++i) {
        double d = candidate.recent_samples[i] - mean;
        squared += d * d;
    }
    double stddev = std::sqrt(squared / static_cast<double>(window));

    if (stddev == 0.0) {
        return 1.0;
    }
    if (std::abs(mean) < 1e-9) {
        return 0.0;
    }

    double cv = stddev / std::abs(mean);
    return 1.0 / (1.0 + cv);
}

double LegScorer::base_composite(const ScoredCandidate& scored) const {
    return scored.model_probability * config_.weight_probability +
           scored.expected_value * config_.scale_expected_value * config_.weight_expected_value +
           scored.edge * config_.scale_edge * config_.weight_edge +
           scored.consistency_score * config_.scale_consistency * config_.weight_consistency;
}

double LegScorer::adjustment(const ScoredCandidate& scored) const {
    double total = 0.0;

    if (scored.rivalry_flag) {
        total -= config_.rivalry_penalty;
    }

    const auto& features = scored.candidate.context_features;
    auto win_streak = numeric_feature(features, "win_streak");
    if (win_streak && *win_streak >= config_.streak_bonus_min_wins) {
        total += config_.streak_bonus;
    }
    auto opponent_streak = numeric_feature(features, "opponent_streak");
    if (opponent_streak && *opponent_streak <= config_.opponent_streak_max) {
        total += config_.streak_bonus;
    }

    return total;
}

void LegScorer::score(ScoredCandidate& scored) const {
    auto rivalry = rivalries_.find(scored.candidate);
    scored.rivalry_flag = rivalry.has_value();
    scored.rivalry_name = rivalry ? rivalry->name : std::string();
    scored.consistency_score = consistency_score(scored.candidate);
    scored.adjustment = adjustment(scored);
    scored.composite_score = base_composite(scored) + scored.adjustment;
}
