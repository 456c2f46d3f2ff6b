#include "estimator.hpp"
#include "errors.hpp"
#include "features.hpp"
#include "tree_ensemble.hpp"
#include "value_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

HeuristicEstimator::HeuristicEstimator(const Config& config) : config_(config) {}

double HeuristicEstimator::estimate(const BetCandidate& candidate) const {
    try {
        return estimate_or_throw(candidate);
    } catch (const DataQualityError& e) {
        spdlog::warn("Data quality: {} [{}] using fallback probability {:.2f}: {}",
                     candidate.selection, candidate.event_id, config_.fallback_probability, e.what());
        return config_.fallback_probability;
    }
}

double HeuristicEstimator::estimate_or_throw(const BetCandidate& candidate) const {
    if (!std::isfinite(candidate.decimal_odds) || candidate.decimal_odds <= 1.0) {
        throw DataQualityError("decimal odds unusable for implied probability");
    }

    const auto row = model_feature_row(candidate);
    const double implied = implied_probability(candidate.decimal_odds);
    const bool is_favorite = row[2].value_or(implied > 0.5 ? 1.0 : 0.0) >= 0.5;

    auto read_rate = [&](std::size_t index, const char* name) {
        if (!row[index]) {
            double imputed = is_favorite ? 0.55 : 0.45;
            spdlog::debug("Data quality: {} missing {}, imputed {:.2f}", candidate.selection, name, imputed);
            return imputed;
        }
        double value = *row[index];
        if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
            throw DataQualityError(fmt::format("{} out of range: {}", name, value));
        }
        return value;
    };

    const double win_rate = read_rate(0, "win_rate");
    const double recent_form = read_rate(1, "recent_form");
    const bool is_home = row[3].value_or(0.0) >= 0.5;

    double adjustment = 0.02;
    if (implied >= 0.85) {
        if (win_rate >= 0.65) {
            adjustment = 0.05;
        } else if (win_rate >= 0.55) {
            adjustment = 0.03;
        } else {
            adjustment = 0.01;
        }
    } else if (implied >= 0.75) {
        adjustment = win_rate >= 0.60 ? 0.04 : 0.02;
    } else if (implied >= 0.60) {
        adjustment = 0.03;
    }

    if (is_home) {
        adjustment += 0.02;
    }
    if (recent_form > 0.6) {
        adjustment += 0.02;
    }

    return std::min(0.98, std::max(0.02, implied + adjustment));
}

EstimatorHandle load_estimator(const Config& config) {
    if (config.model_path.empty()) {
        spdlog::info("No model artifact configured, using heuristic estimator");
        return std::make_shared<HeuristicEstimator>(config);
    }

    auto model = TreeEnsembleEstimator::load(config, config.model_path);
    spdlog::info("Loaded tree ensemble from {} ({} trees)", config.model_path, model->tree_count());
    return model;
}
