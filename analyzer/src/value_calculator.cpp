#include "value_calculator.hpp"

double implied_probability(double decimal_odds) {
    return 1.0 / decimal_odds;
}

double expected_value(double model_probability, double decimal_odds) {
    return model_probability * decimal_odds - 1.0;
}

double edge(double model_probability, double decimal_odds) {
    return model_probability - implied_probability(decimal_odds);
}

int value_rating(double expected_value) {
    if (expected_value >= 0.10) {
        return 5;
    } else if (expected_value >= 0.06) {
        return 4;
    } else if (expected_value >= 0.04) {
        return 3;
    } else if (expected_value >= 0.02) {
        return 2;
    }
    return 1;
}

ConfidenceTier confidence_tier(const Config& config, double model_probability, double edge) {
    if (model_probability >= config.tier_high_min_prob && edge >= config.tier_high_min_edge) {
        return ConfidenceTier::High;
    } else if (model_probability >= config.tier_medium_min_prob && edge >= config.tier_medium_min_edge) {
        return ConfidenceTier::Medium;
    }
    return ConfidenceTier::Low;
}

ScoredCandidate score_candidate(const Config& config, const BetCandidate& candidate, double model_probability) {
    ScoredCandidate scored;
    scored.candidate = candidate;
    scored.model_probability = model_probability;
    scored.implied_probability = implied_probability(candidate.decimal_odds);
    scored.edge = edge(model_probability, candidate.decimal_odds);
    scored.expected_value = expected_value(model_probability, candidate.decimal_odds);
    scored.value_rating = value_rating(scored.expected_value);
    scored.confidence_tier = confidence_tier(config, scored.model_probability, scored.edge);
    return scored;
}
