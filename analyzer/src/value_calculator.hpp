#pragma once

#include "types.hpp"
#include "config.hpp"

// Market-implied win probability, 1 / odds
double implied_probability(double decimal_odds);

// Expected profit per unit stake, p * odds - 1
double expected_value(double model_probability, double decimal_odds);

// Model probability minus implied probability
double edge(double model_probability, double decimal_odds);

// 1..5 star rating from expected value
int value_rating(double expected_value);

ConfidenceTier confidence_tier(const Config& config, double model_probability, double edge);

// Attach every value metric derived from one (probability, odds) pair
ScoredCandidate score_candidate(const Config& config, const BetCandidate& candidate, double model_probability);
