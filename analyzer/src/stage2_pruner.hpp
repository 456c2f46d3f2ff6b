#pragma once

#include "types.hpp"
#include "config.hpp"
#include "scoring.hpp"
#include <vector>

// Composite scoring, ranking and truncation of Stage 1 survivors
class Stage2Pruner {
public:
    explicit Stage2Pruner(const Config& config);

    // Ranked legs, at most min(limit, max_recommended_legs); empty input -> empty output
    std::vector<RecommendedLeg> apply(const std::vector<ScoredCandidate>& survivors, std::size_t limit) const;
    std::vector<RecommendedLeg> apply(const std::vector<ScoredCandidate>& survivors) const;

    // Ranking order: adjusted composite desc, model probability desc,
    // odds desc, earlier start first
    static bool ranks_before(const ScoredCandidate& a, const ScoredCandidate& b);

private:
    const Config& config_;
    LegScorer scorer_;
};
