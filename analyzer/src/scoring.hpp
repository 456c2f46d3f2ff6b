#pragma once

#include "types.hpp"
#include "config.hpp"
#include "rivalry.hpp"

class LegScorer {
public:
    explicit LegScorer(const Config& config);

    // Attach rivalry flag, consistency, adjustment and composite score
    void score(ScoredCandidate& scored) const;

    // Weighted blend before penalties and bonuses
    double base_composite(const ScoredCandidate& scored) const;

    // Rivalry penalty plus form bonuses; never folded into model_probability
    double adjustment(const ScoredCandidate& scored) const;

    // 1 / (1 + coefficient of variation) over the recent sample window
    double consistency_score(const BetCandidate& candidate) const;

private:
    const Config& config_;
    RivalryTable rivalries_;
};
