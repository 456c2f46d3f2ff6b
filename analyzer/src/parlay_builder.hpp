#pragma once

#include "types.hpp"
#include "config.hpp"
#include <optional>
#include <vector>

// Picks a subset of ranked legs whose combined odds approximate a target.
//
// Legs are walked in composite-score order, adding the next eligible leg while
// the running product stays under target * (1 + parlay_tolerance) and
// backtracking when a branch overshoots. The first combination that reaches the
// target wins. If none does, every combination of parlay_min_legs..max_legs legs
// among the top parlay_top_k is scored and the closest one at or above
// target * parlay_min_fraction is returned.
class ParlayBuilder {
public:
    explicit ParlayBuilder(const Config& config);

    // std::nullopt when no combination reaches the minimum fraction of the target.
    // Throws std::invalid_argument for target_odds <= 1.0 or max_legs < 1.
    std::optional<Parlay> build(const std::vector<RecommendedLeg>& legs, double target_odds, int max_legs) const;

private:
    struct Combination {
        std::vector<std::size_t> members;  // positions in score order
        double product = 1.0;
        double score = 0.0;
    };

    struct SearchContext {
        const std::vector<const RecommendedLeg*>& ordered;
        double target;
        double ceiling;
        double floor;
        std::size_t min_legs;
        std::size_t max_legs;
    };

    std::optional<Combination> greedy_search(const SearchContext& ctx) const;
    std::optional<Combination> exhaustive_search(const SearchContext& ctx) const;

    static bool conflicts(const SearchContext& ctx, const std::vector<std::size_t>& members, std::size_t candidate);
    static bool better(const Combination& a, const Combination& b, double target);

    Parlay assemble(const SearchContext& ctx, const Combination& combination) const;

    const Config& config_;
};
