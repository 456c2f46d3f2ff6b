#include "parlay_builder.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace {
    constexpr double kEpsilon = 1e-12;
}

ParlayBuilder::ParlayBuilder(const Config& config) : config_(config) {}

bool ParlayBuilder::conflicts(const SearchContext& ctx, const std::vector<std::size_t>& members, std::size_t candidate) {
    const auto& next = ctx.ordered[candidate]->scored.candidate;
    for (std::size_t index : members) {
        const auto& chosen = ctx.ordered[index]->scored.candidate;
        if (chosen.event_id == next.event_id || chosen.selection == next.selection) {
            return true;
        }
    }
    return false;
}

bool ParlayBuilder::better(const Combination& a, const Combination& b, double target) {
    // Meeting the target beats undershooting it
    bool a_meets = a.product + kEpsilon >= target;
    bool b_meets = b.product + kEpsilon >= target;
    if (a_meets != b_meets) {
        return a_meets;
    }

    double a_distance = std::abs(a.product - target);
    double b_distance = std::abs(b.product - target);
    if (std::abs(a_distance - b_distance) > kEpsilon) {
        return a_distance < b_distance;
    }

    if (a.members.size() != b.members.size()) {
        return a.members.size() < b.members.size();
    }

    if (std::abs(a.score - b.score) > kEpsilon) {
        return a.score > b.score;
    }

    return a.members < b.members;
}

std::optional<ParlayBuilder::Combination> ParlayBuilder::greedy_search(const SearchContext& ctx) const {
    Combination current;
    std::optional<Combination> found;
    int budget = config_.parlay_backtrack_budget;

    std::function<bool(std::size_t)> descend = [&](std::size_t start) -> bool {
        for (std::size_t i = start; i < ctx.ordered.size(); ++i) {
            if (budget <= 0) {
                return false;
            }
            if (conflicts(ctx, current.members, i)) {
                continue;
            }

            const auto& leg = ctx.ordered[i]->scored;
            double product = current.product * leg.candidate.decimal_odds;
            if (product > ctx.ceiling + kEpsilon) {
                continue;
            }

            --budget;
            current.members.push_back(i);
            double previous_product = current.product;
            double previous_score = current.score;
            current.product = product;
            current.score += leg.composite_score.value_or(0.0);

            if (current.members.size() >= ctx.min_legs && product + kEpsilon >= ctx.target) {
                found = current;
                return true;
            }
            if (current.members.size() < ctx.max_legs && descend(i + 1)) {
                return true;
            }

            current.members.pop_back();
            current.product = previous_product;
            current.score = previous_score;
        }
        return false;
    };

    descend(0);
    if (budget <= 0 && !found) {
        spdlog::debug("Parlay greedy search exhausted its backtracking budget");
    }
    return found;
}

std::optional<ParlayBuilder::Combination> ParlayBuilder::exhaustive_search(const SearchContext& ctx) const {
    const std::size_t k = std::min(ctx.ordered.size(), static_cast<std::size_t>(config_.parlay_top_k));
    const std::size_t max_size = std::min(ctx.max_legs, k);

    std::optional<Combination> best;
    Combination current;

    std::function<void(std::size_t)> enumerate = [&](std::size_t start) {
        if (current.members.size() >= ctx.min_legs &&
            current.product + kEpsilon >= ctx.floor &&
            current.product <= ctx.ceiling + kEpsilon) {
            if (!best || better(current, *best, ctx.target)) {
                best = current;
            }
        }
        if (current.members.size() >= max_size) {
            return;
        }

        for (std::size_t i = start; i < k; ++i) {
            if (conflicts(ctx, current.members, i)) {
                continue;
            }
            const auto& leg = ctx.ordered[i]->scored;
            double product = current.product * leg.candidate.decimal_odds;
            // Odds exceed 1.0, so adding legs only raises the product
            if (product > ctx.ceiling + kEpsilon) {
                continue;
            }

            double previous_product = current.product;
            double previous_score = current.score;
            current.members.push_back(i);
            current.product = product;
            current.score += leg.composite_score.value_or(0.0);

            enumerate(i + 1);

            current.members.pop_back();
            current.product = previous_product;
            current.score = previous_score;
        }
    };

    enumerate(0);
    return best;
}

Parlay ParlayBuilder::assemble(const SearchContext& ctx, const Combination& combination) const {
    Parlay parlay;
    parlay.target_odds = ctx.target;
    parlay.combined_probability = 1.0;
    for (std::size_t index : combination.members) {
        const auto& leg = *ctx.ordered[index];
        parlay.legs.push_back(leg);
        parlay.combined_odds *= leg.scored.candidate.decimal_odds;
        parlay.combined_probability *= leg.scored.model_probability;
        parlay.total_composite_score += leg.scored.composite_score.value_or(0.0);
    }
    return parlay;
}

std::optional<Parlay> ParlayBuilder::build(const std::vector<RecommendedLeg>& legs, double target_odds, int max_legs) const {
    if (!std::isfinite(target_odds) || target_odds <= 1.0) {
        throw std::invalid_argument("target_odds must be greater than 1.0");
    }
    if (max_legs < 1) {
        throw std::invalid_argument("max_legs must be at least 1");
    }

    if (legs.empty()) {
        return std::nullopt;
    }

    std::vector<const RecommendedLeg*> ordered;
    ordered.reserve(legs.size());
    for (const auto& leg : legs) {
        ordered.push_back(&leg);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const RecommendedLeg* a, const RecommendedLeg* b) {
        return a->scored.composite_score.value_or(0.0) > b->scored.composite_score.value_or(0.0);
    });

    SearchContext ctx{
        ordered,
        target_odds,
        target_odds * (1.0 + config_.parlay_tolerance),
        target_odds * config_.parlay_min_fraction,
        std::min(static_cast<std::size_t>(config_.parlay_min_legs), static_cast<std::size_t>(max_legs)),
        static_cast<std::size_t>(max_legs),
    };

    auto combination = greedy_search(ctx);
    if (!combination) {
        spdlog::debug("Greedy parlay search missed target {:.2f}, searching top {} legs", target_odds, config_.parlay_top_k);
        combination = exhaustive_search(ctx);
    }

    if (!combination) {
        spdlog::info("No parlay within {} legs reaches {:.0f}% of target odds {:.2f}",
                     max_legs, config_.parlay_min_fraction * 100.0, target_odds);
        return std::nullopt;
    }

    return assemble(ctx, *combination);
}
