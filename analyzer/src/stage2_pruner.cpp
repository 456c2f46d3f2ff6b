#include "stage2_pruner.hpp"
#include "rationale.hpp"
#include <algorithm>
#include <set>
#include <spdlog/spdlog.h>
#include <utility>

Stage2Pruner::Stage2Pruner(const Config& config) : config_(config), scorer_(config) {}

bool Stage2Pruner::ranks_before(const ScoredCandidate& a, const ScoredCandidate& b) {
    double score_a = a.composite_score.value_or(0.0);
    double score_b = b.composite_score.value_or(0.0);
    if (score_a != score_b) {
        return score_a > score_b;
    }
    if (a.model_probability != b.model_probability) {
        return a.model_probability > b.model_probability;
    }
    if (a.candidate.decimal_odds != b.candidate.decimal_odds) {
        return a.candidate.decimal_odds > b.candidate.decimal_odds;
    }
    return a.candidate.event_start_time < b.candidate.event_start_time;
}

std::vector<RecommendedLeg> Stage2Pruner::apply(const std::vector<ScoredCandidate>& survivors) const {
    return apply(survivors, static_cast<std::size_t>(config_.max_recommended_legs));
}

std::vector<RecommendedLeg> Stage2Pruner::apply(const std::vector<ScoredCandidate>& survivors,
                                                std::size_t limit) const {
    std::vector<RecommendedLeg> legs;
    if (survivors.empty()) {
        return legs;
    }

    std::vector<ScoredCandidate> scored = survivors;
    for (auto& candidate : scored) {
        scorer_.score(candidate);
    }

    // Stable so fully tied candidates keep their input order
    std::stable_sort(scored.begin(), scored.end(), ranks_before);

    const std::size_t cap = std::min(limit, static_cast<std::size_t>(config_.max_recommended_legs));
    std::set<std::pair<std::string, std::string>> seen;

    for (auto& candidate : scored) {
        if (legs.size() >= cap) {
            break;
        }
        auto key = std::make_pair(candidate.candidate.event_id, candidate.candidate.selection);
        if (!seen.insert(key).second) {
            continue;
        }

        RecommendedLeg leg;
        leg.rank = static_cast<int>(legs.size()) + 1;
        leg.rationale = generate_rationale(candidate);
        leg.scored = std::move(candidate);
        legs.push_back(std::move(leg));
    }

    spdlog::debug("Stage 2 prune: {} survivors -> {} legs", survivors.size(), legs.size());
    return legs;
}
