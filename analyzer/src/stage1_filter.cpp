#include "stage1_filter.hpp"
#include <spdlog/spdlog.h>

Stage1Filter::Stage1Filter(const Config& config) : config_(config), validator_(config) {}

bool Stage1Filter::passes(const ScoredCandidate& scored, std::chrono::system_clock::time_point now) const {
    const auto& candidate = scored.candidate;

    // Upstream drops past and far-future events; re-checked here
    if (!validator_.is_within_horizon(candidate.event_start_time, now)) {
        return false;
    }

    if (candidate.decimal_odds < config_.stage1_min_odds || candidate.decimal_odds > config_.stage1_max_odds) {
        return false;
    }

    if (scored.model_probability < config_.stage1_min_model_prob) {
        return false;
    }

    if (scored.edge < config_.stage1_min_edge) {
        return false;
    }

    if (scored.expected_value < config_.stage1_min_ev) {
        return false;
    }

    return true;
}

std::vector<ScoredCandidate> Stage1Filter::apply(const std::vector<ScoredCandidate>& pool,
                                                 std::chrono::system_clock::time_point now) const {
    std::vector<ScoredCandidate> survivors;
    for (const auto& scored : pool) {
        if (passes(scored, now)) {
            survivors.push_back(scored);
        }
    }

    spdlog::debug("Stage 1 filter: {} candidates -> {} survivors", pool.size(), survivors.size());
    return survivors;
}
