#include "pipeline.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "value_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <tuple>

Pipeline::Pipeline(const Config& config,
                   EstimatorHandle estimator,
                   const CandidatePool& pool,
                   std::shared_ptr<const FeatureProvider> features,
                   Clock clock)
    : config_(config),
      estimator_(std::move(estimator)),
      pool_(pool),
      features_(std::move(features)),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })),
      validator_(config),
      stage1_(config),
      stage2_(config),
      builder_(config) {
    if (!estimator_) {
        throw std::invalid_argument("Pipeline requires an estimator");
    }
}

std::vector<ScoredCandidate> Pipeline::score_snapshot(const std::vector<BetCandidate>& candidates,
                                                      const CandidateFilter& filter,
                                                      std::chrono::system_clock::time_point now,
                                                      std::size_t& considered,
                                                      std::size_t& rejected) const {
    std::vector<ScoredCandidate> scored;
    scored.reserve(candidates.size());

    for (const auto& candidate : candidates) {
        if (filter && !filter(candidate)) {
            continue;
        }
        ++considered;

        try {
            validator_.validate(candidate);
        } catch (const InvalidInputError& e) {
            ++rejected;
            spdlog::warn("Dropping candidate {} / {}: {}", candidate.event_id, candidate.selection, e.what());
            continue;
        }

        if (!validator_.is_within_horizon(candidate.event_start_time, now)) {
            ++rejected;
            spdlog::warn("Dropping candidate {} / {}: event start {} outside the {}-day horizon",
                         candidate.event_id, candidate.selection,
                         util::to_iso8601(candidate.event_start_time), config_.max_event_days_ahead);
            continue;
        }

        if (features_) {
            BetCandidate enriched = with_features(candidate, *features_);
            double probability = estimator_->estimate(enriched);
            scored.push_back(score_candidate(config_, enriched, probability));
        } else {
            double probability = estimator_->estimate(candidate);
            scored.push_back(score_candidate(config_, candidate, probability));
        }
    }

    return scored;
}

Pipeline::RunResult Pipeline::run(std::size_t limit, const CandidateFilter& filter, bool publish_stats) {
    CandidateSnapshot snapshot = pool_.snapshot();
    auto now = clock_();

    RunResult result;
    auto scored = score_snapshot(*snapshot, filter, now, result.stats.candidates_in, result.stats.rejected_invalid);
    auto survivors = stage1_.apply(scored, now);
    result.legs = stage2_.apply(survivors, limit);

    result.stats.survivors_stage1 = survivors.size();
    result.stats.final_legs_count = result.legs.size();
    result.stats.last_run = now;

    if (!publish_stats) {
        spdlog::debug("Filtered run: {} candidates, {} passed stage 1, {} legs",
                      result.stats.candidates_in, result.stats.survivors_stage1, result.stats.final_legs_count);
        return result;
    }

    spdlog::info("Pipeline run: {} candidates, {} rejected, {} passed stage 1, {} legs",
                 result.stats.candidates_in, result.stats.rejected_invalid,
                 result.stats.survivors_stage1, result.stats.final_legs_count);

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        last_stats_ = result.stats;
    }
    return result;
}

std::vector<RecommendedLeg> Pipeline::get_recommended_legs(std::size_t limit) {
    // Ranked at the configured cap; limit only trims the reply
    auto legs = run(static_cast<std::size_t>(config_.max_recommended_legs), nullptr, true).legs;
    if (legs.size() > limit) {
        legs.erase(legs.begin() + static_cast<std::ptrdiff_t>(limit), legs.end());
    }
    return legs;
}

std::vector<ScoredCandidate> Pipeline::get_value_bets(std::optional<Sport> sport, std::size_t limit, bool after_stage1) {
    CandidateSnapshot snapshot = pool_.snapshot();
    auto now = clock_();

    CandidateFilter filter;
    if (sport) {
        Sport wanted = *sport;
        filter = [wanted](const BetCandidate& c) { return c.sport == wanted; };
    }

    std::size_t considered = 0;
    std::size_t rejected = 0;
    auto scored = score_snapshot(*snapshot, filter, now, considered, rejected);
    if (after_stage1) {
        scored = stage1_.apply(scored, now);
    }

    std::vector<ScoredCandidate> value_bets;
    for (auto& candidate : scored) {
        if (candidate.expected_value >= config_.min_ev_threshold) {
            value_bets.push_back(std::move(candidate));
        }
    }

    std::stable_sort(value_bets.begin(), value_bets.end(), [](const ScoredCandidate& a, const ScoredCandidate& b) {
        return a.expected_value > b.expected_value;
    });

    // Same bet quoted by several bookmakers: keep the best-EV quote
    using Key = std::tuple<std::string, std::string, MarketType, std::optional<double>>;
    std::set<Key> seen;
    std::vector<ScoredCandidate> unique;
    for (auto& candidate : value_bets) {
        if (unique.size() >= limit) {
            break;
        }
        const auto& c = candidate.candidate;
        if (!seen.insert(Key{c.event_id, c.selection, c.market_type, c.line}).second) {
            continue;
        }
        unique.push_back(std::move(candidate));
    }

    spdlog::debug("Value bets: {} considered, {} rejected, {} returned", considered, rejected, unique.size());
    return unique;
}

std::optional<Parlay> Pipeline::build_parlay(double target_odds, int max_legs,
                                             std::optional<Sport> sport,
                                             std::optional<MarketType> market) {
    if (!std::isfinite(target_odds) || target_odds <= 1.0) {
        throw std::invalid_argument("target_odds must be greater than 1.0");
    }
    if (max_legs < 1) {
        throw std::invalid_argument("max_legs must be at least 1");
    }

    CandidateFilter filter;
    if (sport || market) {
        filter = [sport, market](const BetCandidate& c) {
            return (!sport || c.sport == *sport) && (!market || c.market_type == *market);
        };
    }

    auto legs = run(static_cast<std::size_t>(config_.max_recommended_legs), filter, !filter).legs;
    return builder_.build(legs, target_odds, max_legs);
}

PipelineStats Pipeline::get_pipeline_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return last_stats_;
}

PipelineSummary Pipeline::get_summary() {
    auto result = run(static_cast<std::size_t>(config_.max_recommended_legs), nullptr, true);

    PipelineSummary summary;
    summary.candidates_analyzed = result.stats.candidates_in;
    summary.recommended_legs_count = result.legs.size();

    if (result.legs.empty()) {
        summary.sample_four_leg_odds = 0.0;
        return summary;
    }

    double odds_sum = 0.0;
    double probability_sum = 0.0;
    double ev_sum = 0.0;
    double composite_sum = 0.0;
    for (const auto& leg : result.legs) {
        const auto& scored = leg.scored;
        summary.sports_breakdown[to_string(scored.candidate.sport)]++;
        odds_sum += scored.candidate.decimal_odds;
        probability_sum += scored.model_probability;
        ev_sum += scored.expected_value;
        composite_sum += scored.composite_score.value_or(0.0);
        if (scored.rivalry_flag) {
            ++summary.rivalry_legs_included;
        }
    }

    double count = static_cast<double>(result.legs.size());
    summary.average_odds = odds_sum / count;
    summary.average_model_probability = probability_sum / count;
    summary.average_expected_value = ev_sum / count;
    summary.average_composite_score = composite_sum / count;

    summary.sample_four_leg_odds = 1.0;
    for (std::size_t i = 0; i < result.legs.size() && i < 4; ++i) {
        summary.sample_four_leg_odds *= result.legs[i].scored.candidate.decimal_odds;
    }

    summary.legs = std::move(result.legs);
    return summary;
}
