#pragma once

#include "types.hpp"
#include "config.hpp"
#include "candidate_pool.hpp"
#include "candidate_validator.hpp"
#include "estimator.hpp"
#include "features.hpp"
#include "parlay_builder.hpp"
#include "stage1_filter.hpp"
#include "stage2_pruner.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

// Stage 1 -> Stage 2 -> parlay builder over the current candidate snapshot.
// Each call reads one snapshot and never mutates it, so calls may overlap.
class Pipeline {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    Pipeline(const Config& config,
             EstimatorHandle estimator,
             const CandidatePool& pool,
             std::shared_ptr<const FeatureProvider> features = nullptr,
             Clock clock = nullptr);

    std::vector<RecommendedLeg> get_recommended_legs(std::size_t limit);

    // Candidates with EV >= min_ev_threshold, best EV first, one per
    // (event, selection, market, line)
    std::vector<ScoredCandidate> get_value_bets(std::optional<Sport> sport, std::size_t limit, bool after_stage1 = false);

    // Throws std::invalid_argument for target_odds <= 1.0 or max_legs < 1
    std::optional<Parlay> build_parlay(double target_odds, int max_legs,
                                       std::optional<Sport> sport = std::nullopt,
                                       std::optional<MarketType> market = std::nullopt);

    // Counts from the most recent unfiltered run
    PipelineStats get_pipeline_stats() const;

    PipelineSummary get_summary();

private:
    using CandidateFilter = std::function<bool(const BetCandidate&)>;

    struct RunResult {
        std::vector<RecommendedLeg> legs;
        PipelineStats stats;
    };

    // Validate, enrich and estimate every candidate; invalid or out-of-horizon
    // ones are counted and dropped
    std::vector<ScoredCandidate> score_snapshot(const std::vector<BetCandidate>& candidates,
                                                const CandidateFilter& filter,
                                                std::chrono::system_clock::time_point now,
                                                std::size_t& considered,
                                                std::size_t& rejected) const;

    // Only unfiltered runs publish last_stats_
    RunResult run(std::size_t limit, const CandidateFilter& filter, bool publish_stats);

    const Config& config_;
    EstimatorHandle estimator_;
    const CandidatePool& pool_;
    std::shared_ptr<const FeatureProvider> features_;
    Clock clock_;

    CandidateValidator validator_;
    Stage1Filter stage1_;
    Stage2Pruner stage2_;
    ParlayBuilder builder_;

    mutable std::mutex stats_mutex_;
    PipelineStats last_stats_;
};
