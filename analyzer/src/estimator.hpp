#pragma once

#include "types.hpp"
#include "config.hpp"
#include <memory>

// Calibrated win probability for one candidate. Implementations are
// read-only after construction and safe to call from several threads.
class ProbabilityEstimator {
public:
    virtual ~ProbabilityEstimator() = default;

    // Always in [0, 1]; never throws for bad features
    virtual double estimate(const BetCandidate& candidate) const = 0;

    virtual std::string name() const = 0;
};

// Process-wide handle; loaded once at startup and shared with every pipeline run
using EstimatorHandle = std::shared_ptr<const ProbabilityEstimator>;

// Implied probability nudged by form, home side and recent results.
// Used when no trained model artifact is configured.
class HeuristicEstimator : public ProbabilityEstimator {
public:
    explicit HeuristicEstimator(const Config& config);

    double estimate(const BetCandidate& candidate) const override;
    std::string name() const override { return "heuristic"; }

private:
    double estimate_or_throw(const BetCandidate& candidate) const;

    const Config& config_;
};

// Tree ensemble when model_path is set, heuristic otherwise.
// Throws ModelLoadError if the artifact cannot be loaded.
EstimatorHandle load_estimator(const Config& config);
