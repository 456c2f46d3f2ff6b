#pragma once

#include "types.hpp"
#include "config.hpp"
#include "candidate_validator.hpp"
#include <chrono>
#include <vector>

// Hard threshold reject filter over the scored pool
class Stage1Filter {
public:
    explicit Stage1Filter(const Config& config);

    std::vector<ScoredCandidate> apply(const std::vector<ScoredCandidate>& pool,
                                       std::chrono::system_clock::time_point now) const;

    bool passes(const ScoredCandidate& scored, std::chrono::system_clock::time_point now) const;

private:
    const Config& config_;
    CandidateValidator validator_;
};
