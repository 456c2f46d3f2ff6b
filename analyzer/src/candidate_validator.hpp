#pragma once

#include "types.hpp"
#include "config.hpp"
#include <chrono>
#include <string>

class CandidateValidator {
public:
    explicit CandidateValidator(const Config& config);

    // Throws InvalidInputError with the rejection reason
    void validate(const BetCandidate& candidate) const;

    // Start time in (now, now + horizon]
    bool is_within_horizon(std::chrono::system_clock::time_point start,
                           std::chrono::system_clock::time_point now) const;

    // TBA / TBD style team names
    static bool is_placeholder_team(const std::string& team);

private:
    const Config& config_;
};
