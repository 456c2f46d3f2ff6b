#include "candidate_validator.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cmath>
#include <fmt/format.h>

namespace {
    // Matched as whole words
    const char* const kPlaceholderTokens[] = {"tba", "tbd", "tbc"};
    // Matched anywhere in the name
    const char* const kPlaceholderPhrases[] = {"to be announced", "to be determined", "to be confirmed"};
}

CandidateValidator::CandidateValidator(const Config& config) : config_(config) {}

void CandidateValidator::validate(const BetCandidate& candidate) const {
    if (!std::isfinite(candidate.decimal_odds) || candidate.decimal_odds <= 1.0) {
        throw InvalidInputError(fmt::format("decimal odds {} must be greater than 1.0", candidate.decimal_odds));
    }

    if (candidate.event_id.empty()) {
        throw InvalidInputError("missing event identifier");
    }

    if (candidate.selection.empty()) {
        throw InvalidInputError("missing selection description");
    }

    if (!is_market_allowed(candidate.sport, candidate.market_type)) {
        throw InvalidInputError(fmt::format("market {} is not offered for {}",
                                            to_string(candidate.market_type), to_string(candidate.sport)));
    }

    if (candidate.home_team.empty() || candidate.away_team.empty()) {
        throw InvalidInputError("opponent not confirmed");
    }

    if (is_placeholder_team(candidate.home_team) || is_placeholder_team(candidate.away_team)) {
        throw InvalidInputError(fmt::format("placeholder opponent in {} v {}",
                                            candidate.home_team, candidate.away_team));
    }

    if (util::to_lower(candidate.home_team) == util::to_lower(candidate.away_team)) {
        throw InvalidInputError(fmt::format("home and away team are both {}", candidate.home_team));
    }
}

bool CandidateValidator::is_within_horizon(std::chrono::system_clock::time_point start,
                                           std::chrono::system_clock::time_point now) const {
    auto horizon = now + std::chrono::hours(24 * config_.max_event_days_ahead);
    return start > now && start <= horizon;
}

bool CandidateValidator::is_placeholder_team(const std::string& team) {
    std::string lowered = util::to_lower(util::trim(team));
    for (const char* phrase : kPlaceholderPhrases) {
        if (lowered.find(phrase) != std::string::npos) {
            return true;
        }
    }
    for (const auto& word : util::split_words(lowered)) {
        for (const char* token : kPlaceholderTokens) {
            if (word == token) {
                return true;
            }
        }
    }
    return false;
}
