#include "rivalry.hpp"
#include "errors.hpp"
#include "features.hpp"
#include "util.hpp"

namespace {
    const std::vector<RivalryEntry> kBuiltinRivalries = {
        {Sport::AmericanFootball, "Dallas Cowboys", "Philadelphia Eagles", "NFC East Rivalry"},
        {Sport::AmericanFootball, "Green Bay Packers", "Chicago Bears", "Oldest NFL Rivalry"},
        {Sport::AmericanFootball, "New England Patriots", "New York Jets", "AFC East Rivalry"},
        {Sport::AmericanFootball, "Kansas City Chiefs", "Las Vegas Raiders", "AFC West Rivalry"},
        {Sport::AmericanFootball, "San Francisco 49ers", "Seattle Seahawks", "NFC West Rivalry"},
        {Sport::Basketball, "Los Angeles Lakers", "Boston Celtics", "Historic NBA Rivalry"},
        {Sport::Basketball, "Los Angeles Lakers", "Los Angeles Clippers", "LA Battle"},
        {Sport::Basketball, "Golden State Warriors", "Cleveland Cavaliers", "Finals Rivalry"},
        {Sport::Basketball, "Miami Heat", "Boston Celtics", "Eastern Rivalry"},
        {Sport::RugbyLeague, "Queensland Maroons", "New South Wales Blues", "State of Origin"},
        {Sport::RugbyLeague, "South Sydney Rabbitohs", "Sydney Roosters", "Oldest NRL Rivalry"},
        {Sport::RugbyLeague, "Brisbane Broncos", "North Queensland Cowboys", "Queensland Derby"},
    };
}

RivalryTable::RivalryTable(const Config& config) : entries_(kBuiltinRivalries) {
    entries_.insert(entries_.end(), config.rivalries.begin(), config.rivalries.end());
}

bool RivalryTable::team_matches(const std::string& listed, const std::string& team) {
    if (listed.empty() || team.empty()) {
        return false;
    }
    std::string a = util::to_lower(listed);
    std::string b = util::to_lower(team);
    return a.find(b) != std::string::npos || b.find(a) != std::string::npos;
}

std::optional<RivalryMatch> RivalryTable::find(const BetCandidate& candidate) const {
    const auto& home = candidate.home_team;
    const auto& away = candidate.away_team;

    for (const auto& entry : entries_) {
        if (entry.sport != candidate.sport) {
            continue;
        }
        bool forward = team_matches(entry.team_a, home) && team_matches(entry.team_b, away);
        bool reverse = team_matches(entry.team_b, home) && team_matches(entry.team_a, away);
        if (forward || reverse) {
            return RivalryMatch{entry.name};
        }
    }

    // Matchup tagged upstream as a derby or high-variance fixture
    auto it = candidate.context_features.find("rivalry");
    if (it != candidate.context_features.end()) {
        try {
            if (feature_as_number("rivalry", it->second) > 0.0) {
                return RivalryMatch{"Tagged rivalry"};
            }
        } catch (const DataQualityError&) {
            // Any non-boolean text tag names the rivalry
            if (const auto* tag = std::get_if<std::string>(&it->second)) {
                return RivalryMatch{*tag};
            }
        }
    }

    return std::nullopt;
}
