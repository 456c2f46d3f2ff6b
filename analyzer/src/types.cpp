#include "types.hpp"
#include <algorithm>
#include <utility>

namespace {
    const std::vector<std::pair<Sport, std::string>> kSportNames = {
        {Sport::Basketball, "basketball"},
        {Sport::AmericanFootball, "american_football"},
        {Sport::MixedMartialArts, "mixed_martial_arts"},
        {Sport::RugbyLeague, "rugby_league"},
    };

    const std::vector<std::pair<MarketType, std::string>> kMarketNames = {
        {MarketType::Moneyline, "moneyline"},
        {MarketType::Spread, "spread"},
        {MarketType::Totals, "totals"},
        {MarketType::PlayerPointsOverUnder, "player_points_over_under"},
        {MarketType::PlayerReboundsOverUnder, "player_rebounds_over_under"},
        {MarketType::PlayerAssistsOverUnder, "player_assists_over_under"},
        {MarketType::PlayerThreesOverUnder, "player_threes_over_under"},
        {MarketType::PlayerBlocksOverUnder, "player_blocks_over_under"},
        {MarketType::PlayerStealsOverUnder, "player_steals_over_under"},
        {MarketType::PlayerPraOverUnder, "player_pra_over_under"},
        {MarketType::PlayerDoubleDouble, "player_double_double"},
        {MarketType::AlternatePlayerPoints, "alternate_player_points"},
        {MarketType::AlternatePlayerRebounds, "alternate_player_rebounds"},
        {MarketType::AlternatePlayerAssists, "alternate_player_assists"},
        {MarketType::AlternatePlayerThrees, "alternate_player_threes"},
        {MarketType::PlayerPassTdsOverUnder, "player_pass_tds_over_under"},
        {MarketType::PlayerPassYardsOverUnder, "player_pass_yards_over_under"},
        {MarketType::PlayerRushYardsOverUnder, "player_rush_yards_over_under"},
        {MarketType::PlayerReceivingYardsOverUnder, "player_receiving_yards_over_under"},
        {MarketType::PlayerReceptionsOverUnder, "player_receptions_over_under"},
        {MarketType::PlayerPassCompletionsOverUnder, "player_pass_completions_over_under"},
        {MarketType::PlayerPassAttemptsOverUnder, "player_pass_attempts_over_under"},
        {MarketType::PlayerRushAttemptsOverUnder, "player_rush_attempts_over_under"},
        {MarketType::PlayerAnytimeTouchdown, "player_anytime_touchdown"},
        {MarketType::PlayerFirstTouchdown, "player_first_touchdown"},
        {MarketType::AlternatePlayerPassYards, "alternate_player_pass_yards"},
        {MarketType::AlternatePlayerRushYards, "alternate_player_rush_yards"},
        {MarketType::AlternatePlayerReceivingYards, "alternate_player_receiving_yards"},
        {MarketType::MethodOfVictory, "method_of_victory"},
        {MarketType::TotalRounds, "total_rounds"},
        {MarketType::AnytimeTryscorer, "anytime_tryscorer"},
    };

    const std::vector<MarketType> kBasketballMarkets = {
        MarketType::Moneyline,
        MarketType::PlayerPointsOverUnder,
        MarketType::PlayerReboundsOverUnder,
        MarketType::PlayerAssistsOverUnder,
        MarketType::PlayerThreesOverUnder,
        MarketType::PlayerBlocksOverUnder,
        MarketType::PlayerStealsOverUnder,
        MarketType::PlayerPraOverUnder,
        MarketType::PlayerDoubleDouble,
        MarketType::AlternatePlayerPoints,
        MarketType::AlternatePlayerRebounds,
        MarketType::AlternatePlayerAssists,
        MarketType::AlternatePlayerThrees,
    };

    const std::vector<MarketType> kFootballMarkets = {
        MarketType::Moneyline,
        MarketType::Spread,
        MarketType::Totals,
        MarketType::PlayerPassTdsOverUnder,
        MarketType::PlayerPassYardsOverUnder,
        MarketType::PlayerRushYardsOverUnder,
        MarketType::PlayerReceivingYardsOverUnder,
        MarketType::PlayerReceptionsOverUnder,
        MarketType::PlayerAnytimeTouchdown,
        MarketType::PlayerPassCompletionsOverUnder,
        MarketType::PlayerPassAttemptsOverUnder,
        MarketType::PlayerRushAttemptsOverUnder,
        MarketType::PlayerFirstTouchdown,
        MarketType::AlternatePlayerPassYards,
        MarketType::AlternatePlayerRushYards,
        MarketType::AlternatePlayerReceivingYards,
    };

    const std::vector<MarketType> kCombatMarkets = {
        MarketType::Moneyline,
        MarketType::MethodOfVictory,
        MarketType::TotalRounds,
    };

    const std::vector<MarketType> kRugbyLeagueMarkets = {
        MarketType::Moneyline,
        MarketType::Spread,
        MarketType::Totals,
        MarketType::AnytimeTryscorer,
    };

    template <typename E>
    std::string name_of(const std::vector<std::pair<E, std::string>>& table, E value) {
        for (const auto& entry : table) {
            if (entry.first == value) {
                return entry.second;
            }
        }
        return "unknown";
    }

    template <typename E>
    std::optional<E> value_of(const std::vector<std::pair<E, std::string>>& table, const std::string& name) {
        for (const auto& entry : table) {
            if (entry.second == name) {
                return entry.first;
            }
        }
        return std::nullopt;
    }
}

std::string to_string(Sport sport) {
    return name_of(kSportNames, sport);
}

std::string to_string(MarketType market) {
    return name_of(kMarketNames, market);
}

std::string to_string(ConfidenceTier tier) {
    switch (tier) {
        case ConfidenceTier::High:
            return "high";
        case ConfidenceTier::Medium:
            return "medium";
        case ConfidenceTier::Low:
            return "low";
    }
    return "low";
}

std::optional<Sport> sport_from_string(const std::string& value) {
    return value_of(kSportNames, value);
}

std::optional<MarketType> market_type_from_string(const std::string& value) {
    return value_of(kMarketNames, value);
}

bool is_market_allowed(Sport sport, MarketType market) {
    const std::vector<MarketType>* allowed = nullptr;
    switch (sport) {
        case Sport::Basketball:
            allowed = &kBasketballMarkets;
            break;
        case Sport::AmericanFootball:
            allowed = &kFootballMarkets;
            break;
        case Sport::MixedMartialArts:
            allowed = &kCombatMarkets;
            break;
        case Sport::RugbyLeague:
            allowed = &kRugbyLeagueMarkets;
            break;
    }
    if (!allowed) {
        return false;
    }
    return std::find(allowed->begin(), allowed->end(), market) != allowed->end();
}

std::optional<double> numeric_feature(const FeatureMap& features, const std::string& name) {
    auto it = features.find(name);
    if (it == features.end()) {
        return std::nullopt;
    }
    if (const double* value = std::get_if<double>(&it->second)) {
        return *value;
    }
    return std::nullopt;
}
