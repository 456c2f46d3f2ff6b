#include "features.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "value_calculator.hpp"
#include <algorithm>
#include <fmt/format.h>

FeatureMap OddsDerivedFeatureProvider::lookup(const BetCandidate& candidate) const {
    const double odds = candidate.decimal_odds;
    const double implied = odds > 1.0 ? implied_probability(odds) : 0.5;
    const bool is_favorite = odds < 2.0;

    double form = 0.42;
    if (odds <= 1.15) {
        form = 0.75;
    } else if (odds <= 1.25) {
        form = 0.68;
    } else if (odds <= 1.50) {
        form = 0.60;
    } else if (is_favorite) {
        form = 0.55;
    }

    double ranking_diff = 10.0;
    if (odds < 1.5) {
        ranking_diff = -20.0;
    } else if (is_favorite) {
        ranking_diff = -10.0;
    }

    double consistency = 0.0;
    double streak = 0.0;
    if (is_favorite && odds <= 1.25) {
        consistency = std::min(0.65 + implied * 0.2, 0.95);
        streak = std::max(1, static_cast<int>((1.25 - odds) * 10));
    } else {
        consistency = std::min(0.4 + implied * 0.3, 0.95);
        streak = static_cast<int>((implied - 0.5) * 4);
    }

    FeatureMap features;
    features["win_rate"] = form;
    features["recent_form"] = form;
    features["is_favorite"] = is_favorite ? 1.0 : 0.0;
    features["is_home"] = candidate.selection == candidate.home_team ? 1.0 : 0.0;
    features["ranking_diff"] = ranking_diff;
    features["consistency"] = consistency;
    features["win_streak"] = streak;
    return features;
}

BetCandidate with_features(const BetCandidate& candidate, const FeatureProvider& provider) {
    BetCandidate enriched = candidate;
    FeatureMap extra = provider.lookup(candidate);
    // insert() leaves existing keys untouched
    enriched.context_features.insert(extra.begin(), extra.end());
    return enriched;
}

const std::vector<std::string>& model_feature_names() {
    static const std::vector<std::string> names = {
        "win_rate",
        "recent_form",
        "is_favorite",
        "is_home",
        "ranking_diff",
        "implied_prob",
    };
    return names;
}

double feature_as_number(const std::string& name, const FeatureValue& value) {
    if (const double* number = std::get_if<double>(&value)) {
        return *number;
    }

    std::string text = util::to_lower(util::trim(std::get<std::string>(value)));
    if (text == "true" || text == "yes" || text == "home" || text == "1") {
        return 1.0;
    }
    if (text == "false" || text == "no" || text == "away" || text == "0") {
        return 0.0;
    }
    throw DataQualityError(fmt::format("feature {} has non-numeric value '{}'", name, text));
}

std::vector<std::optional<double>> model_feature_row(const BetCandidate& candidate) {
    const auto& features = candidate.context_features;
    auto lookup = [&features](const std::string& name) -> std::optional<double> {
        auto it = features.find(name);
        if (it == features.end()) {
            return std::nullopt;
        }
        return feature_as_number(name, it->second);
    };

    std::vector<std::optional<double>> row;
    row.reserve(model_feature_names().size());

    row.push_back(lookup("win_rate"));
    row.push_back(lookup("recent_form"));

    auto is_favorite = lookup("is_favorite");
    if (!is_favorite && candidate.decimal_odds > 1.0) {
        is_favorite = candidate.decimal_odds < 2.0 ? 1.0 : 0.0;
    }
    row.push_back(is_favorite);

    auto is_home = lookup("is_home");
    if (!is_home && !candidate.home_team.empty()) {
        is_home = candidate.selection == candidate.home_team ? 1.0 : 0.0;
    }
    row.push_back(is_home);

    auto ranking_diff = lookup("ranking_diff");
    if (ranking_diff) {
        *ranking_diff /= 100.0;
    }
    row.push_back(ranking_diff);

    std::optional<double> implied;
    if (candidate.decimal_odds > 1.0) {
        implied = implied_probability(candidate.decimal_odds);
    }
    row.push_back(implied);

    return row;
}
