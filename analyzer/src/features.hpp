#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

// Supplies context features for a candidate (recent form, matchup history, ...)
class FeatureProvider {
public:
    virtual ~FeatureProvider() = default;

    // Features to add; keys already present on the candidate are never replaced
    virtual FeatureMap lookup(const BetCandidate& candidate) const = 0;
};

// Fills form features from the odds band when no stats feed supplied them
class OddsDerivedFeatureProvider : public FeatureProvider {
public:
    FeatureMap lookup(const BetCandidate& candidate) const override;
};

// Copy of the candidate with provider features merged in
BetCandidate with_features(const BetCandidate& candidate, const FeatureProvider& provider);

// Model input order: win_rate, recent_form, is_favorite, is_home, ranking_diff/100, implied_prob
const std::vector<std::string>& model_feature_names();

// Row in model order. nullopt marks a feature that is neither supplied nor derivable.
// Throws DataQualityError for categorical values that do not map to a number.
std::vector<std::optional<double>> model_feature_row(const BetCandidate& candidate);

// Numeric reading of a feature; booleans spelled as text map to 0/1.
// Throws DataQualityError otherwise.
double feature_as_number(const std::string& name, const FeatureValue& value);
