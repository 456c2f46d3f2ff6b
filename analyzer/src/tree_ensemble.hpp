#pragma once

#include "estimator.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Gradient-boosted decision trees trained offline.
// probability = sigmoid(base_score + learning_rate * sum(tree leaves))
class TreeEnsembleEstimator : public ProbabilityEstimator {
public:
    struct FeatureSpec {
        std::string name;
        std::size_t row_index = 0;  // position in model_feature_row()
        double default_value = 0.0;
        double min_value = 0.0;
        double max_value = 1.0;
    };

    struct Node {
        int feature = -1;  // -1 for a leaf
        double threshold = 0.0;
        int left = -1;
        int right = -1;
        double leaf = 0.0;
    };

    using Tree = std::vector<Node>;

    // Throws ModelLoadError
    static std::shared_ptr<const TreeEnsembleEstimator> load(const Config& config, const std::string& path);
    static std::shared_ptr<const TreeEnsembleEstimator> from_json(const Config& config, const nlohmann::json& artifact);

    double estimate(const BetCandidate& candidate) const override;
    std::string name() const override { return "tree_ensemble"; }

    std::size_t tree_count() const { return trees_.size(); }

    TreeEnsembleEstimator(const Config& config, double base_score, double learning_rate,
                          std::vector<FeatureSpec> features, std::vector<Tree> trees);

private:
    std::vector<double> prepare_inputs(const BetCandidate& candidate) const;
    double evaluate(const Tree& tree, const std::vector<double>& inputs) const;

    const Config& config_;
    double base_score_;
    double learning_rate_;
    std::vector<FeatureSpec> features_;
    std::vector<Tree> trees_;
};
