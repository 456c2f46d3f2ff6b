#include "tree_ensemble.hpp"
#include "errors.hpp"
#include "features.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {
    std::size_t row_index_for(const std::string& feature_name) {
        const auto& names = model_feature_names();
        auto it = std::find(names.begin(), names.end(), feature_name);
        if (it == names.end()) {
            throw ModelLoadError(fmt::format("model uses unknown feature '{}'", feature_name));
        }
        return static_cast<std::size_t>(it - names.begin());
    }

    void check_tree(const TreeEnsembleEstimator::Tree& tree, std::size_t tree_index, std::size_t feature_count) {
        if (tree.empty()) {
            throw ModelLoadError(fmt::format("tree {} has no nodes", tree_index));
        }
        for (std::size_t i = 0; i < tree.size(); ++i) {
            const auto& node = tree[i];
            if (node.feature < 0) {
                continue;
            }
            if (static_cast<std::size_t>(node.feature) >= feature_count) {
                throw ModelLoadError(fmt::format("tree {} node {} references feature {}", tree_index, i, node.feature));
            }
            // Children after parents guarantees every walk terminates
            auto child_ok = [&](int child) {
                return child > static_cast<int>(i) && child < static_cast<int>(tree.size());
            };
            if (!child_ok(node.left) || !child_ok(node.right)) {
                throw ModelLoadError(fmt::format("tree {} node {} has invalid children", tree_index, i));
            }
        }
    }
}

TreeEnsembleEstimator::TreeEnsembleEstimator(const Config& config, double base_score, double learning_rate,
                                             std::vector<FeatureSpec> features, std::vector<Tree> trees)
    : config_(config),
      base_score_(base_score),
      learning_rate_(learning_rate),
      features_(std::move(features)),
      trees_(std::move(trees)) {}

std::shared_ptr<const TreeEnsembleEstimator> TreeEnsembleEstimator::load(const Config& config, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ModelLoadError(fmt::format("cannot open model artifact {}", path));
    }

    json artifact;
    try {
        in >> artifact;
    } catch (const json::exception& e) {
        throw ModelLoadError(fmt::format("malformed model artifact {}: {}", path, e.what()));
    }
    return from_json(config, artifact);
}

std::shared_ptr<const TreeEnsembleEstimator> TreeEnsembleEstimator::from_json(const Config& config, const json& artifact) {
    try {
        double base_score = artifact.value("base_score", 0.0);
        double learning_rate = artifact.value("learning_rate", 0.1);

        std::vector<FeatureSpec> features;
        for (const auto& f : artifact.at("features")) {
            FeatureSpec spec;
            spec.name = f.at("name").get<std::string>();
            spec.row_index = row_index_for(spec.name);
            spec.default_value = f.at("default").get<double>();
            spec.min_value = f.value("min", -std::numeric_limits<double>::infinity());
            spec.max_value = f.value("max", std::numeric_limits<double>::infinity());
            features.push_back(spec);
        }
        if (features.empty()) {
            throw ModelLoadError("model declares no features");
        }

        std::vector<Tree> trees;
        for (const auto& t : artifact.at("trees")) {
            Tree tree;
            for (const auto& n : t.at("nodes")) {
                Node node;
                if (n.contains("leaf")) {
                    node.leaf = n.at("leaf").get<double>();
                } else {
                    node.feature = n.at("feature").get<int>();
                    node.threshold = n.at("threshold").get<double>();
                    node.left = n.at("left").get<int>();
                    node.right = n.at("right").get<int>();
                }
                tree.push_back(node);
            }
            check_tree(tree, trees.size(), features.size());
            trees.push_back(std::move(tree));
        }
        if (trees.empty()) {
            throw ModelLoadError("model contains no trees");
        }

        return std::make_shared<TreeEnsembleEstimator>(
            config, base_score, learning_rate, std::move(features), std::move(trees));
    } catch (const json::exception& e) {
        throw ModelLoadError(fmt::format("invalid model artifact: {}", e.what()));
    }
}

std::vector<double> TreeEnsembleEstimator::prepare_inputs(const BetCandidate& candidate) const {
    const auto row = model_feature_row(candidate);

    std::vector<double> inputs;
    inputs.reserve(features_.size());
    for (const auto& spec : features_) {
        const auto& value = row[spec.row_index];
        if (!value) {
            spdlog::warn("Data quality: {} [{}] missing {}, imputed {:.3f}",
                         candidate.selection, candidate.event_id, spec.name, spec.default_value);
            inputs.push_back(spec.default_value);
            continue;
        }
        if (!std::isfinite(*value) || *value < spec.min_value || *value > spec.max_value) {
            throw DataQualityError(fmt::format("{} = {} outside [{}, {}]",
                                               spec.name, *value, spec.min_value, spec.max_value));
        }
        inputs.push_back(*value);
    }
    return inputs;
}

double TreeEnsembleEstimator::evaluate(const Tree& tree, const std::vector<double>& inputs) const {
    std::size_t index = 0;
    while (tree[index].feature >= 0) {
        const auto& node = tree[index];
        index = static_cast<std::size_t>(
            inputs[static_cast<std::size_t>(node.feature)] <= node.threshold ? node.left : node.right);
    }
    return tree[index].leaf;
}

double TreeEnsembleEstimator::estimate(const BetCandidate& candidate) const {
    try {
        auto inputs = prepare_inputs(candidate);

        double margin = base_score_;
        for (const auto& tree : trees_) {
            margin += learning_rate_ * evaluate(tree, inputs);
        }

        double probability = 1.0 / (1.0 + std::exp(-margin));
        return std::min(1.0, std::max(0.0, probability));
    } catch (const DataQualityError& e) {
        spdlog::warn("Data quality: {} [{}] using fallback probability {:.2f}: {}",
                     candidate.selection, candidate.event_id, config_.fallback_probability, e.what());
        return config_.fallback_probability;
    }
}
