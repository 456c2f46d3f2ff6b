#include "rationale.hpp"
#include <fmt/format.h>
#include <vector>

std::string generate_rationale(const ScoredCandidate& scored) {
    const auto& candidate = scored.candidate;
    std::vector<std::string> parts;

    parts.push_back(fmt::format("MODEL ANALYSIS: {} ({}) @ ${:.2f}.",
                                candidate.selection, to_string(candidate.sport), candidate.decimal_odds));

    parts.push_back(fmt::format("Edge: model {:.1f}% vs market implied {:.1f}% = {:+.1f}pp. EV: {:+.1f}%.",
                                scored.model_probability * 100.0,
                                scored.implied_probability * 100.0,
                                scored.edge * 100.0,
                                scored.expected_value * 100.0));

    parts.push_back(fmt::format("Consistency: {:.0f}% over the recent sample window.",
                                scored.consistency_score * 100.0));

    if (scored.rivalry_flag) {
        parts.push_back(fmt::format("RISK NOTE: {} - rivalry games are historically closer; score reduced.",
                                    scored.rivalry_name.empty() ? "rivalry matchup" : scored.rivalry_name));
    }

    if (candidate.decimal_odds <= 1.10) {
        parts.push_back("Market view: heavy favourite (implied >90% win probability).");
    } else if (candidate.decimal_odds <= 1.15) {
        parts.push_back("Market view: strong favourite (implied 85-90% win probability).");
    } else if (candidate.decimal_odds <= 1.20) {
        parts.push_back("Market view: clear favourite (implied 80-85% win probability).");
    } else {
        parts.push_back("Market view: moderate favourite (implied below 80% win probability).");
    }

    parts.push_back(fmt::format("Confidence: {}.", to_string(scored.confidence_tier)));
    parts.push_back("Model-based analysis, not a guarantee. Always bet responsibly.");

    std::string rationale;
    for (const auto& part : parts) {
        if (!rationale.empty()) {
            rationale += ' ';
        }
        rationale += part;
    }
    return rationale;
}
