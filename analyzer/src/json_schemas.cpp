#include "json_schemas.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <fmt/format.h>

using json = nlohmann::json;

namespace {
    const json& required(const json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) {
            throw InvalidInputError(fmt::format("candidate is missing '{}'", key));
        }
        return *it;
    }

    FeatureValue feature_from_json(const std::string& name, const json& value) {
        if (value.is_boolean()) {
            return value.get<bool>() ? 1.0 : 0.0;
        }
        if (value.is_number()) {
            return value.get<double>();
        }
        if (value.is_string()) {
            return value.get<std::string>();
        }
        throw InvalidInputError(fmt::format("feature '{}' must be a number, boolean or string", name));
    }

    json feature_to_json(const FeatureValue& value) {
        if (const double* number = std::get_if<double>(&value)) {
            return *number;
        }
        return std::get<std::string>(value);
    }
}

json CommandRequest::to_json() const {
    return json{
        {"type", type},
        {"cmd", cmd},
        {"args", args},
        {"corr_id", corr_id},
        {"ts", ts}
    };
}

std::optional<CommandRequest> CommandRequest::from_json(const json& j) {
    if (!j.is_object() || !j.contains("cmd") || !j.contains("corr_id")) {
        return std::nullopt;
    }

    try {
        CommandRequest req;
        req.type = j.value("type", "command");
        req.cmd = j.at("cmd").get<std::string>();
        req.corr_id = j.at("corr_id").get<std::string>();
        req.args = j.value("args", json::object());
        req.ts = j.value("ts", "");
        return req;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

json CommandReply::to_json() const {
    return json{
        {"corr_id", corr_id},
        {"ok", ok},
        {"message", message},
        {"data", data},
        {"ts", ts}
    };
}

BetCandidate candidate_from_json(const json& j) {
    if (!j.is_object()) {
        throw InvalidInputError("candidate record is not an object");
    }

    try {
        BetCandidate candidate;

        auto sport_name = required(j, "sport").get<std::string>();
        auto sport = sport_from_string(sport_name);
        if (!sport) {
            throw InvalidInputError(fmt::format("unknown sport '{}'", sport_name));
        }
        candidate.sport = *sport;

        auto market_name = required(j, "market_type").get<std::string>();
        auto market = market_type_from_string(market_name);
        if (!market) {
            throw InvalidInputError(fmt::format("unknown market type '{}'", market_name));
        }
        candidate.market_type = *market;

        candidate.event_id = required(j, "event_id").get<std::string>();
        candidate.selection = required(j, "selection").get<std::string>();
        candidate.decimal_odds = required(j, "decimal_odds").get<double>();

        auto start = required(j, "event_start_time").get<std::string>();
        try {
            candidate.event_start_time = util::parse_iso8601(start);
        } catch (const std::invalid_argument& e) {
            throw InvalidInputError(e.what());
        }

        candidate.home_team = j.value("home_team", "");
        candidate.away_team = j.value("away_team", "");
        candidate.bookmaker = j.value("bookmaker", "");

        auto line = j.find("line");
        if (line != j.end() && line->is_number()) {
            candidate.line = line->get<double>();
        }

        auto features = j.find("context_features");
        if (features != j.end() && features->is_object()) {
            for (auto it = features->begin(); it != features->end(); ++it) {
                if (it->is_null()) {
                    continue;
                }
                candidate.context_features.emplace(it.key(), feature_from_json(it.key(), it.value()));
            }
        }

        auto samples = j.find("recent_samples");
        if (samples != j.end() && samples->is_array()) {
            candidate.recent_samples = samples->get<std::vector<double>>();
        }

        return candidate;
    } catch (const json::exception& e) {
        throw InvalidInputError(fmt::format("malformed candidate: {}", e.what()));
    }
}

json to_json(const BetCandidate& candidate) {
    json features = json::object();
    for (const auto& [name, value] : candidate.context_features) {
        features[name] = feature_to_json(value);
    }

    return json{
        {"sport", to_string(candidate.sport)},
        {"market_type", to_string(candidate.market_type)},
        {"event_id", candidate.event_id},
        {"event_start_time", util::to_iso8601(candidate.event_start_time)},
        {"selection", candidate.selection},
        {"home_team", candidate.home_team},
        {"away_team", candidate.away_team},
        {"bookmaker", candidate.bookmaker},
        {"line", candidate.line ? json(*candidate.line) : json(nullptr)},
        {"decimal_odds", candidate.decimal_odds},
        {"context_features", features},
        {"recent_samples", candidate.recent_samples}
    };
}

json to_json(const ScoredCandidate& scored) {
    json j = to_json(scored.candidate);
    j["model_probability"] = scored.model_probability;
    j["implied_probability"] = scored.implied_probability;
    j["edge"] = scored.edge;
    j["expected_value"] = scored.expected_value;
    j["value_rating"] = scored.value_rating;
    j["confidence_tier"] = to_string(scored.confidence_tier);
    j["rivalry_flag"] = scored.rivalry_flag;
    j["rivalry_name"] = scored.rivalry_name;
    j["consistency_score"] = scored.consistency_score;
    j["adjustment"] = scored.adjustment;
    j["composite_score"] = scored.composite_score ? json(*scored.composite_score) : json(nullptr);
    return j;
}

json to_json(const RecommendedLeg& leg) {
    json j = to_json(leg.scored);
    j["rank"] = leg.rank;
    j["rationale"] = leg.rationale;
    return j;
}

json to_json(const Parlay& parlay, double stake) {
    json legs = json::array();
    for (const auto& leg : parlay.legs) {
        legs.push_back(to_json(leg));
    }

    return json{
        {"legs", legs},
        {"leg_count", parlay.leg_count()},
        {"combined_odds", parlay.combined_odds},
        {"combined_probability", parlay.combined_probability},
        {"total_composite_score", parlay.total_composite_score},
        {"target_odds", parlay.target_odds},
        {"stake", stake},
        {"potential_return", parlay.potential_return(stake)}
    };
}

json to_json(const PipelineStats& stats) {
    return json{
        {"candidates_in", stats.candidates_in},
        {"rejected_invalid", stats.rejected_invalid},
        {"survivors_stage1", stats.survivors_stage1},
        {"final_legs_count", stats.final_legs_count},
        {"last_run", stats.last_run.time_since_epoch().count() == 0
            ? json(nullptr) : json(util::to_iso8601(stats.last_run))}
    };
}

json to_json(const PipelineSummary& summary) {
    json legs = json::array();
    for (const auto& leg : summary.legs) {
        legs.push_back(to_json(leg));
    }

    return json{
        {"candidates_analyzed", summary.candidates_analyzed},
        {"recommended_legs_count", summary.recommended_legs_count},
        {"sports_breakdown", summary.sports_breakdown},
        {"average_odds", summary.average_odds},
        {"average_model_probability", summary.average_model_probability},
        {"average_expected_value", summary.average_expected_value},
        {"average_composite_score", summary.average_composite_score},
        {"sample_four_leg_odds", summary.sample_four_leg_odds},
        {"rivalry_legs_included", summary.rivalry_legs_included},
        {"legs", legs}
    };
}
