#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

struct CommandRequest {
    std::string type = "command";
    std::string cmd;
    nlohmann::json args = nlohmann::json::object();
    std::string corr_id;
    std::string ts;

    nlohmann::json to_json() const;
    // nullopt when cmd or corr_id is missing
    static std::optional<CommandRequest> from_json(const nlohmann::json& j);
};

struct CommandReply {
    std::string corr_id;
    bool ok = true;
    std::string message;
    nlohmann::json data = nlohmann::json::object();
    std::string ts;

    nlohmann::json to_json() const;
};

// Snapshot record -> candidate. Throws InvalidInputError on missing fields,
// unknown sport or market names and unparseable start times.
BetCandidate candidate_from_json(const nlohmann::json& j);

nlohmann::json to_json(const BetCandidate& candidate);
nlohmann::json to_json(const ScoredCandidate& scored);
nlohmann::json to_json(const RecommendedLeg& leg);
nlohmann::json to_json(const Parlay& parlay, double stake);
nlohmann::json to_json(const PipelineStats& stats);
nlohmann::json to_json(const PipelineSummary& summary);
