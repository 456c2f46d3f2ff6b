#include "command_handler.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

namespace {
    std::optional<Sport> sport_arg(const json& args) {
        if (!args.contains("sport") || args["sport"].is_null()) {
            return std::nullopt;
        }
        auto name = args["sport"].get<std::string>();
        auto sport = sport_from_string(name);
        if (!sport) {
            throw std::invalid_argument(fmt::format("Unknown sport: {}", name));
        }
        return sport;
    }

    std::optional<MarketType> market_arg(const json& args) {
        if (!args.contains("market_type") || args["market_type"].is_null()) {
            return std::nullopt;
        }
        auto name = args["market_type"].get<std::string>();
        auto market = market_type_from_string(name);
        if (!market) {
            throw std::invalid_argument(fmt::format("Unknown market type: {}", name));
        }
        return market;
    }

    std::size_t limit_arg(const json& args, int default_limit) {
        int limit = args.value("limit", default_limit);
        if (limit < 1) {
            throw std::invalid_argument("limit must be at least 1");
        }
        return static_cast<std::size_t>(limit);
    }
}

CommandHandler::CommandHandler(const Config& config, Pipeline& pipeline, RefreshFn refresh)
    : config_(config), pipeline_(pipeline), refresh_(std::move(refresh)) {}

CommandReply CommandHandler::handle(const CommandRequest& request) {
    CommandReply reply;
    reply.corr_id = request.corr_id;
    reply.ok = true;

    try {
        const json& args = request.args.is_object() ? request.args : json::object();

        if (request.cmd == "recommended_legs") {
            reply.data = handle_recommended_legs(args);
            reply.message = fmt::format("{} recommended legs", reply.data["count"].get<std::size_t>());
        } else if (request.cmd == "value_bets") {
            reply.data = handle_value_bets(args);
            reply.message = fmt::format("{} value bets", reply.data["count"].get<std::size_t>());
        } else if (request.cmd == "build_parlay") {
            reply.data = handle_build_parlay(args, reply.message);
        } else if (request.cmd == "pipeline_stats") {
            reply.data = to_json(pipeline_.get_pipeline_stats());
            reply.message = "Pipeline stats";
        } else if (request.cmd == "summary") {
            reply.data = to_json(pipeline_.get_summary());
            reply.message = "Pipeline summary";
        } else if (request.cmd == "refresh") {
            reply.data = handle_refresh();
            reply.message = "Candidate snapshot reloaded";
        } else {
            reply.ok = false;
            reply.message = fmt::format("Unknown command: {}", request.cmd);
        }
    } catch (const std::exception& e) {
        spdlog::error("Error handling {} request {}: {}", request.cmd, request.corr_id, e.what());
        reply.ok = false;
        reply.message = e.what();
        reply.data = json::object();
    }

    reply.ts = util::current_iso8601();
    return reply;
}

json CommandHandler::handle_recommended_legs(const json& args) {
    auto legs = pipeline_.get_recommended_legs(limit_arg(args, config_.max_recommended_legs));

    json items = json::array();
    for (const auto& leg : legs) {
        items.push_back(to_json(leg));
    }
    return json{{"legs", items}, {"count", legs.size()}};
}

json CommandHandler::handle_value_bets(const json& args) {
    auto bets = pipeline_.get_value_bets(sport_arg(args), limit_arg(args, 10), args.value("after_stage1", false));

    json items = json::array();
    for (const auto& bet : bets) {
        items.push_back(to_json(bet));
    }
    return json{{"value_bets", items}, {"count", bets.size()}};
}

json CommandHandler::handle_build_parlay(const json& args, std::string& message) {
    double target_odds = args.value("target_odds", config_.default_target_odds);
    int max_legs = args.value("max_legs", config_.default_max_legs);
    double stake = args.value("stake", 10.0);
    if (stake <= 0.0) {
        throw std::invalid_argument("stake must be positive");
    }

    auto parlay = pipeline_.build_parlay(target_odds, max_legs, sport_arg(args), market_arg(args));
    if (!parlay) {
        message = fmt::format("No parlay within {} legs reaches target odds {:.2f}", max_legs, target_odds);
        return json{{"parlay", nullptr}};
    }

    message = fmt::format("{}-leg parlay at {:.2f}", parlay->leg_count(), parlay->combined_odds);
    return json{{"parlay", to_json(*parlay, stake)}};
}

json CommandHandler::handle_refresh() {
    if (!refresh_) {
        throw std::runtime_error("Snapshot refresh is not available");
    }
    std::size_t count = refresh_();
    return json{{"candidates", count}};
}
