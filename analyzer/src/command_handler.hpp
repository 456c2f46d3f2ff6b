#pragma once

#include "config.hpp"
#include "json_schemas.hpp"
#include "pipeline.hpp"
#include <functional>

// Maps bus commands onto pipeline operations. Every request gets a reply;
// failures become ok=false with the reason in message.
class CommandHandler {
public:
    // Reloads the candidate snapshot and returns its size
    using RefreshFn = std::function<std::size_t()>;

    CommandHandler(const Config& config, Pipeline& pipeline, RefreshFn refresh = nullptr);

    CommandReply handle(const CommandRequest& request);

private:
    nlohmann::json handle_recommended_legs(const nlohmann::json& args);
    nlohmann::json handle_value_bets(const nlohmann::json& args);
    nlohmann::json handle_build_parlay(const nlohmann::json& args, std::string& message);
    nlohmann::json handle_refresh();

    const Config& config_;
    Pipeline& pipeline_;
    RefreshFn refresh_;
};
