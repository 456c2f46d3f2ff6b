#pragma once

#include "config.hpp"
#include "json_schemas.hpp"
#include <functional>
#include <memory>

// Command request/reply streams over Redis consumer groups
class RedisBus {
public:
    explicit RedisBus(const Config& config);
    ~RedisBus();

    bool connect();
    void disconnect();
    bool is_connected() const;
    bool ensure_connection();

    void subscribe_command_requests(std::function<void(const CommandRequest&)> callback);
    void stop_subscribers();

    bool publish_command_reply(const CommandReply& reply);

    RedisBus(const RedisBus&) = delete;
    RedisBus& operator=(const RedisBus&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};
