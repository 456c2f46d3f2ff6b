#include "redis_bus.hpp"
#include <sw/redis++/redis++.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <unordered_map>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

class RedisBus::Impl {
public:
    explicit Impl(const Config& config)
        : config_(config), running_(false), backoff_ms_(1000), retry_count_(0) {
        connect();
    }

    ~Impl() {
        stop_subscribers();
        disconnect();
    }

    bool connect() {
        try {
            redis_ = std::make_unique<sw::redis::Redis>(config_.redis_url);
            redis_->ping();
            spdlog::info("Connected to Redis at {}", config_.redis_url);
            backoff_ms_ = 1000;
            retry_count_ = 0;
            return true;
        } catch (const sw::redis::Error& e) {
            spdlog::error("Failed to connect to Redis: {}", e.what());
            redis_.reset();
            return false;
        }
    }

    void disconnect() {
        if (redis_) {
            redis_.reset();
            spdlog::info("Disconnected from Redis");
        }
    }

    bool is_connected() const {
        if (!redis_) {
            return false;
        }

        try {
            redis_->ping();
            return true;
        } catch (const sw::redis::Error& e) {
            spdlog::debug("Redis ping failed: {}", e.what());
            return false;
        }
    }

    bool ensure_connection() {
        if (is_connected()) {
            return true;
        }

        auto now = std::chrono::steady_clock::now();
        if (std::chrono::duration_cast<std::chrono::milliseconds>(
                now - last_connection_attempt_).count() < backoff_ms_) {
            return false;
        }
        last_connection_attempt_ = now;

        if (connect()) {
            spdlog::info("Redis connection restored");
            return true;
        }

        spdlog::warn("Redis reconnection failed (attempt {})", ++retry_count_);
        backoff_ms_ = std::min(backoff_ms_ * 2, 30000);
        return false;
    }

    void subscribe_command_requests(std::function<void(const CommandRequest&)> callback) {
        if (command_thread_.joinable()) {
            spdlog::warn("Command requests subscriber already running");
            return;
        }

        running_ = true;
        command_thread_ = std::thread([this, callback]() {
            spdlog::info("Starting command requests subscriber on {}", config_.stream_req);

            sw::redis::ConnectionOptions opts;
            opts.uri = config_.redis_url;
            // xreadgroup blocks up to one second; the socket must outlast it
            opts.socket_timeout = std::chrono::milliseconds(2000);
            sw::redis::Redis redis(opts);

            try {
                redis.xgroup_create(config_.stream_req, config_.consumer_group, "0", true);
            } catch (const sw::redis::Error& e) {
                spdlog::debug("Consumer group already exists or error: {}", e.what());
            }

            std::string consumer_id = config_.service_name + "_" +
                std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()));

            using Attrs = std::unordered_map<std::string, std::string>;
            using Item = std::pair<std::string, Attrs>;
            using Result = std::unordered_map<std::string, std::vector<Item>>;

            while (running_) {
                try {
                    Result result;
                    redis.xreadgroup(config_.consumer_group, consumer_id, config_.stream_req, ">",
                                     std::chrono::milliseconds(1000), 1,
                                     std::inserter(result, result.end()));

                    for (const auto& stream : result) {
                        for (const auto& entry : stream.second) {
                            const auto& id = entry.first;
                            const auto& fields = entry.second;

                            try {
                                auto data = fields.find("data");
                                if (data != fields.end()) {
                                    auto request = CommandRequest::from_json(json::parse(data->second));
                                    if (request) {
                                        callback(*request);
                                    } else {
                                        spdlog::warn("Ignoring malformed command request {}", id);
                                    }
                                }
                            } catch (const std::exception& e) {
                                spdlog::error("Error processing command request {}: {}", id, e.what());
                            }

                            redis.xack(config_.stream_req, config_.consumer_group, id);
                        }
                    }
                } catch (const sw::redis::TimeoutError&) {
                    continue;
                } catch (const sw::redis::Error& e) {
                    spdlog::error("Error in command requests subscriber: {}", e.what());
                    std::this_thread::sleep_for(std::chrono::seconds(1));
                }
            }

            spdlog::info("Command requests subscriber stopped");
        });
    }

    void stop_subscribers() {
        running_ = false;
        if (command_thread_.joinable()) {
            command_thread_.join();
        }
    }

    bool publish_command_reply(const CommandReply& reply) {
        if (!ensure_connection()) {
            return false;
        }

        try {
            std::unordered_map<std::string, std::string> fields = {
                {"data", reply.to_json().dump()},
                {"corr_id", reply.corr_id},
                {"ts", reply.ts}
            };

            redis_->xadd(config_.stream_rep, "*", fields.begin(), fields.end());
            return true;
        } catch (const sw::redis::Error& e) {
            spdlog::error("Failed to publish command reply: {}", e.what());
            return false;
        }
    }

private:
    const Config& config_;
    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> running_;
    std::thread command_thread_;

    std::chrono::steady_clock::time_point last_connection_attempt_ = std::chrono::steady_clock::now();
    int backoff_ms_;
    int retry_count_;
};

RedisBus::RedisBus(const Config& config) : impl_(std::make_unique<Impl>(config)) {}

RedisBus::~RedisBus() = default;

bool RedisBus::connect() {
    return impl_->connect();
}

void RedisBus::disconnect() {
    impl_->disconnect();
}

bool RedisBus::is_connected() const {
    return impl_->is_connected();
}

bool RedisBus::ensure_connection() {
    return impl_->ensure_connection();
}

void RedisBus::subscribe_command_requests(std::function<void(const CommandRequest&)> callback) {
    impl_->subscribe_command_requests(std::move(callback));
}

void RedisBus::stop_subscribers() {
    impl_->stop_subscribers();
}

bool RedisBus::publish_command_reply(const CommandReply& reply) {
    return impl_->publish_command_reply(reply);
}
