#include "health.hpp"
#include "json_schemas.hpp"
#include "util.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <thread>

class HealthServer::Impl {
public:
    Impl(const Config& config, const CandidatePool& pool, const Pipeline& pipeline)
        : config_(config), pool_(pool), pipeline_(pipeline), running_(false) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            return;
        }
        running_ = true;

        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json health_status;
            health_status["service"] = config_.service_name;
            health_status["status"] = "healthy";
            health_status["timestamp"] = util::current_iso8601();

            bool snapshot_loaded = pool_.loaded();
            auto snapshot = pool_.snapshot();
            health_status["components"]["snapshot"] = {
                {"status", snapshot_loaded ? "healthy" : "unhealthy"},
                {"candidates", snapshot->size()},
                {"fetched_at", snapshot_loaded ? nlohmann::json(util::to_iso8601(pool_.fetched_at())) : nlohmann::json(nullptr)}
            };
            health_status["components"]["pipeline"] = to_json(pipeline_.get_pipeline_stats());

            if (!snapshot_loaded) {
                health_status["status"] = "unhealthy";
                res.status = 503;
            } else {
                res.status = 200;
            }

            res.set_content(health_status.dump(2), "application/json");
        });

        // Bind before spawning the thread so stop() always has a socket to close
        if (!server_.bind_to_port(config_.health_host.c_str(), config_.health_port)) {
            spdlog::error("Health check server could not bind {}:{}", config_.health_host, config_.health_port);
            running_ = false;
            return;
        }

        server_thread_ = std::thread([this]() {
            spdlog::info("Health check server listening on {}:{}", config_.health_host, config_.health_port);
            server_.listen_after_bind();
        });
    }

    void stop() {
        if (running_) {
            running_ = false;
            server_.stop();
            if (server_thread_.joinable()) {
                server_thread_.join();
            }
            spdlog::info("Health check server stopped");
        }
    }

private:
    const Config& config_;
    const CandidatePool& pool_;
    const Pipeline& pipeline_;
    std::atomic<bool> running_;
    httplib::Server server_;
    std::thread server_thread_;
};

HealthServer::HealthServer(const Config& config, const CandidatePool& pool, const Pipeline& pipeline)
    : pImpl_(std::make_unique<Impl>(config, pool, pipeline)) {}

HealthServer::~HealthServer() = default;

void HealthServer::start() {
    pImpl_->start();
}

void HealthServer::stop() {
    pImpl_->stop();
}
