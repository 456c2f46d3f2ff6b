#include "analyzer_service.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>

AnalyzerService::AnalyzerService(const Config& config)
    : config_(config) {

    estimator_ = load_estimator(config_);
    spdlog::info("Probability estimator: {}", estimator_->name());

    source_ = std::make_unique<JsonFileCandidateSource>(config_.snapshot_path);
    pool_ = std::make_unique<CandidatePool>();
    pipeline_ = std::make_unique<Pipeline>(
        config_,
        estimator_,
        *pool_,
        std::make_shared<OddsDerivedFeatureProvider>()
    );
    command_handler_ = std::make_unique<CommandHandler>(
        config_,
        *pipeline_,
        [this]() { return refresh_snapshot(); }
    );
    redis_bus_ = std::make_unique<RedisBus>(config_);
    health_ = std::make_unique<HealthServer>(config_, *pool_, *pipeline_);
}

AnalyzerService::~AnalyzerService() {
    stop();
}

void AnalyzerService::run() {
    if (running_) {
        spdlog::warn("Analyzer service is already running");
        return;
    }

    running_ = true;

    // Start with an empty pool if the fetcher has not written a snapshot yet
    try {
        refresh_snapshot();
    } catch (const std::runtime_error& e) {
        spdlog::warn("Initial snapshot load failed: {}", e.what());
    }

    redis_bus_->subscribe_command_requests([this](const CommandRequest& request) {
        handle_command_request(request);
    });

    health_->start();

    reload_thread_ = std::thread(&AnalyzerService::reload_thread_func, this);

    spdlog::info("Analyzer service started");
}

void AnalyzerService::stop() {
    if (!running_) {
        return;
    }

    running_ = false;
    reload_cv_.notify_all();

    redis_bus_->stop_subscribers();
    health_->stop();

    if (reload_thread_.joinable()) {
        reload_thread_.join();
    }

    spdlog::info("Analyzer service stopped");
}

std::size_t AnalyzerService::refresh_snapshot() {
    auto mtime = source_->modified_time();
    std::size_t count = pool_->refresh(*source_);

    std::lock_guard<std::mutex> lock(reload_mutex_);
    loaded_mtime_ = mtime;
    return count;
}

void AnalyzerService::reload_thread_func() {
    spdlog::info("Snapshot reload thread started ({}s interval)", config_.snapshot_reload_seconds);

    while (running_) {
        {
            std::unique_lock<std::mutex> lock(reload_mutex_);
            reload_cv_.wait_for(lock, std::chrono::seconds(config_.snapshot_reload_seconds), [this] {
                return !running_;
            });
            if (!running_) {
                break;
            }

            auto mtime = source_->modified_time();
            if (!mtime || (loaded_mtime_ && *mtime == *loaded_mtime_)) {
                continue;
            }
        }

        try {
            std::size_t count = refresh_snapshot();
            spdlog::info("Candidate snapshot reloaded: {} candidates", count);
        } catch (const std::runtime_error& e) {
            spdlog::error("Snapshot reload failed, keeping previous snapshot: {}", e.what());
        }
    }

    spdlog::info("Snapshot reload thread stopped");
}

void AnalyzerService::handle_command_request(const CommandRequest& request) {
    spdlog::debug("Command {} ({})", request.cmd, request.corr_id);

    CommandReply reply = command_handler_->handle(request);
    if (!redis_bus_->publish_command_reply(reply)) {
        spdlog::error("Failed to publish reply for {}", request.corr_id);
    }
}
