#pragma once

#include "config.hpp"
#include "candidate_pool.hpp"
#include "command_handler.hpp"
#include "estimator.hpp"
#include "features.hpp"
#include "health.hpp"
#include "pipeline.hpp"
#include "redis_bus.hpp"
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

class AnalyzerService {
public:
    // Throws ModelLoadError if the configured model artifact cannot be loaded
    explicit AnalyzerService(const Config& config);
    ~AnalyzerService();

    void run();
    void stop();

private:
    // Periodic snapshot reload when the file changes
    void reload_thread_func();

    std::size_t refresh_snapshot();
    void handle_command_request(const CommandRequest& request);

    Config config_;

    EstimatorHandle estimator_;
    std::unique_ptr<JsonFileCandidateSource> source_;
    std::unique_ptr<CandidatePool> pool_;
    std::unique_ptr<Pipeline> pipeline_;
    std::unique_ptr<CommandHandler> command_handler_;
    std::unique_ptr<RedisBus> redis_bus_;
    std::unique_ptr<HealthServer> health_;

    std::atomic<bool> running_{false};
    std::thread reload_thread_;
    std::mutex reload_mutex_;
    std::condition_variable reload_cv_;
    std::optional<std::filesystem::file_time_type> loaded_mtime_;
};
