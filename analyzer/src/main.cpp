#include "config.hpp"
#include "analyzer_service.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <memory>
#include <atomic>
#include <thread>
#include <chrono>

std::atomic<bool> g_terminate_flag(false);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_terminate_flag = true;
    }
}

int main(int argc, char* argv[]) {
    util::setup_logging("legscout_analyzer", "info");
    spdlog::info("Starting LegScout Analyzer...");

    std::string config_path = "config.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    Config config;
    try {
        config.load(config_path);
        config.load_from_env();
        config.validate();
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::info("Configuration loaded from {}", config_path);
    } catch (const std::exception& e) {
        spdlog::critical("Failed to load configuration: {}", e.what());
        return 1;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::unique_ptr<AnalyzerService> service;
    try {
        service = std::make_unique<AnalyzerService>(config);
        service->run();
    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize or start the service: {}", e.what());
        return 1;
    }

    while (!g_terminate_flag) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("Termination signal received. Shutting down...");
    service->stop();

    spdlog::info("LegScout Analyzer has shut down gracefully.");
    spdlog::shutdown();
    return 0;
}
