#include "config.hpp"
#include "engine_service.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

// Global atomic flag to handle termination signals
std::atomic<bool> g_terminate_flag(false);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_terminate_flag = true;
    }
}

int main() {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("netcomply", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
    spdlog::flush_on(spdlog::level::info);

    Config config;
    try {
        config.load_from_env();
        config.validate();
        spdlog::set_level(spdlog::level::from_str(config.log_level));
    } catch (const std::exception& e) {
        spdlog::critical("Invalid configuration: {}", e.what());
        return 1;
    }

    spdlog::info("Starting {}...", config.service_name);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::unique_ptr<EngineService> service;
    try {
        service = std::make_unique<EngineService>(config);
        service->start();
    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize or start the service: {}", e.what());
        return 1;
    }

    while (!g_terminate_flag) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    spdlog::info("Termination signal received. Shutting down...");

    service->stop();
    service.reset();

    spdlog::info("{} has shut down gracefully.", config.service_name);
    spdlog::shutdown();
    return 0;
}
