/**
 * @file main.cpp
 * @brief Entry point for the beacon device heartbeat service
 *
 * Accepts device heartbeats over HTTP, keeps the latest state of every device
 * in memory, evicts devices that stop reporting, and reloads its
 * configuration file without losing cached state.
 */

#include <csignal>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include "config/service_config.hpp"
#include "core/exception.hpp"
#include "http_server.hpp"
#include "logging/logging.hpp"
#include "maintenance/asio_scheduler.hpp"
#include "maintenance/thread_scheduler.hpp"
#include "reload/reload_coordinator.hpp"
#include "service/process_state.hpp"
#include "stats/cpu_monitor.hpp"

namespace {

volatile std::sig_atomic_t g_shutdownRequested = 0;

/**
 * @brief Signal handler for graceful shutdown
 */
void signalHandler(int signal) { g_shutdownRequested = signal; }

/**
 * @brief io_context with an optional thread running it, torn down last
 */
struct IoRunner {
    boost::asio::io_context context;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
        guard{context.get_executor()};
    std::thread thread;

    void run() {
        thread = std::thread([this] { context.run(); });
    }

    ~IoRunner() {
        guard.reset();
        context.stop();
        if (thread.joinable()) {
            thread.join();
        }
    }
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --config <path>  Configuration file "
                 "(default: config/beacon.json)\n"
              << "  --help, -h       Show this help message\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path configPath = "config/beacon.json";

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    beacon::config::ServiceConfig config;
    try {
        config = beacon::config::loadOrDefault(configPath);
    } catch (const beacon::ConfigError& e) {
        spdlog::critical("Cannot load configuration: {}", e.what());
        return 1;
    }

    if (!beacon::logging::initialize(config.logging)) {
        spdlog::warn("File logging unavailable, continuing on console only");
    }

    spdlog::info("==============================================");
    spdlog::info("  {} {}", config.app.name, config.app.version);
    spdlog::info("==============================================");
    spdlog::info("Configuration: {}", configPath.string());

    try {
        beacon::service::ProcessState state(config.cache.shardCount);

        IoRunner io;

        std::unique_ptr<beacon::maintenance::MaintenanceScheduler> scheduler;
        if (config.cache.backend() ==
            beacon::config::MaintenanceBackend::Asio) {
            scheduler = std::make_unique<
                beacon::maintenance::AsioMaintenanceScheduler>(state.cache(),
                                                               io.context);
            io.run();
        } else {
            scheduler = std::make_unique<
                beacon::maintenance::ThreadMaintenanceScheduler>(state.cache());
        }
        scheduler->start(
            std::chrono::seconds(config.cache.sweepIntervalSeconds),
            config.cache.maxAgeSeconds);
        state.attachScheduler(scheduler.get());

        beacon::stats::CpuMonitor cpuMonitor;
        if (!cpuMonitor.start()) {
            spdlog::warn("CPU monitor did not start");
        }
        state.attachCpuMonitor(&cpuMonitor);

        beacon::reload::ReloadCoordinator coordinator(
            configPath, config, beacon::server::HttpServer::factory(state));
        coordinator.onConfigChanged(
            [initial = config.cache](
                const beacon::config::ServiceConfig& next) {
                if (next.cache != initial) {
                    spdlog::warn(
                        "Cache settings changed; they take effect after a "
                        "restart");
                }
            });

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        coordinator.start();
        spdlog::info("Press Ctrl+C to stop the server");

        while (g_shutdownRequested == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        spdlog::warn("Received signal {}, initiating graceful shutdown...",
                     static_cast<int>(g_shutdownRequested));

        state.attachScheduler(nullptr);
        state.attachCpuMonitor(nullptr);
        coordinator.stop();
        scheduler->stop();
        cpuMonitor.stop();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        beacon::logging::shutdown();
        return 1;
    }

    spdlog::info("Server shutdown complete");
    beacon::logging::shutdown();
    return 0;
}
