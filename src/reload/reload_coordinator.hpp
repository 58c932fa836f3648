/*
 * reload_coordinator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-01

Description: Rebuilds the serving component when the config file changes

**************************************************/

#ifndef BEACON_RELOAD_RELOAD_COORDINATOR_HPP
#define BEACON_RELOAD_RELOAD_COORDINATOR_HPP

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "config/components/watcher.hpp"
#include "config/service_config.hpp"
#include "serving_component.hpp"

namespace beacon::reload {

/**
 * @brief Watches the configuration file and swaps the serving component
 *
 * A reload loads and validates the file first. If that fails the running
 * component is kept and the error is recorded; the next change retries.
 * Otherwise listeners are notified, the old component is stopped, and a new
 * one is built from the new configuration and started. The log level follows
 * the new configuration. Shared state such as the device cache lives outside
 * the component and survives every reload.
 */
class ReloadCoordinator {
public:
    using ConfigListener = std::function<void(const config::ServiceConfig&)>;

    ReloadCoordinator(std::filesystem::path config_path,
                      config::ServiceConfig initial, ServingFactory factory);
    ~ReloadCoordinator();

    ReloadCoordinator(const ReloadCoordinator&) = delete;
    ReloadCoordinator& operator=(const ReloadCoordinator&) = delete;

    /**
     * @brief Start serving with the initial configuration and, when enabled,
     * begin watching the file
     * @throws ReloadError if the first component cannot be built or started
     */
    void start();

    /**
     * @brief Stop watching, then stop the serving component. Idempotent.
     */
    void stop();

    /**
     * @brief Run one reload cycle now
     * @return true if the new configuration is being served
     */
    bool reloadNow();

    /**
     * @brief Subscribe to successfully loaded configurations
     *
     * Listeners run before the old component is stopped, on the thread
     * performing the reload.
     */
    void onConfigChanged(ConfigListener listener);

    [[nodiscard]] config::ServiceConfig currentConfig() const;

    [[nodiscard]] bool isServing() const;

    [[nodiscard]] bool isWatching() const;

    [[nodiscard]] std::uint64_t reloadCount() const noexcept {
        return reloadCount_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t failedReloadCount() const noexcept {
        return failedReloadCount_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::optional<std::string> lastError() const;

private:
    /**
     * @throws ReloadError
     */
    void applyReload();

    [[nodiscard]] std::unique_ptr<ServingComponent> buildAndStart(
        const config::ServiceConfig& config);

    void onFileEvent(const std::filesystem::path& path,
                     config::FileEvent event);

    const std::filesystem::path configPath_;
    ServingFactory factory_;

    std::mutex reloadMutex_;  ///< Serialises reload cycles and start/stop

    mutable std::mutex stateMutex_;
    config::ServiceConfig config_;
    std::unique_ptr<ServingComponent> component_;
    std::vector<ConfigListener> listeners_;
    std::optional<std::string> lastError_;

    std::unique_ptr<config::ConfigWatcher> watcher_;

    std::atomic<bool> active_{false};  ///< Between start() and stop()
    std::atomic<std::uint64_t> reloadCount_{0};
    std::atomic<std::uint64_t> failedReloadCount_{0};

    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace beacon::reload

#endif  // BEACON_RELOAD_RELOAD_COORDINATOR_HPP
