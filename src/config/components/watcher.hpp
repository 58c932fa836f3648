/*
 * watcher.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Configuration File Watcher Component

**************************************************/

#ifndef BEACON_CONFIG_COMPONENTS_WATCHER_HPP
#define BEACON_CONFIG_COMPONENTS_WATCHER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

namespace beacon::config {

/**
 * @brief Kind of change observed on a watched file
 */
enum class FileEvent {
    CREATED,   ///< File appeared after being absent
    MODIFIED,  ///< Modification time or size changed
    DELETED    ///< File disappeared
};

using FileChangeCallback =
    std::function<void(const std::filesystem::path&, FileEvent)>;

/**
 * @brief Polls watched files and reports changes after a quiet period
 *
 * Debouncing is trailing: each detected change restarts the window and the
 * callback fires once the file has been unchanged for debounce_delay. A burst
 * of writes therefore yields one event carrying the latest kind of change.
 *
 * Callbacks run on the watcher thread without any watcher lock held.
 * Exceptions escaping a callback are logged and counted.
 */
class ConfigWatcher {
public:
    struct WatcherOptions {
        std::chrono::milliseconds poll_interval{100};
        std::chrono::milliseconds debounce_delay{250};
    };

    struct Statistics {
        std::size_t watched_paths_count{0};
        std::uint64_t changes_detected{0};  ///< Raw changes seen by polling
        std::uint64_t events_debounced{0};  ///< Changes folded into another
        std::uint64_t events_delivered{0};  ///< Callbacks invoked
        std::uint64_t callback_errors{0};
    };

    explicit ConfigWatcher() : ConfigWatcher(WatcherOptions{}) {}
    explicit ConfigWatcher(const WatcherOptions& options);
    ~ConfigWatcher();

    ConfigWatcher(const ConfigWatcher&) = delete;
    ConfigWatcher& operator=(const ConfigWatcher&) = delete;

    /**
     * @brief Watch an existing regular file
     * @return false if the file is missing, a directory, or callback is null
     */
    [[nodiscard]] bool watchFile(const std::filesystem::path& file_path,
                                 FileChangeCallback callback);

    bool stopWatching(const std::filesystem::path& path);

    [[nodiscard]] bool isWatching(const std::filesystem::path& path) const;

    [[nodiscard]] std::vector<std::filesystem::path> getWatchedPaths() const;

    /**
     * @brief Start the polling thread
     * @return false if already running
     */
    bool startWatching();

    /**
     * @brief Stop and join the polling thread. Idempotent.
     */
    void stop();

    [[nodiscard]] bool isRunning() const noexcept;

    [[nodiscard]] const WatcherOptions& getOptions() const noexcept {
        return options_;
    }

    [[nodiscard]] Statistics getStatistics() const;

    void resetStatistics();

    /**
     * @brief Run one poll pass on the calling thread
     */
    void forceCheck();

    /**
     * @brief Files with a change waiting out the debounce window
     */
    [[nodiscard]] std::size_t getPendingEventCount() const;

private:
    using TimePoint = std::chrono::steady_clock::time_point;

    struct WatchedPath {
        std::filesystem::path path;
        FileChangeCallback callback;
        bool exists{false};
        std::filesystem::file_time_type last_write_time{};
        std::uintmax_t last_size{0};
        std::optional<TimePoint> pending_since;  ///< Last change not yet fired
        FileEvent pending_event{FileEvent::MODIFIED};

        WatchedPath(std::filesystem::path p, FileChangeCallback cb);
    };

    struct DueEvent {
        std::filesystem::path path;
        FileEvent event;
        FileChangeCallback callback;
    };

    void watchLoop(std::stop_token token);
    void pollOnce();
    void checkPath(WatchedPath& watched_path, TimePoint now);
    void triggerEvent(const DueEvent& due);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, WatchedPath> watched_paths_;
    WatcherOptions options_;
    Statistics stats_;

    std::mutex wait_mutex_;
    std::condition_variable_any wakeup_;
    std::jthread watch_thread_;

    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace beacon::config

#endif  // BEACON_CONFIG_COMPONENTS_WATCHER_HPP
