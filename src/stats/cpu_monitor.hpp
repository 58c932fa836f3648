/*
 * cpu_monitor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-03

Description: Background sampler for system-wide CPU usage

**************************************************/

#ifndef BEACON_STATS_CPU_MONITOR_HPP
#define BEACON_STATS_CPU_MONITOR_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string_view>
#include <thread>

#include <spdlog/spdlog.h>

namespace beacon::stats {

/**
 * @brief Cumulative jiffies from the aggregate "cpu" line of /proc/stat
 */
struct CpuTimes {
    std::uint64_t busy{0};
    std::uint64_t total{0};
};

/**
 * @brief Samples /proc/stat on a std::jthread and caches the usage
 *
 * Readers never touch the file; usagePercent() is a single atomic load.
 * Usage is the busy share of the jiffies elapsed between two samples,
 * averaged over all cores, and stays 0 until two samples exist.
 */
class CpuMonitor {
public:
    static constexpr std::chrono::milliseconds DEFAULT_INTERVAL{2000};

    explicit CpuMonitor(std::filesystem::path stat_path = "/proc/stat");
    ~CpuMonitor();

    CpuMonitor(const CpuMonitor&) = delete;
    CpuMonitor& operator=(const CpuMonitor&) = delete;

    /**
     * @brief Take a first sample and keep sampling every interval
     * @return false if already running
     */
    bool start(std::chrono::milliseconds interval = DEFAULT_INTERVAL);

    /**
     * @brief Stop sampling; the last value stays readable
     */
    void stop();

    [[nodiscard]] bool isRunning() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    /**
     * @brief Read the stat file once and update the cached usage
     * @return false if the file is missing or has no aggregate cpu line
     */
    bool sampleOnce();

    /**
     * @brief Cached usage in percent, two decimal places
     */
    [[nodiscard]] double usagePercent() const noexcept {
        return static_cast<double>(
                   usageHundredths_.load(std::memory_order_relaxed)) /
               100.0;
    }

    [[nodiscard]] static std::optional<CpuTimes> parseStatLine(
        std::string_view line);

    [[nodiscard]] static double usageBetween(const CpuTimes& previous,
                                             const CpuTimes& current) noexcept;

private:
    void loop(std::stop_token token, std::chrono::milliseconds interval);

    std::filesystem::path statPath_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex sampleMutex_;
    std::optional<CpuTimes> previous_;
    std::atomic<std::uint64_t> usageHundredths_{0};

    std::atomic<bool> running_{false};
    std::mutex waitMutex_;
    std::condition_variable_any wakeup_;
    std::jthread worker_;
};

}  // namespace beacon::stats

#endif  // BEACON_STATS_CPU_MONITOR_HPP
