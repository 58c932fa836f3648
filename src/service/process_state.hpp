/*
 * process_state.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-01

Description: State that outlives every serving component

**************************************************/

#ifndef BEACON_SERVICE_PROCESS_STATE_HPP
#define BEACON_SERVICE_PROCESS_STATE_HPP

#include <atomic>
#include <cstdint>

#include "cache/device_cache_manager.hpp"
#include "maintenance/maintenance_scheduler.hpp"
#include "stats/cpu_monitor.hpp"
#include "stats/operation_counters.hpp"

namespace beacon::service {

/**
 * @brief The device cache, metrics and request counters for the process
 *
 * Built once in main and shared by reference with each HTTP server
 * instance, so a configuration reload never loses cached devices or
 * counters.
 */
class ProcessState {
public:
    explicit ProcessState(
        std::size_t shard_count = cache::CacheStore::DEFAULT_SHARD_COUNT,
        cache::DeviceCacheManager::Clock clock = {})
        : cache_(shard_count, &metrics_.queries, std::move(clock)) {}

    ProcessState(const ProcessState&) = delete;
    ProcessState& operator=(const ProcessState&) = delete;

    [[nodiscard]] cache::DeviceCacheManager& cache() noexcept {
        return cache_;
    }
    [[nodiscard]] const cache::DeviceCacheManager& cache() const noexcept {
        return cache_;
    }

    [[nodiscard]] stats::ServiceMetrics& metrics() noexcept {
        return metrics_;
    }

    /// @return Count including this call
    std::uint64_t recordHealthCheck() noexcept {
        return healthChecks_.fetch_add(1, std::memory_order_relaxed) + 1;
    }

    /// @return Count including this call
    std::uint64_t recordHeartbeat() noexcept {
        return heartbeats_.fetch_add(1, std::memory_order_relaxed) + 1;
    }

    [[nodiscard]] std::uint64_t healthChecks() const noexcept {
        return healthChecks_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t heartbeats() const noexcept {
        return heartbeats_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Scheduler whose statistics are reported; may be null
     */
    void attachScheduler(
        const maintenance::MaintenanceScheduler* scheduler) noexcept {
        scheduler_.store(scheduler, std::memory_order_release);
    }

    [[nodiscard]] const maintenance::MaintenanceScheduler* scheduler()
        const noexcept {
        return scheduler_.load(std::memory_order_acquire);
    }

    /**
     * @brief CPU sampler whose usage is reported; may be null
     */
    void attachCpuMonitor(const stats::CpuMonitor* monitor) noexcept {
        cpuMonitor_.store(monitor, std::memory_order_release);
    }

    [[nodiscard]] const stats::CpuMonitor* cpuMonitor() const noexcept {
        return cpuMonitor_.load(std::memory_order_acquire);
    }

private:
    stats::ServiceMetrics metrics_;
    cache::DeviceCacheManager cache_;
    std::atomic<std::uint64_t> healthChecks_{0};
    std::atomic<std::uint64_t> heartbeats_{0};
    std::atomic<const maintenance::MaintenanceScheduler*> scheduler_{nullptr};
    std::atomic<const stats::CpuMonitor*> cpuMonitor_{nullptr};
};

}  // namespace beacon::service

#endif  // BEACON_SERVICE_PROCESS_STATE_HPP
