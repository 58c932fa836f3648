/*
 * maintenance_scheduler.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-29

Description: Periodic stale-entry sweep over the device cache

**************************************************/

#ifndef BEACON_MAINTENANCE_MAINTENANCE_SCHEDULER_HPP
#define BEACON_MAINTENANCE_MAINTENANCE_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "cache/device_cache_manager.hpp"

namespace beacon::maintenance {

using json = nlohmann::json;

/**
 * @brief Scheduler lifecycle; Stopped is terminal
 */
enum class SchedulerState { Idle, Running, Stopped };

[[nodiscard]] std::string_view toString(SchedulerState state) noexcept;

/**
 * @brief Counters describing the sweeps run so far
 */
struct SweepStatistics {
    std::uint64_t sweeps_run{0};
    std::uint64_t failures{0};
    std::uint64_t total_removed{0};
    std::uint64_t last_removed{0};

    [[nodiscard]] json toJson() const {
        return {{"sweeps_run", sweeps_run},
                {"failures", failures},
                {"total_removed", total_removed},
                {"last_removed", last_removed}};
    }
};

/**
 * @brief Removes stale entries from a DeviceCacheManager on a fixed period
 *
 * Each iteration waits one interval, then evicts every entry the eviction
 * predicate selects. A failing sweep is logged and counted; the loop keeps
 * running. Drivers differ only in how they wait.
 *
 * The scheduler must be stopped before the manager it sweeps is destroyed.
 */
class MaintenanceScheduler {
public:
    using EvictPredicate = cache::DeviceCacheManager::Predicate;
    using Interval = std::chrono::milliseconds;

    MaintenanceScheduler(cache::DeviceCacheManager& manager, std::string name);
    virtual ~MaintenanceScheduler() = default;

    MaintenanceScheduler(const MaintenanceScheduler&) = delete;
    MaintenanceScheduler& operator=(const MaintenanceScheduler&) = delete;

    /**
     * @brief Evict entries whose age exceeds @p max_age_seconds
     * @return false unless the scheduler was Idle
     */
    bool start(Interval interval, std::int64_t max_age_seconds);

    /**
     * @brief Evict entries selected by @p predicate
     * @return false unless the scheduler was Idle
     */
    bool start(Interval interval, EvictPredicate predicate);

    /**
     * @brief Request shutdown and wait for the loop to finish. Idempotent.
     */
    void stop();

    /**
     * @brief Run one sweep on the calling thread
     * @return Number of entries removed
     * @throws MaintenanceSweepError if the sweep fails or no eviction policy
     * has been set by start()
     */
    std::size_t sweepOnce();

    [[nodiscard]] SchedulerState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool isRunning() const noexcept {
        return state() == SchedulerState::Running;
    }

    [[nodiscard]] SweepStatistics statistics() const;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

protected:
    /**
     * @brief Begin the periodic loop; called once on Idle -> Running
     */
    virtual void launch(Interval interval) = 0;

    /**
     * @brief Wake and join the loop; called once on Running -> Stopped
     */
    virtual void halt() = 0;

    /**
     * @brief Sweep with failures contained, for use by the loop
     */
    void runSweep() noexcept;

    std::shared_ptr<spdlog::logger> logger_;

private:
    cache::DeviceCacheManager& manager_;
    std::string name_;
    std::atomic<SchedulerState> state_{SchedulerState::Idle};
    std::mutex lifecycleMutex_;

    mutable std::mutex policyMutex_;
    std::optional<std::int64_t> maxAgeSeconds_;
    EvictPredicate predicate_;

    std::atomic<std::uint64_t> sweepsRun_{0};
    std::atomic<std::uint64_t> failures_{0};
    std::atomic<std::uint64_t> totalRemoved_{0};
    std::atomic<std::uint64_t> lastRemoved_{0};
};

}  // namespace beacon::maintenance

#endif  // BEACON_MAINTENANCE_MAINTENANCE_SCHEDULER_HPP
