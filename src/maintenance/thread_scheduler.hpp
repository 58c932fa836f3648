/*
 * thread_scheduler.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-29

Description: Maintenance driver on a dedicated thread

**************************************************/

#ifndef BEACON_MAINTENANCE_THREAD_SCHEDULER_HPP
#define BEACON_MAINTENANCE_THREAD_SCHEDULER_HPP

#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <thread>

#include "maintenance_scheduler.hpp"

namespace beacon::maintenance {

/**
 * @brief Sweeps from a std::jthread that sleeps on its stop token
 *
 * stop() wakes the sleeper immediately.
 */
class ThreadMaintenanceScheduler final : public MaintenanceScheduler {
public:
    explicit ThreadMaintenanceScheduler(cache::DeviceCacheManager& manager);
    ~ThreadMaintenanceScheduler() override;

protected:
    void launch(Interval interval) override;
    void halt() override;

private:
    void loop(std::stop_token token, Interval interval);

    std::mutex waitMutex_;
    std::condition_variable_any wakeup_;
    std::jthread worker_;
};

}  // namespace beacon::maintenance

#endif  // BEACON_MAINTENANCE_THREAD_SCHEDULER_HPP
