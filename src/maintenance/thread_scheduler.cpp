/*
 * thread_scheduler.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "thread_scheduler.hpp"

namespace beacon::maintenance {

ThreadMaintenanceScheduler::ThreadMaintenanceScheduler(
    cache::DeviceCacheManager& manager)
    : MaintenanceScheduler(manager, "thread") {}

ThreadMaintenanceScheduler::~ThreadMaintenanceScheduler() { stop(); }

void ThreadMaintenanceScheduler::launch(Interval interval) {
    worker_ = std::jthread([this, interval](std::stop_token token) {
        loop(std::move(token), interval);
    });
}

void ThreadMaintenanceScheduler::halt() {
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
}

void ThreadMaintenanceScheduler::loop(std::stop_token token,
                                      Interval interval) {
    logger_->debug("Maintenance thread running");
    while (!token.stop_requested()) {
        {
            std::unique_lock lock(waitMutex_);
            if (wakeup_.wait_for(lock, token, interval, [&token] {
                    return token.stop_requested();
                })) {
                break;
            }
        }
        runSweep();
    }
    logger_->debug("Maintenance thread exiting");
}

}  // namespace beacon::maintenance
