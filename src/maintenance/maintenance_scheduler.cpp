/*
 * maintenance_scheduler.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "maintenance_scheduler.hpp"

#include "core/exception.hpp"

namespace beacon::maintenance {

std::string_view toString(SchedulerState state) noexcept {
    switch (state) {
        case SchedulerState::Idle:
            return "idle";
        case SchedulerState::Running:
            return "running";
        case SchedulerState::Stopped:
            return "stopped";
    }
    return "unknown";
}

MaintenanceScheduler::MaintenanceScheduler(cache::DeviceCacheManager& manager,
                                           std::string name)
    : manager_(manager), name_(std::move(name)) {
    logger_ = spdlog::get("maintenance");
    if (!logger_) {
        logger_ = spdlog::default_logger();
    }
}

bool MaintenanceScheduler::start(Interval interval,
                                 std::int64_t max_age_seconds) {
    std::lock_guard lock(lifecycleMutex_);
    if (state() != SchedulerState::Idle) {
        logger_->warn("{} scheduler start ignored in state {}", name_,
                      toString(state()));
        return false;
    }
    {
        std::lock_guard policyLock(policyMutex_);
        maxAgeSeconds_ = max_age_seconds;
        predicate_ = nullptr;
    }
    launch(interval);
    state_.store(SchedulerState::Running, std::memory_order_release);
    logger_->info("{} scheduler started: every {}ms, max age {}s", name_,
                  interval.count(), max_age_seconds);
    return true;
}

bool MaintenanceScheduler::start(Interval interval, EvictPredicate predicate) {
    std::lock_guard lock(lifecycleMutex_);
    if (state() != SchedulerState::Idle) {
        logger_->warn("{} scheduler start ignored in state {}", name_,
                      toString(state()));
        return false;
    }
    {
        std::lock_guard policyLock(policyMutex_);
        maxAgeSeconds_.reset();
        predicate_ = std::move(predicate);
    }
    launch(interval);
    state_.store(SchedulerState::Running, std::memory_order_release);
    logger_->info("{} scheduler started: every {}ms, custom predicate", name_,
                  interval.count());
    return true;
}

void MaintenanceScheduler::stop() {
    std::lock_guard lock(lifecycleMutex_);
    const auto previous =
        state_.exchange(SchedulerState::Stopped, std::memory_order_acq_rel);
    if (previous == SchedulerState::Running) {
        halt();
        logger_->info("{} scheduler stopped after {} sweeps", name_,
                      sweepsRun_.load(std::memory_order_relaxed));
    }
}

std::size_t MaintenanceScheduler::sweepOnce() {
    std::optional<std::int64_t> maxAge;
    EvictPredicate predicate;
    {
        std::lock_guard lock(policyMutex_);
        maxAge = maxAgeSeconds_;
        predicate = predicate_;
    }

    if (!maxAge && !predicate) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        THROW_MAINTENANCE_SWEEP_ERROR("No eviction policy configured for " +
                                      name_);
    }

    std::size_t removed = 0;
    try {
        removed = maxAge ? manager_.removeOlderThan(*maxAge)
                         : manager_.removeMatching(predicate);
    } catch (const std::exception& e) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        THROW_MAINTENANCE_SWEEP_ERROR("Sweep failed in " + name_ + ": " +
                                      e.what());
    } catch (...) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        THROW_MAINTENANCE_SWEEP_ERROR("Sweep failed in " + name_ +
                                      ": unknown exception");
    }

    sweepsRun_.fetch_add(1, std::memory_order_relaxed);
    totalRemoved_.fetch_add(removed, std::memory_order_relaxed);
    lastRemoved_.store(removed, std::memory_order_relaxed);
    if (removed > 0) {
        logger_->info("{} sweep removed {} stale entries", name_, removed);
    } else {
        logger_->debug("{} sweep removed nothing", name_);
    }
    return removed;
}

void MaintenanceScheduler::runSweep() noexcept {
    try {
        sweepOnce();
    } catch (const MaintenanceSweepError& e) {
        logger_->error("{}", e.what());
    } catch (const std::exception& e) {
        logger_->error("{} sweep aborted: {}", name_, e.what());
    } catch (...) {
        logger_->error("{} sweep aborted: unknown exception", name_);
    }
}

SweepStatistics MaintenanceScheduler::statistics() const {
    SweepStatistics stats;
    stats.sweeps_run = sweepsRun_.load(std::memory_order_relaxed);
    stats.failures = failures_.load(std::memory_order_relaxed);
    stats.total_removed = totalRemoved_.load(std::memory_order_relaxed);
    stats.last_removed = lastRemoved_.load(std::memory_order_relaxed);
    return stats;
}

}  // namespace beacon::maintenance
