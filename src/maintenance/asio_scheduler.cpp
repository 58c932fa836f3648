/*
 * asio_scheduler.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "asio_scheduler.hpp"

#include <mutex>

namespace beacon::maintenance {

// Shared with pending handlers so a cancelled wait never touches a dead
// scheduler.
struct AsioMaintenanceScheduler::LoopState {
    LoopState(boost::asio::io_context& io_context, Interval period)
        : timer(io_context), interval(period) {}

    boost::asio::steady_timer timer;
    Interval interval;
    std::mutex mutex;
    bool stopped{false};
};

AsioMaintenanceScheduler::AsioMaintenanceScheduler(
    cache::DeviceCacheManager& manager, boost::asio::io_context& io_context)
    : MaintenanceScheduler(manager, "asio"), ioContext_(io_context) {}

AsioMaintenanceScheduler::~AsioMaintenanceScheduler() { stop(); }

void AsioMaintenanceScheduler::launch(Interval interval) {
    state_ = std::make_shared<LoopState>(ioContext_, interval);
    boost::asio::post(ioContext_, [this, state = state_] {
        std::lock_guard lock(state->mutex);
        if (!state->stopped) {
            scheduleTick(state);
        }
    });
}

void AsioMaintenanceScheduler::scheduleTick(
    const std::shared_ptr<LoopState>& state) {
    state->timer.expires_after(state->interval);
    state->timer.async_wait(
        [this, state](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            std::lock_guard lock(state->mutex);
            if (state->stopped) {
                return;
            }
            runSweep();
            scheduleTick(state);
        });
}

void AsioMaintenanceScheduler::halt() {
    if (!state_) {
        return;
    }
    {
        // Waits out a sweep that is already running
        std::lock_guard lock(state_->mutex);
        state_->stopped = true;
    }
    boost::asio::post(ioContext_, [state = state_] { state->timer.cancel(); });
    state_.reset();
}

}  // namespace beacon::maintenance
