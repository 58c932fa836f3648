/*
 * asio_scheduler.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-29

Description: Maintenance driver as a timer task on a Boost.Asio io_context

**************************************************/

#ifndef BEACON_MAINTENANCE_ASIO_SCHEDULER_HPP
#define BEACON_MAINTENANCE_ASIO_SCHEDULER_HPP

#include <memory>
#include <utility>

#include <boost/asio.hpp>

#include "maintenance_scheduler.hpp"

namespace beacon::maintenance {

/**
 * @brief Sweeps from steady_timer callbacks on a caller-owned io_context
 *
 * Sweeps run on whichever thread runs the io_context. stop() cancels the
 * pending wait and returns once no sweep is in progress; it must not be
 * called from inside a sweep. The io_context must outlive the scheduler.
 */
class AsioMaintenanceScheduler final : public MaintenanceScheduler {
public:
    AsioMaintenanceScheduler(cache::DeviceCacheManager& manager,
                             boost::asio::io_context& io_context);
    ~AsioMaintenanceScheduler() override;

protected:
    void launch(Interval interval) override;
    void halt() override;

private:
    struct LoopState;

    void scheduleTick(const std::shared_ptr<LoopState>& state);

    boost::asio::io_context& ioContext_;
    std::shared_ptr<LoopState> state_;
};

}  // namespace beacon::maintenance

#endif  // BEACON_MAINTENANCE_ASIO_SCHEDULER_HPP
