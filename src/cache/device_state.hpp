/*
 * device_state.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Per-device record held by the device cache

**************************************************/

#ifndef BEACON_CACHE_DEVICE_STATE_HPP
#define BEACON_CACHE_DEVICE_STATE_HPP

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace beacon::cache {

using json = nlohmann::json;

/**
 * @brief Live state of one device
 */
struct DeviceState {
    std::string device_id;               ///< Caller assigned label, not unique
    std::string ip;                      ///< Last reported address
    std::optional<std::int32_t> last_port;  ///< Last reported port, if any
    std::int64_t last_seen{0};           ///< Unix time of last update (s)
    std::uint64_t heartbeat_count{0};    ///< Heartbeats after the first one

    /**
     * @brief Seconds elapsed between last_seen and @p now
     */
    [[nodiscard]] std::int64_t ageAt(std::int64_t now) const noexcept {
        return now - last_seen;
    }

    [[nodiscard]] json toJson() const;

    friend bool operator==(const DeviceState&, const DeviceState&) = default;
};

}  // namespace beacon::cache

#endif  // BEACON_CACHE_DEVICE_STATE_HPP
