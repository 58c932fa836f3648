/*
 * device_state.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "device_state.hpp"

namespace beacon::cache {

json DeviceState::toJson() const {
    json j = {{"device_id", device_id},
              {"ip", ip},
              {"last_port", nullptr},
              {"last_seen", last_seen},
              {"heartbeat_count", heartbeat_count}};
    if (last_port) {
        j["last_port"] = *last_port;
    }
    return j;
}

}  // namespace beacon::cache
