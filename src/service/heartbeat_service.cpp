/*
 * heartbeat_service.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "heartbeat_service.hpp"

#include <spdlog/spdlog.h>

#include "cache/hardware_address.hpp"
#include "core/exception.hpp"
#include "timestamp.hpp"

namespace beacon::service {

HeartbeatService::HeartbeatService(ProcessState& state) : state_(state) {}

void HeartbeatService::validate(const HeartbeatRequest& request) {
    if (request.id <= 0) {
        THROW_VALIDATION_ERROR("Invalid device ID: " +
                               std::to_string(request.id));
    }
    if (request.mac.empty()) {
        THROW_VALIDATION_ERROR("MAC address cannot be empty");
    }
    if (request.mac.size() > cache::HardwareAddress::TEXT_LENGTH) {
        THROW_VALIDATION_ERROR("MAC address too long: " + request.mac);
    }
    if (request.ip.empty()) {
        THROW_VALIDATION_ERROR("IP address cannot be empty");
    }
}

std::optional<std::string> HeartbeatService::timestampToIso(
    std::optional<std::int64_t> ts) {
    if (!ts) {
        return std::nullopt;
    }
    if (*ts < MIN_TIMESTAMP || *ts > MAX_TIMESTAMP) {
        THROW_VALIDATION_ERROR("Timestamp out of range: " +
                               std::to_string(*ts));
    }
    return formatRfc3339(*ts);
}

json HeartbeatService::process(const HeartbeatRequest& request,
                               std::string_view client) {
    validate(request);
    const auto timestampIso = timestampToIso(request.ts);

    const auto device = state_.cache().addOrUpdate(
        std::to_string(request.id), request.mac, request.ip, request.lp);
    const auto count = state_.recordHeartbeat();

    spdlog::info("HBD processed for client {}: count={}", client, count);

    json received = {{"id", request.id},
                     {"mac", request.mac},
                     {"ip", request.ip},
                     {"lp", nullptr},
                     {"timestamp", nullptr},
                     {"timestamp_iso", nullptr}};
    if (request.lp) {
        received["lp"] = *request.lp;
    }
    if (request.ts) {
        received["timestamp"] = *request.ts;
        received["timestamp_iso"] = *timestampIso;
    }

    return {{"status", "success"},
            {"message", "Heartbeat data received and processed"},
            {"received_data", std::move(received)},
            {"device_heartbeats", device.heartbeat_count},
            {"processed_at", nowRfc3339()}};
}

}  // namespace beacon::service
