/*
 * heartbeat_service.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-01

Description: Heartbeat validation and cache ingestion

**************************************************/

#ifndef BEACON_SERVICE_HEARTBEAT_SERVICE_HPP
#define BEACON_SERVICE_HEARTBEAT_SERVICE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "process_state.hpp"

namespace beacon::service {

using json = nlohmann::json;

/**
 * @brief Parameters of one device heartbeat
 */
struct HeartbeatRequest {
    std::int32_t id{0};
    std::string mac;
    std::string ip;
    std::optional<std::int32_t> lp;  ///< Last port
    std::optional<std::int64_t> ts;  ///< Device clock, Unix seconds
};

class HeartbeatService {
public:
    /// 2000-01-01T00:00:00Z
    static constexpr std::int64_t MIN_TIMESTAMP = 946684800;
    /// 2100-01-01T00:00:00Z
    static constexpr std::int64_t MAX_TIMESTAMP = 4102444800;

    explicit HeartbeatService(ProcessState& state);

    /**
     * @brief Validate @p request and record the heartbeat in the cache
     *
     * The cached last_seen is the server's receive time; the device's ts is
     * only echoed back.
     *
     * @throws ValidationError (MalformedAddressError for a bad mac)
     */
    json process(const HeartbeatRequest& request, std::string_view client);

    /**
     * @throws ValidationError on the first rule @p request breaks
     */
    static void validate(const HeartbeatRequest& request);

    /**
     * @brief RFC 3339 form of @p ts, empty when absent
     * @throws ValidationError if @p ts is outside [MIN_TIMESTAMP, MAX_TIMESTAMP]
     */
    [[nodiscard]] static std::optional<std::string> timestampToIso(
        std::optional<std::int64_t> ts);

private:
    ProcessState& state_;
};

}  // namespace beacon::service

#endif  // BEACON_SERVICE_HEARTBEAT_SERVICE_HPP
