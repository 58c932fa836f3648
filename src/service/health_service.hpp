/*
 * health_service.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-01

Description: Health and statistics reports

**************************************************/

#ifndef BEACON_SERVICE_HEALTH_SERVICE_HPP
#define BEACON_SERVICE_HEALTH_SERVICE_HPP

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "config/service_config.hpp"
#include "process_state.hpp"

namespace beacon::service {

using json = nlohmann::json;

/**
 * @brief Client details reported back by the health endpoint
 */
struct HealthRequest {
    std::string client;
    std::optional<std::string> user_agent;
    std::size_t headers_count{0};
};

class HealthService {
public:
    explicit HealthService(ProcessState& state);

    /**
     * @brief Count a health check and describe the service
     */
    json process(const HealthRequest& request, const config::AppConfig& app);

    /**
     * @brief Full statistics report: counters, cache, latencies, maintenance, CPU
     */
    [[nodiscard]] json statistics(const config::ServiceConfig& config) const;

    /**
     * @brief Zero the latency counters and return what they held
     */
    json resetStatistics();

private:
    ProcessState& state_;
};

}  // namespace beacon::service

#endif  // BEACON_SERVICE_HEALTH_SERVICE_HPP
