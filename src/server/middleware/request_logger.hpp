/*
 * request_logger.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BEACON_SERVER_MIDDLEWARE_REQUEST_LOGGER_HPP
#define BEACON_SERVER_MIDDLEWARE_REQUEST_LOGGER_HPP

#include <crow.h>
#include <chrono>
#include <memory>

#include <spdlog/spdlog.h>

#include "service/endpoint_category.hpp"
#include "stats/operation_counters.hpp"

namespace beacon::server::middleware {

/**
 * @brief Logs every request and records its latency per endpoint
 *
 * counters must be set before the app starts serving.
 */
struct RequestLogger {
    struct context {
        std::chrono::steady_clock::time_point start_time;
    };

    stats::OperationCounters* counters{nullptr};
    std::shared_ptr<spdlog::logger> logger{spdlog::default_logger()};

    void before_handle(crow::request& req, crow::response& /*res*/,
                       context& ctx) {
        ctx.start_time = std::chrono::steady_clock::now();
        logger->debug("Incoming request: {} {} from {}",
                      crow::method_name(req.method), req.url,
                      req.remote_ip_address);
    }

    void after_handle(crow::request& req, crow::response& res, context& ctx) {
        const auto elapsed = std::chrono::steady_clock::now() - ctx.start_time;
        if (counters != nullptr) {
            counters->record(service::endpointCategory(
                                 crow::method_name(req.method), req.url),
                             std::chrono::duration_cast<stats::Duration>(
                                 elapsed));
        }
        logger->info(
            "Request completed: {} {} - Status: {} - Duration: {:.2f}ms",
            crow::method_name(req.method), req.url, res.code,
            std::chrono::duration<double, std::milli>(elapsed).count());
    }
};

}  // namespace beacon::server::middleware

#endif  // BEACON_SERVER_MIDDLEWARE_REQUEST_LOGGER_HPP
