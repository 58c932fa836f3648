/*
 * health_service.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "health_service.hpp"

#include <spdlog/spdlog.h>

#include "timestamp.hpp"

namespace beacon::service {

HealthService::HealthService(ProcessState& state) : state_(state) {}

json HealthService::process(const HealthRequest& request,
                            const config::AppConfig& app) {
    const auto count = state_.recordHealthCheck();
    spdlog::debug("Health check #{} from {} ({} headers)", count,
                  request.client, request.headers_count);

    json response = {{"status", "healthy"},
                     {"timestamp", nowRfc3339()},
                     {"service_name", app.name},
                     {"version", app.version},
                     {"health_count", count},
                     {"heartbeat_count", state_.heartbeats()},
                     {"user_agent", nullptr},
                     {"headers_count", request.headers_count},
                     {"cache_size", state_.cache().size()}};
    if (request.user_agent) {
        response["user_agent"] = *request.user_agent;
    }
    return response;
}

json HealthService::statistics(const config::ServiceConfig& config) const {
    auto& metrics = state_.metrics();
    const auto endpoints = metrics.endpoints.snapshot();
    const auto queries = metrics.queries.snapshot();
    const auto endpointTotal = metrics.endpoints.aggregate();
    const auto queryTotal = metrics.queries.aggregate();

    json report = {
        {"timestamp", nowRfc3339()},
        {"service", {{"name", config.app.name}, {"version", config.app.version}}},
        {"request_counters",
         {{"health_checks", state_.healthChecks()},
          {"heartbeats", state_.heartbeats()}}},
        {"cache",
         state_.cache().stats(config.cache.staleThresholdSeconds).toJson()},
        {"performance_metrics",
         {{"web_endpoints", stats::OperationCounters::toJson(endpoints)},
          {"cache_queries", stats::OperationCounters::toJson(queries)},
          {"aggregated",
           {{"web_requests", endpointTotal.toJson()},
            {"cache_queries", queryTotal.toJson()}}}}},
        {"analysis",
         {{"total_operations",
           endpointTotal.invocations + queryTotal.invocations},
          {"tracked_endpoints", metrics.endpoints.categories()},
          {"tracked_queries", metrics.queries.categories()}}}};

    if (const auto* scheduler = state_.scheduler()) {
        report["maintenance"] = {
            {"backend", scheduler->name()},
            {"state", std::string(maintenance::toString(scheduler->state()))},
            {"sweeps", scheduler->statistics().toJson()}};
    }
    if (const auto* monitor = state_.cpuMonitor()) {
        report["system_metrics"] = {
            {"cpu_usage_percent", monitor->usagePercent()}};
    }
    return report;
}

json HealthService::resetStatistics() {
    auto& metrics = state_.metrics();
    const auto endpoints = metrics.endpoints.snapshotAndReset();
    const auto queries = metrics.queries.snapshotAndReset();
    spdlog::info("Performance statistics reset");
    return {{"status", "success"},
            {"message", "Performance statistics have been reset"},
            {"timestamp", nowRfc3339()},
            {"previous_stats",
             {{"web_endpoints", stats::OperationCounters::toJson(endpoints)},
              {"cache_queries", stats::OperationCounters::toJson(queries)}}}};
}

}  // namespace beacon::service
