/*
 * http_server.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Crow HTTP front end over the device cache

**************************************************/

#ifndef BEACON_SERVER_HTTP_SERVER_HPP
#define BEACON_SERVER_HTTP_SERVER_HPP

#include <crow.h>
#include <atomic>
#include <future>
#include <memory>

#include <spdlog/spdlog.h>

#include "config/service_config.hpp"
#include "middleware/request_logger.hpp"
#include "reload/serving_component.hpp"
#include "service/health_service.hpp"
#include "service/heartbeat_service.hpp"
#include "service/process_state.hpp"

namespace beacon::server {

using ServerApp = crow::App<middleware::RequestLogger>;

/**
 * @brief HTTP listener for one configuration
 *
 * Routes:
 *   GET    /health          service health
 *   GET    /hbd             heartbeat ingestion (id, mac, ip, lp, ts)
 *   GET    /stats           counters, cache summary, latencies
 *   GET    /stats/reset     zero latencies, return previous values
 *   GET    /cache           every cached device
 *   GET    /cache/stats     cache summary
 *   GET    /cache/<mac>     one device
 *   DELETE /cache/<mac>     evict one device
 *   POST   /cache/cleanup   evict by criteria (JSON body)
 */
class HttpServer final : public reload::ServingComponent {
public:
    HttpServer(config::ServiceConfig config, service::ProcessState& state);
    ~HttpServer() override;

    /**
     * @throws ServerError if the listener does not come up
     */
    void start() override;
    void stop() override;
    [[nodiscard]] bool isRunning() const override {
        return running_.load(std::memory_order_acquire);
    }

    /**
     * @brief Factory for ReloadCoordinator
     */
    [[nodiscard]] static reload::ServingFactory factory(
        service::ProcessState& state);

private:
    void registerRoutes();

    crow::response health(const crow::request& req);
    crow::response heartbeat(const crow::request& req);
    crow::response stats();
    crow::response resetStats();
    crow::response listCache();
    crow::response cacheStats();
    crow::response getDevice(const std::string& mac);
    crow::response removeDevice(const std::string& mac);
    crow::response cleanup(const crow::request& req);

    config::ServiceConfig config_;
    service::ProcessState& state_;
    service::HeartbeatService heartbeats_;
    service::HealthService health_;

    ServerApp app_;
    std::future<void> runFuture_;
    std::atomic<bool> running_{false};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace beacon::server

#endif  // BEACON_SERVER_HTTP_SERVER_HPP
