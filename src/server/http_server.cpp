/*
 * http_server.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "http_server.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>

#include "cache/cache_stats.hpp"
#include "core/exception.hpp"
#include "utils/response.hpp"

namespace beacon::server {

using utils::ResponseBuilder;

namespace {

const char* queryParam(const crow::request& req,
                       std::initializer_list<const char*> names) {
    for (const char* name : names) {
        if (const char* value = req.url_params.get(name)) {
            return value;
        }
    }
    return nullptr;
}

template <typename T>
std::optional<T> parseNumber(std::string_view text) {
    T value{};
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

HttpServer::HttpServer(config::ServiceConfig config,
                       service::ProcessState& state)
    : config_(std::move(config)),
      state_(state),
      heartbeats_(state),
      health_(state),
      logger_(spdlog::get("http")) {
    if (!logger_) {
        logger_ = spdlog::default_logger();
    }
    app_.loglevel(crow::LogLevel::Warning);

    auto& requestLogger = app_.get_middleware<middleware::RequestLogger>();
    requestLogger.counters = &state_.metrics().endpoints;
    requestLogger.logger = logger_;

    registerRoutes();
}

HttpServer::~HttpServer() { stop(); }

reload::ServingFactory HttpServer::factory(service::ProcessState& state) {
    return [&state](const config::ServiceConfig& config)
               -> std::unique_ptr<reload::ServingComponent> {
        return std::make_unique<HttpServer>(config, state);
    };
}

void HttpServer::registerRoutes() {
    CROW_ROUTE(app_, "/health")
        .methods(crow::HTTPMethod::Get)(
            [this](const crow::request& req) { return health(req); });
    CROW_ROUTE(app_, "/hbd")
        .methods(crow::HTTPMethod::Get)(
            [this](const crow::request& req) { return heartbeat(req); });

    CROW_ROUTE(app_, "/stats")
        .methods(crow::HTTPMethod::Get)([this] { return stats(); });
    CROW_ROUTE(app_, "/stats/reset")
        .methods(crow::HTTPMethod::Get)([this] { return resetStats(); });

    CROW_ROUTE(app_, "/cache")
        .methods(crow::HTTPMethod::Get)([this] { return listCache(); });
    CROW_ROUTE(app_, "/cache/stats")
        .methods(crow::HTTPMethod::Get)([this] { return cacheStats(); });
    CROW_ROUTE(app_, "/cache/cleanup")
        .methods(crow::HTTPMethod::Post)(
            [this](const crow::request& req) { return cleanup(req); });
    CROW_ROUTE(app_, "/cache/<string>")
        .methods(crow::HTTPMethod::Get, crow::HTTPMethod::Delete)(
            [this](const crow::request& req, const std::string& mac) {
                return req.method == crow::HTTPMethod::Delete
                           ? removeDevice(mac)
                           : getDevice(mac);
            });
}

void HttpServer::start() {
    if (running_.load()) {
        return;
    }
    logger_->info("Starting HTTP server on {}:{} with {} threads",
                  config_.app.host, config_.app.port, config_.app.threads);

    app_.bindaddr(config_.app.host)
        .port(static_cast<std::uint16_t>(config_.app.port))
        .concurrency(static_cast<std::uint16_t>(config_.app.threads));
    runFuture_ = app_.run_async();
    app_.wait_for_server_start();

    if (runFuture_.wait_for(std::chrono::seconds(0)) ==
        std::future_status::ready) {
        try {
            runFuture_.get();
        } catch (const std::exception& e) {
            THROW_SERVER_ERROR("HTTP server failed on port " +
                               std::to_string(config_.app.port) + ": " +
                               e.what());
        }
        THROW_SERVER_ERROR("HTTP server exited during startup on port " +
                           std::to_string(config_.app.port));
    }

    running_.store(true, std::memory_order_release);
    logger_->info("HTTP server listening on {}:{}", config_.app.host,
                  config_.app.port);
}

void HttpServer::stop() {
    const bool wasRunning = running_.exchange(false);
    if (!runFuture_.valid()) {
        return;
    }
    app_.stop();
    try {
        runFuture_.get();
    } catch (const std::exception& e) {
        logger_->error("HTTP server terminated with error: {}", e.what());
    }
    if (wasRunning) {
        logger_->info("HTTP server on port {} stopped", config_.app.port);
    }
}

crow::response HttpServer::health(const crow::request& req) {
    service::HealthRequest request;
    request.client = req.remote_ip_address;
    request.headers_count = req.headers.size();
    if (auto agent = req.get_header_value("User-Agent"); !agent.empty()) {
        request.user_agent = agent;
    }
    return ResponseBuilder::json(health_.process(request, config_.app));
}

crow::response HttpServer::heartbeat(const crow::request& req) {
    service::HeartbeatRequest request;

    const char* id = queryParam(req, {"id", "ID", "Id"});
    if (id == nullptr) {
        return ResponseBuilder::missingField("id");
    }
    auto parsedId = parseNumber<std::int32_t>(id);
    if (!parsedId) {
        return ResponseBuilder::invalidFieldValue("id", "32-bit integer");
    }
    request.id = *parsedId;

    const char* mac = queryParam(req, {"mac", "MAC", "Mac"});
    if (mac == nullptr) {
        return ResponseBuilder::missingField("mac");
    }
    request.mac = mac;

    const char* ip = queryParam(req, {"ip", "IP", "Ip"});
    if (ip == nullptr) {
        return ResponseBuilder::missingField("ip");
    }
    request.ip = ip;

    if (const char* lp = queryParam(req, {"lp", "LP", "Lp"})) {
        request.lp = parseNumber<std::int32_t>(lp);
        if (!request.lp) {
            return ResponseBuilder::invalidFieldValue("lp", "32-bit integer");
        }
    }
    if (const char* ts = queryParam(req, {"ts", "TS", "Ts"})) {
        request.ts = parseNumber<std::int64_t>(ts);
        if (!request.ts) {
            return ResponseBuilder::invalidFieldValue("ts", "Unix seconds");
        }
    }

    try {
        return ResponseBuilder::json(
            heartbeats_.process(request, req.remote_ip_address));
    } catch (const ValidationError& e) {
        logger_->warn("HBD rejected from {}: {}", req.remote_ip_address,
                      e.what());
        return ResponseBuilder::validationFailed(e.what());
    }
}

crow::response HttpServer::stats() {
    return ResponseBuilder::json(health_.statistics(config_));
}

crow::response HttpServer::resetStats() {
    return ResponseBuilder::json(health_.resetStatistics());
}

crow::response HttpServer::listCache() {
    nlohmann::json devices = nlohmann::json::array();
    for (const auto& [address, device] : state_.cache().snapshot()) {
        auto entry = device.toJson();
        entry["mac"] = address.toString();
        devices.push_back(std::move(entry));
    }
    const auto count = devices.size();
    return ResponseBuilder::success(
        {{"count", count}, {"devices", std::move(devices)}});
}

crow::response HttpServer::cacheStats() {
    auto summary =
        state_.cache().stats(config_.cache.staleThresholdSeconds).toJson();
    summary["stale_threshold_seconds"] = config_.cache.staleThresholdSeconds;
    return ResponseBuilder::success(summary);
}

crow::response HttpServer::getDevice(const std::string& mac) {
    try {
        auto device = state_.cache().get(mac);
        if (!device) {
            return ResponseBuilder::deviceNotFound(mac);
        }
        auto body = device->toJson();
        body["mac"] = cache::HardwareAddress::parse(mac).toString();
        return ResponseBuilder::success(body);
    } catch (const ValidationError& e) {
        return ResponseBuilder::validationFailed(e.what());
    }
}

crow::response HttpServer::removeDevice(const std::string& mac) {
    try {
        auto removed = state_.cache().remove(mac);
        if (!removed) {
            return ResponseBuilder::deviceNotFound(mac);
        }
        return ResponseBuilder::successWithMessage("Device removed",
                                                   removed->toJson());
    } catch (const ValidationError& e) {
        return ResponseBuilder::validationFailed(e.what());
    }
}

crow::response HttpServer::cleanup(const crow::request& req) {
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(req.body);
    } catch (const nlohmann::json::parse_error& e) {
        return ResponseBuilder::invalidJson(e.what());
    }
    if (!body.is_object()) {
        return ResponseBuilder::invalidJson("expected an object");
    }

    cache::RemovalCriteria criteria;
    try {
        criteria = cache::RemovalCriteria::fromJson(body);
    } catch (const nlohmann::json::exception& e) {
        return ResponseBuilder::invalidFieldValue("criteria", e.what());
    }
    if (criteria.matchesEverything()) {
        return ResponseBuilder::validationFailed(
            "At least one removal criterion is required");
    }

    const auto removed = state_.cache().removeAdvanced(criteria);
    logger_->info("Cleanup removed {} entries", removed);
    return ResponseBuilder::successWithMessage(
        "Cleanup complete",
        {{"removed", removed}, {"remaining", state_.cache().size()}});
}

}  // namespace beacon::server
