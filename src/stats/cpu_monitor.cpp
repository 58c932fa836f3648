/*
 * cpu_monitor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "cpu_monitor.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>

namespace beacon::stats {

namespace {

// user nice system idle iowait irq softirq steal; guest time is already
// counted in user
constexpr std::size_t STAT_FIELDS = 8;
constexpr std::size_t IDLE_FIELD = 3;
constexpr std::size_t IOWAIT_FIELD = 4;

}  // namespace

CpuMonitor::CpuMonitor(std::filesystem::path stat_path)
    : statPath_(std::move(stat_path)) {
    logger_ = spdlog::get("system");
    if (!logger_) {
        logger_ = spdlog::default_logger();
    }
}

CpuMonitor::~CpuMonitor() { stop(); }

bool CpuMonitor::start(std::chrono::milliseconds interval) {
    if (running_.exchange(true)) {
        logger_->warn("CPU monitor already running");
        return false;
    }
    if (!sampleOnce()) {
        logger_->warn("CPU usage unavailable: cannot read {}",
                      statPath_.string());
    }
    worker_ = std::jthread([this, interval](std::stop_token token) {
        loop(std::move(token), interval);
    });
    logger_->info("CPU monitor started: every {}ms", interval.count());
    return true;
}

void CpuMonitor::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
    logger_->debug("CPU monitor stopped");
}

bool CpuMonitor::sampleOnce() {
    std::ifstream statFile(statPath_);
    if (!statFile.is_open()) {
        return false;
    }
    std::string line;
    if (!std::getline(statFile, line)) {
        return false;
    }
    auto current = parseStatLine(line);
    if (!current) {
        logger_->debug("No aggregate cpu line in {}", statPath_.string());
        return false;
    }

    std::lock_guard lock(sampleMutex_);
    if (previous_) {
        const double usage = usageBetween(*previous_, *current);
        usageHundredths_.store(
            static_cast<std::uint64_t>(std::llround(usage * 100.0)),
            std::memory_order_relaxed);
    }
    previous_ = current;
    return true;
}

std::optional<CpuTimes> CpuMonitor::parseStatLine(std::string_view line) {
    std::istringstream iss{std::string(line)};
    std::string label;
    if (!(iss >> label) || label != "cpu") {
        return std::nullopt;
    }

    std::array<std::uint64_t, STAT_FIELDS> fields{};
    std::size_t parsed = 0;
    while (parsed < STAT_FIELDS && iss >> fields[parsed]) {
        ++parsed;
    }
    if (parsed <= IDLE_FIELD) {
        return std::nullopt;
    }

    CpuTimes times;
    for (std::size_t i = 0; i < parsed; ++i) {
        times.total += fields[i];
    }
    const auto idle = fields[IDLE_FIELD] + fields[IOWAIT_FIELD];
    times.busy = times.total - idle;
    return times;
}

double CpuMonitor::usageBetween(const CpuTimes& previous,
                                const CpuTimes& current) noexcept {
    if (current.total <= previous.total || current.busy < previous.busy) {
        return 0.0;
    }
    const auto totalDelta = static_cast<double>(current.total - previous.total);
    const auto busyDelta = static_cast<double>(current.busy - previous.busy);
    return std::min(100.0, busyDelta / totalDelta * 100.0);
}

void CpuMonitor::loop(std::stop_token token,
                      std::chrono::milliseconds interval) {
    while (!token.stop_requested()) {
        {
            std::unique_lock lock(waitMutex_);
            if (wakeup_.wait_for(lock, token, interval, [&token] {
                    return token.stop_requested();
                })) {
                break;
            }
        }
        try {
            if (!sampleOnce()) {
                logger_->debug("CPU sample skipped: cannot read {}",
                               statPath_.string());
            }
        } catch (const std::exception& e) {
            logger_->error("CPU sample failed: {}", e.what());
        }
    }
}

}  // namespace beacon::stats
