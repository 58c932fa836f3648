/*
 * timestamp.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "timestamp.hpp"

#include <array>
#include <chrono>
#include <ctime>

namespace beacon::service {

std::string formatRfc3339(std::int64_t unix_seconds) {
    const auto t = static_cast<std::time_t>(unix_seconds);
    std::tm utc{};
    gmtime_r(&t, &utc);
    std::array<char, 32> buffer{};
    const auto written = std::strftime(buffer.data(), buffer.size(),
                                       "%Y-%m-%dT%H:%M:%S+00:00", &utc);
    return std::string(buffer.data(), written);
}

std::string nowRfc3339() {
    return formatRfc3339(std::chrono::duration_cast<std::chrono::seconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count());
}

}  // namespace beacon::service
