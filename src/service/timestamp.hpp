/*
 * timestamp.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BEACON_SERVICE_TIMESTAMP_HPP
#define BEACON_SERVICE_TIMESTAMP_HPP

#include <cstdint>
#include <string>

namespace beacon::service {

/**
 * @brief Format Unix seconds as RFC 3339 in UTC, e.g. 2024-01-01T00:00:00+00:00
 */
[[nodiscard]] std::string formatRfc3339(std::int64_t unix_seconds);

/**
 * @brief Current system time as RFC 3339
 */
[[nodiscard]] std::string nowRfc3339();

}  // namespace beacon::service

#endif  // BEACON_SERVICE_TIMESTAMP_HPP
