/*
 * logging.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Process-wide spdlog setup shared by every component

**************************************************/

#ifndef BEACON_LOGGING_LOGGING_HPP
#define BEACON_LOGGING_LOGGING_HPP

#include <array>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "config/sections/logging_config.hpp"

namespace beacon::logging {

/// Loggers created by initialize() so components find them by name
inline constexpr std::array<std::string_view, 6> COMPONENT_LOGGERS = {
    "device_cache", "maintenance", "config_watcher", "reload", "http",
    "system"};

/**
 * @brief Install console (and optional rotating file) sinks
 *
 * Replaces the default logger and every component logger. Safe to call
 * again; loggers obtained earlier keep writing to the previous sinks.
 *
 * @return false if the file sink could not be opened; console logging is
 * installed regardless
 */
bool initialize(const config::LoggingConfig& config);

/**
 * @brief Registered logger @p name, created on the shared sinks if absent
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> getLogger(
    const std::string& name);

/**
 * @brief Apply @p level ("trace" .. "off") to every registered logger
 * @return false for an unknown level name
 */
bool setLevel(std::string_view level);

/**
 * @brief Level of the default logger as a lowercase name
 */
[[nodiscard]] std::string currentLevel();

/**
 * @brief Flush and drop every logger
 */
void shutdown();

}  // namespace beacon::logging

#endif  // BEACON_LOGGING_LOGGING_HPP
