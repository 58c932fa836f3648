/*
 * service_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Complete service configuration and file persistence

**************************************************/

#ifndef BEACON_CONFIG_SERVICE_CONFIG_HPP
#define BEACON_CONFIG_SERVICE_CONFIG_HPP

#include <filesystem>

#include "sections/app_config.hpp"
#include "sections/cache_config.hpp"
#include "sections/logging_config.hpp"
#include "sections/reload_config.hpp"

namespace beacon::config {

/**
 * @brief Every configuration section, keyed in the file by section PATH
 */
struct ServiceConfig {
    AppConfig app;
    CacheConfig cache;
    LoggingConfig logging;
    ReloadConfig reload;

    [[nodiscard]] json toJson() const;

    /**
     * @brief Build from JSON; absent sections and keys take their defaults
     * @throws ConfigParseError when a value has the wrong type
     */
    [[nodiscard]] static ServiceConfig fromJson(const json& j);

    [[nodiscard]] ConfigValidationResult validate() const;

    bool operator==(const ServiceConfig&) const = default;
};

/**
 * @brief Read, parse and validate a configuration file
 * @throws ConfigIOError, ConfigParseError, InvalidConfigError
 */
[[nodiscard]] ServiceConfig loadConfig(const std::filesystem::path& path);

/**
 * @brief Write @p config as indented JSON, creating parent directories
 * @throws ConfigIOError
 */
void saveConfig(const ServiceConfig& config,
                const std::filesystem::path& path);

/**
 * @brief Load @p path, or write and return the defaults if it does not exist
 *
 * An existing but invalid file is an error, not a reason to overwrite it.
 *
 * @throws ConfigIOError, ConfigParseError, InvalidConfigError
 */
[[nodiscard]] ServiceConfig loadOrDefault(const std::filesystem::path& path);

}  // namespace beacon::config

#endif  // BEACON_CONFIG_SERVICE_CONFIG_HPP
