/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Logging configuration

**************************************************/

#ifndef BEACON_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
#define BEACON_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

#include "../config_section.hpp"

namespace beacon::config {

inline constexpr std::array<std::string_view, 7> LOG_LEVEL_NAMES = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

/**
 * @brief Console and rotating-file logging settings
 *
 * An empty file disables the file sink.
 */
struct LoggingConfig : ConfigSection<LoggingConfig> {
    static constexpr std::string_view PATH = "logging";

    std::string level{"info"};
    /// Placeholders: %Y %m %d %H %M %S %e %l %n %t %v
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v"};
    std::string file;
    std::size_t maxFileSize{10 * 1024 * 1024};  ///< Rotate after (bytes)
    std::size_t maxFiles{5};

    [[nodiscard]] json serialize() const {
        return {{"level", level},
                {"pattern", pattern},
                {"file", file},
                {"maxFileSize", maxFileSize},
                {"maxFiles", maxFiles}};
    }

    [[nodiscard]] static LoggingConfig deserialize(const json& j) {
        LoggingConfig cfg;
        cfg.level = j.value("level", cfg.level);
        cfg.pattern = j.value("pattern", cfg.pattern);
        cfg.file = j.value("file", cfg.file);
        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);
        return cfg;
    }

    [[nodiscard]] ConfigValidationResult validate() const {
        ConfigValidationResult result;
        bool known = false;
        for (auto name : LOG_LEVEL_NAMES) {
            known = known || name == level;
        }
        if (!known) {
            result.addError("logging.level", "unknown level '" + level + "'");
        }
        if (pattern.empty()) {
            result.addError("logging.pattern", "must not be empty");
        }
        if (!file.empty() && maxFileSize == 0) {
            result.addError("logging.maxFileSize", "must be positive");
        }
        if (!file.empty() && maxFiles == 0) {
            result.addError("logging.maxFiles", "must be positive");
        }
        return result;
    }

    bool operator==(const LoggingConfig&) const = default;
};

}  // namespace beacon::config

#endif  // BEACON_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
