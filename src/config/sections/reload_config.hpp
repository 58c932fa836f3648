/*
 * reload_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Configuration hot-reload settings

**************************************************/

#ifndef BEACON_CONFIG_SECTIONS_RELOAD_CONFIG_HPP
#define BEACON_CONFIG_SECTIONS_RELOAD_CONFIG_HPP

#include <chrono>
#include <cstdint>

#include "../config_section.hpp"

namespace beacon::config {

struct ReloadConfig : ConfigSection<ReloadConfig> {
    static constexpr std::string_view PATH = "reload";

    bool enabled{true};
    std::int64_t debounceMs{250};      ///< Quiet period before a reload
    std::int64_t pollIntervalMs{100};  ///< File modification check period

    [[nodiscard]] std::chrono::milliseconds debounce() const {
        return std::chrono::milliseconds(debounceMs);
    }

    [[nodiscard]] std::chrono::milliseconds pollInterval() const {
        return std::chrono::milliseconds(pollIntervalMs);
    }

    [[nodiscard]] json serialize() const {
        return {{"enabled", enabled},
                {"debounceMs", debounceMs},
                {"pollIntervalMs", pollIntervalMs}};
    }

    [[nodiscard]] static ReloadConfig deserialize(const json& j) {
        ReloadConfig cfg;
        cfg.enabled = j.value("enabled", cfg.enabled);
        cfg.debounceMs = j.value("debounceMs", cfg.debounceMs);
        cfg.pollIntervalMs = j.value("pollIntervalMs", cfg.pollIntervalMs);
        return cfg;
    }

    [[nodiscard]] ConfigValidationResult validate() const {
        ConfigValidationResult result;
        if (debounceMs < 0) {
            result.addError("reload.debounceMs", "must not be negative");
        }
        if (pollIntervalMs < 1) {
            result.addError("reload.pollIntervalMs", "must be at least 1");
        }
        return result;
    }

    bool operator==(const ReloadConfig&) const = default;
};

}  // namespace beacon::config

#endif  // BEACON_CONFIG_SECTIONS_RELOAD_CONFIG_HPP
