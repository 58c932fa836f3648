/*
 * cache_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Device cache and maintenance configuration

**************************************************/

#ifndef BEACON_CONFIG_SECTIONS_CACHE_CONFIG_HPP
#define BEACON_CONFIG_SECTIONS_CACHE_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "../config_section.hpp"

namespace beacon::config {

/**
 * @brief Which maintenance driver sweeps the cache
 */
enum class MaintenanceBackend { Thread, Asio };

[[nodiscard]] inline std::string maintenanceBackendToString(
    MaintenanceBackend backend) {
    switch (backend) {
        case MaintenanceBackend::Thread: return "thread";
        case MaintenanceBackend::Asio: return "asio";
    }
    return "thread";
}

struct CacheConfig : ConfigSection<CacheConfig> {
    static constexpr std::string_view PATH = "cache";

    std::int64_t sweepIntervalSeconds{60};
    std::int64_t maxAgeSeconds{300};          ///< Sweep evicts older entries
    std::int64_t staleThresholdSeconds{300};  ///< For reported statistics
    /// "thread" or "asio"
    std::string maintenanceBackend{"thread"};
    std::size_t shardCount{16};

    [[nodiscard]] MaintenanceBackend backend() const {
        return maintenanceBackend == "asio" ? MaintenanceBackend::Asio
                                            : MaintenanceBackend::Thread;
    }

    [[nodiscard]] json serialize() const {
        return {{"sweepIntervalSeconds", sweepIntervalSeconds},
                {"maxAgeSeconds", maxAgeSeconds},
                {"staleThresholdSeconds", staleThresholdSeconds},
                {"maintenanceBackend", maintenanceBackend},
                {"shardCount", shardCount}};
    }

    [[nodiscard]] static CacheConfig deserialize(const json& j) {
        CacheConfig cfg;
        cfg.sweepIntervalSeconds =
            j.value("sweepIntervalSeconds", cfg.sweepIntervalSeconds);
        cfg.maxAgeSeconds = j.value("maxAgeSeconds", cfg.maxAgeSeconds);
        cfg.staleThresholdSeconds =
            j.value("staleThresholdSeconds", cfg.staleThresholdSeconds);
        cfg.maintenanceBackend =
            j.value("maintenanceBackend", cfg.maintenanceBackend);
        cfg.shardCount = j.value("shardCount", cfg.shardCount);
        return cfg;
    }

    [[nodiscard]] ConfigValidationResult validate() const {
        ConfigValidationResult result;
        if (sweepIntervalSeconds < 1) {
            result.addError("cache.sweepIntervalSeconds",
                            "must be at least 1");
        }
        if (maxAgeSeconds < 0) {
            result.addError("cache.maxAgeSeconds", "must not be negative");
        }
        if (staleThresholdSeconds < 0) {
            result.addError("cache.staleThresholdSeconds",
                            "must not be negative");
        }
        if (maintenanceBackend != "thread" && maintenanceBackend != "asio") {
            result.addError("cache.maintenanceBackend",
                            "must be \"thread\" or \"asio\"");
        }
        if (shardCount < 1 || shardCount > 1024) {
            result.addError("cache.shardCount", "must be in [1, 1024]");
        }
        return result;
    }

    bool operator==(const CacheConfig&) const = default;
};

}  // namespace beacon::config

#endif  // BEACON_CONFIG_SECTIONS_CACHE_CONFIG_HPP
