/*
 * cache_stats.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Device cache roll-up and bulk removal criteria

**************************************************/

#ifndef BEACON_CACHE_CACHE_STATS_HPP
#define BEACON_CACHE_CACHE_STATS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace beacon::cache {

using json = nlohmann::json;

/**
 * @brief Summary computed by one full scan of the cache
 */
struct CacheStats {
    std::size_t total_entries{0};
    std::size_t active_entries{0};   ///< age <= stale threshold
    std::size_t stale_entries{0};    ///< age > stale threshold
    std::uint64_t total_heartbeats{0};
    std::int64_t oldest_entry_age_seconds{0};
    std::int64_t newest_entry_age_seconds{0};

    [[nodiscard]] json toJson() const {
        return {{"total_entries", total_entries},
                {"active_entries", active_entries},
                {"stale_entries", stale_entries},
                {"total_heartbeats", total_heartbeats},
                {"oldest_entry_age_seconds", oldest_entry_age_seconds},
                {"newest_entry_age_seconds", newest_entry_age_seconds}};
    }
};

/**
 * @brief Criteria for DeviceCacheManager::removeAdvanced
 *
 * An entry is removed when it matches every criterion that is set. A pattern
 * list matches when the field contains any of its patterns. Unset criteria
 * match everything.
 */
struct RemovalCriteria {
    std::optional<std::int64_t> max_age_seconds;  ///< matches age > value
    std::optional<std::uint64_t> min_heartbeats;  ///< matches count < value
    std::optional<std::vector<std::string>> ip_patterns;
    std::optional<std::vector<std::string>> mac_patterns;
    std::optional<std::vector<std::string>> device_patterns;

    /**
     * @brief True when no criterion is set, i.e. everything matches
     */
    [[nodiscard]] bool matchesEverything() const noexcept {
        return !max_age_seconds && !min_heartbeats && !ip_patterns &&
               !mac_patterns && !device_patterns;
    }

    [[nodiscard]] static RemovalCriteria fromJson(const json& j) {
        RemovalCriteria criteria;
        if (auto it = j.find("max_age_seconds");
            it != j.end() && !it->is_null()) {
            criteria.max_age_seconds = it->get<std::int64_t>();
        }
        if (auto it = j.find("min_heartbeats");
            it != j.end() && !it->is_null()) {
            criteria.min_heartbeats = it->get<std::uint64_t>();
        }
        if (auto it = j.find("ip_patterns"); it != j.end() && !it->is_null()) {
            criteria.ip_patterns = it->get<std::vector<std::string>>();
        }
        if (auto it = j.find("mac_patterns");
            it != j.end() && !it->is_null()) {
            criteria.mac_patterns = it->get<std::vector<std::string>>();
        }
        if (auto it = j.find("device_patterns");
            it != j.end() && !it->is_null()) {
            criteria.device_patterns = it->get<std::vector<std::string>>();
        }
        return criteria;
    }
};

/**
 * @brief Outcome of DeviceCacheManager::inspectAndRemove
 */
struct InspectionResult {
    std::size_t checked{0};
    std::size_t removed{0};
};

}  // namespace beacon::cache

#endif  // BEACON_CACHE_CACHE_STATS_HPP
