/*
 * device_cache_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "device_cache_manager.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <limits>

namespace beacon::cache {

namespace {

std::string toLower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lowered;
}

}  // namespace

DeviceCacheManager::DeviceCacheManager(std::size_t shard_count,
                                       stats::OperationCounters* query_counters,
                                       Clock clock)
    : store_(shard_count),
      queryCounters_(query_counters),
      clock_(std::move(clock)) {
    logger_ = spdlog::get("device_cache");
    if (!logger_) {
        logger_ = spdlog::default_logger();
    }
    logger_->debug("Device cache created with {} shards", store_.shardCount());
}

std::int64_t DeviceCacheManager::systemNow() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::int64_t DeviceCacheManager::now() const {
    return clock_ ? clock_() : systemNow();
}

bool DeviceCacheManager::containsAny(std::string_view value,
                                     const std::vector<std::string>& patterns) {
    return std::any_of(patterns.begin(), patterns.end(),
                       [value](const std::string& pattern) {
                           return value.find(pattern) != std::string_view::npos;
                       });
}

DeviceState DeviceCacheManager::addOrUpdate(
    std::string device_id, std::string_view mac, std::string ip,
    std::optional<std::int32_t> last_port,
    std::optional<std::int64_t> last_seen) {
    const auto address = HardwareAddress::parse(mac);
    const auto seen = last_seen.value_or(now());

    auto [state, created] = store_.upsertWith(
        address,
        [&] {
            return DeviceState{device_id, ip, last_port, seen, 0};
        },
        [&](DeviceState& existing) {
            existing.device_id = device_id;
            existing.ip = ip;
            existing.last_port = last_port;
            existing.last_seen = seen;
            ++existing.heartbeat_count;
        });

    if (created) {
        logger_->info("New device {} registered as {} from {}",
                      address.toString(), state.device_id, state.ip);
    } else {
        logger_->trace("Heartbeat #{} from {}", state.heartbeat_count,
                       address.toString());
    }
    return state;
}

void DeviceCacheManager::updateEntry(std::string_view mac, DeviceState state) {
    const auto address = HardwareAddress::parse(mac);
    state.last_seen = now();
    ++state.heartbeat_count;
    store_.insert(address, std::move(state));
    logger_->debug("Entry {} overwritten", address.toString());
}

std::optional<DeviceState> DeviceCacheManager::get(std::string_view mac) const {
    return get(HardwareAddress::parse(mac));
}

std::optional<DeviceState> DeviceCacheManager::get(
    const HardwareAddress& address) const {
    return store_.get(address);
}

std::optional<DeviceState> DeviceCacheManager::remove(std::string_view mac) {
    return remove(HardwareAddress::parse(mac));
}

std::optional<DeviceState> DeviceCacheManager::remove(
    const HardwareAddress& address) {
    auto removed = store_.remove(address);
    if (removed) {
        logger_->info("Device {} removed", address.toString());
    }
    return removed;
}

std::vector<DeviceCacheManager::Entry> DeviceCacheManager::snapshot() const {
    stats::ScopedOperationTimer timer(queryCounters_, "cache.snapshot");
    return store_.scan();
}

void DeviceCacheManager::forEach(const Visitor& visitor) const {
    stats::ScopedOperationTimer timer(queryCounters_, "cache.for_each");
    store_.forEach(visitor);
}

std::size_t DeviceCacheManager::updateAll(const Updater& updater) {
    stats::ScopedOperationTimer timer(queryCounters_, "cache.update_all");
    const auto before = store_.size();
    const auto visited = store_.updateAll(updater);
    const auto after = store_.size();
    if (after < before) {
        logger_->debug("updateAll dropped {} entries", before - after);
    }
    return visited;
}

std::vector<DeviceCacheManager::Entry> DeviceCacheManager::collectMatching(
    const Predicate& predicate) const {
    stats::ScopedOperationTimer timer(queryCounters_, "cache.collect_matching");
    std::vector<Entry> matches;
    store_.forEach([&](const HardwareAddress& key, const DeviceState& state) {
        if (predicate(key, state)) {
            matches.emplace_back(key, state);
        }
    });
    return matches;
}

std::vector<DeviceCacheManager::Entry>
DeviceCacheManager::collectByDevicePattern(std::string_view pattern) const {
    return collectMatching([pattern](const HardwareAddress&,
                                     const DeviceState& state) {
        return state.device_id.find(pattern) != std::string::npos;
    });
}

std::vector<DeviceCacheManager::Entry> DeviceCacheManager::collectByIpPattern(
    std::string_view pattern) const {
    return collectMatching(
        [pattern](const HardwareAddress&, const DeviceState& state) {
            return state.ip.find(pattern) != std::string::npos;
        });
}

std::vector<DeviceCacheManager::Entry>
DeviceCacheManager::collectWithHighHeartbeats(
    std::uint64_t min_heartbeats) const {
    return collectMatching(
        [min_heartbeats](const HardwareAddress&, const DeviceState& state) {
            return state.heartbeat_count >= min_heartbeats;
        });
}

std::vector<DeviceCacheManager::Entry> DeviceCacheManager::collectNewerThan(
    std::int64_t max_age_seconds) const {
    const auto current = now();
    return collectMatching([current, max_age_seconds](
                               const HardwareAddress&,
                               const DeviceState& state) {
        return state.ageAt(current) <= max_age_seconds;
    });
}

std::size_t DeviceCacheManager::removeMatching(const Predicate& predicate) {
    stats::ScopedOperationTimer timer(queryCounters_, "cache.remove_matching");
    const auto removed = store_.removeIf(predicate);
    if (!removed.empty()) {
        logger_->info("Removed {} matching entries", removed.size());
    }
    return removed.size();
}

std::size_t DeviceCacheManager::removeByIpPattern(std::string_view pattern) {
    return removeMatching(
        [pattern](const HardwareAddress&, const DeviceState& state) {
            return state.ip.find(pattern) != std::string::npos;
        });
}

std::size_t DeviceCacheManager::removeByMacPattern(std::string_view pattern) {
    const auto needle = toLower(pattern);
    return removeMatching(
        [&needle](const HardwareAddress& key, const DeviceState&) {
            return key.toString().find(needle) != std::string::npos;
        });
}

std::size_t DeviceCacheManager::removeByDevicePattern(
    std::string_view pattern) {
    return removeMatching(
        [pattern](const HardwareAddress&, const DeviceState& state) {
            return state.device_id.find(pattern) != std::string::npos;
        });
}

std::size_t DeviceCacheManager::removeWithLowHeartbeats(
    std::uint64_t min_heartbeats) {
    return removeMatching(
        [min_heartbeats](const HardwareAddress&, const DeviceState& state) {
            return state.heartbeat_count < min_heartbeats;
        });
}

std::size_t DeviceCacheManager::removeOlderThan(std::int64_t max_age_seconds) {
    const auto current = now();
    return removeMatching([current, max_age_seconds](
                              const HardwareAddress&,
                              const DeviceState& state) {
        return state.ageAt(current) > max_age_seconds;
    });
}

InspectionResult DeviceCacheManager::inspectAndRemove(
    const Predicate& condition) {
    stats::ScopedOperationTimer timer(queryCounters_, "cache.inspect_and_remove");
    InspectionResult result;
    auto removed = store_.removeIf(
        [&](const HardwareAddress& key, const DeviceState& state) {
            ++result.checked;
            const bool match = condition(key, state);
            logger_->debug("Inspect {} ({}): {}", key.toString(),
                           state.device_id, match ? "remove" : "keep");
            return match;
        });
    result.removed = removed.size();
    logger_->info("Inspection checked {} entries, removed {}", result.checked,
                  result.removed);
    return result;
}

std::size_t DeviceCacheManager::removeAdvanced(
    const RemovalCriteria& criteria) {
    const auto current = now();
    std::optional<std::vector<std::string>> macPatterns;
    if (criteria.mac_patterns) {
        macPatterns.emplace();
        for (const auto& pattern : *criteria.mac_patterns) {
            macPatterns->push_back(toLower(pattern));
        }
    }

    return removeMatching([&](const HardwareAddress& key,
                              const DeviceState& state) {
        if (criteria.max_age_seconds &&
            state.ageAt(current) <= *criteria.max_age_seconds) {
            return false;
        }
        if (criteria.min_heartbeats &&
            state.heartbeat_count >= *criteria.min_heartbeats) {
            return false;
        }
        if (criteria.ip_patterns &&
            !containsAny(state.ip, *criteria.ip_patterns)) {
            return false;
        }
        if (criteria.device_patterns &&
            !containsAny(state.device_id, *criteria.device_patterns)) {
            return false;
        }
        if (macPatterns && !containsAny(key.toString(), *macPatterns)) {
            return false;
        }
        return true;
    });
}

CacheStats DeviceCacheManager::stats(
    std::int64_t stale_threshold_seconds) const {
    stats::ScopedOperationTimer timer(queryCounters_, "cache.stats");
    const auto current = now();
    CacheStats result;
    std::int64_t oldest = 0;
    std::int64_t newest = std::numeric_limits<std::int64_t>::max();

    store_.forEach([&](const HardwareAddress&, const DeviceState& state) {
        const auto age = state.ageAt(current);
        ++result.total_entries;
        if (age > stale_threshold_seconds) {
            ++result.stale_entries;
        } else {
            ++result.active_entries;
        }
        result.total_heartbeats += state.heartbeat_count;
        oldest = std::max(oldest, age);
        newest = std::min(newest, age);
    });

    if (result.total_entries > 0) {
        result.oldest_entry_age_seconds = oldest;
        result.newest_entry_age_seconds = newest;
    }
    return result;
}

void DeviceCacheManager::clear() {
    const auto dropped = store_.size();
    store_.clear();
    logger_->info("Device cache cleared ({} entries)", dropped);
}

}  // namespace beacon::cache
