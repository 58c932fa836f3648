/*
 * device_cache_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Device cache facade - validation, CRUD, bulk predicates, stats

**************************************************/

#ifndef BEACON_CACHE_DEVICE_CACHE_MANAGER_HPP
#define BEACON_CACHE_DEVICE_CACHE_MANAGER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "cache_stats.hpp"
#include "cache_store.hpp"
#include "stats/operation_counters.hpp"

namespace beacon::cache {

/**
 * @brief Facade over CacheStore used by every caller that touches device state
 *
 * Address strings are validated before anything is read or written; a
 * malformed address throws MalformedAddressError and mutates nothing. A key
 * that is not cached yields an empty result, never an error.
 *
 * Bulk operations time themselves into the optional query counters under
 * "cache.<operation>".
 *
 * @thread_safety All public operations are thread-safe
 */
class DeviceCacheManager {
public:
    using Entry = CacheStore::Entry;
    using Visitor = CacheStore::Visitor;
    using Predicate = CacheStore::Predicate;
    using Updater = CacheStore::Updater;
    /// Current Unix time in seconds
    using Clock = std::function<std::int64_t()>;

    static constexpr std::int64_t DEFAULT_STALE_THRESHOLD_SECONDS = 300;

    /**
     * @param shard_count Store shard count
     * @param query_counters Receives bulk-operation latencies; may be null
     * @param clock Time source, system clock when empty
     */
    explicit DeviceCacheManager(
        std::size_t shard_count = CacheStore::DEFAULT_SHARD_COUNT,
        stats::OperationCounters* query_counters = nullptr, Clock clock = {});

    DeviceCacheManager(const DeviceCacheManager&) = delete;
    DeviceCacheManager& operator=(const DeviceCacheManager&) = delete;

    // ========================================================================
    // Single-device operations
    // ========================================================================

    /**
     * @brief Heartbeat ingestion: create or increment
     *
     * A new device starts with heartbeat_count 0. An existing one has its
     * count incremented and device_id, ip, last_port and last_seen refreshed.
     *
     * @param last_seen Explicit timestamp; now when not supplied
     * @return The stored state after the update
     * @throws MalformedAddressError if @p mac does not parse
     */
    DeviceState addOrUpdate(std::string device_id, std::string_view mac,
                            std::string ip,
                            std::optional<std::int32_t> last_port,
                            std::optional<std::int64_t> last_seen =
                                std::nullopt);

    /**
     * @brief Administrative overwrite of a device record
     *
     * Stores @p state with last_seen set to now and heartbeat_count
     * incremented from the supplied value. A smaller count than the cached
     * one is accepted.
     *
     * @throws MalformedAddressError if @p mac does not parse
     */
    void updateEntry(std::string_view mac, DeviceState state);

    /**
     * @throws MalformedAddressError if @p mac does not parse
     */
    [[nodiscard]] std::optional<DeviceState> get(std::string_view mac) const;
    [[nodiscard]] std::optional<DeviceState> get(
        const HardwareAddress& address) const;

    /**
     * @throws MalformedAddressError if @p mac does not parse
     */
    std::optional<DeviceState> remove(std::string_view mac);
    std::optional<DeviceState> remove(const HardwareAddress& address);

    // ========================================================================
    // Iteration
    // ========================================================================

    /**
     * @brief Every entry, in no particular order
     */
    [[nodiscard]] std::vector<Entry> snapshot() const;

    /**
     * @brief Read-only visit of every entry
     */
    void forEach(const Visitor& visitor) const;

    /**
     * @brief Mutate every entry; entries the updater rejects are removed
     * @return Number of entries visited
     */
    std::size_t updateAll(const Updater& updater);

    // ========================================================================
    // Non-destructive queries
    // ========================================================================

    [[nodiscard]] std::vector<Entry> collectMatching(
        const Predicate& predicate) const;
    [[nodiscard]] std::vector<Entry> collectByDevicePattern(
        std::string_view pattern) const;
    [[nodiscard]] std::vector<Entry> collectByIpPattern(
        std::string_view pattern) const;
    [[nodiscard]] std::vector<Entry> collectWithHighHeartbeats(
        std::uint64_t min_heartbeats) const;
    [[nodiscard]] std::vector<Entry> collectNewerThan(
        std::int64_t max_age_seconds) const;

    // ========================================================================
    // Destructive queries
    // ========================================================================

    /**
     * @return Number of entries removed
     */
    std::size_t removeMatching(const Predicate& predicate);
    std::size_t removeByIpPattern(std::string_view pattern);
    std::size_t removeByMacPattern(std::string_view pattern);
    std::size_t removeByDevicePattern(std::string_view pattern);
    std::size_t removeWithLowHeartbeats(std::uint64_t min_heartbeats);
    std::size_t removeOlderThan(std::int64_t max_age_seconds);

    /**
     * @brief Remove entries matching @p condition, logging each decision
     */
    InspectionResult inspectAndRemove(const Predicate& condition);

    /**
     * @brief Remove entries matching every criterion that is set
     */
    std::size_t removeAdvanced(const RemovalCriteria& criteria);

    // ========================================================================
    // Statistics
    // ========================================================================

    [[nodiscard]] CacheStats stats(std::int64_t stale_threshold_seconds =
                                       DEFAULT_STALE_THRESHOLD_SECONDS) const;

    [[nodiscard]] std::size_t size() const noexcept { return store_.size(); }

    void clear();

    /**
     * @brief Current time according to the configured clock
     */
    [[nodiscard]] std::int64_t now() const;

    /**
     * @brief Unix time in seconds from the system clock
     */
    [[nodiscard]] static std::int64_t systemNow();

private:
    [[nodiscard]] static bool containsAny(
        std::string_view value, const std::vector<std::string>& patterns);

    CacheStore store_;
    stats::OperationCounters* queryCounters_;
    Clock clock_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace beacon::cache

#endif  // BEACON_CACHE_DEVICE_CACHE_MANAGER_HPP
