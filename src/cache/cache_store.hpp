/*
 * cache_store.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Sharded concurrent map from hardware address to device state

**************************************************/

#ifndef BEACON_CACHE_CACHE_STORE_HPP
#define BEACON_CACHE_CACHE_STORE_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "device_state.hpp"
#include "hardware_address.hpp"

namespace beacon::cache {

/**
 * @brief Concurrent device map split into independently locked shards
 *
 * Operations on one key are linearizable. Whole-map operations (scan,
 * updateAll, removeIf) lock one shard at a time, so they never observe a torn
 * or duplicated entry but are not a point-in-time snapshot of the whole map.
 *
 * Callbacks passed to updateInPlace, upsertWith, updateAll and removeIf run
 * while the shard is exclusively locked and must not call back into the
 * store. Visitors passed to forEach run on a copy and may.
 *
 * @thread_safety All public operations are thread-safe
 */
class CacheStore {
public:
    static constexpr std::size_t DEFAULT_SHARD_COUNT = 16;

    using Entry = std::pair<HardwareAddress, DeviceState>;
    using Visitor =
        std::function<void(const HardwareAddress&, const DeviceState&)>;
    using Predicate =
        std::function<bool(const HardwareAddress&, const DeviceState&)>;
    using Mutator = std::function<void(DeviceState&)>;
    /// Returns false to remove the entry after mutation
    using Updater = std::function<bool(const HardwareAddress&, DeviceState&)>;

    /**
     * @param shard_count Number of shards, rounded up to a power of two
     */
    explicit CacheStore(std::size_t shard_count = DEFAULT_SHARD_COUNT);

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    /**
     * @brief Copy of the state stored for @p key
     */
    [[nodiscard]] std::optional<DeviceState> get(
        const HardwareAddress& key) const;

    [[nodiscard]] bool contains(const HardwareAddress& key) const;

    /**
     * @brief Unconditional upsert
     */
    void insert(const HardwareAddress& key, DeviceState state);

    /**
     * @brief Mutate the existing value for @p key, if any
     * @return true if a value existed and was mutated
     */
    bool updateInPlace(const HardwareAddress& key, const Mutator& mutator);

    /**
     * @brief Atomic create-or-mutate
     * @param create Builds the value when the key is absent
     * @param update Mutates the value when the key is present
     * @return Resulting value and whether it was created
     */
    std::pair<DeviceState, bool> upsertWith(
        const HardwareAddress& key,
        const std::function<DeviceState()>& create, const Mutator& update);

    /**
     * @brief Remove and return the value for @p key
     */
    std::optional<DeviceState> remove(const HardwareAddress& key);

    /**
     * @brief Copy of every entry, shard by shard
     */
    [[nodiscard]] std::vector<Entry> scan() const;

    /**
     * @brief Visit every entry, shard by shard
     */
    void forEach(const Visitor& visitor) const;

    /**
     * @brief Mutate every entry, removing those the updater rejects
     * @return Number of entries visited
     */
    std::size_t updateAll(const Updater& updater);

    /**
     * @brief Remove every entry matching @p predicate
     * @return The removed entries
     */
    std::vector<Entry> removeIf(const Predicate& predicate);

    /**
     * @brief Current entry count; may be stale under concurrent mutation
     */
    [[nodiscard]] std::size_t size() const noexcept {
        return size_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    void clear();

    [[nodiscard]] std::size_t shardCount() const noexcept {
        return shards_.size();
    }

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<HardwareAddress, DeviceState> entries;
    };

    [[nodiscard]] Shard& shardFor(const HardwareAddress& key);
    [[nodiscard]] const Shard& shardFor(const HardwareAddress& key) const;

    std::vector<Shard> shards_;
    std::size_t shardMask_;
    std::atomic<std::size_t> size_{0};
};

}  // namespace beacon::cache

#endif  // BEACON_CACHE_CACHE_STORE_HPP
