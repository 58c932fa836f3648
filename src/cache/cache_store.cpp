/*
 * cache_store.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "cache_store.hpp"

#include <bit>
#include <mutex>

namespace beacon::cache {

CacheStore::CacheStore(std::size_t shard_count)
    : shards_(std::bit_ceil(shard_count == 0 ? std::size_t{1} : shard_count)),
      shardMask_(shards_.size() - 1) {}

CacheStore::Shard& CacheStore::shardFor(const HardwareAddress& key) {
    return shards_[static_cast<std::size_t>(mixAddress(key) >> 32) &
                   shardMask_];
}

const CacheStore::Shard& CacheStore::shardFor(
    const HardwareAddress& key) const {
    return shards_[static_cast<std::size_t>(mixAddress(key) >> 32) &
                   shardMask_];
}

std::optional<DeviceState> CacheStore::get(const HardwareAddress& key) const {
    const auto& shard = shardFor(key);
    std::shared_lock lock(shard.mutex);
    if (auto it = shard.entries.find(key); it != shard.entries.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool CacheStore::contains(const HardwareAddress& key) const {
    const auto& shard = shardFor(key);
    std::shared_lock lock(shard.mutex);
    return shard.entries.contains(key);
}

void CacheStore::insert(const HardwareAddress& key, DeviceState state) {
    auto& shard = shardFor(key);
    std::unique_lock lock(shard.mutex);
    auto [it, inserted] = shard.entries.insert_or_assign(key, std::move(state));
    if (inserted) {
        size_.fetch_add(1, std::memory_order_relaxed);
    }
}

bool CacheStore::updateInPlace(const HardwareAddress& key,
                               const Mutator& mutator) {
    auto& shard = shardFor(key);
    std::unique_lock lock(shard.mutex);
    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) {
        return false;
    }
    // Mutate a copy so a throwing mutator leaves the stored record intact
    DeviceState updated = it->second;
    mutator(updated);
    it->second = std::move(updated);
    return true;
}

std::pair<DeviceState, bool> CacheStore::upsertWith(
    const HardwareAddress& key, const std::function<DeviceState()>& create,
    const Mutator& update) {
    auto& shard = shardFor(key);
    std::unique_lock lock(shard.mutex);
    if (auto it = shard.entries.find(key); it != shard.entries.end()) {
        DeviceState updated = it->second;
        update(updated);
        it->second = updated;
        return {std::move(updated), false};
    }
    DeviceState created = create();
    shard.entries.emplace(key, created);
    size_.fetch_add(1, std::memory_order_relaxed);
    return {std::move(created), true};
}

std::optional<DeviceState> CacheStore::remove(const HardwareAddress& key) {
    auto& shard = shardFor(key);
    std::unique_lock lock(shard.mutex);
    auto node = shard.entries.extract(key);
    if (node.empty()) {
        return std::nullopt;
    }
    size_.fetch_sub(1, std::memory_order_relaxed);
    return std::move(node.mapped());
}

std::vector<CacheStore::Entry> CacheStore::scan() const {
    std::vector<Entry> entries;
    entries.reserve(size());
    for (const auto& shard : shards_) {
        std::shared_lock lock(shard.mutex);
        entries.insert(entries.end(), shard.entries.begin(),
                       shard.entries.end());
    }
    return entries;
}

void CacheStore::forEach(const Visitor& visitor) const {
    std::vector<Entry> batch;
    for (const auto& shard : shards_) {
        {
            std::shared_lock lock(shard.mutex);
            batch.assign(shard.entries.begin(), shard.entries.end());
        }
        for (const auto& [key, state] : batch) {
            visitor(key, state);
        }
    }
}

std::size_t CacheStore::updateAll(const Updater& updater) {
    std::size_t visited = 0;
    for (auto& shard : shards_) {
        std::unique_lock lock(shard.mutex);
        for (auto it = shard.entries.begin(); it != shard.entries.end();) {
            ++visited;
            // Commit only after the updater returns so a throw leaves the
            // stored record intact
            DeviceState updated = it->second;
            if (updater(it->first, updated)) {
                it->second = std::move(updated);
                ++it;
            } else {
                it = shard.entries.erase(it);
                size_.fetch_sub(1, std::memory_order_relaxed);
            }
        }
    }
    return visited;
}

std::vector<CacheStore::Entry> CacheStore::removeIf(
    const Predicate& predicate) {
    std::vector<Entry> removed;
    for (auto& shard : shards_) {
        std::unique_lock lock(shard.mutex);
        for (auto it = shard.entries.begin(); it != shard.entries.end();) {
            if (predicate(it->first, it->second)) {
                removed.emplace_back(it->first, std::move(it->second));
                it = shard.entries.erase(it);
                size_.fetch_sub(1, std::memory_order_relaxed);
            } else {
                ++it;
            }
        }
    }
    return removed;
}

void CacheStore::clear() {
    for (auto& shard : shards_) {
        std::unique_lock lock(shard.mutex);
        size_.fetch_sub(shard.entries.size(), std::memory_order_relaxed);
        shard.entries.clear();
    }
}

}  // namespace beacon::cache
