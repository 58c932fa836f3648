/*
 * test_device_cache_manager.cpp - Tests for DeviceCacheManager
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "cache/device_cache_manager.hpp"
#include "core/exception.hpp"
#include "stats/operation_counters.hpp"

#include <atomic>
#include <cstdio>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

using beacon::cache::DeviceCacheManager;
using beacon::cache::DeviceState;
using beacon::cache::HardwareAddress;
using beacon::cache::RemovalCriteria;

namespace {

std::string macFor(int index) {
    char buffer[18];
    std::snprintf(buffer, sizeof(buffer), "02:00:00:00:%02x:%02x",
                  (index >> 8) & 0xff, index & 0xff);
    return buffer;
}

}  // namespace

class DeviceCacheManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        manager_ = std::make_unique<DeviceCacheManager>(
            16, &queries_, [this] { return now_.load(); });
    }

    void advance(std::int64_t seconds) { now_ += seconds; }

    std::atomic<std::int64_t> now_{1'700'000'000};
    beacon::stats::OperationCounters queries_;
    std::unique_ptr<DeviceCacheManager> manager_;
};

// ============================================================================
// Add / Get / Remove Tests
// ============================================================================

TEST_F(DeviceCacheManagerTest, FirstHeartbeatStartsAtZero) {
    auto state = manager_->addOrUpdate("7", "AA:BB:CC:DD:EE:01", "10.0.0.5",
                                       8080);
    EXPECT_EQ(state.heartbeat_count, 0u);
    EXPECT_EQ(state.last_seen, now_.load());

    auto stored = manager_->get("aa:bb:cc:dd:ee:01");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, state);
    EXPECT_EQ(stored->last_port.value_or(0), 8080);
}

TEST_F(DeviceCacheManagerTest, EachUpdateIncrementsHeartbeatCount) {
    const std::string mac = "aa:bb:cc:dd:ee:02";
    manager_->addOrUpdate("1", mac, "10.0.0.1", std::nullopt);
    for (int i = 1; i <= 5; ++i) {
        advance(1);
        auto state = manager_->addOrUpdate("1", mac, "10.0.0.9", std::nullopt);
        EXPECT_EQ(state.heartbeat_count, static_cast<std::uint64_t>(i));
    }
    auto stored = manager_->get(mac);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->heartbeat_count, 5u);
    EXPECT_EQ(stored->ip, "10.0.0.9");
    EXPECT_EQ(stored->last_seen, now_.load());
    EXPECT_EQ(manager_->size(), 1u);
}

TEST_F(DeviceCacheManagerTest, ExplicitLastSeenIsStored) {
    auto state = manager_->addOrUpdate("1", macFor(1), "10.0.0.1", 1,
                                       now_.load() - 50);
    EXPECT_EQ(state.ageAt(now_.load()), 50);
}

TEST_F(DeviceCacheManagerTest, MalformedAddressIsRejected) {
    EXPECT_THROW(manager_->addOrUpdate("1", "zz:zz:zz:zz:zz:zz", "10.0.0.1",
                                       std::nullopt),
                 beacon::ValidationError);
    EXPECT_THROW((void)manager_->get("aa:bb:cc"), beacon::ValidationError);
    EXPECT_EQ(manager_->size(), 0u);
}

TEST_F(DeviceCacheManagerTest, RemoveThenGetIsAbsent) {
    manager_->addOrUpdate("1", macFor(1), "10.0.0.1", std::nullopt);
    EXPECT_TRUE(manager_->remove(macFor(1)).has_value());
    EXPECT_FALSE(manager_->get(macFor(1)).has_value());

    EXPECT_FALSE(manager_->remove(macFor(2)).has_value());
    EXPECT_FALSE(manager_->get(macFor(2)).has_value());
}

TEST_F(DeviceCacheManagerTest, UpdateEntryStampsTimeAndCount) {
    DeviceState replacement{"dev", "172.16.0.1", 22, 0, 10};
    manager_->updateEntry(macFor(3), replacement);
    auto stored = manager_->get(macFor(3));
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->last_seen, now_.load());
    EXPECT_EQ(stored->heartbeat_count, 11u);
    EXPECT_EQ(stored->ip, "172.16.0.1");
}

// ============================================================================
// Bulk Tests
// ============================================================================

TEST_F(DeviceCacheManagerTest, UpdateAllIncrementsEveryEntry) {
    for (int i = 0; i < 20; ++i) {
        manager_->addOrUpdate(std::to_string(i), macFor(i), "10.0.0.1",
                              std::nullopt);
    }
    auto before = manager_->size();
    auto visited = manager_->updateAll(
        [](const HardwareAddress&, DeviceState& state) {
            state.heartbeat_count += 1;
            return true;
        });
    EXPECT_EQ(visited, before);
    EXPECT_EQ(manager_->size(), before);
    for (const auto& [address, state] : manager_->snapshot()) {
        EXPECT_EQ(state.heartbeat_count, 1u) << address.toString();
    }
}

TEST_F(DeviceCacheManagerTest, ForEachVisitsEveryEntryAndIsTimed) {
    for (int i = 0; i < 8; ++i) {
        manager_->addOrUpdate(std::to_string(i), macFor(i), "10.0.0.1",
                              std::nullopt);
    }
    std::set<std::string> visited;
    manager_->forEach([&visited](const HardwareAddress& address,
                                 const DeviceState&) {
        visited.insert(address.toString());
    });
    EXPECT_EQ(visited.size(), 8u);
    EXPECT_TRUE(visited.contains(macFor(0)));
    EXPECT_TRUE(visited.contains(macFor(7)));
    EXPECT_EQ(manager_->size(), 8u);
    EXPECT_EQ(queries_.snapshot("cache.for_each").invocations, 1u);
}

TEST_F(DeviceCacheManagerTest, CollectMatchingIsNonDestructive) {
    for (int i = 0; i < 10; ++i) {
        manager_->addOrUpdate("sensor-" + std::to_string(i), macFor(i),
                              "192.168.1." + std::to_string(i), std::nullopt);
    }
    auto before = manager_->snapshot();
    auto matched = manager_->collectMatching(
        [](const HardwareAddress&, const DeviceState& state) {
            return state.ip.ends_with(".3");
        });
    EXPECT_EQ(matched.size(), 1u);
    EXPECT_EQ(manager_->size(), 10u);

    auto after = manager_->snapshot();
    std::set<std::string> beforeKeys;
    std::set<std::string> afterKeys;
    for (const auto& [address, state] : before) {
        beforeKeys.insert(address.toString());
    }
    for (const auto& [address, state] : after) {
        afterKeys.insert(address.toString());
    }
    EXPECT_EQ(beforeKeys, afterKeys);
}

TEST_F(DeviceCacheManagerTest, CollectWrappers) {
    manager_->addOrUpdate("camera-1", macFor(1), "10.1.0.1", std::nullopt);
    manager_->addOrUpdate("sensor-2", macFor(2), "10.2.0.1", std::nullopt);
    advance(100);
    manager_->addOrUpdate("sensor-3", macFor(3), "10.2.0.2", std::nullopt);
    manager_->addOrUpdate("sensor-3", macFor(3), "10.2.0.2", std::nullopt);

    EXPECT_EQ(manager_->collectByDevicePattern("sensor").size(), 2u);
    EXPECT_EQ(manager_->collectByIpPattern("10.1.").size(), 1u);
    EXPECT_EQ(manager_->collectWithHighHeartbeats(1).size(), 1u);
    EXPECT_EQ(manager_->collectNewerThan(10).size(), 1u);
    EXPECT_EQ(manager_->size(), 3u);
}

TEST_F(DeviceCacheManagerTest, RemoveWrappers) {
    manager_->addOrUpdate("camera-1", macFor(1), "10.1.0.1", std::nullopt);
    manager_->addOrUpdate("sensor-2", macFor(2), "10.2.0.1", std::nullopt);
    manager_->addOrUpdate("sensor-3", macFor(3), "10.3.0.1", std::nullopt);
    manager_->addOrUpdate("sensor-3", macFor(3), "10.3.0.1", std::nullopt);
    manager_->addOrUpdate("relay-4", macFor(4), "10.4.0.1", std::nullopt);

    EXPECT_EQ(manager_->removeByIpPattern("10.1."), 1u);
    EXPECT_EQ(manager_->removeByMacPattern("00:02"), 1u);
    EXPECT_EQ(manager_->removeWithLowHeartbeats(1), 1u);
    EXPECT_EQ(manager_->removeByDevicePattern("sensor"), 1u);
    EXPECT_EQ(manager_->size(), 0u);
}

TEST_F(DeviceCacheManagerTest, RemoveOlderThanUsesStrictAge) {
    manager_->addOrUpdate("old", macFor(1), "10.0.0.1", std::nullopt);
    advance(60);
    manager_->addOrUpdate("new", macFor(2), "10.0.0.2", std::nullopt);

    EXPECT_EQ(manager_->removeOlderThan(60), 0u);
    advance(1);
    EXPECT_EQ(manager_->removeOlderThan(60), 1u);
    EXPECT_TRUE(manager_->get(macFor(2)).has_value());
}

TEST_F(DeviceCacheManagerTest, InspectAndRemoveCountsEveryEntry) {
    for (int i = 0; i < 6; ++i) {
        manager_->addOrUpdate(std::to_string(i), macFor(i), "10.0.0.1",
                              std::nullopt);
    }
    auto result = manager_->inspectAndRemove(
        [](const HardwareAddress& address, const DeviceState&) {
            return address.bytes()[5] < 2;
        });
    EXPECT_EQ(result.checked, 6u);
    EXPECT_EQ(result.removed, 2u);
    EXPECT_EQ(manager_->size(), 4u);
}

// ============================================================================
// Advanced Removal Tests
// ============================================================================

TEST_F(DeviceCacheManagerTest, RemoveAdvancedByMaxAge) {
    for (int i = 0; i < 5; ++i) {
        manager_->addOrUpdate(std::to_string(i), macFor(i), "10.0.0.1",
                              std::nullopt, now_.load() - i * 1000);
    }
    RemovalCriteria criteria;
    criteria.max_age_seconds = 3600;

    const auto sweepTime = now_.load();
    const auto before = manager_->snapshot();
    auto removed = manager_->removeAdvanced(criteria);
    EXPECT_EQ(removed, 1u);

    std::set<std::string> kept;
    for (const auto& [address, state] : manager_->snapshot()) {
        EXPECT_LE(state.ageAt(sweepTime), 3600);
        kept.insert(address.toString());
    }
    std::size_t gone = 0;
    for (const auto& [address, state] : before) {
        if (!kept.contains(address.toString())) {
            ++gone;
            EXPECT_GT(state.ageAt(sweepTime), 3600) << address.toString();
        }
    }
    EXPECT_EQ(gone, removed);
}

TEST_F(DeviceCacheManagerTest, RemoveAdvancedByMinHeartbeats) {
    manager_->addOrUpdate("quiet", macFor(1), "10.0.0.1", std::nullopt);
    for (int i = 0; i < 3; ++i) {
        manager_->addOrUpdate("chatty", macFor(2), "10.0.0.2", std::nullopt);
    }
    manager_->addOrUpdate("steady", macFor(3), "10.0.0.3", std::nullopt);
    manager_->addOrUpdate("steady", macFor(3), "10.0.0.3", std::nullopt);

    RemovalCriteria criteria;
    criteria.min_heartbeats = 2;
    EXPECT_EQ(manager_->removeAdvanced(criteria), 2u);
    EXPECT_FALSE(manager_->get(macFor(1)).has_value());
    EXPECT_FALSE(manager_->get(macFor(3)).has_value());
    auto chatty = manager_->get(macFor(2));
    ASSERT_TRUE(chatty.has_value());
    EXPECT_EQ(chatty->heartbeat_count, 2u);
}

TEST_F(DeviceCacheManagerTest, RemoveAdvancedCombinesCriteriaWithAnd) {
    manager_->addOrUpdate("sensor-a", macFor(1), "10.0.0.1", std::nullopt,
                          now_.load() - 5000);
    manager_->addOrUpdate("camera-b", macFor(2), "10.0.0.2", std::nullopt,
                          now_.load() - 5000);
    manager_->addOrUpdate("sensor-c", macFor(3), "10.0.0.3", std::nullopt);

    RemovalCriteria criteria;
    criteria.max_age_seconds = 3600;
    criteria.device_patterns = std::vector<std::string>{"sensor"};

    EXPECT_EQ(manager_->removeAdvanced(criteria), 1u);
    EXPECT_FALSE(manager_->get(macFor(1)).has_value());
    EXPECT_TRUE(manager_->get(macFor(2)).has_value());
    EXPECT_TRUE(manager_->get(macFor(3)).has_value());
}

TEST_F(DeviceCacheManagerTest, RemoveAdvancedPatternListIsOr) {
    manager_->addOrUpdate("a", macFor(1), "10.1.0.1", std::nullopt);
    manager_->addOrUpdate("b", macFor(2), "10.2.0.1", std::nullopt);
    manager_->addOrUpdate("c", macFor(3), "10.3.0.1", std::nullopt);

    RemovalCriteria criteria;
    criteria.ip_patterns = std::vector<std::string>{"10.1.", "10.3."};
    EXPECT_EQ(manager_->removeAdvanced(criteria), 2u);
    EXPECT_EQ(manager_->size(), 1u);
}

TEST_F(DeviceCacheManagerTest, RemoveAdvancedMacPatternIgnoresCase) {
    manager_->addOrUpdate("a", "AA:BB:CC:00:00:01", "10.0.0.1", std::nullopt);
    manager_->addOrUpdate("b", "11:22:33:00:00:02", "10.0.0.2", std::nullopt);

    RemovalCriteria criteria;
    criteria.mac_patterns = std::vector<std::string>{"AA:BB"};
    EXPECT_EQ(manager_->removeAdvanced(criteria), 1u);
    EXPECT_FALSE(manager_->get("aa:bb:cc:00:00:01").has_value());
}

TEST_F(DeviceCacheManagerTest, RemovalCriteriaFromJson) {
    auto criteria = RemovalCriteria::fromJson(
        {{"max_age_seconds", 120}, {"ip_patterns", {"10.0."}}});
    ASSERT_TRUE(criteria.max_age_seconds.has_value());
    EXPECT_EQ(*criteria.max_age_seconds, 120);
    ASSERT_TRUE(criteria.ip_patterns.has_value());
    EXPECT_EQ(criteria.ip_patterns->size(), 1u);
    EXPECT_FALSE(criteria.min_heartbeats.has_value());
    EXPECT_FALSE(criteria.matchesEverything());
    EXPECT_TRUE(RemovalCriteria::fromJson(nlohmann::json::object())
                    .matchesEverything());
}

// ============================================================================
// Statistics Tests
// ============================================================================

TEST_F(DeviceCacheManagerTest, StatsOnEmptyCacheAreZero) {
    auto stats = manager_->stats();
    EXPECT_EQ(stats.total_entries, 0u);
    EXPECT_EQ(stats.oldest_entry_age_seconds, 0);
    EXPECT_EQ(stats.newest_entry_age_seconds, 0);
}

TEST_F(DeviceCacheManagerTest, StatsSplitActiveAndStale) {
    manager_->addOrUpdate("old", macFor(1), "10.0.0.1", std::nullopt,
                          now_.load() - 600);
    manager_->addOrUpdate("new", macFor(2), "10.0.0.2", std::nullopt,
                          now_.load() - 10);
    manager_->addOrUpdate("new", macFor(2), "10.0.0.2", std::nullopt,
                          now_.load() - 10);

    auto stats = manager_->stats(300);
    EXPECT_EQ(stats.total_entries, 2u);
    EXPECT_EQ(stats.active_entries, 1u);
    EXPECT_EQ(stats.stale_entries, 1u);
    EXPECT_EQ(stats.total_heartbeats, 1u);
    EXPECT_EQ(stats.oldest_entry_age_seconds, 600);
    EXPECT_EQ(stats.newest_entry_age_seconds, 10);

    auto json = stats.toJson();
    EXPECT_EQ(json["total_entries"], 2);
}

TEST_F(DeviceCacheManagerTest, BulkOperationsAreTimed) {
    manager_->addOrUpdate("1", macFor(1), "10.0.0.1", std::nullopt);
    (void)manager_->snapshot();
    (void)manager_->stats();
    manager_->removeOlderThan(100);

    EXPECT_EQ(queries_.snapshot("cache.snapshot").invocations, 1u);
    EXPECT_EQ(queries_.snapshot("cache.stats").invocations, 1u);
    EXPECT_GE(queries_.snapshot("cache.remove_matching").invocations, 1u);
}

// ============================================================================
// Concurrency Tests
// ============================================================================

TEST_F(DeviceCacheManagerTest, ConcurrentWritersWithSweeper) {
    std::atomic<bool> writersDone{false};

    auto writer = [this](int offset) {
        for (int i = 0; i < 100; ++i) {
            manager_->addOrUpdate(std::to_string(offset + i),
                                  macFor(offset + i), "10.0.0.1",
                                  std::nullopt);
        }
    };

    std::thread first(writer, 0);
    std::thread second(writer, 1000);
    std::thread sweeper([this, &writersDone] {
        while (!writersDone.load()) {
            manager_->removeMatching(
                [this](const HardwareAddress&, const DeviceState& state) {
                    return state.ageAt(now_.load()) > 3600;
                });
        }
    });

    first.join();
    second.join();
    writersDone = true;
    sweeper.join();

    EXPECT_EQ(manager_->size(), 200u);
    std::set<std::string> keys;
    for (const auto& [address, state] : manager_->snapshot()) {
        keys.insert(address.toString());
    }
    EXPECT_EQ(keys.size(), 200u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_TRUE(keys.contains(macFor(i)));
        EXPECT_TRUE(keys.contains(macFor(1000 + i)));
    }
}
