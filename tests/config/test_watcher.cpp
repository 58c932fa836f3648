/*
 * test_watcher.cpp - Tests for the polling configuration file watcher
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "config/components/watcher.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
namespace fs = std::filesystem;
using beacon::config::ConfigWatcher;
using beacon::config::FileEvent;

class ConfigWatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("beacon_watcher_test_" +
                std::string(::testing::UnitTest::GetInstance()
                                ->current_test_info()
                                ->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        file_ = dir_ / "beacon.json";
        write("{}");
    }

    void TearDown() override { fs::remove_all(dir_); }

    void write(const std::string& content) {
        std::ofstream out(file_, std::ios::trunc);
        out << content;
    }

    ConfigWatcher::WatcherOptions fastOptions() const {
        ConfigWatcher::WatcherOptions options;
        options.poll_interval = 10ms;
        options.debounce_delay = 50ms;
        return options;
    }

    fs::path dir_;
    fs::path file_;
};

// ============================================================================
// Registration Tests
// ============================================================================

TEST_F(ConfigWatcherTest, WatchRequiresExistingFile) {
    ConfigWatcher watcher(fastOptions());
    EXPECT_FALSE(watcher.watchFile(dir_ / "absent.json", [](auto, auto) {}));
    EXPECT_FALSE(watcher.watchFile(dir_, [](auto, auto) {}));
    EXPECT_TRUE(watcher.watchFile(file_, [](auto, auto) {}));
    EXPECT_TRUE(watcher.isWatching(file_));
    EXPECT_EQ(watcher.getWatchedPaths().size(), 1u);
    EXPECT_EQ(watcher.getStatistics().watched_paths_count, 1u);
}

TEST_F(ConfigWatcherTest, StopWatchingRemovesPath) {
    ConfigWatcher watcher(fastOptions());
    ASSERT_TRUE(watcher.watchFile(file_, [](auto, auto) {}));
    EXPECT_TRUE(watcher.stopWatching(file_));
    EXPECT_FALSE(watcher.stopWatching(file_));
    EXPECT_FALSE(watcher.isWatching(file_));
}

TEST_F(ConfigWatcherTest, StartIsRejectedWhileRunning) {
    ConfigWatcher watcher(fastOptions());
    EXPECT_TRUE(watcher.startWatching());
    EXPECT_TRUE(watcher.isRunning());
    EXPECT_FALSE(watcher.startWatching());
    watcher.stop();
    EXPECT_FALSE(watcher.isRunning());
}

// ============================================================================
// Debounce Tests
// ============================================================================

TEST_F(ConfigWatcherTest, BurstOfWritesDeliversOneEvent) {
    ConfigWatcher watcher(fastOptions());
    std::vector<FileEvent> events;
    ASSERT_TRUE(watcher.watchFile(
        file_, [&events](const fs::path&, FileEvent event) {
            events.push_back(event);
        }));

    write(R"({"a": 1})");
    watcher.forceCheck();
    write(R"({"a": 12})");
    watcher.forceCheck();
    write(R"({"a": 123})");
    watcher.forceCheck();
    EXPECT_TRUE(events.empty());
    EXPECT_EQ(watcher.getPendingEventCount(), 1u);

    std::this_thread::sleep_for(80ms);
    watcher.forceCheck();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0], FileEvent::MODIFIED);
    EXPECT_EQ(watcher.getPendingEventCount(), 0u);

    auto stats = watcher.getStatistics();
    EXPECT_EQ(stats.changes_detected, 3u);
    EXPECT_EQ(stats.events_debounced, 2u);
    EXPECT_EQ(stats.events_delivered, 1u);
}

TEST_F(ConfigWatcherTest, ReplaceWithinWindowIsModified) {
    ConfigWatcher watcher(fastOptions());
    std::vector<FileEvent> events;
    ASSERT_TRUE(watcher.watchFile(
        file_, [&events](const fs::path&, FileEvent event) {
            events.push_back(event);
        }));

    fs::remove(file_);
    watcher.forceCheck();
    write(R"({"replaced": true})");
    watcher.forceCheck();

    std::this_thread::sleep_for(80ms);
    watcher.forceCheck();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0], FileEvent::MODIFIED);
}

TEST_F(ConfigWatcherTest, DeletionIsReported) {
    ConfigWatcher watcher(fastOptions());
    std::vector<FileEvent> events;
    ASSERT_TRUE(watcher.watchFile(
        file_, [&events](const fs::path&, FileEvent event) {
            events.push_back(event);
        }));

    fs::remove(file_);
    watcher.forceCheck();
    std::this_thread::sleep_for(80ms);
    watcher.forceCheck();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0], FileEvent::DELETED);
}

TEST_F(ConfigWatcherTest, CallbackErrorsAreCounted) {
    ConfigWatcher watcher(fastOptions());
    ASSERT_TRUE(watcher.watchFile(file_, [](const fs::path&, FileEvent) {
        throw std::runtime_error("callback failure");
    }));

    write(R"({"b": 2})");
    watcher.forceCheck();
    std::this_thread::sleep_for(80ms);
    EXPECT_NO_THROW(watcher.forceCheck());
    EXPECT_EQ(watcher.getStatistics().callback_errors, 1u);

    watcher.resetStatistics();
    EXPECT_EQ(watcher.getStatistics().callback_errors, 0u);
}

TEST_F(ConfigWatcherTest, NonStandardCallbackErrorIsCounted) {
    ConfigWatcher watcher(fastOptions());
    ASSERT_TRUE(
        watcher.watchFile(file_, [](const fs::path&, FileEvent) { throw 42; }));

    write(R"({"d": 4})");
    watcher.forceCheck();
    std::this_thread::sleep_for(80ms);
    EXPECT_NO_THROW(watcher.forceCheck());
    EXPECT_EQ(watcher.getStatistics().callback_errors, 1u);
    EXPECT_EQ(watcher.getStatistics().events_delivered, 1u);
}

TEST_F(ConfigWatcherTest, BackgroundThreadDeliversEvents) {
    ConfigWatcher watcher(fastOptions());
    std::atomic<int> delivered{0};
    ASSERT_TRUE(watcher.watchFile(
        file_, [&delivered](const fs::path&, FileEvent) { ++delivered; }));
    ASSERT_TRUE(watcher.startWatching());

    write(R"({"c": 3})");
    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (delivered.load() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    watcher.stop();
    EXPECT_EQ(delivered.load(), 1);
}
