/*
 * test_reload_coordinator.cpp - Tests for configuration hot reload
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "config/service_config.hpp"
#include "core/exception.hpp"
#include "reload/reload_coordinator.hpp"
#include "service/process_state.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
namespace fs = std::filesystem;
using beacon::config::ServiceConfig;
using beacon::reload::ReloadCoordinator;
using beacon::reload::ServingComponent;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class MockServingComponent : public ServingComponent {
public:
    MOCK_METHOD(void, start, (), (override));
    MOCK_METHOD(void, stop, (), (override));
    MOCK_METHOD(bool, isRunning, (), (const, override));
};

/**
 * @brief Factory that records every component it hands out
 *
 * A configuration whose port is 1 yields a component that fails to start.
 */
class RecordingFactory {
public:
    std::unique_ptr<ServingComponent> operator()(const ServiceConfig& config) {
        auto component = std::make_unique<NiceMock<MockServingComponent>>();
        const int index = static_cast<int>(builtPorts_.size());
        builtPorts_.push_back(config.app.port);
        if (config.app.port == 1) {
            ON_CALL(*component, start())
                .WillByDefault(Throw(std::runtime_error("address in use")));
        } else {
            ON_CALL(*component, start()).WillByDefault([this] { ++started_; });
        }
        ON_CALL(*component, stop()).WillByDefault([this, index] {
            stopped_.push_back(index);
        });
        ON_CALL(*component, isRunning()).WillByDefault(Return(true));
        return component;
    }

    std::vector<int> builtPorts_;
    std::vector<int> stopped_;
    int started_{0};
};

class ReloadCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("beacon_reload_test_" +
                std::string(::testing::UnitTest::GetInstance()
                                ->current_test_info()
                                ->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        path_ = dir_ / "beacon.json";

        initial_.app.port = 8080;
        initial_.reload.enabled = false;
        beacon::config::saveConfig(initial_, path_);
    }

    void TearDown() override { fs::remove_all(dir_); }

    std::unique_ptr<ReloadCoordinator> makeCoordinator(
        const ServiceConfig& initial) {
        return std::make_unique<ReloadCoordinator>(
            path_, initial,
            [this](const ServiceConfig& config) { return factory_(config); });
    }

    void writeConfig(const ServiceConfig& config) {
        beacon::config::saveConfig(config, path_);
    }

    fs::path dir_;
    fs::path path_;
    ServiceConfig initial_;
    RecordingFactory factory_;
};

// ============================================================================
// Lifecycle Tests
// ============================================================================

TEST_F(ReloadCoordinatorTest, StartBuildsComponentForInitialConfig) {
    auto coordinator = makeCoordinator(initial_);
    EXPECT_FALSE(coordinator->isServing());
    coordinator->start();
    EXPECT_TRUE(coordinator->isServing());
    EXPECT_FALSE(coordinator->isWatching());
    ASSERT_EQ(factory_.builtPorts_.size(), 1u);
    EXPECT_EQ(factory_.builtPorts_[0], 8080);

    coordinator->stop();
    EXPECT_FALSE(coordinator->isServing());
    EXPECT_EQ(factory_.stopped_, std::vector<int>{0});
}

TEST_F(ReloadCoordinatorTest, StartFailureIsReloadError) {
    auto bad = initial_;
    bad.app.port = 1;
    auto coordinator = makeCoordinator(bad);
    EXPECT_THROW(coordinator->start(), beacon::ReloadError);
    EXPECT_FALSE(coordinator->isServing());
}

TEST_F(ReloadCoordinatorTest, ReloadWhileStoppedIsIgnored) {
    auto coordinator = makeCoordinator(initial_);
    EXPECT_FALSE(coordinator->reloadNow());
    EXPECT_TRUE(factory_.builtPorts_.empty());
}

// ============================================================================
// Reload Tests
// ============================================================================

TEST_F(ReloadCoordinatorTest, ReloadReplacesComponent) {
    auto coordinator = makeCoordinator(initial_);
    coordinator->start();

    auto next = initial_;
    next.app.port = 9090;
    writeConfig(next);

    EXPECT_TRUE(coordinator->reloadNow());
    EXPECT_EQ(coordinator->reloadCount(), 1u);
    EXPECT_EQ(coordinator->currentConfig().app.port, 9090);
    EXPECT_EQ(factory_.builtPorts_, (std::vector<int>{8080, 9090}));
    EXPECT_EQ(factory_.stopped_, std::vector<int>{0});
    EXPECT_FALSE(coordinator->lastError().has_value());
    coordinator->stop();
}

TEST_F(ReloadCoordinatorTest, ListenersSeeNewConfigBeforeOldComponentStops) {
    auto coordinator = makeCoordinator(initial_);
    std::vector<std::size_t> stoppedAtNotify;
    std::vector<int> seenPorts;
    coordinator->onConfigChanged([&](const ServiceConfig& config) {
        stoppedAtNotify.push_back(factory_.stopped_.size());
        seenPorts.push_back(config.app.port);
    });
    coordinator->start();

    auto next = initial_;
    next.app.port = 9191;
    writeConfig(next);
    ASSERT_TRUE(coordinator->reloadNow());

    EXPECT_EQ(seenPorts, std::vector<int>{9191});
    EXPECT_EQ(stoppedAtNotify, std::vector<std::size_t>{0});
    coordinator->stop();
}

TEST_F(ReloadCoordinatorTest, ThrowingListenerDoesNotAbortReload) {
    auto coordinator = makeCoordinator(initial_);
    coordinator->onConfigChanged([](const ServiceConfig&) {
        throw std::runtime_error("listener failure");
    });
    coordinator->start();

    auto next = initial_;
    next.app.port = 9292;
    writeConfig(next);
    EXPECT_TRUE(coordinator->reloadNow());
    EXPECT_EQ(coordinator->currentConfig().app.port, 9292);
    coordinator->stop();
}

TEST_F(ReloadCoordinatorTest, NonStandardListenerExceptionIsContained) {
    auto coordinator = makeCoordinator(initial_);
    coordinator->onConfigChanged([](const ServiceConfig&) { throw 42; });
    coordinator->start();

    auto next = initial_;
    next.app.port = 9393;
    writeConfig(next);
    EXPECT_TRUE(coordinator->reloadNow());
    EXPECT_EQ(coordinator->currentConfig().app.port, 9393);
    coordinator->stop();
}

TEST_F(ReloadCoordinatorTest, NonStandardStartFailureRollsBack) {
    auto coordinator = std::make_unique<ReloadCoordinator>(
        path_, initial_, [this](const ServiceConfig& config) {
            auto component = factory_(config);
            if (config.app.port == 2) {
                auto* mock =
                    static_cast<MockServingComponent*>(component.get());
                ON_CALL(*mock, start()).WillByDefault([] { throw 42; });
            }
            return component;
        });
    coordinator->start();

    auto broken = initial_;
    broken.app.port = 2;
    writeConfig(broken);
    EXPECT_FALSE(coordinator->reloadNow());
    EXPECT_EQ(coordinator->currentConfig().app.port, 8080);
    EXPECT_TRUE(coordinator->isServing());
    coordinator->stop();
}

TEST_F(ReloadCoordinatorTest, InvalidFileKeepsCurrentComponent) {
    auto coordinator = makeCoordinator(initial_);
    coordinator->start();

    auto invalid = initial_;
    invalid.app.threads = 0;
    writeConfig(invalid);

    EXPECT_FALSE(coordinator->reloadNow());
    EXPECT_EQ(coordinator->failedReloadCount(), 1u);
    EXPECT_TRUE(coordinator->lastError().has_value());
    EXPECT_EQ(factory_.builtPorts_.size(), 1u);
    EXPECT_TRUE(factory_.stopped_.empty());
    EXPECT_TRUE(coordinator->isServing());
    coordinator->stop();
}

TEST_F(ReloadCoordinatorTest, FailedStartRestoresPreviousConfig) {
    auto coordinator = makeCoordinator(initial_);
    coordinator->start();

    auto broken = initial_;
    broken.app.port = 1;
    writeConfig(broken);

    EXPECT_FALSE(coordinator->reloadNow());
    EXPECT_EQ(coordinator->failedReloadCount(), 1u);
    EXPECT_EQ(coordinator->currentConfig().app.port, 8080);
    EXPECT_TRUE(coordinator->isServing());
    EXPECT_EQ(factory_.builtPorts_, (std::vector<int>{8080, 1, 8080}));

    auto fixed = initial_;
    fixed.app.port = 9393;
    writeConfig(fixed);
    EXPECT_TRUE(coordinator->reloadNow());
    EXPECT_EQ(coordinator->currentConfig().app.port, 9393);
    EXPECT_FALSE(coordinator->lastError().has_value());
    coordinator->stop();
}

// ============================================================================
// Watcher Integration Tests
// ============================================================================

TEST_F(ReloadCoordinatorTest, FileChangeTriggersReload) {
    auto watched = initial_;
    watched.reload.enabled = true;
    watched.reload.pollIntervalMs = 10;
    watched.reload.debounceMs = 50;
    writeConfig(watched);

    auto coordinator = makeCoordinator(watched);
    coordinator->start();
    EXPECT_TRUE(coordinator->isWatching());

    auto next = watched;
    next.app.port = 9494;
    next.app.name = "beacon-reloaded";
    writeConfig(next);

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (coordinator->reloadCount() == 0 &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(coordinator->reloadCount(), 1u);
    EXPECT_EQ(coordinator->currentConfig().app.port, 9494);

    coordinator->stop();
    EXPECT_FALSE(coordinator->isWatching());
}

// ============================================================================
// Process State Tests
// ============================================================================

TEST_F(ReloadCoordinatorTest, ProcessStateSurvivesReloads) {
    beacon::service::ProcessState state(16);
    std::vector<beacon::service::ProcessState*> seenStates;
    auto coordinator = std::make_unique<ReloadCoordinator>(
        path_, initial_, [&](const ServiceConfig& config) {
            seenStates.push_back(&state);
            return factory_(config);
        });
    coordinator->start();

    state.cache().addOrUpdate("1", "02:00:00:00:00:01", "10.0.0.1", 80);
    state.cache().addOrUpdate("2", "02:00:00:00:00:02", "10.0.0.2",
                              std::nullopt);
    state.cache().addOrUpdate("2", "02:00:00:00:00:02", "10.0.0.2",
                              std::nullopt);
    state.metrics().endpoints.record("/hbd", 3ms);
    state.recordHeartbeat();
    const auto before = state.cache().snapshot();

    auto next = initial_;
    next.app.port = 9595;
    writeConfig(next);
    ASSERT_TRUE(coordinator->reloadNow());

    auto broken = initial_;
    broken.app.port = 1;
    writeConfig(broken);
    ASSERT_FALSE(coordinator->reloadNow());

    auto after = state.cache().snapshot();
    std::sort(after.begin(), after.end(), [](const auto& a, const auto& b) {
        return a.first.toString() < b.first.toString();
    });
    auto expected = before;
    std::sort(expected.begin(), expected.end(),
              [](const auto& a, const auto& b) {
                  return a.first.toString() < b.first.toString();
              });
    EXPECT_EQ(after, expected);
    EXPECT_EQ(state.metrics().endpoints.snapshot("/hbd").invocations, 1u);
    EXPECT_EQ(state.heartbeats(), 1u);
    EXPECT_EQ(seenStates.size(), 4u);
    coordinator->stop();
}
