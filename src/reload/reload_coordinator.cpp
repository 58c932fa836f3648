/*
 * reload_coordinator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "reload_coordinator.hpp"

#include "core/exception.hpp"
#include "logging/logging.hpp"

namespace beacon::reload {

ReloadCoordinator::ReloadCoordinator(std::filesystem::path config_path,
                                     config::ServiceConfig initial,
                                     ServingFactory factory)
    : configPath_(std::move(config_path)),
      factory_(std::move(factory)),
      config_(std::move(initial)),
      logger_(spdlog::get("reload")) {
    if (!logger_) {
        logger_ = spdlog::default_logger();
    }
}

ReloadCoordinator::~ReloadCoordinator() { stop(); }

void ReloadCoordinator::start() {
    std::lock_guard lock(reloadMutex_);
    if (active_.load()) {
        logger_->warn("ReloadCoordinator already started");
        return;
    }

    const auto initial = currentConfig();
    auto component = buildAndStart(initial);
    {
        std::lock_guard stateLock(stateMutex_);
        component_ = std::move(component);
    }
    active_.store(true);
    logger_->info("Serving with configuration from {}", configPath_.string());

    if (!initial.reload.enabled) {
        logger_->info("Configuration hot reload disabled");
        return;
    }

    auto watcher = std::make_unique<config::ConfigWatcher>(
        config::ConfigWatcher::WatcherOptions{initial.reload.pollInterval(),
                                              initial.reload.debounce()});
    const bool watching = watcher->watchFile(
        configPath_,
        [this](const std::filesystem::path& path, config::FileEvent event) {
            onFileEvent(path, event);
        });
    if (!watching) {
        logger_->warn("Cannot watch {}; hot reload unavailable",
                      configPath_.string());
        return;
    }
    watcher->startWatching();
    std::lock_guard stateLock(stateMutex_);
    watcher_ = std::move(watcher);
}

void ReloadCoordinator::stop() {
    // The watcher thread may be inside reloadNow(); join it before taking
    // the reload lock.
    active_.store(false);
    std::unique_ptr<config::ConfigWatcher> watcher;
    {
        std::lock_guard stateLock(stateMutex_);
        watcher = std::move(watcher_);
    }
    if (watcher) {
        watcher->stop();
    }

    std::lock_guard lock(reloadMutex_);
    std::unique_ptr<ServingComponent> component;
    {
        std::lock_guard stateLock(stateMutex_);
        component = std::move(component_);
    }
    if (component) {
        component->stop();
        logger_->info("Serving component stopped");
    }
}

bool ReloadCoordinator::reloadNow() {
    std::lock_guard lock(reloadMutex_);
    if (!active_.load()) {
        logger_->warn("Reload requested while stopped; ignored");
        return false;
    }
    try {
        applyReload();
    } catch (const ReloadError& e) {
        failedReloadCount_.fetch_add(1, std::memory_order_relaxed);
        logger_->error("Configuration reload failed: {}", e.what());
        std::lock_guard stateLock(stateMutex_);
        lastError_ = e.what();
        return false;
    }
    reloadCount_.fetch_add(1, std::memory_order_relaxed);
    {
        std::lock_guard stateLock(stateMutex_);
        lastError_.reset();
    }
    logger_->info("Configuration reloaded from {}", configPath_.string());
    return true;
}

void ReloadCoordinator::applyReload() {
    config::ServiceConfig next;
    try {
        next = config::loadConfig(configPath_);
    } catch (const ConfigError& e) {
        THROW_RELOAD_ERROR(std::string("Rejected configuration: ") +
                           e.what());
    }

    std::vector<ConfigListener> listeners;
    {
        std::lock_guard stateLock(stateMutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        try {
            listener(next);
        } catch (const std::exception& e) {
            logger_->warn("Configuration listener failed: {}", e.what());
        } catch (...) {
            logger_->warn("Configuration listener failed: unknown exception");
        }
    }

    std::unique_ptr<ServingComponent> previous;
    {
        std::lock_guard stateLock(stateMutex_);
        previous = std::move(component_);
    }
    if (previous) {
        previous->stop();
        previous.reset();
    }

    try {
        auto fresh = buildAndStart(next);
        std::lock_guard stateLock(stateMutex_);
        component_ = std::move(fresh);
        config_ = next;
    } catch (const ReloadError&) {
        // Put a component for the last good configuration back in service
        try {
            auto restored = buildAndStart(currentConfig());
            std::lock_guard stateLock(stateMutex_);
            component_ = std::move(restored);
        } catch (const ReloadError& inner) {
            logger_->critical("Could not restore previous component: {}",
                              inner.what());
        }
        throw;
    }

    logging::setLevel(next.logging.level);
}

std::unique_ptr<ServingComponent> ReloadCoordinator::buildAndStart(
    const config::ServiceConfig& config) {
    std::unique_ptr<ServingComponent> component;
    try {
        component = factory_(config);
        if (!component) {
            THROW_RELOAD_ERROR("Serving factory returned no component");
        }
        component->start();
    } catch (const ReloadError&) {
        throw;
    } catch (const std::exception& e) {
        THROW_RELOAD_ERROR(
            std::string("Failed to start serving component: ") + e.what());
    } catch (...) {
        THROW_RELOAD_ERROR(
            "Failed to start serving component: unknown exception");
    }
    return component;
}

void ReloadCoordinator::onFileEvent(const std::filesystem::path& path,
                                    config::FileEvent event) {
    if (event == config::FileEvent::DELETED) {
        logger_->warn("Configuration file {} deleted; keeping current settings",
                      path.string());
        return;
    }
    logger_->info("Configuration file {} changed, reloading", path.string());
    reloadNow();
}

void ReloadCoordinator::onConfigChanged(ConfigListener listener) {
    std::lock_guard stateLock(stateMutex_);
    listeners_.push_back(std::move(listener));
}

config::ServiceConfig ReloadCoordinator::currentConfig() const {
    std::lock_guard stateLock(stateMutex_);
    return config_;
}

bool ReloadCoordinator::isServing() const {
    std::lock_guard stateLock(stateMutex_);
    return component_ != nullptr;
}

bool ReloadCoordinator::isWatching() const {
    std::lock_guard stateLock(stateMutex_);
    return watcher_ != nullptr && watcher_->isRunning();
}

std::optional<std::string> ReloadCoordinator::lastError() const {
    std::lock_guard stateLock(stateMutex_);
    return lastError_;
}

}  // namespace beacon::reload
