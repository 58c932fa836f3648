/*
 * watcher.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Configuration File Watcher Implementation

**************************************************/

#include "watcher.hpp"

#include <exception>
#include <system_error>

namespace beacon::config {

namespace {

std::string keyFor(const std::filesystem::path& path) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(path, ec);
    return ec ? path.lexically_normal().string() : canonical.string();
}

}  // namespace

ConfigWatcher::WatchedPath::WatchedPath(std::filesystem::path p,
                                        FileChangeCallback cb)
    : path(std::move(p)), callback(std::move(cb)) {
    std::error_code ec;
    exists = std::filesystem::exists(path, ec);
    if (exists) {
        last_write_time = std::filesystem::last_write_time(path, ec);
        last_size = std::filesystem::file_size(path, ec);
    }
}

ConfigWatcher::ConfigWatcher(const WatcherOptions& options)
    : options_(options), logger_(spdlog::get("config_watcher")) {
    if (!logger_) {
        logger_ = spdlog::default_logger();
    }

    if (options_.poll_interval < std::chrono::milliseconds(10)) {
        logger_->warn("Poll interval too low ({}ms), adjusting to 10ms minimum",
                      options_.poll_interval.count());
        options_.poll_interval = std::chrono::milliseconds(10);
    }
    if (options_.debounce_delay < std::chrono::milliseconds::zero()) {
        options_.debounce_delay = std::chrono::milliseconds::zero();
    }

    logger_->debug(
        "ConfigWatcher initialized with poll_interval={}ms, "
        "debounce_delay={}ms",
        options_.poll_interval.count(), options_.debounce_delay.count());
}

ConfigWatcher::~ConfigWatcher() { stop(); }

bool ConfigWatcher::watchFile(const std::filesystem::path& file_path,
                              FileChangeCallback callback) {
    if (!callback) {
        logger_->error("Cannot watch file '{}': callback is null",
                       file_path.string());
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
        logger_->error("Cannot watch file '{}': file does not exist",
                       file_path.string());
        return false;
    }
    if (std::filesystem::is_directory(file_path, ec)) {
        logger_->error("Cannot watch file '{}': path is a directory",
                       file_path.string());
        return false;
    }

    const auto key = keyFor(file_path);
    std::lock_guard lock(mutex_);
    if (watched_paths_.contains(key)) {
        logger_->warn("File '{}' is already being watched", key);
        return true;
    }
    watched_paths_.emplace(key, WatchedPath(key, std::move(callback)));
    stats_.watched_paths_count = watched_paths_.size();
    logger_->info("Started watching file: {}", key);
    return true;
}

bool ConfigWatcher::stopWatching(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    const bool erased = watched_paths_.erase(keyFor(path)) > 0;
    stats_.watched_paths_count = watched_paths_.size();
    if (erased) {
        logger_->info("Stopped watching: {}", path.string());
    }
    return erased;
}

bool ConfigWatcher::isWatching(const std::filesystem::path& path) const {
    std::lock_guard lock(mutex_);
    return watched_paths_.contains(keyFor(path));
}

std::vector<std::filesystem::path> ConfigWatcher::getWatchedPaths() const {
    std::lock_guard lock(mutex_);
    std::vector<std::filesystem::path> paths;
    paths.reserve(watched_paths_.size());
    for (const auto& [key, watched] : watched_paths_) {
        paths.push_back(watched.path);
    }
    return paths;
}

bool ConfigWatcher::startWatching() {
    if (isRunning()) {
        logger_->warn("ConfigWatcher is already running");
        return false;
    }
    watch_thread_ = std::jthread(
        [this](std::stop_token token) { watchLoop(std::move(token)); });
    logger_->info("ConfigWatcher started");
    return true;
}

void ConfigWatcher::stop() {
    if (watch_thread_.joinable()) {
        watch_thread_.request_stop();
        watch_thread_.join();
        logger_->info("ConfigWatcher stopped");
    }
}

bool ConfigWatcher::isRunning() const noexcept {
    return watch_thread_.joinable() &&
           !watch_thread_.get_stop_token().stop_requested();
}

ConfigWatcher::Statistics ConfigWatcher::getStatistics() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

void ConfigWatcher::resetStatistics() {
    std::lock_guard lock(mutex_);
    stats_ = Statistics{};
    stats_.watched_paths_count = watched_paths_.size();
}

void ConfigWatcher::forceCheck() { pollOnce(); }

std::size_t ConfigWatcher::getPendingEventCount() const {
    std::lock_guard lock(mutex_);
    std::size_t pending = 0;
    for (const auto& [key, watched] : watched_paths_) {
        if (watched.pending_since) {
            ++pending;
        }
    }
    return pending;
}

void ConfigWatcher::watchLoop(std::stop_token token) {
    logger_->debug("Watch loop started");
    while (!token.stop_requested()) {
        pollOnce();
        std::unique_lock lock(wait_mutex_);
        if (wakeup_.wait_for(lock, token, options_.poll_interval,
                             [&token] { return token.stop_requested(); })) {
            break;
        }
    }
    logger_->debug("Watch loop ended");
}

void ConfigWatcher::pollOnce() {
    std::vector<DueEvent> due;
    {
        std::lock_guard lock(mutex_);
        const auto now = std::chrono::steady_clock::now();
        for (auto& [key, watched] : watched_paths_) {
            checkPath(watched, now);
            if (watched.pending_since &&
                now - *watched.pending_since >= options_.debounce_delay) {
                due.push_back(
                    {watched.path, watched.pending_event, watched.callback});
                watched.pending_since.reset();
            }
        }
    }
    for (const auto& event : due) {
        triggerEvent(event);
    }
}

void ConfigWatcher::checkPath(WatchedPath& watched_path, TimePoint now) {
    std::error_code ec;
    const bool exists = std::filesystem::exists(watched_path.path, ec);
    std::optional<FileEvent> change;

    if (!exists) {
        if (watched_path.exists) {
            change = FileEvent::DELETED;
        }
        watched_path.exists = false;
    } else {
        const auto write_time =
            std::filesystem::last_write_time(watched_path.path, ec);
        if (ec) {
            logger_->warn("Cannot stat '{}': {}", watched_path.path.string(),
                          ec.message());
            return;
        }
        const auto size = std::filesystem::file_size(watched_path.path, ec);
        if (ec) {
            logger_->warn("Cannot stat '{}': {}", watched_path.path.string(),
                          ec.message());
            return;
        }
        if (!watched_path.exists) {
            change = FileEvent::CREATED;
        } else if (write_time != watched_path.last_write_time ||
                   size != watched_path.last_size) {
            change = FileEvent::MODIFIED;
        }
        watched_path.exists = true;
        watched_path.last_write_time = write_time;
        watched_path.last_size = size;
    }

    if (!change) {
        return;
    }
    ++stats_.changes_detected;
    if (watched_path.pending_since) {
        ++stats_.events_debounced;
        // A file that reappears within the window was rewritten, not created
        if (watched_path.pending_event == FileEvent::DELETED &&
            *change == FileEvent::CREATED) {
            change = FileEvent::MODIFIED;
        }
    }
    watched_path.pending_event = *change;
    watched_path.pending_since = now;
}

void ConfigWatcher::triggerEvent(const DueEvent& due) {
    logger_->debug("File {} changed", due.path.string());
    try {
        due.callback(due.path, due.event);
        std::lock_guard lock(mutex_);
        ++stats_.events_delivered;
    } catch (const std::exception& e) {
        logger_->error("Error in file change callback for '{}': {}",
                       due.path.string(), e.what());
        std::lock_guard lock(mutex_);
        ++stats_.events_delivered;
        ++stats_.callback_errors;
    } catch (...) {
        logger_->error("Unknown error in file change callback for '{}'",
                       due.path.string());
        std::lock_guard lock(mutex_);
        ++stats_.events_delivered;
        ++stats_.callback_errors;
    }
}

}  // namespace beacon::config
