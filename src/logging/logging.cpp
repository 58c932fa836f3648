/*
 * logging.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging.hpp"

#include <filesystem>
#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace beacon::logging {

namespace {

struct LoggingState {
    std::mutex mutex;
    std::vector<spdlog::sink_ptr> sinks;
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v"};
    spdlog::level::level_enum level{spdlog::level::info};
};

LoggingState& state() {
    static LoggingState instance;
    return instance;
}

bool parseLevel(std::string_view name, spdlog::level::level_enum& level) {
    for (int i = spdlog::level::trace; i < spdlog::level::n_levels; ++i) {
        const auto candidate = static_cast<spdlog::level::level_enum>(i);
        const auto text = spdlog::level::to_string_view(candidate);
        if (std::string_view(text.data(), text.size()) == name) {
            level = candidate;
            return true;
        }
    }
    // spdlog spells it "warning"
    if (name == "warn") {
        level = spdlog::level::warn;
        return true;
    }
    return false;
}

std::shared_ptr<spdlog::logger> makeLogger(const std::string& name,
                                           const LoggingState& s) {
    auto logger =
        std::make_shared<spdlog::logger>(name, s.sinks.begin(), s.sinks.end());
    logger->set_level(s.level);
    logger->set_pattern(s.pattern);
    return logger;
}

}  // namespace

bool initialize(const config::LoggingConfig& config) {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    s.pattern = config.pattern;
    if (!parseLevel(config.level, s.level)) {
        s.level = spdlog::level::info;
    }

    s.sinks.clear();
    s.sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    bool fileOk = true;
    if (!config.file.empty()) {
        try {
            const std::filesystem::path filePath(config.file);
            if (filePath.has_parent_path()) {
                std::filesystem::create_directories(filePath.parent_path());
            }
            s.sinks.push_back(
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config.file, config.maxFileSize, config.maxFiles));
        } catch (const std::exception& e) {
            fileOk = false;
            spdlog::error("Failed to open log file '{}': {}", config.file,
                          e.what());
        }
    }

    auto defaultLogger = makeLogger("beacon", s);
    spdlog::drop("beacon");
    spdlog::set_default_logger(defaultLogger);

    for (auto name : COMPONENT_LOGGERS) {
        const std::string loggerName(name);
        spdlog::drop(loggerName);
        spdlog::register_logger(makeLogger(loggerName, s));
    }

    spdlog::flush_on(spdlog::level::warn);
    defaultLogger->debug("Logging initialized at level {}", config.level);
    return fileOk;
}

std::shared_ptr<spdlog::logger> getLogger(const std::string& name) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (auto logger = spdlog::get(name)) {
        return logger;
    }
    if (s.sinks.empty()) {
        s.sinks.push_back(
            std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    auto logger = makeLogger(name, s);
    spdlog::register_logger(logger);
    return logger;
}

bool setLevel(std::string_view level) {
    spdlog::level::level_enum parsed{};
    if (!parseLevel(level, parsed)) {
        spdlog::warn("Ignoring unknown log level '{}'", level);
        return false;
    }
    auto& s = state();
    {
        std::lock_guard lock(s.mutex);
        s.level = parsed;
    }
    spdlog::set_level(parsed);
    spdlog::info("Log level set to {}", level);
    return true;
}

std::string currentLevel() {
    const auto text = spdlog::level::to_string_view(spdlog::get_level());
    return std::string(text.data(), text.size());
}

void shutdown() {
    spdlog::apply_all(
        [](const std::shared_ptr<spdlog::logger>& logger) { logger->flush(); });
    spdlog::drop_all();
}

}  // namespace beacon::logging
