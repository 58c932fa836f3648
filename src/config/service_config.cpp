/*
 * service_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "service_config.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "core/exception.hpp"

namespace beacon::config {

namespace {

template <typename Section>
Section sectionFrom(const json& root) {
    const std::string key(Section::PATH);
    if (auto it = root.find(key); it != root.end()) {
        if (!it->is_object()) {
            THROW_CONFIG_PARSE_ERROR("Section '" + key +
                                     "' must be a JSON object");
        }
        return Section::fromJson(*it);
    }
    return Section::defaults();
}

}  // namespace

json ServiceConfig::toJson() const {
    return {{std::string(AppConfig::PATH), app.toJson()},
            {std::string(CacheConfig::PATH), cache.toJson()},
            {std::string(LoggingConfig::PATH), logging.toJson()},
            {std::string(ReloadConfig::PATH), reload.toJson()}};
}

ServiceConfig ServiceConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        THROW_CONFIG_PARSE_ERROR("Configuration root must be a JSON object");
    }
    ServiceConfig config;
    try {
        config.app = sectionFrom<AppConfig>(j);
        config.cache = sectionFrom<CacheConfig>(j);
        config.logging = sectionFrom<LoggingConfig>(j);
        config.reload = sectionFrom<ReloadConfig>(j);
    } catch (const json::exception& e) {
        THROW_CONFIG_PARSE_ERROR(std::string("Invalid configuration value: ") +
                                 e.what());
    }
    return config;
}

ConfigValidationResult ServiceConfig::validate() const {
    ConfigValidationResult result;
    result.merge(app.validate());
    result.merge(cache.validate());
    result.merge(logging.validate());
    result.merge(reload.validate());
    return result;
}

ServiceConfig loadConfig(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        THROW_CONFIG_IO_ERROR("Cannot open configuration file: " +
                              path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    json root;
    try {
        root = json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        THROW_CONFIG_PARSE_ERROR("Failed to parse " + path.string() + ": " +
                                 e.what());
    }

    auto config = ServiceConfig::fromJson(root);
    if (auto result = config.validate(); !result.isValid()) {
        THROW_INVALID_CONFIG_ERROR("Invalid configuration in " +
                                   path.string() + ": " + result.summary());
    }
    spdlog::debug("Configuration loaded from {}", path.string());
    return config;
}

void saveConfig(const ServiceConfig& config,
                const std::filesystem::path& path) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            THROW_CONFIG_IO_ERROR("Cannot create directory " +
                                  path.parent_path().string() + ": " +
                                  ec.message());
        }
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        THROW_CONFIG_IO_ERROR("Cannot write configuration file: " +
                              path.string());
    }
    out << config.toJson().dump(4) << '\n';
    if (!out) {
        THROW_CONFIG_IO_ERROR("Failed writing configuration file: " +
                              path.string());
    }
    spdlog::debug("Configuration saved to {}", path.string());
}

ServiceConfig loadOrDefault(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::info("Configuration {} not found, writing defaults",
                     path.string());
        ServiceConfig defaults;
        saveConfig(defaults, path);
        return defaults;
    }
    return loadConfig(path);
}

}  // namespace beacon::config
