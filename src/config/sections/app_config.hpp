/*
 * app_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Service identity and HTTP listener configuration

**************************************************/

#ifndef BEACON_CONFIG_SECTIONS_APP_CONFIG_HPP
#define BEACON_CONFIG_SECTIONS_APP_CONFIG_HPP

#include <string>

#include "../config_section.hpp"

namespace beacon::config {

/**
 * @brief Service identity and HTTP listener settings
 *
 * @example
 * ```json
 * "app": { "name": "beacon", "version": "1.0.0",
 *          "host": "0.0.0.0", "port": 8080, "threads": 4 }
 * ```
 */
struct AppConfig : ConfigSection<AppConfig> {
    static constexpr std::string_view PATH = "app";
    static constexpr int MAX_THREADS = 1024;

    std::string name{"beacon"};
    std::string version{"1.0.0"};
    std::string host{"0.0.0.0"};  ///< Bind address
    int port{8080};
    int threads{4};  ///< HTTP worker threads

    [[nodiscard]] json serialize() const {
        return {{"name", name},
                {"version", version},
                {"host", host},
                {"port", port},
                {"threads", threads}};
    }

    [[nodiscard]] static AppConfig deserialize(const json& j) {
        AppConfig cfg;
        cfg.name = j.value("name", cfg.name);
        cfg.version = j.value("version", cfg.version);
        cfg.host = j.value("host", cfg.host);
        cfg.port = j.value("port", cfg.port);
        cfg.threads = j.value("threads", cfg.threads);
        return cfg;
    }

    [[nodiscard]] ConfigValidationResult validate() const {
        ConfigValidationResult result;
        if (name.empty()) {
            result.addError("app.name", "must not be empty");
        }
        if (host.empty()) {
            result.addError("app.host", "must not be empty");
        }
        if (port < 1 || port > 65535) {
            result.addError("app.port", "must be in [1, 65535]");
        }
        if (threads < 1 || threads > MAX_THREADS) {
            result.addError("app.threads", "must be in [1, " +
                                               std::to_string(MAX_THREADS) +
                                               "]");
        }
        return result;
    }

    bool operator==(const AppConfig&) const = default;
};

}  // namespace beacon::config

#endif  // BEACON_CONFIG_SECTIONS_APP_CONFIG_HPP
