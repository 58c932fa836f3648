/*
 * serving_component.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-01

Description: Restartable outer surface driven by configuration

**************************************************/

#ifndef BEACON_RELOAD_SERVING_COMPONENT_HPP
#define BEACON_RELOAD_SERVING_COMPONENT_HPP

#include <functional>
#include <memory>

#include "config/service_config.hpp"

namespace beacon::reload {

/**
 * @brief Something that serves requests until stopped, e.g. the HTTP server
 *
 * A component is built for one configuration and started at most once;
 * reloading replaces it with a new instance.
 */
class ServingComponent {
public:
    virtual ~ServingComponent() = default;

    /**
     * @brief Begin serving; returns once the component is accepting work
     * @throws std::exception if the component cannot start
     */
    virtual void start() = 0;

    /**
     * @brief Stop serving and wait until in-flight work is finished
     */
    virtual void stop() = 0;

    [[nodiscard]] virtual bool isRunning() const = 0;
};

using ServingFactory = std::function<std::unique_ptr<ServingComponent>(
    const config::ServiceConfig&)>;

}  // namespace beacon::reload

#endif  // BEACON_RELOAD_SERVING_COMPONENT_HPP
