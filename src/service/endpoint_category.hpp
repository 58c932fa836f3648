/*
 * endpoint_category.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BEACON_SERVICE_ENDPOINT_CATEGORY_HPP
#define BEACON_SERVICE_ENDPOINT_CATEGORY_HPP

#include <algorithm>
#include <array>
#include <string>
#include <string_view>

namespace beacon::service {

/// Category shared by every request that matches no route
inline constexpr std::string_view UNMATCHED_ENDPOINT = "<unmatched>";

/**
 * @brief Counter category for an HTTP request
 *
 * The query string is dropped and per-device paths collapse to
 * "/cache/<mac>". Paths outside the served routes all fold into
 * UNMATCHED_ENDPOINT, so the number of categories stays bounded whatever
 * clients request. Methods other than GET prefix the path, e.g.
 * "DELETE /cache/<mac>".
 */
[[nodiscard]] inline std::string endpointCategory(std::string_view method,
                                                  std::string_view url) {
    static constexpr std::array<std::string_view, 7> KNOWN_PATHS = {
        "/health", "/hbd",         "/stats",        "/stats/reset",
        "/cache",  "/cache/stats", "/cache/cleanup"};
    constexpr std::string_view CACHE_PREFIX = "/cache/";

    auto path = url.substr(0, url.find('?'));
    if (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }

    std::string category;
    if (std::find(KNOWN_PATHS.begin(), KNOWN_PATHS.end(), path) !=
        KNOWN_PATHS.end()) {
        category = std::string(path);
    } else if (path.starts_with(CACHE_PREFIX) &&
               path.size() > CACHE_PREFIX.size() &&
               path.find('/', CACHE_PREFIX.size()) == std::string_view::npos) {
        category = "/cache/<mac>";
    } else {
        return std::string(UNMATCHED_ENDPOINT);
    }

    if (method != "GET") {
        category = std::string(method) + " " + category;
    }
    return category;
}

}  // namespace beacon::service

#endif  // BEACON_SERVICE_ENDPOINT_CATEGORY_HPP
