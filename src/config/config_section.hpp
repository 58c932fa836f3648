/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: ConfigSection CRTP base class for type-safe configuration sections

**************************************************/

#ifndef BEACON_CONFIG_CONFIG_SECTION_HPP
#define BEACON_CONFIG_CONFIG_SECTION_HPP

#include <concepts>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace beacon::config {

using json = nlohmann::json;

/**
 * @brief Errors collected while validating configuration
 */
struct ConfigValidationResult {
    std::vector<std::string> errors;

    [[nodiscard]] bool isValid() const noexcept { return errors.empty(); }

    void addError(std::string_view path, std::string_view message) {
        errors.push_back(std::string(path) + ": " + std::string(message));
    }

    void merge(const ConfigValidationResult& other) {
        errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    }

    [[nodiscard]] std::string summary() const {
        std::string text;
        for (const auto& error : errors) {
            if (!text.empty()) {
                text += "; ";
            }
            text += error;
        }
        return text;
    }
};

/**
 * @brief Requirements on a configuration section type
 */
template <typename T>
concept ConfigSectionDerived = requires(T t, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { t.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
    { t.validate() } -> std::convertible_to<ConfigValidationResult>;
};

/**
 * @brief CRTP base providing the common conversions for a section
 *
 * Derived types supply PATH (their key in the configuration file),
 * serialize(), deserialize() and validate().
 */
template <typename Derived>
class ConfigSection {
public:
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    [[nodiscard]] json toJson() const {
        return static_cast<const Derived*>(this)->serialize();
    }

    /**
     * @brief Deserialize, using defaults for absent keys
     * @throws json::exception when a present value has the wrong type
     */
    [[nodiscard]] static Derived fromJson(const json& j) {
        return Derived::deserialize(j);
    }

    [[nodiscard]] static Derived defaults() { return Derived{}; }

    bool operator==(const ConfigSection&) const = default;
};

}  // namespace beacon::config

#endif  // BEACON_CONFIG_CONFIG_SECTION_HPP
