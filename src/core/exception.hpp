/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Beacon Exception Types

**************************************************/

#ifndef BEACON_CORE_EXCEPTION_HPP
#define BEACON_CORE_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace beacon {

/**
 * @brief Caller supplied input that cannot be accepted
 *
 * Always caller-fixable and never retried automatically.
 */
class ValidationError : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_VALIDATION_ERROR(...)                                  \
    throw beacon::ValidationError(ATOM_FILE_NAME, ATOM_FILE_LINE,    \
                                  ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Hardware address string that does not parse to six octets
 */
class MalformedAddressError : public ValidationError {
    using ValidationError::ValidationError;
};

#define THROW_MALFORMED_ADDRESS(...)                                      \
    throw beacon::MalformedAddressError(ATOM_FILE_NAME, ATOM_FILE_LINE,   \
                                        ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief One maintenance sweep iteration failed
 */
class MaintenanceSweepError : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_MAINTENANCE_SWEEP_ERROR(...)                                \
    throw beacon::MaintenanceSweepError(ATOM_FILE_NAME, ATOM_FILE_LINE,   \
                                        ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Refreshed configuration could not be applied
 */
class ReloadError : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_RELOAD_ERROR(...)                                       \
    throw beacon::ReloadError(ATOM_FILE_NAME, ATOM_FILE_LINE,         \
                              ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief HTTP listener could not be brought up
 */
class ServerError : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_SERVER_ERROR(...)                                       \
    throw beacon::ServerError(ATOM_FILE_NAME, ATOM_FILE_LINE,         \
                              ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Base exception for configuration errors
 */
class ConfigError : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

/**
 * @brief Configuration file could not be read or written
 */
class ConfigIOError : public ConfigError {
    using ConfigError::ConfigError;
};

#define THROW_CONFIG_IO_ERROR(...)                                    \
    throw beacon::ConfigIOError(ATOM_FILE_NAME, ATOM_FILE_LINE,       \
                                ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Configuration file is not valid JSON
 */
class ConfigParseError : public ConfigError {
    using ConfigError::ConfigError;
};

#define THROW_CONFIG_PARSE_ERROR(...)                                 \
    throw beacon::ConfigParseError(ATOM_FILE_NAME, ATOM_FILE_LINE,    \
                                   ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Configuration value out of its allowed range
 */
class InvalidConfigError : public ConfigError {
    using ConfigError::ConfigError;
};

#define THROW_INVALID_CONFIG_ERROR(...)                               \
    throw beacon::InvalidConfigError(ATOM_FILE_NAME, ATOM_FILE_LINE,  \
                                     ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace beacon

#endif  // BEACON_CORE_EXCEPTION_HPP
