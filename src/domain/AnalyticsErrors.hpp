/**
 * @file AnalyticsErrors.hpp
 * @brief Exception types raised by the analytics core.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace healthiq::domain {

/**
 * @class MalformedEventError
 * @brief Input event cannot be analysed (bad timestamp, missing required field, unknown kind).
 *
 * Never caught and skipped inside the pipeline: dropping an event would shift every
 * windowed statistic computed after it.
 */
class MalformedEventError : public std::invalid_argument {
public:
    explicit MalformedEventError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @class ConfigurationError
 * @brief Rejected configuration value, raised before any computation starts.
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message)
        : std::invalid_argument(message) {}
};

} // namespace healthiq::domain
