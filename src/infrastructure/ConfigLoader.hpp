/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading analytics settings (settings.json).
 *
 * Keeps JSON parsing of the configuration out of the analytics components,
 * which only ever see a validated AnalyticsConfig.
 */

#pragma once

#include <string>

#include "domain/AnalyticsConfig.hpp"

namespace healthiq::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads the "analytics" object from <projectRoot>/settings.json.
     * @return Defaults when the file or the key is absent; absent fields keep their defaults.
     * @throws ConfigurationError if the file is unreadable, malformed, or yields an invalid config.
     */
    static domain::AnalyticsConfig LoadAnalyticsConfig(const std::string& projectRoot);

    /** @brief Same as LoadAnalyticsConfig but for an explicit settings file path. */
    static domain::AnalyticsConfig LoadAnalyticsConfigFile(const std::string& settingsPath);
};

} // namespace healthiq::infrastructure
