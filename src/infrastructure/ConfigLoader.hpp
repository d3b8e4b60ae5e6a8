/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 * 
 * Provides a unified way to build the AppConfig value object
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <filesystem>
#include <string>
#include "infrastructure/AppConfig.hpp"

namespace newscast::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Builds the configuration from defaults, the user's settings.json
     *        and the NEWSCAST_CACHE_DIR environment override.
     */
    static AppConfig Load();

    /**
     * @brief Reads overrides from a specific settings file on top of `base`.
     * @param settingsPath File to read. A missing file leaves `base` unchanged.
     * @return The merged configuration. Malformed files are reported and ignored.
     */
    static AppConfig LoadFromFile(const std::filesystem::path& settingsPath, AppConfig base);
};

} // namespace newscast::infrastructure
