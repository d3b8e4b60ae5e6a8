/**
 * @file AppConfig.hpp
 * @brief Startup configuration handed to every component.
 */

#pragma once

#include <cstdint>
#include <string>

namespace newscast::infrastructure {

/**
 * @struct AppConfig
 * @brief Immutable after startup. Defaults target the 20:00 edition of tagesschau.
 */
struct AppConfig {
    std::string cacheDir;                       ///< Where editions are stored.
    std::string filePrefix = "tagesschau";      ///< Artifact name: <prefix>.<date>.mp4

    // Search endpoint, query and edition are fixed, not read from settings.json.
    std::string searchBaseUrl = "https://www.tagesschau.de";
    std::string searchPath = "/api2u/search/";
    std::string searchText = "tagesschau 20 Uhr";
    int pageSize = 30;
    std::string streamVariant = "h264xl";
    std::string editionTime = "20:00";

    std::uintmax_t storageThresholdBytes = 5ULL * 1024 * 1024 * 1024;

    int connectTimeoutSeconds = 10;
    int readTimeoutSeconds = 60;
    int searchTimeoutSeconds = 30;              ///< Whole search request, headers to last byte.
    int downloadTimeoutSeconds = 1800;          ///< Whole video transfer.

    std::string playerCommand = "xdg-open";
};

} // namespace newscast::infrastructure
