/**
 * @file CatalogEntry.hpp
 * @brief Domain records for remote search results and cached videos.
 */

#pragma once
#include <cstdint>
#include <string>
#include "domain/BroadcastDate.hpp"

namespace newscast::domain {

/**
 * @struct CatalogEntry
 * @brief A normalized remote search result for the evening edition.
 *
 * Only entries whose time is the edition time are ever built.
 */
struct CatalogEntry {
    BroadcastDate date;
    std::string time;        ///< "HH:MM", always the edition time.
    std::string timezone;    ///< Offset such as "+02:00".
    std::string sourceUrl;   ///< Selected stream variant.
    std::string targetPath;  ///< <cacheDir>/<prefix>.<date>.mp4
};

/**
 * @struct CacheArtifact
 * @brief A downloaded edition sitting in the cache directory.
 */
struct CacheArtifact {
    std::string path;
    BroadcastDate date;
    std::uintmax_t sizeBytes = 0;
};

} // namespace newscast::domain
