/**
 * @file StorageGuard.hpp
 * @brief Advisory check of how much disk the cache occupies.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace newscast::application {

class StorageGuard {
public:
    /**
     * @brief Compares the cache size against `thresholdBytes`.
     * @return A human-readable advisory (sizes in GB) when the threshold is exceeded.
     */
    static std::optional<std::string> Check(const std::filesystem::path& cacheDir, std::uintmax_t thresholdBytes);

    /** @brief "5.37" for 5.37 GiB. Two decimals. */
    static std::string FormatGigabytes(std::uintmax_t bytes);
};

} // namespace newscast::application
