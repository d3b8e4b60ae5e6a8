/**
 * @file LocalCacheIndex.hpp
 * @brief Index over the directory holding downloaded editions.
 */

#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "domain/BroadcastDate.hpp"
#include "domain/CatalogEntry.hpp"

namespace newscast::infrastructure {

/**
 * @class LocalCacheIndex
 * @brief Infrastructure adapter to scan the cache directory.
 *
 * Artifacts are named <prefix>.<YYYY-MM-DD>.mp4. A file belongs to a date when
 * the dot-separated field right before ".mp4" parses to exactly that date.
 */
class LocalCacheIndex {
public:
    LocalCacheIndex(const std::string& cacheDir, const std::string& prefix);

    /**
     * @brief Looks for any artifact of `date`.
     * @return Path of the first match in directory iteration order. When several
     *         files carry the same date (e.g. different prefixes) which one wins
     *         is unspecified.
     */
    std::optional<std::string> findLocal(const domain::BroadcastDate& date) const;

    /** @brief All artifacts, oldest date first. */
    std::vector<domain::CacheArtifact> list() const;

    /**
     * @brief Removes every artifact and leftover partial download.
     * @return Number of files removed. Other files are left alone.
     */
    std::size_t purge() const;

    std::uintmax_t totalSize() const { return TotalSize(m_cacheDir); }

    /** @brief Where the artifact for `date` lives. Depends on `date` alone. */
    std::string artifactPath(const domain::BroadcastDate& date) const;

    const std::string& cacheDir() const { return m_cacheDir; }

    /** @brief Sum of the sizes of all regular files below `dir`; 0 if it does not exist. */
    static std::uintmax_t TotalSize(const std::filesystem::path& dir);

    /** @brief Extracts the date field from an artifact filename. */
    static std::optional<domain::BroadcastDate> ParseArtifactDate(const std::string& filename);

    static std::string ArtifactPath(const std::string& cacheDir,
                                    const std::string& prefix,
                                    const domain::BroadcastDate& date);

    static constexpr const char* kArtifactExtension = ".mp4";
    static constexpr const char* kPartialExtension = ".part";

private:
    std::string m_cacheDir;
    std::string m_prefix;
};

} // namespace newscast::infrastructure
