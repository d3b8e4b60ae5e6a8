/**
 * @file LocalCacheIndex.cpp
 * @brief Implementation of the LocalCacheIndex.
 */

#include "infrastructure/LocalCacheIndex.hpp"
#include <algorithm>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace newscast::infrastructure {

LocalCacheIndex::LocalCacheIndex(const std::string& cacheDir, const std::string& prefix)
    : m_cacheDir(cacheDir), m_prefix(prefix) {}

std::optional<domain::BroadcastDate> LocalCacheIndex::ParseArtifactDate(const std::string& filename) {
    fs::path p(filename);
    if (p.extension() != kArtifactExtension) {
        return std::nullopt;
    }
    // "tagesschau.2023-04-21" -> "2023-04-21"
    std::string stem = p.stem().string();
    auto dot = stem.rfind('.');
    std::string field = dot == std::string::npos ? stem : stem.substr(dot + 1);
    return domain::BroadcastDate::Parse(field);
}

std::string LocalCacheIndex::ArtifactPath(const std::string& cacheDir,
                                          const std::string& prefix,
                                          const domain::BroadcastDate& date) {
    return (fs::path(cacheDir) / (prefix + "." + date.toString() + kArtifactExtension)).string();
}

std::string LocalCacheIndex::artifactPath(const domain::BroadcastDate& date) const {
    return ArtifactPath(m_cacheDir, m_prefix, date);
}

std::optional<std::string> LocalCacheIndex::findLocal(const domain::BroadcastDate& date) const {
    std::error_code ec;
    if (!fs::is_directory(m_cacheDir, ec)) {
        return std::nullopt;
    }

    for (auto it = fs::directory_iterator(m_cacheDir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code statEc;
        if (!it->is_regular_file(statEc)) {
            continue;
        }
        auto fileDate = ParseArtifactDate(it->path().filename().string());
        if (fileDate && *fileDate == date) {
            return it->path().string();
        }
    }
    if (ec) {
        std::cerr << "[LocalCacheIndex] Cannot read " << m_cacheDir << ": " << ec.message() << std::endl;
    }
    return std::nullopt;
}

std::vector<domain::CacheArtifact> LocalCacheIndex::list() const {
    std::vector<domain::CacheArtifact> artifacts;
    std::error_code ec;
    if (!fs::is_directory(m_cacheDir, ec)) {
        return artifacts;
    }

    for (auto it = fs::directory_iterator(m_cacheDir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code statEc;
        if (!it->is_regular_file(statEc)) {
            continue;
        }
        auto fileDate = ParseArtifactDate(it->path().filename().string());
        if (!fileDate) {
            continue;
        }
        // Vanished between listing and stat
        auto size = it->file_size(statEc);
        if (statEc) {
            continue;
        }
        domain::CacheArtifact artifact;
        artifact.path = it->path().string();
        artifact.date = *fileDate;
        artifact.sizeBytes = size;
        artifacts.push_back(artifact);
    }
    if (ec) {
        std::cerr << "[LocalCacheIndex] Listing of " << m_cacheDir << " stopped early: " << ec.message() << std::endl;
    }

    std::sort(artifacts.begin(), artifacts.end(), [](const domain::CacheArtifact& a, const domain::CacheArtifact& b) {
        if (a.date == b.date) return a.path < b.path;
        return a.date < b.date;
    });
    return artifacts;
}

std::size_t LocalCacheIndex::purge() const {
    std::size_t removed = 0;
    std::error_code ec;
    if (!fs::is_directory(m_cacheDir, ec)) {
        return removed;
    }

    std::vector<fs::path> doomed;
    for (auto it = fs::directory_iterator(m_cacheDir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code statEc;
        if (!it->is_regular_file(statEc)) {
            continue;
        }
        const std::string name = it->path().filename().string();
        if (ParseArtifactDate(name) || it->path().extension() == kPartialExtension) {
            doomed.push_back(it->path());
        }
    }
    if (ec) {
        std::cerr << "[LocalCacheIndex] Purge scan of " << m_cacheDir << " stopped early: " << ec.message() << std::endl;
    }

    for (const auto& path : doomed) {
        std::error_code removeEc;
        if (fs::remove(path, removeEc)) {
            ++removed;
        } else if (removeEc) {
            std::cerr << "[LocalCacheIndex] Failed to remove " << path << ": " << removeEc.message() << std::endl;
        }
    }
    return removed;
}

std::uintmax_t LocalCacheIndex::TotalSize(const fs::path& dir) {
    std::uintmax_t total = 0;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return total;
    }

    for (auto it = fs::recursive_directory_iterator(dir, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code sizeEc;
        if (it->is_regular_file(sizeEc)) {
            auto size = it->file_size(sizeEc);
            if (!sizeEc) total += size;
        }
    }
    if (ec) {
        std::cerr << "[LocalCacheIndex] Size scan of " << dir << " stopped early: " << ec.message() << std::endl;
    }
    return total;
}

} // namespace newscast::infrastructure
