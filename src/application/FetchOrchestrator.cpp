/**
 * @file FetchOrchestrator.cpp
 * @brief Implementation of FetchOrchestrator.
 */

#include "application/FetchOrchestrator.hpp"
#include "application/StorageGuard.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace newscast::application {

FetchOrchestrator::FetchOrchestrator(const infrastructure::AppConfig& config,
                                     std::shared_ptr<domain::CatalogSource> catalog,
                                     std::shared_ptr<domain::Downloader> downloader,
                                     std::shared_ptr<domain::Player> player,
                                     std::shared_ptr<domain::Notifier> notifier)
    : m_config(config)
    , m_cache(config.cacheDir, config.filePrefix)
    , m_catalog(std::move(catalog))
    , m_downloader(std::move(downloader))
    , m_player(std::move(player))
    , m_notifier(std::move(notifier)) {}

const char* FetchOrchestrator::ErrorToString(FetchError error) {
    switch (error) {
        case FetchError::None: return "none";
        case FetchError::RemoteUnavailable: return "remote unavailable";
        case FetchError::NotAvailable: return "not available";
        case FetchError::DownloadFailed: return "download failed";
        case FetchError::CacheUnwritable: return "cache unwritable";
    }
    return "unknown";
}

FetchResult FetchOrchestrator::fetchAndPlay(const domain::BroadcastDate& date) {
    FetchResult result;

    if (auto local = m_cache.findLocal(date)) {
        m_notifier->info("Playing cached edition of " + date.toString() + ": " + *local);
        result.fromCache = true;
        handOff(*local, result);
        return result;
    }

    m_notifier->info("No local copy of " + date.toString() + ", searching the catalog...");
    auto entries = m_catalog->search();
    if (!entries) {
        result.error = FetchError::RemoteUnavailable;
        result.detail = "Search service at " + m_config.searchBaseUrl + " is unavailable.";
        return result;
    }

    auto match = std::find_if(entries->begin(), entries->end(), [&date](const domain::CatalogEntry& e) {
        return e.date == date;
    });
    if (match == entries->end()) {
        result.error = FetchError::NotAvailable;
        result.detail = "No " + m_config.editionTime + " edition available for " + date.toString() + ".";
        return result;
    }

    if (auto advisory = StorageGuard::Check(m_config.cacheDir, m_config.storageThresholdBytes)) {
        m_notifier->warning(*advisory);
    }

    if (!downloadAndPublish(*match, result)) {
        return result;
    }

    m_notifier->info("Downloaded edition of " + date.toString() + " to " + match->targetPath);
    handOff(match->targetPath, result);
    return result;
}

bool FetchOrchestrator::downloadAndPublish(const domain::CatalogEntry& entry, FetchResult& result) {
    const fs::path cacheDir = m_config.cacheDir;
    const fs::path finalPath = entry.targetPath;

    std::error_code ec;
    const bool createdDir = !fs::exists(cacheDir, ec);
    if (createdDir) {
        fs::create_directories(cacheDir, ec);
        if (ec) {
            result.error = FetchError::CacheUnwritable;
            result.detail = "Cannot create " + cacheDir.string() + ": " + ec.message();
            return false;
        }
    }

    // Sibling temp file so the final rename stays on one filesystem.
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(ticks) + infrastructure::LocalCacheIndex::kPartialExtension;

    bool ok = false;
    try {
        ok = m_downloader->download(entry.sourceUrl, tempPath.string());
    } catch (const std::exception& e) {
        std::cerr << "[FetchOrchestrator] Downloader threw: " << e.what() << std::endl;
        ok = false;
    }

    if (ok) {
        fs::rename(tempPath, finalPath, ec);
        if (ec) {
            std::cerr << "[FetchOrchestrator] Rename failed: " << ec.message() << std::endl;
            ok = false;
        }
    }

    if (!ok) {
        std::error_code cleanupEc;
        fs::remove(tempPath, cleanupEc);
        if (createdDir) {
            fs::remove(cacheDir, cleanupEc); // only succeeds while empty
        }
        result.error = FetchError::DownloadFailed;
        result.detail = "Download of " + entry.sourceUrl + " failed.";
        return false;
    }

    return true;
}

void FetchOrchestrator::handOff(const std::string& path, FetchResult& result) {
    result.playbackPath = path;
    result.playerStarted = m_player->play(path);
    if (!result.playerStarted) {
        m_notifier->warning("Could not open " + path + " with the default player.");
    }
}

} // namespace newscast::application
