/**
 * @file FetchOrchestrator.hpp
 * @brief Resolves one evening edition from cache or remote and hands it to the player.
 */

#pragma once

#include <memory>
#include <string>
#include "domain/BroadcastDate.hpp"
#include "domain/CatalogSource.hpp"
#include "domain/Downloader.hpp"
#include "domain/Notifier.hpp"
#include "domain/Player.hpp"
#include "infrastructure/AppConfig.hpp"
#include "infrastructure/LocalCacheIndex.hpp"

namespace newscast::application {

/**
 * @enum FetchError
 * @brief Terminal outcome of a fetch attempt.
 */
enum class FetchError {
    None,
    RemoteUnavailable,  ///< Search endpoint unreachable or answered with an error.
    NotAvailable,       ///< No edition for the date, neither cached nor listed.
    DownloadFailed,     ///< Transfer or publish step failed. Nothing left behind.
    CacheUnwritable     ///< Cache directory could not be created.
};

/**
 * @struct FetchResult
 * @brief Playback handle on success, error and detail otherwise.
 */
struct FetchResult {
    FetchError error = FetchError::None;
    std::string playbackPath;
    bool fromCache = false;
    bool playerStarted = false;
    std::string detail;

    bool ok() const { return error == FetchError::None; }
};

/**
 * @class FetchOrchestrator
 * @brief Local lookup first, then search, download and publish. No retries.
 */
class FetchOrchestrator {
public:
    FetchOrchestrator(const infrastructure::AppConfig& config,
                      std::shared_ptr<domain::CatalogSource> catalog,
                      std::shared_ptr<domain::Downloader> downloader,
                      std::shared_ptr<domain::Player> player,
                      std::shared_ptr<domain::Notifier> notifier);

    /**
     * @brief Makes the edition of `date` available locally and starts playback.
     *
     * A cache hit never touches the network. On any failure the cache directory
     * is left as it was before the call.
     */
    FetchResult fetchAndPlay(const domain::BroadcastDate& date);

    static const char* ErrorToString(FetchError error);

private:
    bool downloadAndPublish(const domain::CatalogEntry& entry, FetchResult& result);
    void handOff(const std::string& path, FetchResult& result);

    infrastructure::AppConfig m_config;
    infrastructure::LocalCacheIndex m_cache;
    std::shared_ptr<domain::CatalogSource> m_catalog;
    std::shared_ptr<domain::Downloader> m_downloader;
    std::shared_ptr<domain::Player> m_player;
    std::shared_ptr<domain::Notifier> m_notifier;
};

} // namespace newscast::application
