/**
 * @file NewscastApp.cpp
 * @brief Implementation of the NewscastApp class.
 */
#include "app/NewscastApp.hpp"

#include "application/DateResolver.hpp"
#include "application/FetchOrchestrator.hpp"
#include "application/StorageGuard.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ExternalPlayer.hpp"
#include "infrastructure/HttpDownloader.hpp"
#include "infrastructure/LocalCacheIndex.hpp"
#include "infrastructure/RemoteCatalogClient.hpp"

#include <chrono>
#include <iostream>

namespace newscast::app {

namespace {

int ExitCodeFor(application::FetchError error) {
    switch (error) {
        case application::FetchError::None: return kExitOk;
        case application::FetchError::CacheUnwritable: return kExitCantCreate;
        case application::FetchError::RemoteUnavailable:
        case application::FetchError::NotAvailable:
        case application::FetchError::DownloadFailed:
            return kExitRuntime;
    }
    return kExitInternal;
}

} // namespace

NewscastApp::NewscastApp()
    : m_notifier(std::make_shared<infrastructure::ConsoleNotifier>(std::cout, std::cerr)) {}

int NewscastApp::Run(const std::vector<std::string>& args) {
    Invocation invocation;
    if (!ParseArguments(args, invocation)) {
        return m_notifier->exitCode();
    }
    if (invocation.mode == Mode::Help) {
        PrintUsage();
        return kExitOk;
    }

    m_config = infrastructure::ConfigLoader::Load();

    switch (invocation.mode) {
        case Mode::List: return RunList();
        case Mode::Purge: return RunPurge();
        case Mode::Fetch: return RunFetch(invocation.date);
        case Mode::Help: break;
    }
    return kExitOk;
}

bool NewscastApp::ParseArguments(const std::vector<std::string>& args, Invocation& out) {
    if (args.size() > 1) {
        m_notifier->error("Too many arguments. See 'newscast --help'.", kExitUsage);
        return false;
    }
    if (args.empty()) {
        return true;
    }

    const std::string& arg = args.front();
    if (arg == "--help" || arg == "-h") {
        out.mode = Mode::Help;
    } else if (arg == "--list" || arg == "-l") {
        out.mode = Mode::List;
    } else if (arg == "--purge" || arg == "-p") {
        out.mode = Mode::Purge;
    } else {
        out.date = domain::BroadcastDate::Parse(arg);
        if (!out.date) {
            m_notifier->error("Invalid argument '" + arg + "': expected a date as YYYY-MM-DD.", kExitUsage);
            return false;
        }
    }
    return true;
}

int NewscastApp::RunFetch(const std::optional<domain::BroadcastDate>& requested) {
    const domain::BroadcastDate date = requested
        ? *requested
        : application::DateResolver::ResolveSearchDate(std::chrono::system_clock::now());

    // Composition Root
    application::FetchOrchestrator orchestrator(
        m_config,
        std::make_shared<infrastructure::RemoteCatalogClient>(m_config),
        std::make_shared<infrastructure::HttpDownloader>(m_config),
        std::make_shared<infrastructure::ExternalPlayer>(m_config.playerCommand),
        m_notifier);

    auto result = orchestrator.fetchAndPlay(date);
    if (!result.ok()) {
        m_notifier->error(result.detail, ExitCodeFor(result.error));
        return m_notifier->exitCode();
    }
    return kExitOk;
}

int NewscastApp::RunList() {
    infrastructure::LocalCacheIndex index(m_config.cacheDir, m_config.filePrefix);
    auto artifacts = index.list();

    std::cout << "Cache: " << m_config.cacheDir << "\n";
    if (artifacts.empty()) {
        std::cout << "  (no editions stored)\n";
    }
    for (const auto& artifact : artifacts) {
        std::cout << "  " << artifact.date.toString() << "  "
                  << application::StorageGuard::FormatGigabytes(artifact.sizeBytes) << " GB  "
                  << artifact.path << "\n";
    }
    std::cout << "Total: " << application::StorageGuard::FormatGigabytes(index.totalSize()) << " GB" << std::endl;

    if (auto advisory = application::StorageGuard::Check(m_config.cacheDir, m_config.storageThresholdBytes)) {
        m_notifier->warning(*advisory);
    }
    return kExitOk;
}

int NewscastApp::RunPurge() {
    infrastructure::LocalCacheIndex index(m_config.cacheDir, m_config.filePrefix);
    const auto removed = index.purge();
    m_notifier->info("Removed " + std::to_string(removed) + " file(s) from " + m_config.cacheDir + ".");
    return kExitOk;
}

void NewscastApp::PrintUsage() const {
    std::cout << "Usage: newscast [YYYY-MM-DD | --list | --purge | --help]\n"
              << "Plays the 20:00 edition of the given day, downloading it into the cache\n"
              << "when no local copy exists. Without a date, the latest aired edition is\n"
              << "used (yesterday's before 20:00). --list shows the cache, --purge empties it.\n"
              << "Settings: " << "$XDG_CONFIG_HOME/newscast/settings.json" << std::endl;
}

} // namespace newscast::app
