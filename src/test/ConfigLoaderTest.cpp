#include <cassert>
#include <cstdlib>
#include <iostream>

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "TestSupport.hpp"

using newscast::infrastructure::AppConfig;
using newscast::infrastructure::ConfigLoader;
using newscast::infrastructure::PathUtils;
using namespace newscast::test;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    ScratchDir scratch("newscast_config");
    AppConfig base;
    base.cacheDir = "/var/cache/newscast";

    // Missing file keeps defaults
    auto same = ConfigLoader::LoadFromFile(scratch.path() / "absent.json", base);
    assert(same.cacheDir == base.cacheDir);
    assert(same.filePrefix == "tagesschau");
    assert(same.streamVariant == "h264xl");
    assert(same.editionTime == "20:00");
    assert(same.storageThresholdBytes == 5ULL * 1024 * 1024 * 1024);

    // Recognized keys override, wrong types are ignored
    const auto settings = scratch.path() / "settings.json";
    WriteFile(settings, R"({
        "cache_dir": "/srv/videos",
        "file_prefix": "ts",
        "read_timeout_seconds": 15,
        "connect_timeout_seconds": "fast",
        "page_size": -3,
        "storage_threshold_bytes": 1048576,
        "edition_time": "17:00",
        "unknown_key": true
    })");
    auto merged = ConfigLoader::LoadFromFile(settings, base);
    assert(merged.cacheDir == "/srv/videos");
    assert(merged.filePrefix == "ts");
    assert(merged.readTimeoutSeconds == 15);
    assert(merged.connectTimeoutSeconds == base.connectTimeoutSeconds);
    assert(merged.pageSize == base.pageSize);
    assert(merged.storageThresholdBytes == 1048576);
    assert(merged.editionTime == "20:00" && "Edition time is fixed.");

    // Search endpoint, query and stream variant cannot be changed from the file
    WriteFile(settings, R"({
        "search_base_url": "http://elsewhere.example",
        "search_path": "/other/",
        "search_text": "x",
        "page_size": 5,
        "stream_variant": "h264s",
        "search_timeout_seconds": 12,
        "download_timeout_seconds": 600
    })");
    auto pinned = ConfigLoader::LoadFromFile(settings, base);
    assert(pinned.searchBaseUrl == "https://www.tagesschau.de");
    assert(pinned.searchPath == "/api2u/search/");
    assert(pinned.searchText == "tagesschau 20 Uhr");
    assert(pinned.pageSize == 30);
    assert(pinned.streamVariant == "h264xl");
    assert(pinned.searchTimeoutSeconds == 12);
    assert(pinned.downloadTimeoutSeconds == 600);

    // Malformed file falls back to defaults
    WriteFile(settings, "{ not json");
    auto fallback = ConfigLoader::LoadFromFile(settings, base);
    assert(fallback.cacheDir == base.cacheDir);

    WriteFile(settings, "[1, 2, 3]");
    assert(ConfigLoader::LoadFromFile(settings, base).cacheDir == base.cacheDir);

    // Full load through XDG locations plus the environment override
    setenv("XDG_CONFIG_HOME", (scratch.path() / "config").c_str(), 1);
    setenv("XDG_CACHE_HOME", (scratch.path() / "cache").c_str(), 1);
    unsetenv("NEWSCAST_CACHE_DIR");
    assert(PathUtils::GetSettingsFile() == scratch.path() / "config" / "newscast" / "settings.json");

    auto defaults = ConfigLoader::Load();
    assert(defaults.cacheDir == (scratch.path() / "cache" / "newscast").string());

    WriteFile(PathUtils::GetSettingsFile(), R"({"file_prefix": "abend"})");
    auto loaded = ConfigLoader::Load();
    assert(loaded.filePrefix == "abend");

    setenv("NEWSCAST_CACHE_DIR", "/mnt/override", 1);
    assert(ConfigLoader::Load().cacheDir == "/mnt/override");
    unsetenv("NEWSCAST_CACHE_DIR");

    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
