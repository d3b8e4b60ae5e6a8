/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace newscast::infrastructure {

namespace {

void ReadString(const nlohmann::json& j, const char* key, std::string& out) {
    if (j.contains(key) && j[key].is_string()) {
        out = j[key].get<std::string>();
    }
}

void ReadPositiveInt(const nlohmann::json& j, const char* key, int& out) {
    if (j.contains(key) && j[key].is_number_integer() && j[key].get<int>() > 0) {
        out = j[key].get<int>();
    }
}

} // namespace

AppConfig ConfigLoader::Load() {
    AppConfig config;
    config.cacheDir = PathUtils::GetDefaultCacheDir().string();
    config = LoadFromFile(PathUtils::GetSettingsFile(), config);

    const char* cacheOverride = std::getenv("NEWSCAST_CACHE_DIR");
    if (cacheOverride && *cacheOverride) {
        config.cacheDir = cacheOverride;
    }
    return config;
}

AppConfig ConfigLoader::LoadFromFile(const std::filesystem::path& settingsPath, AppConfig base) {
    if (!std::filesystem::exists(settingsPath)) {
        return base;
    }

    try {
        std::ifstream f(settingsPath);
        nlohmann::json j;
        f >> j;

        if (!j.is_object()) {
            std::cerr << "[ConfigLoader] " << settingsPath << " is not a JSON object, using defaults." << std::endl;
            return base;
        }

        AppConfig merged = base;
        ReadString(j, "cache_dir", merged.cacheDir);
        ReadString(j, "file_prefix", merged.filePrefix);
        ReadString(j, "player_command", merged.playerCommand);
        ReadPositiveInt(j, "connect_timeout_seconds", merged.connectTimeoutSeconds);
        ReadPositiveInt(j, "read_timeout_seconds", merged.readTimeoutSeconds);
        ReadPositiveInt(j, "search_timeout_seconds", merged.searchTimeoutSeconds);
        ReadPositiveInt(j, "download_timeout_seconds", merged.downloadTimeoutSeconds);

        if (j.contains("storage_threshold_bytes") && j["storage_threshold_bytes"].is_number_unsigned()) {
            merged.storageThresholdBytes = j["storage_threshold_bytes"].get<std::uintmax_t>();
        }
        return merged;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << settingsPath << ": " << e.what() << std::endl;
    }

    return base;
}

} // namespace newscast::infrastructure
