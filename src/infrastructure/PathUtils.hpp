// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace newscast::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetCacheHome();

    /** @brief $XDG_CONFIG_HOME/newscast/settings.json (file may not exist). */
    static std::filesystem::path GetSettingsFile();

    /** @brief Default video cache, $XDG_CACHE_HOME/newscast. Not created here. */
    static std::filesystem::path GetDefaultCacheDir();
};

} // namespace newscast::infrastructure
