// PathUtils Header
#pragma once
#include <filesystem>
#include <string>

namespace highlightdigest::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief $XDG_DATA_HOME/HighlightDigest/highlights.json */
    static std::filesystem::path GetDefaultStorePath();

    /** @brief $XDG_CONFIG_HOME/HighlightDigest/settings.json */
    static std::filesystem::path GetDefaultSettingsPath();
};

} // namespace highlightdigest::infrastructure
