#include "infrastructure/PathUtils.hpp"
#include <cstdlib>

namespace highlightdigest::infrastructure {

namespace fs = std::filesystem;

namespace {
constexpr const char* kAppDirName = "HighlightDigest";
}

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

// Directories are created lazily by the store writer, not here.
fs::path PathUtils::GetDefaultStorePath() {
    return GetDataHome() / kAppDirName / "highlights.json";
}

fs::path PathUtils::GetDefaultSettingsPath() {
    return GetConfigHome() / kAppDirName / "settings.json";
}

} // namespace highlightdigest::infrastructure
