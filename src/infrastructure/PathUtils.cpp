#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace nodeforge::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetHome() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home);
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    return GetHome() / ".config";
}

fs::path PathUtils::GetSettingsFile() {
    return GetConfigHome() / "NodeForge" / "settings.json";
}

fs::path PathUtils::GetDefaultBuildDir() {
    return GetHome() / "Downloads" / "bitcoin_builds";
}

fs::path PathUtils::GetLogsDir(const fs::path& buildDir) {
    return buildDir / "logs";
}

fs::path PathUtils::ExpandHome(const std::string& path) {
    if (path == "~") return GetHome();
    if (path.rfind("~/", 0) == 0) {
        return GetHome() / path.substr(2);
    }
    return fs::path(path);
}

} // namespace nodeforge::infrastructure
