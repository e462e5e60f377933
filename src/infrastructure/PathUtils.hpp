// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace nodeforge::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetSettingsFile();
    static std::filesystem::path GetDefaultBuildDir();
    static std::filesystem::path GetLogsDir(const std::filesystem::path& buildDir);

    /** Expands a leading "~/" using HOME. */
    static std::filesystem::path ExpandHome(const std::string& path);
};

} // namespace nodeforge::infrastructure
