/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Provides a unified way to read build defaults without scattering JSON
 * parsing logic throughout the codebase.
 */

#pragma once

#include "domain/BuildRequest.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace nodeforge::infrastructure {

/**
 * @struct AppConfig
 * @brief Build defaults. Command-line flags override these.
 */
struct AppConfig {
    std::filesystem::path buildDir;
    int jobs = 0; ///< 0 means host cores - 1.
    bool aggressiveOptimizations = false;
    domain::FailurePolicy failurePolicy = domain::FailurePolicy::AbortRemaining;
    std::vector<std::string> toolchainRoots{"/opt/homebrew", "/usr/local"};
    size_t nodeDaemonGroups = 5;
    size_t indexerVersions = 3;
    bool logToFile = true;
};

class ConfigLoader {
public:
    /** @brief Defaults with buildDir = ~/Downloads/bitcoin_builds. */
    static AppConfig Defaults();

    /**
     * @brief Reads settings.json at configPath on top of Defaults().
     * A missing file yields the defaults; a malformed key keeps its default.
     */
    static AppConfig Load(const std::filesystem::path& configPath);

    /** @brief Applies the keys present in JSON text to base. */
    static AppConfig Parse(const std::string& text, AppConfig base);

    /** @brief Writes config to configPath, preserving unknown keys already there. */
    static bool Save(const std::filesystem::path& configPath, const AppConfig& config);
};

} // namespace nodeforge::infrastructure
