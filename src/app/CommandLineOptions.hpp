/**
 * @file CommandLineOptions.hpp
 * @brief Command-line flags of the nodeforge executable.
 */

#pragma once

#include "domain/BuildRequest.hpp"
#include "infrastructure/ConfigLoader.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace nodeforge::app {

/**
 * @struct CommandLineOptions
 * @brief Parsed flags. Unset optionals fall back to settings.json.
 */
struct CommandLineOptions {
    std::optional<std::filesystem::path> configPath;
    std::optional<domain::TargetSelection> target;
    std::optional<int> jobs;
    std::optional<std::filesystem::path> buildDir;
    bool aggressive = false;
    std::string nodeDaemonVersion;
    std::string indexerVersion;
    bool allowUnverified = false;
    bool assumeYes = false;
    bool continueOnFailure = false;
    bool listVersions = false;
    bool checkDeps = false;
    bool installMissing = false;
    bool showHelp = false;
    bool showVersion = false;

    /**
     * @brief Parses args (without argv[0]).
     * @param error Receives a message when nullopt is returned.
     */
    static std::optional<CommandLineOptions> Parse(const std::vector<std::string>& args, std::string& error);

    static std::string Usage();

    /** @brief Flags over config. jobs: flag, else config, else hostCores - 1 (at least 1). */
    domain::BuildRequest toRequest(const infrastructure::AppConfig& config, int hostCores) const;
};

} // namespace nodeforge::app
