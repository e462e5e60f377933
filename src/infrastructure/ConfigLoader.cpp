/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>

namespace nodeforge::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void ReadKey(const json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    try {
        target = j.at(key).get<T>();
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring invalid '" << key << "': " << e.what() << std::endl;
    }
}

std::string PolicyToString(domain::FailurePolicy policy) {
    return policy == domain::FailurePolicy::ContinueIndependently ? "continue" : "abort";
}

} // namespace

AppConfig ConfigLoader::Defaults() {
    AppConfig config;
    config.buildDir = PathUtils::GetDefaultBuildDir();
    return config;
}

AppConfig ConfigLoader::Parse(const std::string& text, AppConfig base) {
    json j;
    try {
        j = json::parse(text);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return base;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings.json is not an object, using defaults" << std::endl;
        return base;
    }

    std::string buildDir;
    ReadKey(j, "build_dir", buildDir);
    if (!buildDir.empty()) {
        base.buildDir = PathUtils::ExpandHome(buildDir);
    }

    ReadKey(j, "jobs", base.jobs);
    if (base.jobs < 0) base.jobs = 0;
    ReadKey(j, "aggressive_optimizations", base.aggressiveOptimizations);
    ReadKey(j, "toolchain_roots", base.toolchainRoots);
    ReadKey(j, "node_daemon_groups", base.nodeDaemonGroups);
    ReadKey(j, "indexer_versions", base.indexerVersions);
    ReadKey(j, "log_to_file", base.logToFile);

    std::string policy;
    ReadKey(j, "failure_policy", policy);
    if (policy == "continue") {
        base.failurePolicy = domain::FailurePolicy::ContinueIndependently;
    } else if (policy == "abort") {
        base.failurePolicy = domain::FailurePolicy::AbortRemaining;
    } else if (!policy.empty()) {
        std::cerr << "[ConfigLoader] Unknown failure_policy '" << policy << "', keeping abort" << std::endl;
    }
    return base;
}

AppConfig ConfigLoader::Load(const fs::path& configPath) {
    AppConfig config = Defaults();
    if (!fs::exists(configPath)) {
        return config;
    }

    std::ifstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Cannot open " << configPath << std::endl;
        return config;
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return Parse(buffer.str(), config);
}

bool ConfigLoader::Save(const fs::path& configPath, const AppConfig& config) {
    json j = json::object();

    // Keep keys written by someone else.
    if (fs::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable settings.json: " << e.what() << std::endl;
            j = json::object();
        }
        if (!j.is_object()) j = json::object();
    }

    j["build_dir"] = config.buildDir.string();
    j["jobs"] = config.jobs;
    j["aggressive_optimizations"] = config.aggressiveOptimizations;
    j["failure_policy"] = PolicyToString(config.failurePolicy);
    j["toolchain_roots"] = config.toolchainRoots;
    j["node_daemon_groups"] = config.nodeDaemonGroups;
    j["indexer_versions"] = config.indexerVersions;
    j["log_to_file"] = config.logToFile;

    try {
        if (configPath.has_parent_path()) {
            fs::create_directories(configPath.parent_path());
        }
        std::ofstream f(configPath);
        f << j.dump(4);
        return static_cast<bool>(f);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing settings.json: " << e.what() << std::endl;
    }
    return false;
}

} // namespace nodeforge::infrastructure
