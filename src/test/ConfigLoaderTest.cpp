#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "app/CommandLineOptions.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ConfirmationGates.hpp"
#include "infrastructure/PathUtils.hpp"
#include "test/TestDoubles.hpp"

namespace fs = std::filesystem;

using nodeforge::app::CommandLineOptions;
using nodeforge::domain::FailurePolicy;
using nodeforge::domain::TargetSelection;
using nodeforge::infrastructure::AppConfig;
using nodeforge::infrastructure::ConfigLoader;
using nodeforge::infrastructure::PathUtils;
using nodeforge::test::ScratchDir;
using nodeforge::test::WriteFile;

namespace {

void TestDefaults(const fs::path& home) {
    AppConfig config = ConfigLoader::Defaults();
    assert(config.buildDir == home / "Downloads" / "bitcoin_builds");
    assert(config.jobs == 0);
    assert(!config.aggressiveOptimizations);
    assert(config.failurePolicy == FailurePolicy::AbortRemaining);
    assert(config.nodeDaemonGroups == 5);
    assert(config.indexerVersions == 3);

    assert(ConfigLoader::Load(home / "does-not-exist.json").buildDir == config.buildDir);
    assert(PathUtils::GetSettingsFile() == PathUtils::GetConfigHome() / "NodeForge" / "settings.json");
    std::cout << "[PASS] Defaults." << std::endl;
}

void TestParseAppliesKnownKeys(const fs::path& home) {
    AppConfig config = ConfigLoader::Parse(R"({
        "build_dir": "~/nodes",
        "jobs": 6,
        "aggressive_optimizations": true,
        "failure_policy": "continue",
        "toolchain_roots": ["/opt/local"],
        "node_daemon_groups": 2,
        "log_to_file": false,
        "unrelated": {"nested": 1}
    })", ConfigLoader::Defaults());

    assert(config.buildDir == home / "nodes");
    assert(config.jobs == 6);
    assert(config.aggressiveOptimizations);
    assert(config.failurePolicy == FailurePolicy::ContinueIndependently);
    assert((config.toolchainRoots == std::vector<std::string>{"/opt/local"}));
    assert(config.nodeDaemonGroups == 2);
    assert(config.indexerVersions == 3);
    assert(!config.logToFile);
    std::cout << "[PASS] Known keys are applied." << std::endl;
}

void TestMalformedInputKeepsDefaults() {
    AppConfig base = ConfigLoader::Defaults();
    AppConfig config = ConfigLoader::Parse(R"({"jobs": "many", "failure_policy": "retry", "log_to_file": 1})", base);
    assert(config.jobs == base.jobs);
    assert(config.failurePolicy == FailurePolicy::AbortRemaining);
    assert(config.logToFile == base.logToFile);

    assert(ConfigLoader::Parse("{ not json", base).buildDir == base.buildDir);
    assert(ConfigLoader::Parse("[1, 2]", base).jobs == base.jobs);
    std::cout << "[PASS] Malformed values fall back to defaults." << std::endl;
}

void TestSavePreservesForeignKeys(const fs::path& dir) {
    fs::path file = dir / "cfg" / "settings.json";
    WriteFile(file, R"({"theme": "dark", "jobs": 2})");

    AppConfig config = ConfigLoader::Load(file);
    assert(config.jobs == 2);
    config.jobs = 7;
    config.failurePolicy = FailurePolicy::ContinueIndependently;
    assert(ConfigLoader::Save(file, config));

    AppConfig reloaded = ConfigLoader::Load(file);
    assert(reloaded.jobs == 7);
    assert(reloaded.failurePolicy == FailurePolicy::ContinueIndependently);

    std::ifstream in(file);
    std::stringstream text;
    text << in.rdbuf();
    assert(text.str().find("\"theme\"") != std::string::npos);
    std::cout << "[PASS] Save keeps keys it does not own." << std::endl;
}

void TestCommandLineOverridesConfig(const fs::path& home) {
    std::string error;
    auto options = CommandLineOptions::Parse({"--target", "both", "--jobs", "3", "--build-dir", "~/b",
                                              "--node-version", "v28.1", "--aggressive", "--yes",
                                              "--continue-on-failure"}, error);
    assert(options);
    assert(options->target == TargetSelection::Both);
    assert(options->assumeYes);

    AppConfig config = ConfigLoader::Defaults();
    auto request = options->toRequest(config, 8);
    assert(request.jobCount == 3);
    assert(request.buildDir == home / "b");
    assert(request.nodeDaemonVersion == "v28.1");
    assert(request.indexerVersion.empty());
    assert(request.aggressiveOptimizations);
    assert(request.failurePolicy == FailurePolicy::ContinueIndependently);
    assert(!request.allowUnverifiedSource);

    // Without flags the config decides, and jobs default to cores - 1.
    auto bare = CommandLineOptions::Parse({}, error);
    assert(bare);
    auto defaulted = bare->toRequest(config, 8);
    assert(defaulted.target == TargetSelection::NodeDaemon);
    assert(defaulted.jobCount == 7);
    assert(bare->toRequest(config, 1).jobCount == 1);
    config.jobs = 4;
    assert(bare->toRequest(config, 8).jobCount == 4);

    auto install = CommandLineOptions::Parse({"--install-missing"}, error);
    assert(install && install->checkDeps && install->installMissing);

    assert(!CommandLineOptions::Parse({"--jobs", "many"}, error));
    assert(!CommandLineOptions::Parse({"--target", "wallet"}, error));
    assert(!CommandLineOptions::Parse({"--node-version"}, error));
    assert(error.find("requires a value") != std::string::npos);
    assert(!CommandLineOptions::Parse({"--frobnicate"}, error));
    std::cout << "[PASS] Command-line flags override the config file." << std::endl;
}

void TestConsoleGate() {
    std::istringstream answers("yes\n\nn\n");
    std::ostringstream out;
    nodeforge::infrastructure::ConsoleConfirmationGate gate(answers, out, true);
    nodeforge::domain::ConfirmationPrompt prompt{nodeforge::domain::GateKind::UnverifiedSource, "T", "M"};
    assert(gate.confirm(prompt));
    assert(!gate.confirm(prompt));
    assert(!gate.confirm(prompt));
    assert(!gate.confirm(prompt)); // input exhausted

    std::istringstream none("y\n");
    nodeforge::infrastructure::ConsoleConfirmationGate batch(none, out, false);
    assert(!batch.confirm(prompt));
    batch.presetAnswer(nodeforge::domain::GateKind::UnverifiedSource, true);
    assert(batch.confirm(prompt));
    std::cout << "[PASS] Console gate defaults to no." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    ScratchDir scratch("nodeforge-config");
    setenv("HOME", scratch.path().c_str(), 1);
    unsetenv("XDG_CONFIG_HOME");

    TestDefaults(scratch.path());
    TestParseAppliesKnownKeys(scratch.path());
    TestMalformedInputKeepsDefaults();
    TestSavePreservesForeignKeys(scratch.path());
    TestCommandLineOverridesConfig(scratch.path());
    TestConsoleGate();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
