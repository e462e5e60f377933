#include "app/CommandLineOptions.hpp"

#include "infrastructure/PathUtils.hpp"

#include <algorithm>
#include <stdexcept>

namespace nodeforge::app {

namespace {

bool ParseJobs(const std::string& text, int& jobs) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) return false;
        jobs = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

std::string CommandLineOptions::Usage() {
    return
        "Usage: nodeforge [options]\n"
        "\n"
        "Builds Bitcoin Core and/or Electrs from a pinned upstream release tag.\n"
        "\n"
        "Options:\n"
        "  --target node|indexer|both   What to build (default: node)\n"
        "  --node-version TAG           Bitcoin Core tag, e.g. v29.1 (default: newest)\n"
        "  --indexer-version TAG        Electrs tag, e.g. v0.10.9 (default: newest)\n"
        "  --jobs N                     Parallel compile jobs (default: cores - 1)\n"
        "  --build-dir DIR              Checkout and output root\n"
        "  --aggressive                 Architecture-specific optimization flags\n"
        "  --allow-unverified           Build even if the checkout does not match the tag\n"
        "  --continue-on-failure        Keep building other targets after a failure\n"
        "  --yes                        Answer yes to confirmation prompts\n"
        "  --config FILE                settings.json to read\n"
        "  --list-versions              Print the available versions and exit\n"
        "  --check-deps                 Check required packages and toolchains and exit\n"
        "  --install-missing            With --check-deps, install what is missing\n"
        "  --version                    Print the version and exit\n"
        "  -h, --help                   Show this help\n";
}

std::optional<CommandLineOptions> CommandLineOptions::Parse(const std::vector<std::string>& args,
                                                            std::string& error) {
    CommandLineOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= args.size()) {
                error = arg + " requires a value";
                return false;
            }
            out = args[++i];
            return true;
        };

        std::string v;
        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
        } else if (arg == "--version") {
            options.showVersion = true;
        } else if (arg == "--target") {
            if (!value(v)) return std::nullopt;
            options.target = domain::ParseSelection(v);
            if (!options.target) {
                error = "Unknown target '" + v + "' (expected node, indexer or both)";
                return std::nullopt;
            }
        } else if (arg == "--jobs" || arg == "-j") {
            if (!value(v)) return std::nullopt;
            int jobs = 0;
            if (!ParseJobs(v, jobs)) {
                error = "Invalid job count '" + v + "'";
                return std::nullopt;
            }
            options.jobs = jobs;
        } else if (arg == "--build-dir") {
            if (!value(v)) return std::nullopt;
            options.buildDir = infrastructure::PathUtils::ExpandHome(v);
        } else if (arg == "--config") {
            if (!value(v)) return std::nullopt;
            options.configPath = infrastructure::PathUtils::ExpandHome(v);
        } else if (arg == "--node-version") {
            if (!value(options.nodeDaemonVersion)) return std::nullopt;
        } else if (arg == "--indexer-version") {
            if (!value(options.indexerVersion)) return std::nullopt;
        } else if (arg == "--aggressive") {
            options.aggressive = true;
        } else if (arg == "--allow-unverified") {
            options.allowUnverified = true;
        } else if (arg == "--yes" || arg == "-y") {
            options.assumeYes = true;
        } else if (arg == "--continue-on-failure") {
            options.continueOnFailure = true;
        } else if (arg == "--list-versions") {
            options.listVersions = true;
        } else if (arg == "--check-deps") {
            options.checkDeps = true;
        } else if (arg == "--install-missing") {
            options.checkDeps = true;
            options.installMissing = true;
        } else {
            error = "Unknown option '" + arg + "'";
            return std::nullopt;
        }
    }
    return options;
}

domain::BuildRequest CommandLineOptions::toRequest(const infrastructure::AppConfig& config, int hostCores) const {
    domain::BuildRequest request;
    request.target = target.value_or(domain::TargetSelection::NodeDaemon);

    if (jobs) {
        request.jobCount = *jobs;
    } else if (config.jobs > 0) {
        request.jobCount = std::min(config.jobs, hostCores);
    } else {
        request.jobCount = std::max(1, hostCores - 1);
    }

    request.buildDir = buildDir.value_or(config.buildDir);
    request.aggressiveOptimizations = aggressive || config.aggressiveOptimizations;
    request.nodeDaemonVersion = nodeDaemonVersion;
    request.indexerVersion = indexerVersion;
    request.allowUnverifiedSource = allowUnverified;
    request.failurePolicy = continueOnFailure ? domain::FailurePolicy::ContinueIndependently
                                              : config.failurePolicy;
    return request;
}

} // namespace nodeforge::app
