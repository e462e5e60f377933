#include "application/DependencyChecker.hpp"

#include "application/ToolchainProbe.hpp"

#include <algorithm>

namespace nodeforge::application {

namespace fs = std::filesystem;

using domain::BuildFailure;
using domain::CommandLine;
using domain::FailureKind;

std::vector<std::string> DependencyReport::missingPackages() const {
    std::vector<std::string> missing;
    for (const auto& p : packages) {
        if (!p.installed) missing.push_back(p.name);
    }
    return missing;
}

bool DependencyReport::complete() const {
    bool toolsOk = std::all_of(tools.begin(), tools.end(),
                               [](const ToolStatus& t) { return t.version.has_value(); });
    return toolsOk && missingPackages().empty();
}

const std::vector<std::string>& DependencyChecker::RequiredPackages() {
    static const std::vector<std::string> packages = {
        "automake", "libtool", "pkg-config", "boost", "miniupnpc", "zeromq", "sqlite",
        "python", "cmake", "llvm", "libevent", "rocksdb", "rust", "git"
    };
    return packages;
}

DependencyChecker::DependencyChecker(const EnvironmentComposer& composer, std::vector<std::string> packages)
    : m_composer(composer), m_packages(std::move(packages)) {}

domain::StageResult<DependencyReport> DependencyChecker::check(const domain::BuildEnvironment& env,
                                                               const StepContext& ctx) const {
    auto manager = m_composer.packageManagerExecutable();
    if (!manager) {
        manager = ToolchainProbe::locate(m_composer.layout().packageManager, env);
    }
    if (!manager) {
        BuildFailure failure;
        failure.kind = FailureKind::ToolchainMissing;
        failure.message = m_composer.layout().packageManager +
                          " not found. Install it first: https://brew.sh";
        return failure;
    }

    DependencyReport report;
    report.packageManager = *manager;
    ctx.log("Checking dependencies with " + manager->string());

    const fs::path cwd = fs::current_path();
    for (const auto& pkg : m_packages) {
        // Not installed is an ordinary answer here, so the runner is called directly.
        CommandLine query{manager->string(), {"list", pkg}};
        auto outcome = ctx.runner.run(query, cwd, env, nullptr);
        bool installed = outcome.succeeded();
        report.packages.push_back({pkg, installed});
        if (installed) {
            ctx.log("  " + pkg + ": installed");
        } else {
            ctx.warn("  " + pkg + ": missing");
        }
    }

    for (const char* tool : {"rustc", "cargo"}) {
        ToolStatus status{tool, std::nullopt};
        auto located = ToolchainProbe::locate(tool, env);
        if (located) {
            auto outcome = ctx.runner.run(CommandLine{located->string(), {"--version"}}, cwd, env, nullptr);
            if (outcome.succeeded() && !outcome.firstLine().empty()) {
                status.version = outcome.firstLine();
            }
        }
        if (status.version) {
            ctx.log(std::string("  ") + tool + ": " + *status.version);
        } else {
            ctx.warn(std::string("  ") + tool + ": not found in PATH");
        }
        report.tools.push_back(std::move(status));
    }

    auto missing = report.missingPackages();
    if (missing.empty()) {
        ctx.log("All dependencies are installed.");
    } else {
        ctx.warn(std::to_string(missing.size()) + " package(s) missing.");
    }
    return report;
}

size_t DependencyChecker::installMissing(DependencyReport& report,
                                         domain::ConfirmationGate& gate,
                                         const domain::BuildEnvironment& env,
                                         const StepContext& ctx) const {
    auto missing = report.missingPackages();
    if (missing.empty()) return 0;

    std::string list;
    for (const auto& name : missing) {
        if (!list.empty()) list += ", ";
        list += name;
    }

    domain::ConfirmationPrompt prompt{
        domain::GateKind::InstallDependencies,
        "Install Missing Dependencies",
        "The following packages will be installed:\n" + list + "\n\nThis may take several minutes. Continue?"};
    if (!gate.confirm(prompt)) {
        ctx.log("Installation skipped.");
        return 0;
    }

    size_t installed = 0;
    for (auto& pkg : report.packages) {
        if (pkg.installed) continue;
        ctx.log("Installing " + pkg.name + "...");
        auto result = ctx.run(CommandLine{report.packageManager.string(), {"install", pkg.name}},
                              fs::current_path(), env);
        if (!result) {
            ctx.warn("Failed to install " + pkg.name);
            report.installFailures.push_back(pkg.name);
            continue;
        }
        pkg.installed = true;
        ++installed;
    }
    ctx.log("Installed " + std::to_string(installed) + " of " + std::to_string(missing.size()) + " package(s).");
    return installed;
}

} // namespace nodeforge::application
