/**
 * @file NodeForgeApp.cpp
 * @brief Implementation of the NodeForgeApp class.
 */
#include "app/NodeForgeApp.hpp"

#include "application/BuildOrchestrator.hpp"
#include "application/DependencyChecker.hpp"
#include "application/StepContext.hpp"
#include "infrastructure/ArchitectureProbe.hpp"
#include "infrastructure/GitHubReleaseClient.hpp"
#include "infrastructure/HostEnvironment.hpp"
#include "infrastructure/PathUtils.hpp"

#include <unistd.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifndef NODEFORGE_VERSION
#define NODEFORGE_VERSION "dev"
#endif

namespace nodeforge::app {

namespace fs = std::filesystem;

using application::EventKind;

namespace {

std::string Timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream out;
    out << std::put_time(&local, "%Y%m%d-%H%M%S");
    return out.str();
}

std::string TargetTag(const std::optional<domain::TargetKind>& target) {
    if (!target) return "";
    return "[" + domain::TargetKindToString(*target) + "] ";
}

domain::CatalogPolicy PolicyWithLimit(domain::TargetKind kind, size_t limit) {
    domain::CatalogPolicy policy = domain::SpecFor(kind).catalog;
    if (limit > 0) policy.maxEntries = limit;
    return policy;
}

} // namespace

int NodeForgeApp::Run(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    std::string error;
    auto options = CommandLineOptions::Parse(args, error);
    if (!options) {
        std::cerr << "[NodeForge] " << error << "\n\n" << CommandLineOptions::Usage();
        return 2;
    }
    if (options->showHelp) {
        std::cout << CommandLineOptions::Usage();
        return 0;
    }
    if (options->showVersion) {
        std::cout << "nodeforge " << NODEFORGE_VERSION << std::endl;
        return 0;
    }

    if (!Init(*options)) {
        return 1;
    }

    int code = 0;
    if (options->listVersions) {
        code = ListVersions();
    } else if (options->checkDeps) {
        code = CheckDependencies(*options);
    } else {
        code = RunBuild(*options);
    }

    Shutdown();
    return code;
}

bool NodeForgeApp::Init(const CommandLineOptions& options) {
    fs::path settings = options.configPath.value_or(infrastructure::PathUtils::GetSettingsFile());
    if (options.configPath && !fs::exists(settings)) {
        std::cerr << "[NodeForge] Config file not found: " << settings << std::endl;
        return false;
    }
    m_config = infrastructure::ConfigLoader::Load(settings);

    m_arch = infrastructure::ArchitectureProbe::Host();
    m_hostCores = infrastructure::HostEnvironment::CoreCount();
    std::cout << "[NodeForge] Architecture: " << domain::ArchitectureToString(m_arch)
              << " (" << infrastructure::ArchitectureProbe::MachineName() << "), "
              << m_hostCores << " cores" << std::endl;

    application::ToolchainLayout layout;
    if (!m_config.toolchainRoots.empty()) {
        layout.roots.assign(m_config.toolchainRoots.begin(), m_config.toolchainRoots.end());
    }

    m_runner = std::make_unique<infrastructure::ShellCommandRunner>();
    m_catalog = std::make_unique<application::VersionCatalog>(
        std::make_shared<infrastructure::GitHubReleaseClient>());
    m_composer = std::make_unique<application::EnvironmentComposer>(
        infrastructure::HostEnvironment::Capture(), layout);

    m_gate = std::make_unique<infrastructure::ConsoleConfirmationGate>(std::cin, std::cout, isatty(STDIN_FILENO) != 0);
    if (options.assumeYes) {
        m_gate->presetAnswer(domain::GateKind::AggressiveOptimizations, true);
        m_gate->presetAnswer(domain::GateKind::InstallDependencies, true);
    }

    m_worker = std::make_unique<application::BuildWorker>();
    return true;
}

void NodeForgeApp::Shutdown() {
    if (m_worker) {
        m_worker->stop();
    }
    FlushEvents();
    if (m_logFile.is_open()) {
        m_logFile.close();
    }
}

int NodeForgeApp::RunBuild(const CommandLineOptions& options) {
    domain::BuildRequest request = options.toRequest(m_config, m_hostCores);
    if (m_config.logToFile) {
        OpenLogFile(request.buildDir);
    }

    std::cout << "[NodeForge] Target: " << domain::SelectionToString(request.target)
              << ", jobs: " << request.jobCount
              << ", build dir: " << request.buildDir.string() << std::endl;

    auto orchestrator = std::make_shared<application::BuildOrchestrator>(
        *m_runner, *m_catalog, *m_composer, m_events, *m_gate, m_arch, m_hostCores);
    orchestrator->setCatalogPolicy(domain::TargetKind::NodeDaemon,
                                   PolicyWithLimit(domain::TargetKind::NodeDaemon, m_config.nodeDaemonGroups));
    orchestrator->setCatalogPolicy(domain::TargetKind::Indexer,
                                   PolicyWithLimit(domain::TargetKind::Indexer, m_config.indexerVersions));

    auto status = m_worker->submit("Build " + domain::SelectionToString(request.target),
                                   [orchestrator, request]() { return orchestrator->run(request); });

    while (!status->isCompleted) {
        for (const auto& event : m_events.waitAndDrain(std::chrono::milliseconds(100))) {
            PrintEvent(event);
        }
    }
    FlushEvents();

    if (status->failed) {
        std::cerr << "[NodeForge] Build aborted: " << status->errorMessage << std::endl;
        return 1;
    }

    domain::BuildReport report = status->report.get();
    PrintReport(report);
    return report.succeeded() ? 0 : 1;
}

int NodeForgeApp::ListVersions() {
    bool any = false;
    for (auto kind : domain::ExpandSelection(domain::TargetSelection::Both)) {
        const auto& spec = domain::SpecFor(kind);
        size_t limit = kind == domain::TargetKind::NodeDaemon ? m_config.nodeDaemonGroups : m_config.indexerVersions;
        domain::CatalogPolicy policy = PolicyWithLimit(kind, limit);

        auto versions = m_catalog->refresh(spec, &policy, [](std::string status) {
            std::cout << "[VersionCatalog] " << status << std::endl;
        });

        std::cout << spec.displayName << ": ";
        if (versions.empty()) {
            std::cout << "versions unavailable" << std::endl;
            continue;
        }
        any = true;
        for (size_t i = 0; i < versions.size(); ++i) {
            std::cout << (i ? ", " : "") << versions[i].name();
        }
        std::cout << std::endl;
    }
    return any ? 0 : 1;
}

int NodeForgeApp::CheckDependencies(const CommandLineOptions& options) {
    application::DependencyChecker checker(*m_composer);
    domain::BuildEnvironment env = m_composer->compose(m_arch, domain::OptimizationTier::Standard);
    application::StepContext ctx{*m_runner, &m_events, std::nullopt};

    auto report = checker.check(env, ctx);
    FlushEvents();
    if (!report) {
        std::cerr << "[DependencyChecker] " << report.failure().describe() << std::endl;
        return 1;
    }

    if (options.installMissing) {
        checker.installMissing(report.value(), *m_gate, env, ctx);
        FlushEvents();
        for (const auto& name : report.value().installFailures) {
            std::cerr << "[DependencyChecker] Not installed: " << name << std::endl;
        }
    }
    return report.value().complete() ? 0 : 1;
}

void NodeForgeApp::OpenLogFile(const fs::path& buildDir) {
    fs::path logsDir = infrastructure::PathUtils::GetLogsDir(buildDir);
    try {
        fs::create_directories(logsDir);
    } catch (const std::exception& e) {
        std::cerr << "[NodeForge] Cannot create log directory: " << e.what() << std::endl;
        return;
    }
    fs::path logPath = logsDir / ("nodeforge-" + Timestamp() + ".log");
    m_logFile.open(logPath, std::ios::app);
    if (!m_logFile.is_open()) {
        std::cerr << "[NodeForge] Cannot open log file: " << logPath << std::endl;
        return;
    }
    std::cout << "[NodeForge] Logging to " << logPath.string() << std::endl;
}

void NodeForgeApp::PrintEvent(const application::BuildEvent& event) {
    std::string line;
    switch (event.kind) {
        case EventKind::Log:
            line = TargetTag(event.target) + event.text;
            std::cout << line << std::endl;
            break;
        case EventKind::Warning:
            line = TargetTag(event.target) + "WARNING: " + event.text;
            std::cout << line << std::endl;
            break;
        case EventKind::Error:
            line = TargetTag(event.target) + "ERROR: " + event.text;
            std::cerr << line << std::endl;
            break;
        case EventKind::Progress: {
            int percent = static_cast<int>(event.progress * 100.0 + 0.5);
            if (percent == m_lastPercent) return;
            m_lastPercent = percent;
            line = "[Progress] " + std::to_string(percent) + "%";
            std::cout << line << std::endl;
            break;
        }
        case EventKind::TargetStarted:
            line = TargetTag(event.target) + ">>> " + event.text;
            std::cout << line << std::endl;
            break;
        case EventKind::TargetFinished:
            line = TargetTag(event.target) + "<<< " + event.text;
            std::cout << line << std::endl;
            break;
    }
    if (m_logFile.is_open()) {
        m_logFile << line << '\n';
    }
}

void NodeForgeApp::FlushEvents() {
    for (const auto& event : m_events.drain()) {
        PrintEvent(event);
    }
    if (m_logFile.is_open()) {
        m_logFile.flush();
    }
}

void NodeForgeApp::PrintReport(const domain::BuildReport& report) {
    std::ostringstream out;
    out << "\n=== Build Summary ===\n";
    if (report.requestFailure) {
        out << "Request failed: " << report.requestFailure->describe() << "\n";
    }
    for (const auto& target : report.targets) {
        const auto& spec = domain::SpecFor(target.target);
        out << spec.displayName << " " << (target.version.empty() ? "(unresolved)" : target.version) << ": ";
        if (target.succeeded()) {
            const auto& result = *target.result;
            out << "OK, " << result.copiedArtifacts.size() << " binaries in " << result.outputDir.string();
            if (!result.missingArtifacts.empty()) {
                out << " (" << result.missingArtifacts.size() << " missing)";
            }
            out << "\n";
            for (const auto& checksum : result.checksums) {
                out << "  " << checksum.sha256 << "  " << checksum.name << "\n";
            }
        } else if (target.failure) {
            out << "FAILED\n  " << target.failure->describe() << "\n";
            if (target.result) {
                for (const auto& name : target.result->missingArtifacts) {
                    out << "  missing: " << name << "\n";
                }
            }
        }
    }
    out << (report.succeeded() ? "All builds succeeded." : "Build finished with errors.") << "\n";

    std::cout << out.str();
    if (m_logFile.is_open()) {
        m_logFile << out.str();
    }
}

} // namespace nodeforge::app
