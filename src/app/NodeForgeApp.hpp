/**
 * @file NodeForgeApp.hpp
 * @brief Main application class for NodeForge.
 */

#pragma once

#include "app/CommandLineOptions.hpp"
#include "application/BuildEventChannel.hpp"
#include "application/BuildWorker.hpp"
#include "application/EnvironmentComposer.hpp"
#include "application/VersionCatalog.hpp"
#include "domain/Architecture.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ConfirmationGates.hpp"
#include "infrastructure/ShellCommandRunner.hpp"

#include <fstream>
#include <memory>
#include <string>

namespace nodeforge::app {

/**
 * @class NodeForgeApp
 * @brief Wires the services together, dispatches the requested mode and
 * prints the event stream.
 */
class NodeForgeApp {
public:
    /**
     * @brief Parses arguments and runs to completion.
     * @return 0 on success, 1 when the build or check failed, 2 on bad usage.
     */
    int Run(int argc, char** argv);

private:
    bool Init(const CommandLineOptions& options);
    void Shutdown();

    int RunBuild(const CommandLineOptions& options);
    int ListVersions();
    int CheckDependencies(const CommandLineOptions& options);

    void OpenLogFile(const std::filesystem::path& buildDir);
    void PrintEvent(const application::BuildEvent& event);
    void FlushEvents();
    void PrintReport(const domain::BuildReport& report);

    infrastructure::AppConfig m_config;
    domain::Architecture m_arch = domain::Architecture::Unknown;
    int m_hostCores = 1;

    application::BuildEventChannel m_events; ///< Outlives the worker that publishes to it.
    std::unique_ptr<infrastructure::ShellCommandRunner> m_runner;
    std::unique_ptr<application::VersionCatalog> m_catalog;
    std::unique_ptr<application::EnvironmentComposer> m_composer;
    std::unique_ptr<infrastructure::ConsoleConfirmationGate> m_gate;
    std::unique_ptr<application::BuildWorker> m_worker;

    std::ofstream m_logFile;
    int m_lastPercent = -1;
};

} // namespace nodeforge::app
