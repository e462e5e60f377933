/**
 * @file DependencyChecker.hpp
 * @brief Reports which host packages and toolchains a build needs and which are missing.
 */

#pragma once

#include "application/EnvironmentComposer.hpp"
#include "application/StepContext.hpp"
#include "domain/BuildFailure.hpp"
#include "domain/ConfirmationGate.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace nodeforge::application {

struct PackageStatus {
    std::string name;
    bool installed = false;
};

struct ToolStatus {
    std::string name;
    std::optional<std::string> version; ///< Empty when the tool did not answer.
};

/**
 * @struct DependencyReport
 * @brief Result of a check() run.
 */
struct DependencyReport {
    std::filesystem::path packageManager;
    std::vector<PackageStatus> packages;
    std::vector<ToolStatus> tools;
    std::vector<std::string> installFailures; ///< Filled by installMissing().

    std::vector<std::string> missingPackages() const;
    bool complete() const;
};

/**
 * @class DependencyChecker
 * @brief Queries the package manager package by package. Never installs without a gate.
 */
class DependencyChecker {
public:
    static const std::vector<std::string>& RequiredPackages();

    explicit DependencyChecker(const EnvironmentComposer& composer,
                               std::vector<std::string> packages = RequiredPackages());

    /** @brief ToolchainMissing when the package manager cannot be located. */
    domain::StageResult<DependencyReport> check(const domain::BuildEnvironment& env,
                                                const StepContext& ctx) const;

    /**
     * @brief Installs every missing package after a single confirmation.
     * Declining leaves the report untouched. Failed installs are recorded in
     * report.installFailures; successful ones flip the package to installed.
     * @return Number of packages installed.
     */
    size_t installMissing(DependencyReport& report,
                          domain::ConfirmationGate& gate,
                          const domain::BuildEnvironment& env,
                          const StepContext& ctx) const;

private:
    const EnvironmentComposer& m_composer;
    std::vector<std::string> m_packages;
};

} // namespace nodeforge::application
