/**
 * @file BuildOrchestrator.hpp
 * @brief Drives every stage of a build request, target by target.
 */

#pragma once

#include "application/ArtifactCollector.hpp"
#include "application/BuildEventChannel.hpp"
#include "application/BuildStrategy.hpp"
#include "application/EnvironmentComposer.hpp"
#include "application/IntegrityVerifier.hpp"
#include "application/SourceAcquirer.hpp"
#include "application/VersionCatalog.hpp"
#include "domain/Architecture.hpp"
#include "domain/BuildRequest.hpp"
#include "domain/CommandRunner.hpp"
#include "domain/ConfirmationGate.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace nodeforge::application {

/**
 * @class BuildOrchestrator
 * @brief resolve version -> compose environment -> preflight -> acquire ->
 * verify -> build -> collect, for each requested target in order.
 *
 * Owns no threads. Everything it has to say goes through the event channel;
 * the only value it returns is the BuildReport. Progress is reset at the start
 * of run() and only moves forward.
 */
class BuildOrchestrator {
public:
    BuildOrchestrator(domain::CommandRunner& runner,
                      VersionCatalog& catalog,
                      const EnvironmentComposer& composer,
                      BuildEventChannel& events,
                      domain::ConfirmationGate& gate,
                      domain::Architecture arch,
                      int hostCores);

    domain::BuildReport run(const domain::BuildRequest& request);

    /** @brief Overrides the catalog policy used when a version must be resolved. */
    void setCatalogPolicy(domain::TargetKind target, domain::CatalogPolicy policy);

    /** @brief InvalidRequest when jobCount is outside [1, hostCores] or buildDir is empty. */
    static std::optional<domain::BuildFailure> Validate(const domain::BuildRequest& request, int hostCores);

    /** @brief <buildDir>/<prefix>-<version without leading v> */
    static std::filesystem::path CheckoutDir(const std::filesystem::path& buildDir,
                                             const domain::TargetSpec& spec,
                                             const domain::ReleaseTag& tag);

    /** @brief <buildDir>/binaries/<prefix>-<version without leading v> */
    static std::filesystem::path OutputDir(const std::filesystem::path& buildDir,
                                           const domain::TargetSpec& spec,
                                           const domain::ReleaseTag& tag);

    /** @brief Upstream tags carry a leading 'v'; "25.0" is looked up as "v25.0". */
    static std::string UpstreamTagName(const domain::ReleaseTag& tag);

private:
    struct Progress {
        size_t index = 0;
        size_t count = 1;
    };

    domain::StageResult<domain::BuildResult> runTarget(domain::TargetKind kind,
                                                       const domain::BuildRequest& request,
                                                       const Progress& progress,
                                                       std::string& resolvedVersion);

    domain::StageResult<domain::ReleaseTag> resolveVersion(const domain::TargetSpec& spec,
                                                           const std::string& requested);

    domain::StageResult<domain::Done> confirmAggressiveTier();
    domain::StageResult<domain::Done> gateUnverifiedSource(const VerificationReport& report,
                                                           const std::string& tag,
                                                           const domain::BuildRequest& request,
                                                           const StepContext& ctx);

    void stageDone(const Progress& progress, int stage);

    domain::CommandRunner& m_runner;
    VersionCatalog& m_catalog;
    const EnvironmentComposer& m_composer;
    BuildEventChannel& m_events;
    domain::ConfirmationGate& m_gate;
    domain::Architecture m_arch;
    int m_hostCores;

    StrategyTable m_strategies = StrategyTable::Default();
    SourceAcquirer m_acquirer;
    IntegrityVerifier m_verifier;
    ArtifactCollector m_collector;
    std::map<domain::TargetKind, domain::CatalogPolicy> m_catalogPolicies;
};

} // namespace nodeforge::application
