/**
 * @file BuildOrchestrator.cpp
 * @brief Implementation of BuildOrchestrator.
 */

#include "application/BuildOrchestrator.hpp"

#include <cctype>
#include <system_error>

namespace nodeforge::application {

namespace fs = std::filesystem;

using domain::BuildFailure;
using domain::BuildReport;
using domain::BuildRequest;
using domain::BuildResult;
using domain::FailureKind;
using domain::ReleaseTag;
using domain::StageResult;
using domain::TargetKind;

namespace {

// Stages counted for progress: version, environment, preflight, acquire, verify, build, collect.
constexpr int kStageCount = 7;

BuildFailure Failure(FailureKind kind, std::string message) {
    BuildFailure failure;
    failure.kind = kind;
    failure.message = std::move(message);
    return failure;
}

} // namespace

BuildOrchestrator::BuildOrchestrator(domain::CommandRunner& runner,
                                     VersionCatalog& catalog,
                                     const EnvironmentComposer& composer,
                                     BuildEventChannel& events,
                                     domain::ConfirmationGate& gate,
                                     domain::Architecture arch,
                                     int hostCores)
    : m_runner(runner)
    , m_catalog(catalog)
    , m_composer(composer)
    , m_events(events)
    , m_gate(gate)
    , m_arch(arch)
    , m_hostCores(hostCores < 1 ? 1 : hostCores) {}

void BuildOrchestrator::setCatalogPolicy(TargetKind target, domain::CatalogPolicy policy) {
    m_catalogPolicies[target] = std::move(policy);
}

std::optional<BuildFailure> BuildOrchestrator::Validate(const BuildRequest& request, int hostCores) {
    if (request.jobCount < 1 || request.jobCount > hostCores) {
        return Failure(FailureKind::InvalidRequest,
                       "Job count " + std::to_string(request.jobCount) + " is outside [1, " +
                       std::to_string(hostCores) + "]");
    }
    if (request.buildDir.empty()) {
        return Failure(FailureKind::InvalidRequest, "Build directory is empty");
    }
    return std::nullopt;
}

std::string BuildOrchestrator::UpstreamTagName(const ReleaseTag& tag) {
    const std::string& name = tag.name();
    if (!name.empty() && std::isdigit(static_cast<unsigned char>(name.front()))) {
        return "v" + name;
    }
    return name;
}

fs::path BuildOrchestrator::CheckoutDir(const fs::path& buildDir,
                                        const domain::TargetSpec& spec,
                                        const ReleaseTag& tag) {
    return buildDir / (spec.directoryPrefix + "-" + tag.cleanVersion());
}

fs::path BuildOrchestrator::OutputDir(const fs::path& buildDir,
                                      const domain::TargetSpec& spec,
                                      const ReleaseTag& tag) {
    return buildDir / "binaries" / (spec.directoryPrefix + "-" + tag.cleanVersion());
}

BuildReport BuildOrchestrator::run(const BuildRequest& request) {
    BuildReport report;
    m_events.resetProgress();

    if (auto invalid = Validate(request, m_hostCores)) {
        m_events.error(invalid->describe());
        report.requestFailure = *invalid;
        return report;
    }

    if (request.aggressiveOptimizations) {
        auto confirmed = confirmAggressiveTier();
        if (!confirmed) {
            m_events.error(confirmed.failure().describe());
            report.requestFailure = confirmed.failure();
            return report;
        }
    }

    const auto targets = domain::ExpandSelection(request.target);
    Progress progress;
    progress.count = targets.size();

    bool aborted = false;
    for (size_t i = 0; i < targets.size(); ++i) {
        TargetKind kind = targets[i];
        domain::TargetOutcome outcome{kind, request.versionFor(kind), std::nullopt, std::nullopt};

        if (aborted) {
            outcome.failure = Failure(FailureKind::Cancelled,
                                      "Not started: an earlier target failed");
            m_events.warn("Skipping " + domain::SpecFor(kind).displayName + " after earlier failure", kind);
            report.targets.push_back(std::move(outcome));
            continue;
        }

        progress.index = i;
        m_events.publish({EventKind::TargetStarted, kind, domain::SpecFor(kind).displayName, 0.0});

        std::string version;
        auto result = runTarget(kind, request, progress, version);
        if (!version.empty()) outcome.version = version;

        if (result) {
            outcome.result = std::move(result.value());
            if (outcome.result->empty()) {
                outcome.failure = Failure(FailureKind::ArtifactMissing,
                                          domain::SpecFor(kind).displayName +
                                              " build produced none of the expected binaries");
            }
        } else {
            outcome.failure = result.failure();
        }

        if (!outcome.failure) {
            m_events.publish({EventKind::TargetFinished, kind, "succeeded", 0.0});
        } else {
            m_events.error(outcome.failure->describe(), kind);
            for (const auto& line : outcome.failure->logTail) {
                m_events.error("  | " + line, kind);
            }
            m_events.publish({EventKind::TargetFinished, kind, "failed", 0.0});
            if (request.failurePolicy == domain::FailurePolicy::AbortRemaining) {
                aborted = true;
            }
        }
        m_events.progress(static_cast<double>(i + 1) / static_cast<double>(progress.count));
        report.targets.push_back(std::move(outcome));
    }

    m_events.progress(1.0);
    if (report.succeeded()) {
        m_events.log("Build complete");
    }
    return report;
}

StageResult<BuildResult> BuildOrchestrator::runTarget(TargetKind kind,
                                                      const BuildRequest& request,
                                                      const Progress& progress,
                                                      std::string& resolvedVersion) {
    const domain::TargetSpec& spec = domain::SpecFor(kind);
    StepContext ctx{m_runner, &m_events, kind};
    const auto tier = request.aggressiveOptimizations ? domain::OptimizationTier::Aggressive
                                                      : domain::OptimizationTier::Standard;

    auto tag = resolveVersion(spec, request.versionFor(kind));
    if (!tag) return tag.failure();
    resolvedVersion = tag.value().name();
    const std::string upstreamTag = UpstreamTagName(tag.value());
    stageDone(progress, 1);

    auto strategy = m_strategies.create(kind, tag.value());
    if (!strategy) {
        return Failure(FailureKind::InvalidRequest,
                       "No build strategy for " + spec.displayName + " " + tag.value().name());
    }

    ctx.log("=== Building " + spec.displayName + " " + upstreamTag + " ===");
    ctx.log("Architecture: " + domain::ArchitectureToString(m_arch) +
            ", optimizations: " + domain::TierToString(tier) +
            ", build system: " + VariantToString(strategy->variant()) +
            ", jobs: " + std::to_string(request.jobCount));

    domain::BuildEnvironment env = m_composer.compose(m_arch, tier);
    strategy->prepareEnvironment(env, m_composer, tier);
    stageDone(progress, 2);

    auto ready = strategy->preflight(env, ctx);
    if (!ready) return ready.failure();
    stageDone(progress, 3);

    std::error_code ec;
    fs::create_directories(request.buildDir, ec);
    if (ec) {
        return Failure(FailureKind::CommandFailure,
                       "Cannot create build directory " + request.buildDir.string() + ": " + ec.message());
    }

    fs::path checkoutDir = CheckoutDir(request.buildDir, spec, tag.value());
    auto checkout = m_acquirer.acquire(spec.repositoryUrl, upstreamTag, checkoutDir, env, ctx);
    if (!checkout) return checkout.failure();
    stageDone(progress, 4);

    auto report = m_verifier.verify(checkout.value().path, upstreamTag, env, ctx);
    if (!report.verified) {
        auto allowed = gateUnverifiedSource(report, upstreamTag, request, ctx);
        if (!allowed) return allowed.failure();
    }
    stageDone(progress, 5);

    auto built = strategy->build(checkout.value(), env, request.jobCount, ctx);
    if (!built) return built.failure();
    stageDone(progress, 6);

    auto candidates = strategy->candidatePaths(checkout.value().path, spec.artifactNames);
    BuildResult result = m_collector.collect(candidates, OutputDir(request.buildDir, spec, tag.value()),
                                             &m_events, kind);
    stageDone(progress, 7);

    if (result.empty()) {
        ctx.warn("Checking what exists...");
        for (const auto& candidate : candidates) {
            ctx.warn(std::string(fs::exists(candidate, ec) ? "  [found]   " : "  [missing] ") + candidate.string());
        }
        return result;
    }

    ctx.log(spec.displayName + " binaries: " + result.outputDir.string());
    return result;
}

StageResult<ReleaseTag> BuildOrchestrator::resolveVersion(const domain::TargetSpec& spec,
                                                          const std::string& requested) {
    if (!requested.empty()) {
        return ReleaseTag(requested);
    }

    m_events.log("No " + spec.displayName + " version selected, fetching releases...", spec.kind);
    auto it = m_catalogPolicies.find(spec.kind);
    const domain::CatalogPolicy* policy = it != m_catalogPolicies.end() ? &it->second : nullptr;
    auto versions = m_catalog.refresh(spec, policy, [this, &spec](std::string status) {
        m_events.log(status, spec.kind);
    });
    if (versions.empty()) {
        return Failure(FailureKind::NetworkFailure,
                       spec.displayName + " versions unavailable; select a version explicitly");
    }
    m_events.log("Using newest " + spec.displayName + " release " + versions.front().name(), spec.kind);
    return versions.front();
}

StageResult<domain::Done> BuildOrchestrator::confirmAggressiveTier() {
    domain::ConfirmationPrompt prompt{
        domain::GateKind::AggressiveOptimizations,
        "Aggressive Optimizations",
        "The build will use architecture-specific optimization flags (-O3, native tuning, LTO).\n"
        "The binaries will only run on this machine's CPU and may expose compiler bugs.\n"
        "Continue?"};
    if (!m_gate.confirm(prompt)) {
        return Failure(FailureKind::Cancelled, "Aggressive optimizations were not confirmed");
    }
    m_events.warn("Aggressive optimizations enabled");
    return domain::Done{};
}

StageResult<domain::Done> BuildOrchestrator::gateUnverifiedSource(const VerificationReport& report,
                                                                  const std::string& tag,
                                                                  const BuildRequest& request,
                                                                  const StepContext& ctx) {
    if (request.allowUnverifiedSource) {
        ctx.warn("Proceeding with unverified source (" + report.reason + ")");
        return domain::Done{};
    }

    domain::ConfirmationPrompt prompt{
        domain::GateKind::UnverifiedSource,
        "Verification Failed",
        report.reason + " for " + tag + ".\n"
        "  Current:  " + (report.headCommit.empty() ? "unknown" : report.headCommit) + "\n"
        "  Expected: " + (report.tagCommit.empty() ? "unknown" : report.tagCommit) + "\n"
        "Build anyway?"};
    if (m_gate.confirm(prompt)) {
        ctx.warn("Building unverified source at user request");
        return domain::Done{};
    }

    BuildFailure failure = Failure(FailureKind::VerificationFailure, report.reason + " for " + tag);
    return failure;
}

void BuildOrchestrator::stageDone(const Progress& progress, int stage) {
    double fraction = (static_cast<double>(progress.index) +
                       static_cast<double>(stage) / kStageCount) /
                      static_cast<double>(progress.count);
    m_events.progress(fraction);
}

} // namespace nodeforge::application
