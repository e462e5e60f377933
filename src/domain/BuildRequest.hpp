/**
 * @file BuildRequest.hpp
 * @brief Request/response value objects exchanged between a front-end and the orchestrator.
 */

#pragma once

#include "domain/BuildFailure.hpp"
#include "domain/BuildResult.hpp"
#include "domain/BuildTarget.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace nodeforge::domain {

/**
 * @enum FailurePolicy
 * @brief What happens to the remaining targets after one fails.
 */
enum class FailurePolicy {
    AbortRemaining,        ///< Stop the whole request at the first failure.
    ContinueIndependently  ///< Keep building the other targets.
};

/**
 * @struct BuildRequest
 * @brief Everything one orchestration run needs. Filled by the caller.
 */
struct BuildRequest {
    TargetSelection target = TargetSelection::NodeDaemon;
    int jobCount = 1;
    std::filesystem::path buildDir;
    bool aggressiveOptimizations = false;
    std::string nodeDaemonVersion; ///< Empty: newest entry of the catalog.
    std::string indexerVersion;    ///< Empty: newest entry of the catalog.
    bool allowUnverifiedSource = false;
    FailurePolicy failurePolicy = FailurePolicy::AbortRemaining;

    const std::string& versionFor(TargetKind kind) const {
        return kind == TargetKind::NodeDaemon ? nodeDaemonVersion : indexerVersion;
    }
};

/**
 * @struct TargetOutcome
 * @brief Terminal state of one target: a result or a typed failure.
 */
struct TargetOutcome {
    TargetKind target;
    std::string version;
    std::optional<BuildResult> result;
    std::optional<BuildFailure> failure;

    bool succeeded() const { return result.has_value() && !failure.has_value(); }
};

/**
 * @struct BuildReport
 * @brief Response of one orchestration run.
 */
struct BuildReport {
    std::vector<TargetOutcome> targets;
    std::optional<BuildFailure> requestFailure; ///< Set when the run never reached a target.

    bool succeeded() const {
        if (requestFailure) return false;
        for (const auto& t : targets) {
            if (!t.succeeded()) return false;
        }
        return !targets.empty();
    }
};

} // namespace nodeforge::domain
