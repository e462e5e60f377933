/**
 * @file BuildFailure.hpp
 * @brief Typed failure kinds and the per-stage result value.
 *
 * Every pipeline stage returns a StageResult instead of throwing, so the
 * orchestrator decides fail-fast / escalate-to-user / fail-soft by switching
 * on the failure kind.
 */

#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace nodeforge::domain {

/**
 * @enum FailureKind
 * @brief Error taxonomy of the build pipeline.
 */
enum class FailureKind {
    NetworkFailure,      ///< Release listing unavailable.
    ToolchainMissing,    ///< Required compiler/package manager not resolvable.
    VerificationFailure, ///< Checkout does not match the tag and no override was granted.
    CommandFailure,      ///< A subprocess exited non-zero.
    ArtifactMissing,     ///< The build produced nothing to collect.
    Cancelled,           ///< A pre-flight confirmation gate was declined.
    InvalidRequest       ///< Request fields out of range.
};

inline std::string FailureKindToString(FailureKind kind) {
    switch (kind) {
        case FailureKind::NetworkFailure: return "NetworkFailure";
        case FailureKind::ToolchainMissing: return "ToolchainMissing";
        case FailureKind::VerificationFailure: return "VerificationFailure";
        case FailureKind::CommandFailure: return "CommandFailure";
        case FailureKind::ArtifactMissing: return "ArtifactMissing";
        case FailureKind::Cancelled: return "Cancelled";
        case FailureKind::InvalidRequest: return "InvalidRequest";
    }
    return "Unknown";
}

/**
 * @struct BuildFailure
 * @brief Failure with enough context to render an actionable message.
 */
struct BuildFailure {
    FailureKind kind = FailureKind::CommandFailure;
    std::string message;
    std::string command;              ///< Failing command line, if any.
    int exitCode = 0;
    std::vector<std::string> logTail; ///< Last captured output lines.

    std::string describe() const {
        std::string text = FailureKindToString(kind) + ": " + message;
        if (!command.empty()) {
            text += "\n  command: " + command;
            text += "\n  exit code: " + std::to_string(exitCode);
        }
        return text;
    }
};

/**
 * @class StageResult
 * @brief Either the value produced by a stage or the reason it failed.
 */
template <typename T>
class StageResult {
public:
    StageResult(T value) : m_data(std::move(value)) {}
    StageResult(BuildFailure failure) : m_data(std::move(failure)) {}

    bool ok() const { return std::holds_alternative<T>(m_data); }
    explicit operator bool() const { return ok(); }

    T& value() { return std::get<T>(m_data); }
    const T& value() const { return std::get<T>(m_data); }

    const BuildFailure& failure() const { return std::get<BuildFailure>(m_data); }

private:
    std::variant<T, BuildFailure> m_data;
};

/** @brief Value for stages that only report success. */
struct Done {};

} // namespace nodeforge::domain
