/**
 * @file IntegrityVerifier.hpp
 * @brief Checks that a checkout sits on the commit its tag points to.
 */

#pragma once

#include "application/StepContext.hpp"
#include "domain/BuildEnvironment.hpp"

#include <filesystem>
#include <string>

namespace nodeforge::application {

/**
 * @struct VerificationReport
 * @brief Outcome of one verification. verified is false whenever either commit is unknown.
 */
struct VerificationReport {
    bool verified = false;
    std::string headCommit;
    std::string tagCommit;
    std::string reason; ///< Why verification failed; empty when verified.
};

/**
 * @class IntegrityVerifier
 * @brief Detective control run after checkout and before compilation.
 *
 * A negative report never aborts by itself: the orchestrator turns it into
 * a user-gated override and fails with VerificationFailure when declined.
 */
class IntegrityVerifier {
public:
    explicit IntegrityVerifier(std::string vcsProgram = "git");

    VerificationReport verify(const std::filesystem::path& checkoutPath,
                              const std::string& expectedTag,
                              const domain::BuildEnvironment& env,
                              const StepContext& ctx) const;

private:
    std::string m_vcs;
};

} // namespace nodeforge::application
