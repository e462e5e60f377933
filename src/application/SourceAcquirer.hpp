/**
 * @file SourceAcquirer.hpp
 * @brief Shallow, tag-pinned checkout of an upstream repository.
 */

#pragma once

#include "application/StepContext.hpp"
#include "domain/BuildEnvironment.hpp"
#include "domain/BuildFailure.hpp"
#include "domain/BuildResult.hpp"

#include <filesystem>
#include <string>

namespace nodeforge::application {

/**
 * @class SourceAcquirer
 * @brief Clones or updates destDir so that its working tree is at tag.
 *
 * A missing destDir is cloned with --depth 1 --branch <tag>. An existing one
 * only fetches that tag (shallow) and checks it out; the full history is never
 * fetched. Calling acquire twice with the same tag is harmless.
 */
class SourceAcquirer {
public:
    explicit SourceAcquirer(std::string vcsProgram = "git");

    domain::StageResult<domain::SourceCheckout> acquire(const std::string& repoUrl,
                                                        const std::string& tag,
                                                        const std::filesystem::path& destDir,
                                                        const domain::BuildEnvironment& env,
                                                        const StepContext& ctx) const;

    /** @brief Commit the working tree of checkoutPath is at ("git rev-parse HEAD"). */
    domain::StageResult<std::string> headCommit(const std::filesystem::path& checkoutPath,
                                                const domain::BuildEnvironment& env,
                                                const StepContext& ctx) const;

private:
    std::string m_vcs;
};

} // namespace nodeforge::application
