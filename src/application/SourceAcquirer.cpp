/**
 * @file SourceAcquirer.cpp
 * @brief Implementation of SourceAcquirer.
 */

#include "application/SourceAcquirer.hpp"

#include <system_error>

namespace nodeforge::application {

namespace fs = std::filesystem;

using domain::BuildFailure;
using domain::CommandLine;
using domain::FailureKind;
using domain::SourceCheckout;
using domain::StageResult;

SourceAcquirer::SourceAcquirer(std::string vcsProgram)
    : m_vcs(std::move(vcsProgram)) {}

StageResult<SourceCheckout> SourceAcquirer::acquire(const std::string& repoUrl,
                                                    const std::string& tag,
                                                    const fs::path& destDir,
                                                    const domain::BuildEnvironment& env,
                                                    const StepContext& ctx) const {
    SourceCheckout checkout;
    checkout.path = destDir;
    checkout.requestedTag = tag;

    std::error_code ec;
    fs::path parent = destDir.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            BuildFailure failure;
            failure.kind = FailureKind::CommandFailure;
            failure.message = "Cannot create build directory " + parent.string() + ": " + ec.message();
            return failure;
        }
    }

    if (!fs::exists(destDir, ec)) {
        ctx.log("Cloning " + repoUrl + " at " + tag + "...");
        CommandLine clone{m_vcs, {"clone", "--depth", "1", "--branch", tag, repoUrl, destDir.string()}};
        auto result = ctx.run(clone, parent.empty() ? fs::current_path() : parent, env);
        if (!result) return result.failure();
        ctx.log("Source cloned to " + destDir.string());
    } else {
        ctx.log("Source directory already exists: " + destDir.string());
        ctx.log("Updating to " + tag + "...");
        CommandLine fetch{m_vcs, {"fetch", "--depth", "1", "origin", "tag", tag}};
        auto fetched = ctx.run(fetch, destDir, env);
        if (!fetched) return fetched.failure();

        CommandLine switchTo{m_vcs, {"checkout", tag}};
        auto switched = ctx.run(switchTo, destDir, env);
        if (!switched) return switched.failure();
        ctx.log("Updated to " + tag);
    }

    auto commit = headCommit(destDir, env, ctx);
    if (!commit) return commit.failure();
    checkout.resolvedCommit = commit.value();
    return checkout;
}

StageResult<std::string> SourceAcquirer::headCommit(const fs::path& checkoutPath,
                                                    const domain::BuildEnvironment& env,
                                                    const StepContext& ctx) const {
    CommandLine revParse{m_vcs, {"rev-parse", "HEAD"}};
    auto result = ctx.run(revParse, checkoutPath, env, false);
    if (!result) return result.failure();

    std::string commit = result.value().firstLine();
    if (commit.empty()) {
        BuildFailure failure = MakeCommandFailure(revParse, result.value());
        failure.message = "Could not read the checked out commit";
        return failure;
    }
    return commit;
}

} // namespace nodeforge::application
