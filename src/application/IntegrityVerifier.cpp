#include "application/IntegrityVerifier.hpp"

namespace nodeforge::application {

using domain::CommandLine;

namespace {

std::string Abbrev(const std::string& commit) {
    return commit.size() > 16 ? commit.substr(0, 16) + "..." : commit;
}

} // namespace

IntegrityVerifier::IntegrityVerifier(std::string vcsProgram)
    : m_vcs(std::move(vcsProgram)) {}

VerificationReport IntegrityVerifier::verify(const std::filesystem::path& checkoutPath,
                                             const std::string& expectedTag,
                                             const domain::BuildEnvironment& env,
                                             const StepContext& ctx) const {
    VerificationReport report;

    auto head = ctx.run(CommandLine{m_vcs, {"rev-parse", "HEAD"}}, checkoutPath, env, false);
    if (!head || head.value().firstLine().empty()) {
        report.reason = "Could not get commit hash";
        ctx.warn(report.reason);
        return report;
    }
    report.headCommit = head.value().firstLine();

    auto tag = ctx.run(CommandLine{m_vcs, {"rev-list", "-n", "1", expectedTag}}, checkoutPath, env, false);
    if (!tag || tag.value().firstLine().empty()) {
        report.reason = "Could not get tag commit hash";
        ctx.warn(report.reason);
        return report;
    }
    report.tagCommit = tag.value().firstLine();

    if (report.headCommit != report.tagCommit) {
        report.reason = "Repository commit mismatch";
        ctx.warn(report.reason + "!");
        ctx.warn("  Current:  " + Abbrev(report.headCommit));
        ctx.warn("  Expected: " + Abbrev(report.tagCommit));
        return report;
    }

    report.verified = true;
    ctx.log("Git repository verified at " + expectedTag);
    ctx.log("  Commit: " + Abbrev(report.headCommit));
    return report;
}

} // namespace nodeforge::application
