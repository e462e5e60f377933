#include "application/strategies/AutotoolsStrategy.hpp"

#include <algorithm>
#include <iterator>

namespace nodeforge::application::strategies {

using domain::CommandLine;

namespace {
constexpr const char* kCMakeOnlyArtifact = "bitcoin-util";
}

domain::StageResult<domain::Done> AutotoolsStrategy::build(const domain::SourceCheckout& checkout,
                                                           const domain::BuildEnvironment& env,
                                                           int jobs,
                                                           const StepContext& ctx) const {
    ctx.log("Building with Autotools (" + checkout.requestedTag + ")...");

    ctx.log("Running autogen.sh...");
    auto bootstrap = ctx.run(CommandLine{"./autogen.sh", {}}, checkout.path, env);
    if (!bootstrap) return bootstrap.failure();

    // Node-only build: no wallet (no Berkeley DB) and no GUI.
    ctx.log("Configuring (wallet support disabled for node-only build)...");
    auto configure = ctx.run(CommandLine{"./configure", {"--disable-wallet", "--disable-gui"}}, checkout.path, env);
    if (!configure) return configure.failure();

    ctx.log("Compiling with " + std::to_string(jobs) + " cores...");
    auto make = ctx.run(CommandLine{"make", {"-j" + std::to_string(jobs)}}, checkout.path, env);
    if (!make) return make.failure();

    return domain::Done{};
}

std::vector<std::string> AutotoolsStrategy::expectedArtifacts(const std::vector<std::string>& names) const {
    std::vector<std::string> expected;
    std::copy_if(names.begin(), names.end(), std::back_inserter(expected),
                 [](const std::string& name) { return name != kCMakeOnlyArtifact; });
    return expected;
}

std::filesystem::path AutotoolsStrategy::artifactDir(const std::filesystem::path& sourceDir) const {
    return sourceDir / "bin";
}

} // namespace nodeforge::application::strategies
