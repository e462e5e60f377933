#include "application/strategies/CMakeStrategy.hpp"

namespace nodeforge::application::strategies {

using domain::CommandLine;

domain::StageResult<domain::Done> CMakeStrategy::build(const domain::SourceCheckout& checkout,
                                                       const domain::BuildEnvironment& env,
                                                       int jobs,
                                                       const StepContext& ctx) const {
    ctx.log("Building with CMake (" + checkout.requestedTag + ")...");

    ctx.log("Configuring (wallet support disabled for node-only build)...");
    CommandLine configure{"cmake", {"-B", kBuildSubdir, "-DENABLE_WALLET=OFF", "-DENABLE_IPC=OFF"}};
    auto configured = ctx.run(configure, checkout.path, env);
    if (!configured) return configured.failure();

    ctx.log("Compiling with " + std::to_string(jobs) + " cores...");
    CommandLine compile{"cmake", {"--build", kBuildSubdir, "-j" + std::to_string(jobs)}};
    auto compiled = ctx.run(compile, checkout.path, env);
    if (!compiled) return compiled.failure();

    return domain::Done{};
}

std::filesystem::path CMakeStrategy::artifactDir(const std::filesystem::path& sourceDir) const {
    return sourceDir / kBuildSubdir / "bin";
}

} // namespace nodeforge::application::strategies
