#include "application/strategies/CargoReleaseStrategy.hpp"

#include "application/ToolchainProbe.hpp"

namespace nodeforge::application::strategies {

using domain::BuildFailure;
using domain::CommandLine;
using domain::FailureKind;

namespace {

BuildFailure MakeToolchainMissing(const std::string& what, const domain::BuildEnvironment& env) {
    std::string path = env.get(domain::BuildEnvironment::kSearchPathVar).value_or("");
    if (path.size() > 200) path = path.substr(0, 200) + "...";

    BuildFailure failure;
    failure.kind = FailureKind::ToolchainMissing;
    failure.message = what + " not found in PATH. The indexer requires Rust/Cargo to compile. "
                      "Run with --check-deps, install Rust (https://rustup.rs) and retry. "
                      "Current PATH: " + path;
    return failure;
}

} // namespace

domain::StageResult<domain::Done> CargoReleaseStrategy::preflight(const domain::BuildEnvironment& env,
                                                                  const StepContext& ctx) const {
    ctx.log("Verifying Rust installation...");

    auto cargo = ToolchainProbe::locate("cargo", env);
    if (!cargo) return MakeToolchainMissing("cargo", env);
    auto rustc = ToolchainProbe::locate("rustc", env);
    if (!rustc) return MakeToolchainMissing("rustc", env);

    auto cargoVersion = ctx.run(CommandLine{cargo->string(), {"--version"}}, std::filesystem::current_path(), env, false);
    if (!cargoVersion) return MakeToolchainMissing("A working cargo", env);
    ctx.log("Cargo found: " + cargoVersion.value().firstLine());

    auto rustcVersion = ctx.run(CommandLine{rustc->string(), {"--version"}}, std::filesystem::current_path(), env, false);
    if (rustcVersion) {
        ctx.log("Rustc found: " + rustcVersion.value().firstLine());
    } else {
        ctx.warn("rustc --version failed, but cargo was found. Proceeding...");
    }
    return domain::Done{};
}

void CargoReleaseStrategy::prepareEnvironment(domain::BuildEnvironment& env,
                                              const EnvironmentComposer& composer,
                                              domain::OptimizationTier tier) const {
    composer.applyRustFlags(env, tier);
}

domain::StageResult<domain::Done> CargoReleaseStrategy::build(const domain::SourceCheckout& checkout,
                                                              const domain::BuildEnvironment& env,
                                                              int jobs,
                                                              const StepContext& ctx) const {
    ctx.log("Building with Cargo (" + std::to_string(jobs) + " jobs)...");
    if (auto libclang = env.get("LIBCLANG_PATH")) {
        ctx.log("  LIBCLANG_PATH: " + *libclang);
    }
    if (auto rustflags = env.get("RUSTFLAGS")) {
        ctx.log("  RUSTFLAGS: " + *rustflags);
    }

    CommandLine cargo{"cargo", {"build", "--release", "--jobs", std::to_string(jobs)}};
    auto built = ctx.run(cargo, checkout.path, env);
    if (!built) return built.failure();
    return domain::Done{};
}

std::filesystem::path CargoReleaseStrategy::artifactDir(const std::filesystem::path& sourceDir) const {
    return sourceDir / "target" / "release";
}

} // namespace nodeforge::application::strategies
