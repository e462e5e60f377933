/**
 * @file CargoReleaseStrategy.hpp
 * @brief cargo build --release, used by the indexer.
 */

#pragma once

#include "application/BuildStrategy.hpp"

namespace nodeforge::application::strategies {

/**
 * @class CargoReleaseStrategy
 * @brief Rust release build. Refuses to start without rustc and cargo on the composed PATH.
 */
class CargoReleaseStrategy : public BuildStrategy {
public:
    StrategyVariant variant() const override { return StrategyVariant::CargoRelease; }

    /** @brief ToolchainMissing unless rustc and cargo resolve in env. */
    domain::StageResult<domain::Done> preflight(const domain::BuildEnvironment& env,
                                                const StepContext& ctx) const override;

    /** @brief RUSTFLAGS and the cargo release profile for the tier. */
    void prepareEnvironment(domain::BuildEnvironment& env,
                            const EnvironmentComposer& composer,
                            domain::OptimizationTier tier) const override;

    domain::StageResult<domain::Done> build(const domain::SourceCheckout& checkout,
                                            const domain::BuildEnvironment& env,
                                            int jobs,
                                            const StepContext& ctx) const override;

    /** @brief <src>/target/release */
    std::filesystem::path artifactDir(const std::filesystem::path& sourceDir) const override;
};

} // namespace nodeforge::application::strategies
