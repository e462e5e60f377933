/**
 * @file CMakeStrategy.hpp
 * @brief Out-of-tree CMake configure + build, used by node daemon releases from 25.0 on.
 */

#pragma once

#include "application/BuildStrategy.hpp"

namespace nodeforge::application::strategies {

class CMakeStrategy : public BuildStrategy {
public:
    static constexpr const char* kBuildSubdir = "build";

    StrategyVariant variant() const override { return StrategyVariant::CMake; }

    domain::StageResult<domain::Done> build(const domain::SourceCheckout& checkout,
                                            const domain::BuildEnvironment& env,
                                            int jobs,
                                            const StepContext& ctx) const override;

    /** @brief <src>/build/bin */
    std::filesystem::path artifactDir(const std::filesystem::path& sourceDir) const override;
};

} // namespace nodeforge::application::strategies
