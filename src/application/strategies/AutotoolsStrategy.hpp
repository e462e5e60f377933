/**
 * @file AutotoolsStrategy.hpp
 * @brief autogen.sh + configure + make, used by node daemon releases before 25.0.
 */

#pragma once

#include "application/BuildStrategy.hpp"

namespace nodeforge::application::strategies {

class AutotoolsStrategy : public BuildStrategy {
public:
    StrategyVariant variant() const override { return StrategyVariant::Autotools; }

    domain::StageResult<domain::Done> build(const domain::SourceCheckout& checkout,
                                            const domain::BuildEnvironment& env,
                                            int jobs,
                                            const StepContext& ctx) const override;

    /** @brief Everything but bitcoin-util, which only the CMake build installs in bin/. */
    std::vector<std::string> expectedArtifacts(const std::vector<std::string>& names) const override;

    /** @brief <src>/bin */
    std::filesystem::path artifactDir(const std::filesystem::path& sourceDir) const override;
};

} // namespace nodeforge::application::strategies
