/**
 * @file BuildStrategy.hpp
 * @brief Build-system variants and the table that selects one per target and version.
 */

#pragma once

#include "application/EnvironmentComposer.hpp"
#include "application/StepContext.hpp"
#include "domain/BuildResult.hpp"
#include "domain/BuildTarget.hpp"
#include "domain/ReleaseTag.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nodeforge::application {

/**
 * @enum StrategyVariant
 * @brief The build pipelines NodeForge knows how to drive.
 */
enum class StrategyVariant {
    Autotools,
    CMake,
    CargoRelease
};

std::string VariantToString(StrategyVariant variant);

/**
 * @class BuildStrategy
 * @brief Configures and compiles a checkout, then says where binaries end up.
 */
class BuildStrategy {
public:
    virtual ~BuildStrategy() = default;

    virtual StrategyVariant variant() const = 0;

    /**
     * @brief Checks run right after the environment is composed, before any
     * source work. A failure here must be cheap and final.
     */
    virtual domain::StageResult<domain::Done> preflight(const domain::BuildEnvironment& env,
                                                        const StepContext& ctx) const;

    /** @brief Adds variant-specific variables to a freshly composed environment. */
    virtual void prepareEnvironment(domain::BuildEnvironment& env,
                                    const EnvironmentComposer& composer,
                                    domain::OptimizationTier tier) const;

    /** @brief Runs configure + compile. Output is streamed through ctx. */
    virtual domain::StageResult<domain::Done> build(const domain::SourceCheckout& checkout,
                                                    const domain::BuildEnvironment& env,
                                                    int jobs,
                                                    const StepContext& ctx) const = 0;

    /** @brief Directory the compiled binaries are written to. */
    virtual std::filesystem::path artifactDir(const std::filesystem::path& sourceDir) const = 0;

    /** @brief Subset of the target's binaries this build system installs. */
    virtual std::vector<std::string> expectedArtifacts(const std::vector<std::string>& names) const;

    /** @brief artifactDir joined with every expected binary name. */
    std::vector<std::filesystem::path> candidatePaths(const std::filesystem::path& sourceDir,
                                                      const std::vector<std::string>& names) const;
};

/** @brief Instantiates the strategy for a variant. */
std::unique_ptr<BuildStrategy> MakeStrategy(StrategyVariant variant);

/** @brief Node daemon releases from 25.0 on ship a CMake build. */
bool UsesCMake(const domain::ReleaseTag& tag);

/**
 * @struct StrategyRule
 * @brief (target, version predicate) -> variant.
 */
struct StrategyRule {
    domain::TargetKind target;
    std::string description;
    std::function<bool(const domain::ReleaseTag&)> matches;
    StrategyVariant variant;
};

/**
 * @class StrategyTable
 * @brief Ordered rules; the first matching rule wins.
 */
class StrategyTable {
public:
    /** @brief node: major >= 25 -> CMake, else Autotools. indexer: CargoRelease. */
    static StrategyTable Default();

    void addRule(StrategyRule rule);

    std::optional<StrategyVariant> select(domain::TargetKind target, const domain::ReleaseTag& tag) const;
    std::unique_ptr<BuildStrategy> create(domain::TargetKind target, const domain::ReleaseTag& tag) const;

    const std::vector<StrategyRule>& rules() const { return m_rules; }

private:
    std::vector<StrategyRule> m_rules;
};

} // namespace nodeforge::application
