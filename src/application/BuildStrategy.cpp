/**
 * @file BuildStrategy.cpp
 * @brief Strategy base behaviour, factory and selection table.
 */

#include "application/BuildStrategy.hpp"

#include "application/strategies/AutotoolsStrategy.hpp"
#include "application/strategies/CMakeStrategy.hpp"
#include "application/strategies/CargoReleaseStrategy.hpp"

namespace nodeforge::application {

namespace fs = std::filesystem;

using domain::ReleaseTag;
using domain::TargetKind;

std::string VariantToString(StrategyVariant variant) {
    switch (variant) {
        case StrategyVariant::Autotools: return "Autotools";
        case StrategyVariant::CMake: return "CMake";
        case StrategyVariant::CargoRelease: return "Cargo";
    }
    return "Unknown";
}

domain::StageResult<domain::Done> BuildStrategy::preflight(const domain::BuildEnvironment&,
                                                           const StepContext&) const {
    return domain::Done{};
}

void BuildStrategy::prepareEnvironment(domain::BuildEnvironment&,
                                       const EnvironmentComposer&,
                                       domain::OptimizationTier) const {}

std::vector<std::string> BuildStrategy::expectedArtifacts(const std::vector<std::string>& names) const {
    return names;
}

std::vector<fs::path> BuildStrategy::candidatePaths(const fs::path& sourceDir,
                                                    const std::vector<std::string>& names) const {
    std::vector<fs::path> paths;
    fs::path dir = artifactDir(sourceDir);
    for (const auto& name : expectedArtifacts(names)) {
        paths.push_back(dir / name);
    }
    return paths;
}

std::unique_ptr<BuildStrategy> MakeStrategy(StrategyVariant variant) {
    switch (variant) {
        case StrategyVariant::Autotools: return std::make_unique<strategies::AutotoolsStrategy>();
        case StrategyVariant::CMake: return std::make_unique<strategies::CMakeStrategy>();
        case StrategyVariant::CargoRelease: return std::make_unique<strategies::CargoReleaseStrategy>();
    }
    return nullptr;
}

bool UsesCMake(const ReleaseTag& tag) {
    return tag.key().major >= 25;
}

StrategyTable StrategyTable::Default() {
    StrategyTable table;
    table.addRule({TargetKind::NodeDaemon, "node daemon >= 25.0", UsesCMake, StrategyVariant::CMake});
    table.addRule({TargetKind::NodeDaemon, "node daemon < 25.0",
                   [](const ReleaseTag& tag) { return !UsesCMake(tag); }, StrategyVariant::Autotools});
    table.addRule({TargetKind::Indexer, "indexer, any version",
                   [](const ReleaseTag&) { return true; }, StrategyVariant::CargoRelease});
    return table;
}

void StrategyTable::addRule(StrategyRule rule) {
    m_rules.push_back(std::move(rule));
}

std::optional<StrategyVariant> StrategyTable::select(TargetKind target, const ReleaseTag& tag) const {
    for (const auto& rule : m_rules) {
        if (rule.target == target && rule.matches && rule.matches(tag)) {
            return rule.variant;
        }
    }
    return std::nullopt;
}

std::unique_ptr<BuildStrategy> StrategyTable::create(TargetKind target, const ReleaseTag& tag) const {
    auto variant = select(target, tag);
    if (!variant) return nullptr;
    return MakeStrategy(*variant);
}

} // namespace nodeforge::application
