/**
 * @file EnvironmentComposer.cpp
 * @brief Implementation of EnvironmentComposer.
 */

#include "application/EnvironmentComposer.hpp"

namespace nodeforge::application {

namespace fs = std::filesystem;

using domain::Architecture;
using domain::BuildEnvironment;
using domain::OptimizationTier;

namespace {

std::string Join(const std::vector<std::string>& flags) {
    std::string joined;
    for (const auto& flag : flags) {
        if (!joined.empty()) joined += ' ';
        joined += flag;
    }
    return joined;
}

} // namespace

EnvironmentComposer::EnvironmentComposer(HostSnapshot host, ToolchainLayout layout)
    : m_host(std::move(host))
    , m_layout(std::move(layout)) {}

bool EnvironmentComposer::exists(const fs::path& p) const {
    return m_host.exists && m_host.exists(p);
}

std::optional<fs::path> EnvironmentComposer::packageManagerExecutable() const {
    for (const auto& root : m_layout.roots) {
        fs::path candidate = root / "bin" / m_layout.packageManager;
        if (exists(candidate)) return candidate;
    }
    return std::nullopt;
}

std::optional<fs::path> EnvironmentComposer::packageManagerPrefix() const {
    auto executable = packageManagerExecutable();
    if (!executable) return std::nullopt;
    return executable->parent_path().parent_path();
}

std::optional<fs::path> EnvironmentComposer::llvmPrefix() const {
    std::vector<fs::path> candidates;
    if (auto prefix = packageManagerPrefix()) {
        candidates.push_back(*prefix / "opt" / "llvm");
    }
    for (const auto& root : m_layout.roots) {
        candidates.push_back(root / "opt" / "llvm");
    }
    for (const auto& candidate : candidates) {
        if (exists(candidate)) return candidate;
    }
    return std::nullopt;
}

std::string EnvironmentComposer::inheritedPath() const {
    for (const auto& [name, value] : m_host.variables) {
        if (name == BuildEnvironment::kSearchPathVar) return value;
    }
    return {};
}

std::vector<std::string> EnvironmentComposer::composeSearchPath() const {
    std::vector<std::string> components;
    auto prefix = packageManagerPrefix();

    if (prefix) {
        components.push_back((*prefix / "bin").string());
    }
    for (const auto& root : m_layout.roots) {
        fs::path bin = root / "bin";
        if (exists(bin)) components.push_back(bin.string());
    }

    // Toolchain-specific directories, only when installed.
    std::vector<fs::path> toolchainDirs;
    if (!m_host.homeDir.empty()) {
        toolchainDirs.push_back(m_host.homeDir / ".cargo" / "bin");
    }
    if (auto llvm = llvmPrefix()) {
        toolchainDirs.push_back(*llvm / "bin");
    }
    for (const auto& dir : toolchainDirs) {
        if (exists(dir)) components.push_back(dir.string());
    }

    for (const auto& dir : domain::SplitSearchPath(inheritedPath())) {
        components.push_back(dir);
    }
    return domain::DedupePreservingOrder(components);
}

BuildEnvironment EnvironmentComposer::compose(Architecture arch, OptimizationTier tier) const {
    BuildEnvironment env;
    for (const auto& [name, value] : m_host.variables) {
        env.set(name, value);
    }

    env.setSearchPath(composeSearchPath());

    if (auto llvm = llvmPrefix()) {
        std::string lib = (*llvm / "lib").string();
        env.set("LIBCLANG_PATH", lib);
        env.set("DYLD_LIBRARY_PATH", lib);
    }

    for (const auto& [name, value] : compilerFlags(arch, tier)) {
        env.set(name, value);
    }
    return env;
}

void EnvironmentComposer::applyRustFlags(BuildEnvironment& env, OptimizationTier tier) const {
    for (const auto& [name, value] : rustFlags(tier)) {
        env.set(name, value);
    }
}

EnvironmentComposer::FlagList EnvironmentComposer::compilerFlags(Architecture arch, OptimizationTier tier) {
    std::vector<std::string> base;
    std::vector<std::string> aggressive;

    switch (arch) {
        case Architecture::AppleSilicon:
            base = {"-mcpu=apple-m1", "-O2", "-fomit-frame-pointer", "-fno-common"};
            aggressive = {"-O3", "-flto", "-march=armv8.5-a+fp16+crypto+dotprod"};
            break;
        case Architecture::Intel:
            base = {"-march=native", "-O2", "-fomit-frame-pointer", "-fno-common"};
            aggressive = {"-O3", "-flto", "-mtune=native"};
            break;
        case Architecture::Unknown:
            // No safe ISA assumptions: same flags at every tier.
            return {{"CFLAGS", "-O2"}, {"CXXFLAGS", "-O2"}};
    }

    std::vector<std::string> flags = base;
    std::string ldflags;
    if (tier == OptimizationTier::Aggressive) {
        flags.insert(flags.end(), aggressive.begin(), aggressive.end());
        ldflags = "-flto";
    }

    FlagList result = {{"CFLAGS", Join(flags)}, {"CXXFLAGS", Join(flags)}};
    if (!ldflags.empty()) {
        result.emplace_back("LDFLAGS", ldflags);
    }
    return result;
}

EnvironmentComposer::FlagList EnvironmentComposer::rustFlags(OptimizationTier tier) {
    if (tier == OptimizationTier::Aggressive) {
        // Fat LTO needs embedded bitcode or cargo emits an unusable artifact.
        return {
            {"RUSTFLAGS", "-C opt-level=3 -C target-cpu=native"},
            {"CARGO_PROFILE_RELEASE_LTO", "fat"},
            {"CARGO_PROFILE_RELEASE_OPT_LEVEL", "3"},
            {"CARGO_PROFILE_RELEASE_EMBED_BITCODE", "yes"},
        };
    }
    return {
        {"RUSTFLAGS", "-C opt-level=2 -C target-cpu=native"},
        {"CARGO_PROFILE_RELEASE_OPT_LEVEL", "2"},
    };
}

} // namespace nodeforge::application
