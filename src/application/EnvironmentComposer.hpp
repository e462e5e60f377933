/**
 * @file EnvironmentComposer.hpp
 * @brief Builds the isolated environment a build subprocess runs with.
 */

#pragma once

#include "domain/Architecture.hpp"
#include "domain/BuildEnvironment.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nodeforge::application {

/**
 * @struct HostSnapshot
 * @brief Read-only view of the host the composer works from.
 *
 * Captured once by the caller; the composer never reads the live process
 * environment, which keeps composition deterministic.
 */
struct HostSnapshot {
    std::vector<std::pair<std::string, std::string>> variables; ///< Inherited environment.
    std::filesystem::path homeDir;
    std::function<bool(const std::filesystem::path&)> exists;   ///< File or directory probe.
};

/**
 * @struct ToolchainLayout
 * @brief Where toolchains are expected to be installed.
 */
struct ToolchainLayout {
    std::vector<std::filesystem::path> roots{"/opt/homebrew", "/usr/local"};
    std::string packageManager = "brew";
};

/**
 * @class EnvironmentComposer
 * @brief Pure compose(architecture, tier) -> BuildEnvironment.
 */
class EnvironmentComposer {
public:
    using FlagList = std::vector<std::pair<std::string, std::string>>;

    explicit EnvironmentComposer(HostSnapshot host, ToolchainLayout layout = {});

    /**
     * @brief Full copy of the inherited environment with PATH, toolchain and
     * compiler flag variables overlaid.
     */
    domain::BuildEnvironment compose(domain::Architecture arch, domain::OptimizationTier tier) const;

    /**
     * @brief Toolchain roots, then toolchain directories, then the inherited
     * PATH. Only directories that exist; no duplicates.
     */
    std::vector<std::string> composeSearchPath() const;

    /** @brief Adds RUSTFLAGS and the cargo release profile variables for tier. */
    void applyRustFlags(domain::BuildEnvironment& env, domain::OptimizationTier tier) const;

    /** @brief Install prefix of the package manager ("/opt/homebrew"), if found. */
    std::optional<std::filesystem::path> packageManagerPrefix() const;
    std::optional<std::filesystem::path> packageManagerExecutable() const;

    /** @brief CFLAGS/CXXFLAGS/LDFLAGS for arch and tier. Empty values are omitted. */
    static FlagList compilerFlags(domain::Architecture arch, domain::OptimizationTier tier);

    static FlagList rustFlags(domain::OptimizationTier tier);

    const ToolchainLayout& layout() const { return m_layout; }

private:
    bool exists(const std::filesystem::path& p) const;
    std::optional<std::filesystem::path> llvmPrefix() const;
    std::string inheritedPath() const;

    HostSnapshot m_host;
    ToolchainLayout m_layout;
};

} // namespace nodeforge::application
