/**
 * @file BuildResult.hpp
 * @brief Entities produced along the pipeline: the checkout and the collected binaries.
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace nodeforge::domain {

/**
 * @struct SourceCheckout
 * @brief A tag-pinned working tree on disk.
 */
struct SourceCheckout {
    std::filesystem::path path;
    std::string requestedTag;
    std::string resolvedCommit; ///< Empty until the checkout succeeded.
};

/**
 * @struct ArtifactChecksum
 * @brief SHA-256 of one collected binary.
 */
struct ArtifactChecksum {
    std::string name;
    std::string sha256;
};

/**
 * @struct BuildResult
 * @brief What the collector harvested. Missing files are data, not faults.
 */
struct BuildResult {
    std::filesystem::path outputDir;
    std::vector<std::filesystem::path> copiedArtifacts;
    std::vector<std::string> missingArtifacts;
    std::vector<ArtifactChecksum> checksums;

    /** @brief True when the build apparently produced nothing usable. */
    bool empty() const { return copiedArtifacts.empty(); }
};

} // namespace nodeforge::domain
