/**
 * @file ArtifactCollector.hpp
 * @brief Harvests compiled binaries into the output directory.
 */

#pragma once

#include "application/BuildEventChannel.hpp"
#include "domain/BuildResult.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace nodeforge::application {

/**
 * @class ArtifactCollector
 * @brief Copies every candidate that exists, records every one that does not.
 *
 * Never fails because of a single missing binary. BuildOrchestrator turns
 * an empty BuildResult into an ArtifactMissing failure.
 */
class ArtifactCollector {
public:
    static constexpr const char* kChecksumFile = "SHA256SUMS";

    explicit ArtifactCollector(bool writeChecksums = true);

    domain::BuildResult collect(const std::vector<std::filesystem::path>& candidates,
                                const std::filesystem::path& destDir,
                                BuildEventChannel* events = nullptr,
                                std::optional<domain::TargetKind> target = std::nullopt) const;

private:
    void writeChecksums(domain::BuildResult& result,
                        BuildEventChannel* events,
                        std::optional<domain::TargetKind> target) const;

    bool m_writeChecksums;
};

} // namespace nodeforge::application
