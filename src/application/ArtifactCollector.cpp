/**
 * @file ArtifactCollector.cpp
 * @brief Implementation of ArtifactCollector.
 */

#include "application/ArtifactCollector.hpp"

#include "infrastructure/ArtifactDigest.hpp"

#include <fstream>
#include <system_error>

namespace nodeforge::application {

namespace fs = std::filesystem;

namespace {

constexpr fs::perms kExecutablePerms =
    fs::perms::owner_all |
    fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;

} // namespace

ArtifactCollector::ArtifactCollector(bool writeChecksums)
    : m_writeChecksums(writeChecksums) {}

domain::BuildResult ArtifactCollector::collect(const std::vector<fs::path>& candidates,
                                               const fs::path& destDir,
                                               BuildEventChannel* events,
                                               std::optional<domain::TargetKind> target) const {
    auto log = [&](const std::string& text) { if (events) events->log(text, target); };
    auto warn = [&](const std::string& text) { if (events) events->warn(text, target); };

    domain::BuildResult result;
    result.outputDir = destDir;

    std::error_code ec;
    fs::create_directories(destDir, ec);
    if (ec) {
        warn("Cannot create output directory " + destDir.string() + ": " + ec.message());
        for (const auto& candidate : candidates) {
            result.missingArtifacts.push_back(candidate.filename().string());
        }
        return result;
    }

    log("Copying binaries to: " + destDir.string());
    for (const auto& candidate : candidates) {
        std::string name = candidate.filename().string();
        if (!fs::exists(candidate, ec)) {
            warn("Binary not found (skipping): " + candidate.string());
            result.missingArtifacts.push_back(name);
            continue;
        }

        fs::path dest = destDir / name;
        fs::copy_file(candidate, dest, fs::copy_options::overwrite_existing, ec);
        if (!ec) {
            fs::permissions(dest, kExecutablePerms, fs::perm_options::replace, ec);
        }
        if (ec) {
            warn("Failed to copy " + name + ": " + ec.message());
            result.missingArtifacts.push_back(name);
            continue;
        }

        result.copiedArtifacts.push_back(dest);
        log("Copied: " + name + " -> " + dest.string());
    }

    if (result.empty()) {
        warn("No binaries were copied!");
        return result;
    }

    if (m_writeChecksums) {
        writeChecksums(result, events, target);
    }
    return result;
}

void ArtifactCollector::writeChecksums(domain::BuildResult& result,
                                       BuildEventChannel* events,
                                       std::optional<domain::TargetKind> target) const {
    std::string manifest;
    for (const auto& artifact : result.copiedArtifacts) {
        auto digest = infrastructure::ArtifactDigest::Sha256File(artifact);
        if (!digest) {
            if (events) events->warn("Could not hash " + artifact.string(), target);
            continue;
        }
        std::string name = artifact.filename().string();
        result.checksums.push_back({name, *digest});
        manifest += *digest + "  " + name + "\n";
    }

    fs::path manifestPath = result.outputDir / kChecksumFile;
    std::ofstream out(manifestPath, std::ios::trunc);
    out << manifest;
    if (!out) {
        if (events) events->warn("Failed to write " + manifestPath.string(), target);
    }
}

} // namespace nodeforge::application
