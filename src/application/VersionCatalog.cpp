/**
 * @file VersionCatalog.cpp
 * @brief Implementation of VersionCatalog.
 */

#include "application/VersionCatalog.hpp"

#include <algorithm>

namespace nodeforge::application {

using domain::ReleaseTag;

VersionCatalog::VersionCatalog(std::shared_ptr<domain::ReleaseSource> source)
    : m_source(std::move(source)) {}

std::vector<ReleaseTag> VersionCatalog::resolve(const std::vector<std::string>& tags,
                                                size_t maxGroups,
                                                const std::string& rcMarker,
                                                size_t scanLimit) {
    // Each group keeps its best tag; groups stay in first-seen order until sorted.
    std::vector<ReleaseTag> groups;
    size_t scanned = 0;

    for (const auto& name : tags) {
        ReleaseTag tag(name);
        if (tag.empty() || tag.containsMarker(rcMarker)) continue;
        if (scanLimit > 0 && scanned == scanLimit) break;
        ++scanned;

        auto it = std::find_if(groups.begin(), groups.end(), [&tag](const ReleaseTag& best) {
            return best.key().sameGroup(tag.key());
        });
        if (it == groups.end()) {
            groups.push_back(tag);
        } else if (it->key() < tag.key()) {
            *it = tag;
        }
    }

    std::stable_sort(groups.begin(), groups.end(), [](const ReleaseTag& a, const ReleaseTag& b) {
        if (a.key().major != b.key().major) return a.key().major > b.key().major;
        return a.key().minor > b.key().minor;
    });

    if (groups.size() > maxGroups) {
        groups.resize(maxGroups);
    }
    return groups;
}

std::vector<ReleaseTag> VersionCatalog::latest(const std::vector<std::string>& tags,
                                               size_t count,
                                               const std::string& rcMarker) {
    std::vector<ReleaseTag> result;
    for (const auto& name : tags) {
        if (result.size() >= count) break;
        ReleaseTag tag(name);
        if (tag.empty() || tag.containsMarker(rcMarker)) continue;
        result.push_back(tag);
    }
    return result;
}

std::vector<ReleaseTag> VersionCatalog::apply(const domain::CatalogPolicy& policy,
                                              const std::vector<std::string>& tags) {
    if (policy.groupByMinor) {
        return resolve(tags, policy.maxEntries, policy.rcMarker, policy.scanLimit);
    }
    return latest(tags, policy.maxEntries, policy.rcMarker);
}

std::vector<ReleaseTag> VersionCatalog::refresh(const domain::TargetSpec& target,
                                                const domain::CatalogPolicy* policy,
                                                std::function<void(std::string)> statusCallback) {
    if (!m_source) return {};

    auto listing = m_source->fetchTagNames(target.releasesEndpoint);
    if (!listing) {
        if (statusCallback) statusCallback("Failed to fetch " + target.displayName + " versions");
        return {};
    }

    auto versions = apply(policy ? *policy : target.catalog, *listing);
    if (statusCallback) {
        statusCallback("Found " + std::to_string(versions.size()) + " " + target.displayName + " versions");
    }
    return versions;
}

} // namespace nodeforge::application
