/**
 * @file VersionCatalog.hpp
 * @brief Reduces an upstream release listing to a short list of buildable versions.
 */

#pragma once

#include "domain/BuildTarget.hpp"
#include "domain/ReleaseSource.hpp"
#include "domain/ReleaseTag.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace nodeforge::application {

/**
 * @class VersionCatalog
 * @brief Fetches release tags and applies the per-target selection policy.
 *
 * Network and parse failures are fail-soft: the caller receives an empty list
 * and must treat it as "versions unavailable".
 */
class VersionCatalog {
public:
    explicit VersionCatalog(std::shared_ptr<domain::ReleaseSource> source);

    /**
     * @brief Grouped resolution.
     *
     * Drops tags containing rcMarker (case-insensitive), groups by
     * (major, minor) in first-seen order, keeps the highest patch of each
     * group (first seen on ties), orders groups newest first and keeps
     * maxGroups of them.
     * @param scanLimit Number of non-RC tags considered; 0 means all.
     */
    static std::vector<domain::ReleaseTag> resolve(const std::vector<std::string>& tags,
                                                   size_t maxGroups,
                                                   const std::string& rcMarker = "rc",
                                                   size_t scanLimit = 0);

    /** @brief First count non-RC tags in upstream order. */
    static std::vector<domain::ReleaseTag> latest(const std::vector<std::string>& tags,
                                                  size_t count,
                                                  const std::string& rcMarker = "rc");

    /** @brief Applies a target's CatalogPolicy to an already fetched listing. */
    static std::vector<domain::ReleaseTag> apply(const domain::CatalogPolicy& policy,
                                                 const std::vector<std::string>& tags);

    /**
     * @brief Fetches the listing of target and applies its policy.
     * @param policy Overrides the target's default policy when given.
     * @param statusCallback Receives one human readable status line.
     */
    std::vector<domain::ReleaseTag> refresh(const domain::TargetSpec& target,
                                            const domain::CatalogPolicy* policy = nullptr,
                                            std::function<void(std::string)> statusCallback = nullptr);

private:
    std::shared_ptr<domain::ReleaseSource> m_source;
};

} // namespace nodeforge::application
