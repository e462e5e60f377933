/**
 * @file BuildTarget.hpp
 * @brief Static description of the two upstream projects NodeForge builds.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace nodeforge::domain {

/**
 * @enum TargetKind
 * @brief One buildable upstream project.
 */
enum class TargetKind {
    NodeDaemon, ///< Bitcoin Core (bitcoind and friends).
    Indexer     ///< Electrs.
};

/**
 * @enum TargetSelection
 * @brief What a single request asks to build.
 */
enum class TargetSelection {
    NodeDaemon,
    Indexer,
    Both
};

/**
 * @struct CatalogPolicy
 * @brief How the release listing of a target is reduced to a version list.
 */
struct CatalogPolicy {
    bool groupByMinor = true; ///< false: first N non-RC tags in upstream order.
    size_t maxEntries = 5;    ///< Groups (grouped) or tags (ungrouped) kept.
    size_t scanLimit = 0;     ///< Non-RC tags considered before grouping; 0 = all.
    std::string rcMarker = "rc";
};

/**
 * @struct TargetSpec
 * @brief Fixed facts about a target: where it lives and what it produces.
 */
struct TargetSpec {
    TargetKind kind;
    std::string displayName;      ///< "Bitcoin Core"
    std::string directoryPrefix;  ///< "bitcoin" -> <buildDir>/bitcoin-25.0
    std::string repositoryUrl;
    std::string releasesEndpoint; ///< JSON release listing.
    std::vector<std::string> artifactNames;
    CatalogPolicy catalog;
};

const TargetSpec& SpecFor(TargetKind kind);

/** @brief Targets of a selection in build order (node daemon first). */
std::vector<TargetKind> ExpandSelection(TargetSelection selection);

std::string TargetKindToString(TargetKind kind);
std::string SelectionToString(TargetSelection selection);

/** @brief Accepts "node", "bitcoin", "indexer", "electrs", "both" (any case). */
std::optional<TargetSelection> ParseSelection(const std::string& text);

} // namespace nodeforge::domain
