#include "domain/BuildTarget.hpp"

#include <algorithm>
#include <cctype>

namespace nodeforge::domain {

namespace {

TargetSpec MakeNodeDaemonSpec() {
    TargetSpec spec;
    spec.kind = TargetKind::NodeDaemon;
    spec.displayName = "Bitcoin Core";
    spec.directoryPrefix = "bitcoin";
    spec.repositoryUrl = "https://github.com/bitcoin/bitcoin.git";
    spec.releasesEndpoint = "https://api.github.com/repos/bitcoin/bitcoin/releases";
    spec.artifactNames = {"bitcoind", "bitcoin-cli", "bitcoin-tx", "bitcoin-wallet", "bitcoin-util"};
    spec.catalog.groupByMinor = true;
    spec.catalog.maxEntries = 5;
    spec.catalog.scanLimit = 20;
    return spec;
}

TargetSpec MakeIndexerSpec() {
    TargetSpec spec;
    spec.kind = TargetKind::Indexer;
    spec.displayName = "Electrs";
    spec.directoryPrefix = "electrs";
    spec.repositoryUrl = "https://github.com/romanz/electrs.git";
    spec.releasesEndpoint = "https://api.github.com/repos/romanz/electrs/releases";
    spec.artifactNames = {"electrs"};
    spec.catalog.groupByMinor = false;
    spec.catalog.maxEntries = 3;
    return spec;
}

} // namespace

const TargetSpec& SpecFor(TargetKind kind) {
    static const TargetSpec nodeDaemon = MakeNodeDaemonSpec();
    static const TargetSpec indexer = MakeIndexerSpec();
    return kind == TargetKind::NodeDaemon ? nodeDaemon : indexer;
}

std::vector<TargetKind> ExpandSelection(TargetSelection selection) {
    switch (selection) {
        case TargetSelection::NodeDaemon: return {TargetKind::NodeDaemon};
        case TargetSelection::Indexer: return {TargetKind::Indexer};
        case TargetSelection::Both: return {TargetKind::NodeDaemon, TargetKind::Indexer};
    }
    return {};
}

std::string TargetKindToString(TargetKind kind) {
    return kind == TargetKind::NodeDaemon ? "node" : "indexer";
}

std::string SelectionToString(TargetSelection selection) {
    switch (selection) {
        case TargetSelection::NodeDaemon: return "node";
        case TargetSelection::Indexer: return "indexer";
        case TargetSelection::Both: return "both";
    }
    return "node";
}

std::optional<TargetSelection> ParseSelection(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower == "node" || lower == "bitcoin" || lower == "nodedaemon") return TargetSelection::NodeDaemon;
    if (lower == "indexer" || lower == "electrs") return TargetSelection::Indexer;
    if (lower == "both") return TargetSelection::Both;
    return std::nullopt;
}

} // namespace nodeforge::domain
