#include "domain/BuildEnvironment.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace nodeforge::domain {

void BuildEnvironment::set(const std::string& name, const std::string& value) {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&name](const Entry& e) { return e.first == name; });
    if (it != m_entries.end()) {
        it->second = value;
    } else {
        m_entries.emplace_back(name, value);
    }
}

std::optional<std::string> BuildEnvironment::get(const std::string& name) const {
    for (const auto& entry : m_entries) {
        if (entry.first == name) return entry.second;
    }
    return std::nullopt;
}

std::vector<std::string> BuildEnvironment::searchPath() const {
    auto value = get(kSearchPathVar);
    if (!value) return {};
    return SplitSearchPath(*value);
}

void BuildEnvironment::setSearchPath(const std::vector<std::string>& directories) {
    set(kSearchPathVar, JoinSearchPath(DedupePreservingOrder(directories)));
}

std::vector<std::string> SplitSearchPath(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, BuildEnvironment::kSearchPathSeparator)) {
        if (!item.empty()) parts.push_back(item);
    }
    return parts;
}

std::string JoinSearchPath(const std::vector<std::string>& directories) {
    std::string joined;
    for (const auto& dir : directories) {
        if (dir.empty()) continue;
        if (!joined.empty()) joined += BuildEnvironment::kSearchPathSeparator;
        joined += dir;
    }
    return joined;
}

std::vector<std::string> DedupePreservingOrder(const std::vector<std::string>& items) {
    std::vector<std::string> unique;
    std::unordered_set<std::string> seen;
    for (const auto& item : items) {
        if (item.empty()) continue;
        if (seen.insert(item).second) {
            unique.push_back(item);
        }
    }
    return unique;
}

} // namespace nodeforge::domain
