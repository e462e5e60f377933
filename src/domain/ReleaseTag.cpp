#include "domain/ReleaseTag.hpp"

#include <algorithm>
#include <cctype>

namespace nodeforge::domain {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

// Reads a run of digits starting at pos. Returns false if there is none.
bool ReadNumber(const std::string& s, size_t& pos, int& out) {
    size_t start = pos;
    long long value = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
        if (value < 100000000) {
            value = value * 10 + (s[pos] - '0');
        }
        ++pos;
    }
    if (pos == start) return false;
    out = static_cast<int>(value);
    return true;
}

} // namespace

VersionKey ParseVersionKey(const std::string& tag) {
    VersionKey key;
    size_t pos = tag.find_first_not_of("vV");
    if (pos == std::string::npos) return key;

    int* parts[] = {&key.major, &key.minor, &key.patch};
    for (int i = 0; i < 3; ++i) {
        if (!ReadNumber(tag, pos, *parts[i])) break;
        if (pos >= tag.size() || tag[pos] != '.') break;
        ++pos;
    }
    return key;
}

ReleaseTag::ReleaseTag(std::string name)
    : m_name(std::move(name))
    , m_key(ParseVersionKey(m_name)) {}

std::string ReleaseTag::cleanVersion() const {
    size_t pos = m_name.find_first_not_of('v');
    return pos == std::string::npos ? std::string() : m_name.substr(pos);
}

bool ReleaseTag::containsMarker(const std::string& marker) const {
    if (marker.empty()) return false;
    return ToLower(m_name).find(ToLower(marker)) != std::string::npos;
}

} // namespace nodeforge::domain
