/**
 * @file ReleaseTag.hpp
 * @brief Value object for an upstream release identifier and its ordering key.
 */

#pragma once

#include <string>
#include <tuple>

namespace nodeforge::domain {

/**
 * @struct VersionKey
 * @brief Ordered (major, minor, patch) decomposition of a tag.
 */
struct VersionKey {
    int major = 0;
    int minor = 0;
    int patch = 0;

    bool operator<(const VersionKey& other) const {
        return std::tie(major, minor, patch) < std::tie(other.major, other.minor, other.patch);
    }
    bool operator==(const VersionKey& other) const {
        return major == other.major && minor == other.minor && patch == other.patch;
    }
    bool operator!=(const VersionKey& other) const { return !(*this == other); }

    /** @brief True when both keys fall in the same (major, minor) group. */
    bool sameGroup(const VersionKey& other) const {
        return major == other.major && minor == other.minor;
    }
};

/**
 * @brief Tolerant parse: leading 'v' characters are skipped, up to three
 * dot-separated numbers are read, missing components default to 0.
 * "v29.1" -> (29, 1, 0), "0.10.5" -> (0, 10, 5), "garbage" -> (0, 0, 0).
 */
VersionKey ParseVersionKey(const std::string& tag);

/**
 * @class ReleaseTag
 * @brief Opaque upstream tag string (e.g. "v25.0") plus its parsed key.
 */
class ReleaseTag {
public:
    ReleaseTag() = default;
    explicit ReleaseTag(std::string name);

    const std::string& name() const { return m_name; }
    const VersionKey& key() const { return m_key; }
    bool empty() const { return m_name.empty(); }

    /** @brief Tag without its leading 'v' characters; names on-disk directories. */
    std::string cleanVersion() const;

    /** @brief Case-insensitive substring test for a pre-release marker such as "rc". */
    bool containsMarker(const std::string& marker) const;

    bool operator==(const ReleaseTag& other) const { return m_name == other.m_name; }
    bool operator!=(const ReleaseTag& other) const { return m_name != other.m_name; }

private:
    std::string m_name;
    VersionKey m_key;
};

} // namespace nodeforge::domain
