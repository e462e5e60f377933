/**
 * @file BuildEnvironment.hpp
 * @brief Ordered variable mapping handed to a single subprocess invocation.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nodeforge::domain {

/**
 * @class BuildEnvironment
 * @brief Ordered mapping of variable name -> value.
 *
 * Insertion order is preserved; assigning an existing name replaces the value
 * in place. Instances are plain values: copying one never touches the
 * environment of the running process.
 */
class BuildEnvironment {
public:
    using Entry = std::pair<std::string, std::string>;

    static constexpr const char* kSearchPathVar = "PATH";
    static constexpr char kSearchPathSeparator = ':';

    void set(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;

    const std::vector<Entry>& entries() const { return m_entries; }
    size_t size() const { return m_entries.size(); }

    /** @brief PATH split into its directories (empty segments dropped). */
    std::vector<std::string> searchPath() const;
    void setSearchPath(const std::vector<std::string>& directories);

private:
    std::vector<Entry> m_entries;
};

/** @brief Splits a PATH-style string on ':' dropping empty segments. */
std::vector<std::string> SplitSearchPath(const std::string& value);

/** @brief Joins directories with ':'. */
std::string JoinSearchPath(const std::vector<std::string>& directories);

/** @brief Removes duplicates keeping the first occurrence of each entry. */
std::vector<std::string> DedupePreservingOrder(const std::vector<std::string>& items);

} // namespace nodeforge::domain
