/**
 * @file ReleaseSource.hpp
 * @brief Interface for reading an upstream release listing.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace nodeforge::domain {

/**
 * @class ReleaseSource
 * @brief Provides the tag names of a release listing, newest first as published upstream.
 */
class ReleaseSource {
public:
    virtual ~ReleaseSource() = default;

    /**
     * @brief Fetches the tag names published at endpoint.
     * @return Tag names in upstream order, or nullopt on network/parse failure.
     */
    virtual std::optional<std::vector<std::string>> fetchTagNames(const std::string& endpoint) = 0;
};

} // namespace nodeforge::domain
