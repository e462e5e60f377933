/**
 * @file GitHubReleaseClient.hpp
 * @brief Low-level HTTP client for the GitHub releases REST API.
 */

#pragma once

#include "domain/ReleaseSource.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nodeforge::infrastructure {

/**
 * @class GitHubReleaseClient
 * @brief GET <endpoint> and read tag_name from every element of the JSON array.
 */
class GitHubReleaseClient : public domain::ReleaseSource {
public:
    explicit GitHubReleaseClient(int timeoutSeconds = 10);

    std::optional<std::vector<std::string>> fetchTagNames(const std::string& endpoint) override;

    /** @brief "https://api.github.com/repos/x/y/releases" -> {"https://api.github.com", "/repos/x/y/releases"} */
    static std::optional<std::pair<std::string, std::string>> SplitUrl(const std::string& url);

    /** @brief tag_name of every object in a releases JSON array; nullopt if the body is not one. */
    static std::optional<std::vector<std::string>> ParseTagNames(const std::string& body);

private:
    int m_timeoutSeconds;
};

} // namespace nodeforge::infrastructure
