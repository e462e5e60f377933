#include "infrastructure/GitHubReleaseClient.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <iostream>

namespace nodeforge::infrastructure {

using json = nlohmann::json;

GitHubReleaseClient::GitHubReleaseClient(int timeoutSeconds)
    : m_timeoutSeconds(timeoutSeconds) {}

std::optional<std::pair<std::string, std::string>> GitHubReleaseClient::SplitUrl(const std::string& url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) return std::nullopt;
    auto pathStart = url.find('/', schemeEnd + 3);
    if (pathStart == std::string::npos) {
        return std::make_pair(url, std::string("/"));
    }
    return std::make_pair(url.substr(0, pathStart), url.substr(pathStart));
}

std::optional<std::vector<std::string>> GitHubReleaseClient::ParseTagNames(const std::string& body) {
    try {
        auto releases = json::parse(body);
        if (!releases.is_array()) {
            return std::nullopt;
        }
        std::vector<std::string> tags;
        for (const auto& item : releases) {
            if (item.is_object() && item.contains("tag_name") && item["tag_name"].is_string()) {
                tags.push_back(item["tag_name"].get<std::string>());
            }
        }
        return tags;
    } catch (const std::exception& e) {
        std::cerr << "[GitHubReleaseClient] JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> GitHubReleaseClient::fetchTagNames(const std::string& endpoint) {
    auto parts = SplitUrl(endpoint);
    if (!parts) {
        std::cerr << "[GitHubReleaseClient] Invalid endpoint: " << endpoint << std::endl;
        return std::nullopt;
    }

    httplib::Client cli(parts->first);
    cli.set_connection_timeout(m_timeoutSeconds);
    cli.set_read_timeout(m_timeoutSeconds);
    cli.set_follow_location(true);

    httplib::Headers headers = {
        {"Accept", "application/vnd.github+json"},
        {"User-Agent", "NodeForge"}
    };

    auto res = cli.Get(parts->second, headers);
    if (!res) {
        std::cerr << "[GitHubReleaseClient] Connection failed: " << httplib::to_string(res.error()) << std::endl;
        return std::nullopt;
    }
    if (res->status != 200) {
        std::cerr << "[GitHubReleaseClient] HTTP Error " << res->status << " for " << endpoint << std::endl;
        return std::nullopt;
    }
    return ParseTagNames(res->body);
}

} // namespace nodeforge::infrastructure
