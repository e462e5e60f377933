/**
 * @file TestDoubles.hpp
 * @brief Scripted CommandRunner and ReleaseSource used by the test executables.
 */

#pragma once

#include "domain/CommandRunner.hpp"
#include "domain/ReleaseSource.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nodeforge::test {

/**
 * @class FakeCommandRunner
 * @brief Records every command; answers from rules matched by substring.
 *
 * The last rule added whose pattern occurs in the rendered command line wins.
 * Unmatched commands succeed with no output.
 */
class FakeCommandRunner : public domain::CommandRunner {
public:
    struct Response {
        int exitCode = 0;
        std::vector<std::string> output;
        std::function<void(const std::filesystem::path& workingDir)> effect;
    };

    struct Call {
        std::string line;
        std::filesystem::path workingDir;
        domain::BuildEnvironment env;
    };

    void on(const std::string& pattern, Response response) {
        m_rules.emplace_back(pattern, std::move(response));
    }

    domain::CommandOutcome run(const domain::CommandLine& command,
                               const std::filesystem::path& workingDir,
                               const domain::BuildEnvironment& env,
                               LineSink onLine) override {
        std::string line = command.toString();
        calls.push_back({line, workingDir, env});

        Response response;
        for (auto it = m_rules.rbegin(); it != m_rules.rend(); ++it) {
            if (line.find(it->first) != std::string::npos) {
                response = it->second;
                break;
            }
        }
        if (response.effect) response.effect(workingDir);

        domain::CommandOutcome outcome;
        outcome.started = true;
        outcome.exitCode = response.exitCode;
        outcome.tail = response.output;
        if (onLine) {
            for (const auto& out : response.output) onLine(out);
        }
        return outcome;
    }

    /** @brief Index of the first call containing pattern, or -1. */
    int indexOf(const std::string& pattern) const {
        for (size_t i = 0; i < calls.size(); ++i) {
            if (calls[i].line.find(pattern) != std::string::npos) return static_cast<int>(i);
        }
        return -1;
    }

    bool ran(const std::string& pattern) const { return indexOf(pattern) >= 0; }

    std::vector<Call> calls;

private:
    std::vector<std::pair<std::string, Response>> m_rules;
};

/**
 * @class FakeReleaseSource
 * @brief Returns canned listings per endpoint; unknown endpoints fail.
 */
class FakeReleaseSource : public domain::ReleaseSource {
public:
    void set(const std::string& endpoint, std::vector<std::string> tags) {
        m_listings[endpoint] = std::move(tags);
    }

    std::optional<std::vector<std::string>> fetchTagNames(const std::string& endpoint) override {
        ++fetches;
        auto it = m_listings.find(endpoint);
        if (it == m_listings.end()) return std::nullopt;
        return it->second;
    }

    int fetches = 0;

private:
    std::map<std::string, std::vector<std::string>> m_listings;
};

/** @brief Fresh directory under the system temp dir, removed on destruction. */
class ScratchDir {
public:
    explicit ScratchDir(const std::string& name) {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() / (name + "-" + std::to_string(stamp));
        std::filesystem::create_directories(m_path);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

inline void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream(path) << content;
}

} // namespace nodeforge::test
