/**
 * @file CommandRunner.hpp
 * @brief Interface for running an external tool (git, cmake, make, cargo, brew).
 */

#pragma once

#include "domain/BuildEnvironment.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace nodeforge::domain {

/**
 * @struct CommandLine
 * @brief Program plus arguments. Never interpreted by a shell as a whole.
 */
struct CommandLine {
    std::string program;
    std::vector<std::string> args;

    /** @brief Human readable form, quoted where needed ("$ git clone ..."). */
    std::string toString() const;
};

/** @brief Single-quotes a word for a POSIX shell when it contains anything unusual. */
std::string ShellQuote(const std::string& word);

/**
 * @struct CommandOutcome
 * @brief Exit status and the last lines of merged stdout/stderr.
 */
struct CommandOutcome {
    int exitCode = -1;
    bool started = false;
    std::vector<std::string> tail; ///< Bounded; the full stream goes to the line sink.

    bool succeeded() const { return started && exitCode == 0; }
    /** @brief First non-empty captured line, trimmed. Used for single-line queries. */
    std::string firstLine() const;
};

/**
 * @class CommandRunner
 * @brief Abstract synchronous command execution.
 *
 * The environment overlay applies to the child only. Output lines are handed
 * to onLine as they arrive, in order, stdout and stderr merged.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    using LineSink = std::function<void(const std::string& line)>;

    virtual CommandOutcome run(const CommandLine& command,
                               const std::filesystem::path& workingDir,
                               const BuildEnvironment& env,
                               LineSink onLine) = 0;
};

} // namespace nodeforge::domain
