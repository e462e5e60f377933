/**
 * @file ShellCommandRunner.hpp
 * @brief CommandRunner backed by popen(3) and a POSIX shell.
 */

#pragma once

#include "domain/CommandRunner.hpp"

#include <cstddef>
#include <string>

namespace nodeforge::infrastructure {

/**
 * @class ShellCommandRunner
 * @brief Runs a command with `env -i` so the overlay reaches the child only.
 *
 * stderr is merged into stdout and read line by line while the child runs.
 * Only the last tailLines lines are retained in the outcome.
 */
class ShellCommandRunner : public domain::CommandRunner {
public:
    explicit ShellCommandRunner(size_t tailLines = 40);
    ~ShellCommandRunner() override = default;

    domain::CommandOutcome run(const domain::CommandLine& command,
                               const std::filesystem::path& workingDir,
                               const domain::BuildEnvironment& env,
                               LineSink onLine) override;

    /** @brief The exact /bin/sh line run() hands to popen. */
    static std::string BuildShellLine(const domain::CommandLine& command,
                                      const std::filesystem::path& workingDir,
                                      const domain::BuildEnvironment& env);

private:
    size_t m_tailLines;
};

} // namespace nodeforge::infrastructure
