/**
 * @file StepContext.hpp
 * @brief Runs one pipeline command and turns its exit status into a StageResult.
 */

#pragma once

#include "application/BuildEventChannel.hpp"
#include "domain/BuildFailure.hpp"
#include "domain/BuildTarget.hpp"
#include "domain/CommandRunner.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace nodeforge::application {

/**
 * @struct StepContext
 * @brief What a stage needs to execute commands on behalf of one target.
 *
 * Subprocess output is forwarded to the event channel line by line as it
 * arrives; only the runner's bounded tail is kept for failure reports.
 */
struct StepContext {
    domain::CommandRunner& runner;
    BuildEventChannel* events = nullptr;
    std::optional<domain::TargetKind> target;

    /**
     * @brief Logs "$ <command>", runs it and maps a non-zero exit to CommandFailure.
     * @param echoOutput When false output lines are not forwarded (single-line queries).
     */
    domain::StageResult<domain::CommandOutcome> run(const domain::CommandLine& command,
                                                    const std::filesystem::path& workingDir,
                                                    const domain::BuildEnvironment& env,
                                                    bool echoOutput = true) const;

    void log(const std::string& text) const;
    void warn(const std::string& text) const;
};

/** @brief CommandFailure carrying the command line, exit code and captured tail. */
domain::BuildFailure MakeCommandFailure(const domain::CommandLine& command, const domain::CommandOutcome& outcome);

} // namespace nodeforge::application
