#include "application/StepContext.hpp"

namespace nodeforge::application {

using domain::BuildFailure;
using domain::CommandLine;
using domain::CommandOutcome;
using domain::FailureKind;

BuildFailure MakeCommandFailure(const CommandLine& command, const CommandOutcome& outcome) {
    BuildFailure failure;
    failure.kind = FailureKind::CommandFailure;
    failure.command = command.toString();
    failure.exitCode = outcome.exitCode;
    failure.logTail = outcome.tail;
    failure.message = outcome.started
        ? "Command failed: " + failure.command
        : "Command could not be started: " + failure.command;
    return failure;
}

domain::StageResult<CommandOutcome> StepContext::run(const CommandLine& command,
                                                     const std::filesystem::path& workingDir,
                                                     const domain::BuildEnvironment& env,
                                                     bool echoOutput) const {
    log("$ " + command.toString());

    domain::CommandRunner::LineSink sink;
    if (echoOutput && events) {
        auto* channel = events;
        auto kind = target;
        sink = [channel, kind](const std::string& line) { channel->log(line, kind); };
    }

    CommandOutcome outcome = runner.run(command, workingDir, env, sink);
    if (!outcome.succeeded()) {
        return MakeCommandFailure(command, outcome);
    }
    return outcome;
}

void StepContext::log(const std::string& text) const {
    if (events) events->log(text, target);
}

void StepContext::warn(const std::string& text) const {
    if (events) events->warn(text, target);
}

} // namespace nodeforge::application
