/**
 * @file ShellCommandRunner.cpp
 * @brief Implementation of ShellCommandRunner.
 */

#include "infrastructure/ShellCommandRunner.hpp"

#include <sys/wait.h>

#include <cstdio>
#include <deque>
#include <iostream>

namespace nodeforge::infrastructure {

using domain::CommandOutcome;
using domain::ShellQuote;

ShellCommandRunner::ShellCommandRunner(size_t tailLines)
    : m_tailLines(tailLines == 0 ? 1 : tailLines) {}

std::string ShellCommandRunner::BuildShellLine(const domain::CommandLine& command,
                                               const std::filesystem::path& workingDir,
                                               const domain::BuildEnvironment& env) {
    // The group redirect also captures a failing cd.
    std::string line = "{ ";
    if (!workingDir.empty()) {
        line += "cd " + ShellQuote(workingDir.string()) + " && ";
    }
    line += "exec env -i";
    for (const auto& [name, value] : env.entries()) {
        line += " " + ShellQuote(name + "=" + value);
    }
    line += " " + command.toString() + "; } 2>&1";
    return line;
}

CommandOutcome ShellCommandRunner::run(const domain::CommandLine& command,
                                       const std::filesystem::path& workingDir,
                                       const domain::BuildEnvironment& env,
                                       LineSink onLine) {
    CommandOutcome outcome;
    std::string shellLine = BuildShellLine(command, workingDir, env);

    FILE* pipe = popen(shellLine.c_str(), "r");
    if (!pipe) {
        std::cerr << "[ShellCommandRunner] popen failed to start: " << command.toString() << std::endl;
        return outcome;
    }
    outcome.started = true;

    std::deque<std::string> tail;
    auto emit = [&](std::string line) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (onLine) onLine(line);
        tail.push_back(std::move(line));
        if (tail.size() > m_tailLines) tail.pop_front();
    };

    // fgets may split long lines; stitch chunks until the newline arrives.
    char buffer[512];
    std::string pending;
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        pending += buffer;
        if (!pending.empty() && pending.back() == '\n') {
            pending.pop_back();
            emit(std::move(pending));
            pending.clear();
        }
    }
    if (!pending.empty()) {
        emit(std::move(pending));
    }

    int status = pclose(pipe);
    if (status == -1) {
        outcome.exitCode = -1;
    } else if (WIFEXITED(status)) {
        outcome.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.exitCode = 128 + WTERMSIG(status);
    } else {
        outcome.exitCode = -1;
    }

    outcome.tail.assign(tail.begin(), tail.end());
    return outcome;
}

} // namespace nodeforge::infrastructure
