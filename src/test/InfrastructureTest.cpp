#include <cassert>
#include <cstdlib>
#include <iostream>

#include "infrastructure/ArchitectureProbe.hpp"
#include "infrastructure/GitHubReleaseClient.hpp"
#include "infrastructure/HostEnvironment.hpp"
#include "infrastructure/ShellCommandRunner.hpp"

using namespace nodeforge::infrastructure;
using nodeforge::domain::Architecture;
using nodeforge::domain::BuildEnvironment;
using nodeforge::domain::CommandLine;

namespace {

void TestParseTagNames() {
    auto tags = GitHubReleaseClient::ParseTagNames(
        R"([{"tag_name": "v29.1", "name": "Bitcoin Core 29.1"}, {"id": 7}, {"tag_name": "v29.0"}])");
    assert(tags);
    assert((*tags == std::vector<std::string>{"v29.1", "v29.0"}));

    assert(!GitHubReleaseClient::ParseTagNames("{\"message\": \"API rate limit exceeded\"}"));
    assert(!GitHubReleaseClient::ParseTagNames("not json"));
    assert(GitHubReleaseClient::ParseTagNames("[]")->empty());
    std::cout << "[PASS] Release listing parsing." << std::endl;
}

void TestSplitUrl() {
    auto split = GitHubReleaseClient::SplitUrl("https://api.github.com/repos/bitcoin/bitcoin/releases");
    assert(split);
    assert(split->first == "https://api.github.com");
    assert(split->second == "/repos/bitcoin/bitcoin/releases");
    assert(!GitHubReleaseClient::SplitUrl("api.github.com/repos"));
    std::cout << "[PASS] URL splitting." << std::endl;
}

void TestShellLine() {
    BuildEnvironment env;
    env.set("PATH", "/usr/bin:/bin");
    env.set("CFLAGS", "-O2 -fno-common");
    std::string line = ShellCommandRunner::BuildShellLine(CommandLine{"make", {"-j4"}}, "/work/my dir", env);
    assert(line == "{ cd '/work/my dir' && exec env -i PATH=/usr/bin:/bin 'CFLAGS=-O2 -fno-common' make -j4; } 2>&1");
    std::cout << "[PASS] Shell line quotes words and isolates the environment." << std::endl;
}

void TestRunMergesStreamsAndIsolatesEnvironment() {
    ShellCommandRunner runner(2);
    BuildEnvironment env;
    env.set("PATH", "/usr/bin:/bin");
    env.set("NODEFORGE_PROBE", "42");

    std::vector<std::string> lines;
    auto outcome = runner.run(CommandLine{"sh", {"-c", "echo one; echo two >&2; echo $NODEFORGE_PROBE; exit 3"}},
                              "/", env, [&lines](const std::string& l) { lines.push_back(l); });
    assert(outcome.started);
    assert(outcome.exitCode == 3);
    assert(!outcome.succeeded());
    assert((lines == std::vector<std::string>{"one", "two", "42"}));
    assert((outcome.tail == std::vector<std::string>{"two", "42"}));

    // The overlay never reaches this process.
    assert(std::getenv("NODEFORGE_PROBE") == nullptr);

    auto ok = runner.run(CommandLine{"sh", {"-c", "echo $HOME"}}, "", env, nullptr);
    assert(ok.succeeded());
    assert(ok.firstLine().empty());
    std::cout << "[PASS] Commands run with exactly the given environment." << std::endl;
}

void TestMissingWorkingDirIsCaptured() {
    ShellCommandRunner runner(4);
    BuildEnvironment env;
    env.set("PATH", "/usr/bin:/bin");

    std::vector<std::string> lines;
    auto outcome = runner.run(CommandLine{"true", {}}, "/nonexistent-nodeforge-dir", env,
                              [&lines](const std::string& l) { lines.push_back(l); });
    assert(outcome.started);
    assert(!outcome.succeeded());
    assert(!lines.empty());
    assert(!outcome.tail.empty());
    assert(outcome.tail.back().find("/nonexistent-nodeforge-dir") != std::string::npos);
    std::cout << "[PASS] A failing cd lands in the captured output." << std::endl;
}

void TestArchitecture() {
    assert(ArchitectureProbe::Classify("arm64") == Architecture::AppleSilicon);
    assert(ArchitectureProbe::Classify("x86_64") == Architecture::Intel);
    assert(ArchitectureProbe::Classify("riscv64") == Architecture::Unknown);
    assert(ArchitectureProbe::Host() == ArchitectureProbe::Host());
    assert(HostEnvironment::CoreCount() >= 1);

    auto host = HostEnvironment::Capture();
    assert(host.exists && host.exists("/"));
    std::cout << "[PASS] Host probes." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Infrastructure Test..." << std::endl;

    TestParseTagNames();
    TestSplitUrl();
    TestShellLine();
    TestRunMergesStreamsAndIsolatesEnvironment();
    TestMissingWorkingDirIsCaptured();
    TestArchitecture();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
