#include <cassert>
#include <filesystem>
#include <iostream>

#include "application/DependencyChecker.hpp"
#include "infrastructure/ConfirmationGates.hpp"
#include "test/TestDoubles.hpp"

namespace fs = std::filesystem;

using namespace nodeforge::application;
using nodeforge::domain::BuildEnvironment;
using nodeforge::domain::FailureKind;
using nodeforge::domain::GateKind;
using nodeforge::infrastructure::StaticConfirmationGate;
using nodeforge::test::FakeCommandRunner;
using nodeforge::test::ScratchDir;
using nodeforge::test::WriteFile;

namespace {

HostSnapshot HostAt(const fs::path& home) {
    HostSnapshot host;
    host.homeDir = home;
    host.exists = [](const fs::path& p) { return fs::exists(p); };
    return host;
}

void MakeExecutable(const fs::path& path) {
    WriteFile(path, "#!/bin/sh\n");
    fs::permissions(path, fs::perms::owner_all);
}

void TestReportAndInstall() {
    ScratchDir scratch("nodeforge-deps");
    fs::path root = scratch.path() / "brewroot";
    MakeExecutable(root / "bin" / "brew");
    MakeExecutable(scratch.path() / "tools" / "rustc");
    MakeExecutable(scratch.path() / "tools" / "cargo");

    ToolchainLayout layout;
    layout.roots = {root};
    EnvironmentComposer composer(HostAt(scratch.path()), layout);

    BuildEnvironment env;
    env.setSearchPath({(scratch.path() / "tools").string()});

    FakeCommandRunner runner;
    runner.on("list", {0, {}, nullptr});
    runner.on("list zeromq", {1, {"Error: No such keg"}, nullptr});
    runner.on("list rocksdb", {1, {}, nullptr});
    runner.on("rustc --version", {0, {"rustc 1.78.0"}, nullptr});
    runner.on("cargo --version", {0, {"cargo 1.78.0"}, nullptr});
    runner.on("install rocksdb", {1, {"Error: download failed"}, nullptr});

    BuildEventChannel events;
    StepContext ctx{runner, &events, std::nullopt};
    DependencyChecker checker(composer);

    auto report = checker.check(env, ctx);
    assert(report.ok());
    assert(report.value().packageManager == root / "bin" / "brew");
    assert(report.value().packages.size() == DependencyChecker::RequiredPackages().size());
    assert((report.value().missingPackages() == std::vector<std::string>{"zeromq", "rocksdb"}));
    assert(report.value().tools.size() == 2);
    assert(*report.value().tools[0].version == "rustc 1.78.0");
    assert(!report.value().complete());

    StaticConfirmationGate no(false);
    assert(checker.installMissing(report.value(), no, env, ctx) == 0);
    assert(no.timesAsked(GateKind::InstallDependencies) == 1);
    assert(!runner.ran("install"));

    StaticConfirmationGate yes(true);
    size_t installed = checker.installMissing(report.value(), yes, env, ctx);
    assert(installed == 1);
    assert(yes.timesAsked(GateKind::InstallDependencies) == 1);
    assert(runner.ran("install zeromq"));
    assert((report.value().installFailures == std::vector<std::string>{"rocksdb"}));
    assert((report.value().missingPackages() == std::vector<std::string>{"rocksdb"}));
    std::cout << "[PASS] Missing packages reported, installed after one confirmation." << std::endl;
}

void TestMissingPackageManager() {
    ScratchDir scratch("nodeforge-deps");
    ToolchainLayout layout;
    layout.roots = {scratch.path() / "nowhere"};
    EnvironmentComposer composer(HostAt(scratch.path()), layout);

    FakeCommandRunner runner;
    BuildEventChannel events;
    StepContext ctx{runner, &events, std::nullopt};

    auto report = DependencyChecker(composer).check(BuildEnvironment{}, ctx);
    assert(!report.ok());
    assert(report.failure().kind == FailureKind::ToolchainMissing);
    assert(runner.calls.empty());
    std::cout << "[PASS] No package manager is ToolchainMissing." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting DependencyChecker Test..." << std::endl;

    TestReportAndInstall();
    TestMissingPackageManager();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
