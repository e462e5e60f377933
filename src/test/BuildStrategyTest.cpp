#include <cassert>
#include <filesystem>
#include <iostream>

#include "application/BuildEventChannel.hpp"
#include "application/BuildStrategy.hpp"
#include "application/StepContext.hpp"
#include "test/TestDoubles.hpp"

namespace fs = std::filesystem;

using namespace nodeforge::application;
using nodeforge::domain::BuildEnvironment;
using nodeforge::domain::FailureKind;
using nodeforge::domain::ReleaseTag;
using nodeforge::domain::SourceCheckout;
using nodeforge::domain::TargetKind;
using nodeforge::test::FakeCommandRunner;

namespace {

void TestSelectionTable() {
    auto table = StrategyTable::Default();
    assert(table.select(TargetKind::NodeDaemon, ReleaseTag("25.0")) == StrategyVariant::CMake);
    assert(table.select(TargetKind::NodeDaemon, ReleaseTag("v25.1")) == StrategyVariant::CMake);
    assert(table.select(TargetKind::NodeDaemon, ReleaseTag("v29.1")) == StrategyVariant::CMake);
    assert(table.select(TargetKind::NodeDaemon, ReleaseTag("24.2")) == StrategyVariant::Autotools);
    assert(table.select(TargetKind::NodeDaemon, ReleaseTag("v0.21.2")) == StrategyVariant::Autotools);
    assert(table.select(TargetKind::Indexer, ReleaseTag("v0.10.9")) == StrategyVariant::CargoRelease);

    auto strategy = table.create(TargetKind::NodeDaemon, ReleaseTag("v25.0"));
    assert(strategy && strategy->variant() == StrategyVariant::CMake);

    // An empty table selects nothing.
    StrategyTable empty;
    assert(!empty.select(TargetKind::NodeDaemon, ReleaseTag("v25.0")));
    assert(!empty.create(TargetKind::Indexer, ReleaseTag("v0.10.9")));
    std::cout << "[PASS] Strategy table selects by target and version." << std::endl;
}

void TestCMakeCommands() {
    FakeCommandRunner runner;
    BuildEventChannel events;
    StepContext ctx{runner, &events, TargetKind::NodeDaemon};

    SourceCheckout checkout{"/work/bitcoin-25.0", "v25.0", "abc"};
    auto strategy = MakeStrategy(StrategyVariant::CMake);
    auto result = strategy->build(checkout, BuildEnvironment{}, 6, ctx);
    assert(result.ok());

    assert(runner.calls.size() == 2);
    assert(runner.calls[0].line == "cmake -B build -DENABLE_WALLET=OFF -DENABLE_IPC=OFF");
    assert(runner.calls[1].line == "cmake --build build -j6");
    assert(runner.calls[0].workingDir == fs::path("/work/bitcoin-25.0"));
    assert(strategy->artifactDir("/work/bitcoin-25.0") == fs::path("/work/bitcoin-25.0/build/bin"));
    std::cout << "[PASS] CMake configures out of tree with the wallet disabled." << std::endl;
}

void TestAutotoolsCommandsAndFailure() {
    FakeCommandRunner runner;
    runner.on("make -j", {2, {"error: something broke"}, nullptr});
    BuildEventChannel events;
    StepContext ctx{runner, &events, TargetKind::NodeDaemon};

    SourceCheckout checkout{"/work/bitcoin-24.2", "v24.2", "abc"};
    auto strategy = MakeStrategy(StrategyVariant::Autotools);
    auto result = strategy->build(checkout, BuildEnvironment{}, 3, ctx);
    assert(!result.ok());
    assert(result.failure().kind == FailureKind::CommandFailure);
    assert(result.failure().command == "make -j3");
    assert(result.failure().exitCode == 2);
    assert(result.failure().logTail.size() == 1);

    assert(runner.calls.size() == 3);
    assert(runner.calls[0].line == "./autogen.sh");
    assert(runner.calls[1].line == "./configure --disable-wallet --disable-gui");
    assert(strategy->artifactDir("/work/bitcoin-24.2") == fs::path("/work/bitcoin-24.2/bin"));

    // bitcoin-util is only expected from the CMake build.
    const std::vector<std::string> names{"bitcoind", "bitcoin-cli", "bitcoin-tx", "bitcoin-wallet", "bitcoin-util"};
    auto candidates = strategy->candidatePaths("/work/bitcoin-24.2", names);
    assert(candidates.size() == 4);
    assert(candidates.back() == fs::path("/work/bitcoin-24.2/bin/bitcoin-wallet"));
    assert(MakeStrategy(StrategyVariant::CMake)->candidatePaths("/work/bitcoin-25.0", names).size() == 5);

    // Subprocess output reached the channel in order.
    bool sawOutput = false;
    for (const auto& event : events.drain()) {
        if (event.text == "error: something broke") sawOutput = true;
    }
    assert(sawOutput);
    std::cout << "[PASS] Autotools stops at the first failing command." << std::endl;
}

void TestCargoPreflight() {
    nodeforge::test::ScratchDir scratch("nodeforge-strategy");
    fs::path bin = scratch.path() / "bin";
    for (const char* tool : {"cargo", "rustc"}) {
        nodeforge::test::WriteFile(bin / tool, "#!/bin/sh\n");
        fs::permissions(bin / tool, fs::perms::owner_all);
    }

    BuildEnvironment env;
    env.setSearchPath({bin.string()});

    FakeCommandRunner runner;
    runner.on("cargo --version", {0, {"cargo 1.78.0"}, nullptr});
    runner.on("rustc --version", {1, {}, nullptr});
    BuildEventChannel events;
    StepContext ctx{runner, &events, TargetKind::Indexer};

    auto strategy = MakeStrategy(StrategyVariant::CargoRelease);
    assert(strategy->preflight(env, ctx).ok());

    // Without a toolchain on the composed path nothing is run.
    FakeCommandRunner idle;
    StepContext idleCtx{idle, &events, TargetKind::Indexer};
    auto missing = strategy->preflight(BuildEnvironment{}, idleCtx);
    assert(!missing.ok());
    assert(missing.failure().kind == FailureKind::ToolchainMissing);
    assert(idle.calls.empty());

    FakeCommandRunner broken;
    broken.on("cargo --version", {127, {}, nullptr});
    StepContext brokenCtx{broken, &events, TargetKind::Indexer};
    assert(strategy->preflight(env, brokenCtx).failure().kind == FailureKind::ToolchainMissing);
    std::cout << "[PASS] Cargo preflight fails fast when the toolchain is missing." << std::endl;
}

void TestCargoBuild() {
    FakeCommandRunner runner;
    BuildEventChannel events;
    StepContext ctx{runner, &events, TargetKind::Indexer};
    auto strategy = MakeStrategy(StrategyVariant::CargoRelease);

    EnvironmentComposer composer(HostSnapshot{});
    BuildEnvironment env;
    strategy->prepareEnvironment(env, composer, nodeforge::domain::OptimizationTier::Standard);
    assert(env.get("RUSTFLAGS").has_value());

    SourceCheckout checkout{"/work/electrs-0.10.9", "v0.10.9", "abc"};
    assert(strategy->build(checkout, env, 4, ctx).ok());
    assert(runner.calls.size() == 1);
    assert(runner.calls[0].line == "cargo build --release --jobs 4");
    assert(runner.calls[0].env.get("RUSTFLAGS") == env.get("RUSTFLAGS"));
    assert(strategy->artifactDir("/work/electrs-0.10.9") == fs::path("/work/electrs-0.10.9/target/release"));

    auto candidates = strategy->candidatePaths("/work/electrs-0.10.9", {"electrs"});
    assert(candidates.size() == 1 && candidates[0] == fs::path("/work/electrs-0.10.9/target/release/electrs"));
    std::cout << "[PASS] Cargo builds a release profile with the composed environment." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting BuildStrategy Test..." << std::endl;

    TestSelectionTable();
    TestCMakeCommands();
    TestAutotoolsCommandsAndFailure();
    TestCargoPreflight();
    TestCargoBuild();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
