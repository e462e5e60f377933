#include <cassert>
#include <filesystem>
#include <iostream>

#include "application/IntegrityVerifier.hpp"
#include "application/SourceAcquirer.hpp"
#include "test/TestDoubles.hpp"

namespace fs = std::filesystem;

using namespace nodeforge::application;
using nodeforge::domain::BuildEnvironment;
using nodeforge::domain::FailureKind;
using nodeforge::domain::TargetKind;
using nodeforge::test::FakeCommandRunner;
using nodeforge::test::ScratchDir;

namespace {

const std::string kUrl = "https://github.com/bitcoin/bitcoin.git";

void TestFreshCloneIsShallowAndPinned() {
    ScratchDir scratch("nodeforge-acquire");
    fs::path dest = scratch.path() / "builds" / "bitcoin-25.0";

    FakeCommandRunner runner;
    runner.on("clone", {0, {"Cloning into 'bitcoin-25.0'..."}, [dest](const fs::path&) {
        fs::create_directories(dest);
    }});
    runner.on("rev-parse HEAD", {0, {"8105bce5b384c72cf08b25b7c5343622754e7337\n"}, nullptr});
    BuildEventChannel events;
    StepContext ctx{runner, &events, TargetKind::NodeDaemon};

    SourceAcquirer acquirer;
    auto checkout = acquirer.acquire(kUrl, "v25.0", dest, BuildEnvironment{}, ctx);
    assert(checkout.ok());
    assert(checkout.value().path == dest);
    assert(checkout.value().requestedTag == "v25.0");
    assert(checkout.value().resolvedCommit == "8105bce5b384c72cf08b25b7c5343622754e7337");

    assert(runner.calls.size() == 2);
    assert(runner.calls[0].line == "git clone --depth 1 --branch v25.0 " + kUrl + " " + dest.string());
    assert(runner.calls[0].workingDir == dest.parent_path());
    assert(fs::exists(dest.parent_path()));
    assert(!runner.ran("fetch"));
    std::cout << "[PASS] Missing checkout is cloned with --depth 1 --branch <tag>." << std::endl;
}

void TestExistingCheckoutOnlyFetchesTheTag() {
    ScratchDir scratch("nodeforge-acquire");
    fs::path dest = scratch.path() / "bitcoin-25.0";
    fs::create_directories(dest);

    FakeCommandRunner runner;
    runner.on("rev-parse HEAD", {0, {"abc123"}, nullptr});
    BuildEventChannel events;
    StepContext ctx{runner, &events, TargetKind::NodeDaemon};

    SourceAcquirer acquirer;
    for (int i = 0; i < 2; ++i) {
        auto checkout = acquirer.acquire(kUrl, "v25.0", dest, BuildEnvironment{}, ctx);
        assert(checkout.ok() && checkout.value().resolvedCommit == "abc123");
    }
    assert(!runner.ran("clone"));
    assert(runner.calls[0].line == "git fetch --depth 1 origin tag v25.0");
    assert(runner.calls[1].line == "git checkout v25.0");
    assert(runner.calls[0].workingDir == dest);
    for (const auto& call : runner.calls) {
        assert(call.line.find("--unshallow") == std::string::npos);
    }
    std::cout << "[PASS] Existing checkout is updated to the tag without full history." << std::endl;
}

void TestCloneFailureIsCommandFailure() {
    ScratchDir scratch("nodeforge-acquire");
    FakeCommandRunner runner;
    runner.on("clone", {128, {"fatal: Remote branch v99.0 not found"}, nullptr});
    BuildEventChannel events;
    StepContext ctx{runner, &events, TargetKind::NodeDaemon};

    auto checkout = SourceAcquirer().acquire(kUrl, "v99.0", scratch.path() / "bitcoin-99.0", BuildEnvironment{}, ctx);
    assert(!checkout.ok());
    assert(checkout.failure().kind == FailureKind::CommandFailure);
    assert(checkout.failure().exitCode == 128);
    assert(checkout.failure().logTail.front().find("not found") != std::string::npos);
    std::cout << "[PASS] Failed clone reports command, exit code and output." << std::endl;
}

void TestVerifier() {
    BuildEventChannel events;
    IntegrityVerifier verifier;

    FakeCommandRunner equal;
    equal.on("rev-parse HEAD", {0, {"abc123"}, nullptr});
    equal.on("rev-list -n 1 v25.0", {0, {"abc123"}, nullptr});
    StepContext ctx{equal, &events, TargetKind::NodeDaemon};
    auto report = verifier.verify("/work/bitcoin-25.0", "v25.0", BuildEnvironment{}, ctx);
    assert(report.verified);
    assert(report.reason.empty());

    FakeCommandRunner moved;
    moved.on("rev-parse HEAD", {0, {"abc123"}, nullptr});
    moved.on("rev-list -n 1 v25.0", {0, {"def456"}, nullptr});
    StepContext movedCtx{moved, &events, TargetKind::NodeDaemon};
    report = verifier.verify("/work/bitcoin-25.0", "v25.0", BuildEnvironment{}, movedCtx);
    assert(!report.verified);
    assert(report.headCommit == "abc123" && report.tagCommit == "def456");

    // Unknown tag commit is never treated as verified.
    FakeCommandRunner unknown;
    unknown.on("rev-parse HEAD", {0, {"abc123"}, nullptr});
    unknown.on("rev-list", {128, {}, nullptr});
    StepContext unknownCtx{unknown, &events, TargetKind::NodeDaemon};
    report = verifier.verify("/work/bitcoin-25.0", "v25.0", BuildEnvironment{}, unknownCtx);
    assert(!report.verified);
    assert(!report.reason.empty());
    std::cout << "[PASS] Verification compares HEAD with the tag commit." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting SourceAcquisition Test..." << std::endl;

    TestFreshCloneIsShallowAndPinned();
    TestExistingCheckoutOnlyFetchesTheTag();
    TestCloneFailureIsCommandFailure();
    TestVerifier();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
