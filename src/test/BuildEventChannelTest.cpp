#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "application/BuildEventChannel.hpp"
#include "application/BuildWorker.hpp"

using namespace nodeforge::application;
using nodeforge::domain::BuildReport;

namespace {

void WaitFor(const std::shared_ptr<BuildJobStatus>& status) {
    int elapsed = 0;
    while (!status->isCompleted && elapsed < 5000) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        elapsed += 5;
    }
    assert(status->isCompleted);
}

void TestConcurrentPublishersKeepPerThreadOrder() {
    BuildEventChannel channel;
    const int kProducers = 8;
    const int kPerProducer = 200;

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&channel, p]() {
            for (int i = 0; i < kPerProducer; ++i) {
                channel.log(std::to_string(p) + ":" + std::to_string(i));
            }
        });
    }

    std::map<int, int> lastSeen;
    int received = 0;
    int idleRounds = 0;
    while (received < kProducers * kPerProducer && idleRounds < 100) {
        auto batch = channel.waitAndDrain(std::chrono::milliseconds(50));
        if (batch.empty()) ++idleRounds;
        for (const auto& event : batch) {
            auto colon = event.text.find(':');
            int producer = std::stoi(event.text.substr(0, colon));
            int index = std::stoi(event.text.substr(colon + 1));
            auto it = lastSeen.find(producer);
            assert(it == lastSeen.end() || it->second + 1 == index);
            lastSeen[producer] = index;
            ++received;
        }
    }
    for (auto& t : producers) t.join();
    received += static_cast<int>(channel.drain().size());

    assert(received == kProducers * kPerProducer);
    std::cout << "[PASS] " << received << " events delivered, per-publisher order kept." << std::endl;
}

void TestProgressIsMonotonic() {
    BuildEventChannel channel;
    channel.progress(0.25);
    channel.progress(0.10);
    channel.progress(0.25);
    channel.progress(2.0);
    assert(channel.tracker().value() == 1.0);

    std::vector<double> published;
    for (const auto& event : channel.drain()) {
        if (event.kind == EventKind::Progress) published.push_back(event.progress);
    }
    assert((published == std::vector<double>{0.25, 1.0}));

    channel.resetProgress();
    assert(channel.tracker().value() == 0.0);

    ProgressTracker tracker;
    std::vector<std::thread> writers;
    for (int w = 1; w <= 4; ++w) {
        writers.emplace_back([&tracker, w]() {
            for (int i = 0; i <= 100; ++i) tracker.advanceTo(i / 100.0 * w / 4.0);
        });
    }
    for (auto& t : writers) t.join();
    assert(tracker.value() == 1.0);
    std::cout << "[PASS] Progress never moves backwards." << std::endl;
}

void TestWorkerRunsJobsInOrder() {
    BuildWorker worker;
    std::mutex orderMutex;
    std::vector<int> order;
    std::atomic<int> running{0};
    std::atomic<bool> overlapped{false};

    std::vector<std::shared_ptr<BuildJobStatus>> statuses;
    for (int i = 0; i < 5; ++i) {
        statuses.push_back(worker.submit("job " + std::to_string(i), [&, i]() {
            if (running.fetch_add(1) != 0) overlapped = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            {
                std::lock_guard<std::mutex> lock(orderMutex);
                order.push_back(i);
            }
            running.fetch_sub(1);
            return BuildReport{};
        }));
    }
    for (const auto& status : statuses) WaitFor(status);

    assert(!overlapped);
    assert((order == std::vector<int>{0, 1, 2, 3, 4}));
    for (const auto& status : statuses) {
        assert(!status->failed);
        assert(status->report.get().targets.empty());
    }
    std::cout << "[PASS] Worker runs one job at a time in submission order." << std::endl;
}

void TestWorkerRecordsFailures() {
    BuildWorker worker;
    auto status = worker.submit("throws", []() -> BuildReport {
        throw std::runtime_error("disk full");
    });
    WaitFor(status);
    assert(status->failed);
    assert(status->errorMessage == "disk full");

    worker.stop();
    auto rejected = worker.submit("late", []() { return BuildReport{}; });
    assert(rejected->isCompleted && rejected->failed);
    std::cout << "[PASS] Job failures and post-stop submissions are reported." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting BuildEventChannel Test..." << std::endl;

    TestConcurrentPublishersKeepPerThreadOrder();
    TestProgressIsMonotonic();
    TestWorkerRunsJobsInOrder();
    TestWorkerRecordsFailures();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
