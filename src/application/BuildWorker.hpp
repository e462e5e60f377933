/**
 * @file BuildWorker.hpp
 * @brief The single background thread orchestration runs on.
 */

#pragma once

#include "domain/BuildRequest.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace nodeforge::application {

/**
 * @struct BuildJobStatus
 * @brief Information about a queued, running or completed job.
 */
struct BuildJobStatus {
    int id = 0;
    std::string description;
    std::atomic<bool> isRunning{false};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage; ///< Written before isCompleted is set.
    std::shared_future<domain::BuildReport> report;
};

/**
 * @class BuildWorker
 * @brief Serializes build jobs on one worker thread.
 *
 * Jobs run strictly one after another, so two requests never compete for the
 * same checkout or output directory. The interactive thread only submits and
 * waits.
 */
class BuildWorker {
public:
    using Job = std::function<domain::BuildReport()>;

    BuildWorker();
    ~BuildWorker();

    BuildWorker(const BuildWorker&) = delete;
    BuildWorker& operator=(const BuildWorker&) = delete;

    /** @brief Queues a job. The returned status becomes ready when it finishes. */
    std::shared_ptr<BuildJobStatus> submit(const std::string& description, Job job);

    /** @brief Number of jobs not yet started. */
    size_t pending();

    /** @brief Finishes every queued job, then joins the worker thread. */
    void stop();

private:
    struct QueuedJob {
        std::shared_ptr<BuildJobStatus> status;
        std::packaged_task<domain::BuildReport()> task;
    };

    void workerLoop();

    std::queue<QueuedJob> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;

    std::thread m_worker;
    std::atomic<bool> m_running;
    std::atomic<int> m_nextId{0};
};

} // namespace nodeforge::application
