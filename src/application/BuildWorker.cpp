/**
 * @file BuildWorker.cpp
 * @brief Implementation of BuildWorker.
 */

#include "application/BuildWorker.hpp"

#include <iostream>

namespace nodeforge::application {

BuildWorker::BuildWorker() : m_running(true) {
    m_worker = std::thread(&BuildWorker::workerLoop, this);
}

BuildWorker::~BuildWorker() {
    stop();
}

void BuildWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

std::shared_ptr<BuildJobStatus> BuildWorker::submit(const std::string& description, Job job) {
    auto status = std::make_shared<BuildJobStatus>();
    status->id = m_nextId++;
    status->description = description;

    QueuedJob queued{status, std::packaged_task<domain::BuildReport()>(std::move(job))};
    status->report = queued.task.get_future().share();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            std::cerr << "[BuildWorker] Rejected job after stop: " << description << std::endl;
            status->failed = true;
            status->errorMessage = "Worker stopped";
            status->isCompleted = true;
            return status;
        }
        m_queue.push(std::move(queued));
    }
    m_cv.notify_one();
    return status;
}

size_t BuildWorker::pending() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

void BuildWorker::workerLoop() {
    while (true) {
        QueuedJob job;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                return;
            }

            if (m_queue.empty()) {
                continue; // Spurious wake up
            }

            job = std::move(m_queue.front());
            m_queue.pop();
        }

        // Run outside the lock so submit() never waits on a build.
        job.status->isRunning = true;
        job.task();
        try {
            job.status->report.get();
        } catch (const std::exception& e) {
            std::cerr << "[BuildWorker] Job " << job.status->id << " failed: " << e.what() << std::endl;
            job.status->errorMessage = e.what();
            job.status->failed = true;
        } catch (...) {
            std::cerr << "[BuildWorker] Job " << job.status->id << " failed with an unknown error" << std::endl;
            job.status->errorMessage = "Unknown error during build execution.";
            job.status->failed = true;
        }
        job.status->isRunning = false;
        job.status->isCompleted = true;
    }
}

} // namespace nodeforge::application
