/**
 * @file BuildEventChannel.hpp
 * @brief Ordered stream of log lines and progress updates produced by the orchestrator.
 *
 * The orchestrator only ever publishes; any consumer (console, file, test)
 * drains the channel on its own thread.
 */

#pragma once

#include "domain/BuildTarget.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace nodeforge::application {

/**
 * @enum EventKind
 * @brief Categories of events in the stream.
 */
enum class EventKind {
    Log,            ///< Informational line (including subprocess output).
    Warning,
    Error,
    Progress,       ///< progress field carries the new fraction.
    TargetStarted,
    TargetFinished
};

/**
 * @struct BuildEvent
 * @brief One entry of the stream.
 */
struct BuildEvent {
    EventKind kind = EventKind::Log;
    std::optional<domain::TargetKind> target;
    std::string text;
    double progress = 0.0;
};

/**
 * @class ProgressTracker
 * @brief The single shared progress value. One writer (the orchestrator), any readers.
 */
class ProgressTracker {
public:
    void reset() { m_value.store(0.0); }

    /** @brief Raises the value to fraction; lower values are ignored. Returns the stored value. */
    double advanceTo(double fraction);

    double value() const { return m_value.load(); }

private:
    std::atomic<double> m_value{0.0};
};

/**
 * @class BuildEventChannel
 * @brief Thread-safe FIFO of BuildEvents.
 */
class BuildEventChannel {
public:
    void publish(BuildEvent event);

    void log(const std::string& text, std::optional<domain::TargetKind> target = std::nullopt);
    void warn(const std::string& text, std::optional<domain::TargetKind> target = std::nullopt);
    void error(const std::string& text, std::optional<domain::TargetKind> target = std::nullopt);

    /** @brief Sets the tracker and publishes a Progress event if the value moved. */
    void progress(double fraction);
    void resetProgress();

    /** @brief Removes and returns every pending event. */
    std::vector<BuildEvent> drain();

    /** @brief Blocks until an event is pending or the timeout expires, then drains. */
    std::vector<BuildEvent> waitAndDrain(std::chrono::milliseconds timeout);

    const ProgressTracker& tracker() const { return m_tracker; }

private:
    std::deque<BuildEvent> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    ProgressTracker m_tracker;
};

} // namespace nodeforge::application
