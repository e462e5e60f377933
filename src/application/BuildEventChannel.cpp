/**
 * @file BuildEventChannel.cpp
 * @brief Implementation of BuildEventChannel and ProgressTracker.
 */

#include "application/BuildEventChannel.hpp"

#include <algorithm>

namespace nodeforge::application {

double ProgressTracker::advanceTo(double fraction) {
    fraction = std::clamp(fraction, 0.0, 1.0);
    double current = m_value.load();
    while (fraction > current && !m_value.compare_exchange_weak(current, fraction)) {
    }
    return m_value.load();
}

void BuildEventChannel::publish(BuildEvent event) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push_back(std::move(event));
    }
    m_cv.notify_all();
}

void BuildEventChannel::log(const std::string& text, std::optional<domain::TargetKind> target) {
    publish(BuildEvent{EventKind::Log, target, text, m_tracker.value()});
}

void BuildEventChannel::warn(const std::string& text, std::optional<domain::TargetKind> target) {
    publish(BuildEvent{EventKind::Warning, target, text, m_tracker.value()});
}

void BuildEventChannel::error(const std::string& text, std::optional<domain::TargetKind> target) {
    publish(BuildEvent{EventKind::Error, target, text, m_tracker.value()});
}

void BuildEventChannel::progress(double fraction) {
    double before = m_tracker.value();
    double after = m_tracker.advanceTo(fraction);
    if (after != before) {
        publish(BuildEvent{EventKind::Progress, std::nullopt, {}, after});
    }
}

void BuildEventChannel::resetProgress() {
    m_tracker.reset();
    publish(BuildEvent{EventKind::Progress, std::nullopt, {}, 0.0});
}

std::vector<BuildEvent> BuildEventChannel::drain() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<BuildEvent> events(std::make_move_iterator(m_queue.begin()),
                                   std::make_move_iterator(m_queue.end()));
    m_queue.clear();
    return events;
}

std::vector<BuildEvent> BuildEventChannel::waitAndDrain(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait_for(lock, timeout, [this] { return !m_queue.empty(); });
    std::vector<BuildEvent> events(std::make_move_iterator(m_queue.begin()),
                                   std::make_move_iterator(m_queue.end()));
    m_queue.clear();
    return events;
}

} // namespace nodeforge::application
