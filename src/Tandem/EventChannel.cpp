// =================================================================
// src/Tandem/EventChannel.cpp
// =================================================================
// Implementation of the progress event channel.

#include "Tandem/EventChannel.hpp"
#include <algorithm>
#include <stdexcept>

namespace Tandem {

std::string progressEventTypeToString(ProgressEventType type) {
    switch (type) {
        case ProgressEventType::RUN_STARTED: return "run_started";
        case ProgressEventType::STATE_CHANGED: return "state_changed";
        case ProgressEventType::STEP_STARTED: return "step_started";
        case ProgressEventType::MODEL_SWITCH: return "model_switch";
        case ProgressEventType::STEP_RETRY: return "step_retry";
        case ProgressEventType::STEP_COMPLETED: return "step_completed";
        case ProgressEventType::RUN_COMPLETED: return "run_completed";
        case ProgressEventType::RUN_FAILED: return "run_failed";
        case ProgressEventType::RUN_CANCELLED: return "run_cancelled";
        case ProgressEventType::AGENT_STEP: return "agent_step";
    }
    return "unknown";
}

EventSubscription::EventSubscription(size_t max_queue_size) : m_max_queue_size(max_queue_size) {
    if (max_queue_size == 0) {
        throw std::invalid_argument("Subscription queue size must be at least 1");
    }
}

bool EventSubscription::poll(ProgressEvent& event) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_queue.empty()) {
        return false;
    }
    event = std::move(m_queue.front());
    m_queue.pop_front();
    return true;
}

bool EventSubscription::waitFor(ProgressEvent& event, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_condition.wait_for(lock, timeout, [this] { return m_closed || !m_queue.empty(); });

    if (m_queue.empty()) {
        return false;
    }
    event = std::move(m_queue.front());
    m_queue.pop_front();
    return true;
}

std::vector<ProgressEvent> EventSubscription::drain() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ProgressEvent> events(std::make_move_iterator(m_queue.begin()),
                                      std::make_move_iterator(m_queue.end()));
    m_queue.clear();
    return events;
}

size_t EventSubscription::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

size_t EventSubscription::droppedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}

void EventSubscription::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_condition.notify_all();
}

bool EventSubscription::isClosed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

void EventSubscription::push(const ProgressEvent& event) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return;
        }
        if (m_queue.size() >= m_max_queue_size) {
            m_queue.pop_front();
            m_dropped++;
        }
        m_queue.push_back(event);
    }
    m_condition.notify_one();
}

std::shared_ptr<EventSubscription> EventChannel::subscribe(size_t max_queue_size) {
    auto subscription = std::make_shared<EventSubscription>(max_queue_size);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_subscribers.push_back(subscription);
    return subscription;
}

void EventChannel::unsubscribe(const std::shared_ptr<EventSubscription>& subscription) {
    if (!subscription) {
        return;
    }
    subscription->close();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_subscribers.erase(
        std::remove_if(m_subscribers.begin(), m_subscribers.end(),
            [&subscription](const std::weak_ptr<EventSubscription>& weak) {
                auto locked = weak.lock();
                return !locked || locked == subscription;
            }),
        m_subscribers.end());
}

void EventChannel::publish(const ProgressEvent& event) {
    std::vector<std::shared_ptr<EventSubscription>> targets;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_subscribers.begin();
        while (it != m_subscribers.end()) {
            if (auto subscription = it->lock()) {
                targets.push_back(subscription);
                ++it;
            } else {
                it = m_subscribers.erase(it);
            }
        }
    }

    for (const auto& subscription : targets) {
        subscription->push(event);
    }
}

size_t EventChannel::subscriberCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t count = 0;
    for (const auto& weak : m_subscribers) {
        if (!weak.expired()) {
            count++;
        }
    }
    return count;
}

} // namespace Tandem
