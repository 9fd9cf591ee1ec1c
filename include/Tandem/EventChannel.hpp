// =================================================================
// include/Tandem/EventChannel.hpp
// =================================================================
// Publish/subscribe queue for run progress events.

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Tandem {

enum class ProgressEventType {
    RUN_STARTED,
    STATE_CHANGED,
    STEP_STARTED,
    MODEL_SWITCH,
    STEP_RETRY,
    STEP_COMPLETED,
    RUN_COMPLETED,
    RUN_FAILED,
    RUN_CANCELLED,
    AGENT_STEP          ///< Step appended by the autonomous agent loop
};

struct ProgressEvent {
    ProgressEventType type = ProgressEventType::STATE_CHANGED;
    std::string source;         ///< Emitting component
    std::string agent_id;       ///< Agent involved, empty if none
    double progress = 0.0;      ///< Run progress in [0, 1]
    std::string message;        ///< Human-readable status
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

std::string progressEventTypeToString(ProgressEventType type);

/**
 * @brief One consumer's view of the channel
 *
 * Each subscription has its own bounded queue; the oldest event is
 * dropped when a slow consumer falls behind.
 */
class EventSubscription {
public:
    explicit EventSubscription(size_t max_queue_size);

    /**
     * @brief Take the next event without blocking
     * @return False if the queue is empty
     */
    bool poll(ProgressEvent& event);

    /**
     * @brief Wait for the next event
     * @param event Receives the event
     * @param timeout Maximum time to wait
     * @return False on timeout or when closed and empty
     */
    bool waitFor(ProgressEvent& event, std::chrono::milliseconds timeout);

    /**
     * @brief Take all queued events
     */
    std::vector<ProgressEvent> drain();

    size_t pending() const;

    size_t droppedCount() const;

    void close();

    bool isClosed() const;

private:
    friend class EventChannel;

    void push(const ProgressEvent& event);

    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::deque<ProgressEvent> m_queue;
    size_t m_max_queue_size;
    size_t m_dropped = 0;
    bool m_closed = false;
};

/**
 * @brief Fan-out channel shared by the engine components
 */
class EventChannel {
public:
    /**
     * @brief Register a new consumer
     * @param max_queue_size Queue bound for this consumer
     * @return Subscription; dropping the last reference unsubscribes
     */
    std::shared_ptr<EventSubscription> subscribe(size_t max_queue_size = 1024);

    void unsubscribe(const std::shared_ptr<EventSubscription>& subscription);

    /**
     * @brief Deliver an event to every open subscription
     */
    void publish(const ProgressEvent& event);

    size_t subscriberCount() const;

private:
    mutable std::mutex m_mutex;
    std::vector<std::weak_ptr<EventSubscription>> m_subscribers;
};

} // namespace Tandem
