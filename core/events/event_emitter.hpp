#pragma once

/**
 * @file event_emitter.hpp
 * @brief Thread-safe fan-out event dispatcher with per-subscriber queues
 *
 * Architecture:
 * - AvatarClient emits delivery, health and reload events to one EventEmitter
 * - Each subscriber (SSE client, telemetry sink) gets its own bounded queue
 * - Fan-out is non-blocking: a slow subscriber never delays speak() callers
 * - Overflow drops oldest events per-subscriber with warning log
 *
 * Thread safety:
 * - emit() is called from request threads and the health prober
 * - subscribe()/unsubscribe() called from HTTP threads (SSE handlers)
 * - pop() called from subscriber threads (SSE handler loop, telemetry flush)
 */

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <deque>
#include <string>
#include <unordered_map>

#include "event_types.hpp"

namespace avatarlink {
namespace events {

/**
 * @brief Bounded event queue for a single subscriber
 */
class SubscriberQueue {
public:
    explicit SubscriberQueue(size_t max_size, const std::string &name = "");

    /**
     * @brief Push event (producer side). Drops the oldest event when full.
     *
     * @return true if pushed without dropping
     */
    bool push(const Event &event);

    /**
     * @brief Pop event, waiting up to timeout_ms (0 = non-blocking)
     */
    std::optional<Event> pop(int timeout_ms = 0);
    std::optional<Event> try_pop();

    size_t size() const;
    bool empty() const;
    size_t dropped_count() const;

    // Unblocks waiting consumers
    void close();
    bool is_closed() const;

private:
    const size_t max_size_;
    const std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> events_;
    size_t dropped_count_;
    bool closed_ = false;
};

/**
 * @brief Subscription handle; unsubscribes on destruction
 */
class Subscription {
public:
    using SubscriptionId = uint64_t;

    Subscription(SubscriptionId id, std::shared_ptr<SubscriberQueue> queue,
                 std::function<void(SubscriptionId)> unsubscribe_fn);
    ~Subscription();

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;

    std::optional<Event> pop(int timeout_ms = 100);
    std::optional<Event> try_pop();

    SubscriptionId id() const;
    bool is_active() const;
    size_t queue_size() const;
    size_t dropped_count() const;

    void unsubscribe();

private:
    SubscriptionId id_;
    std::shared_ptr<SubscriberQueue> queue_;
    std::function<void(SubscriptionId)> unsubscribe_fn_;
};

/**
 * @brief Event filter for subscribers
 *
 * Empty filter = receive all events. A provider filter drops reload events,
 * which concern the whole provider set.
 */
struct EventFilter {
    std::string provider;  // Empty = all providers
    bool deliveries = true;
    bool health = true;
    bool reloads = true;

    bool matches(const Event &event) const;

    static EventFilter all();
};

/**
 * @brief Thread-safe event emitter with fan-out to per-subscriber queues
 */
class EventEmitter {
public:
    using SubscriptionId = Subscription::SubscriptionId;

    /**
     * @param default_queue_size Default max events per subscriber queue
     * @param max_subscribers Maximum concurrent subscribers (0 = unlimited)
     */
    explicit EventEmitter(size_t default_queue_size = 100, size_t max_subscribers = 32);

    /**
     * @brief Subscribe to events
     *
     * @return Subscription handle, or nullptr if max subscribers reached
     */
    std::unique_ptr<Subscription> subscribe(const EventFilter &filter = EventFilter::all(), size_t queue_size = 0,
                                            const std::string &name = "");

    /**
     * @brief Assign a monotonic event_id and fan out to matching subscribers
     */
    void emit(Event event);

    uint64_t next_event_id() const;
    size_t subscriber_count() const;
    size_t max_subscribers() const;
    bool at_capacity() const;

private:
    void unsubscribe(SubscriptionId id);

    struct SubscriberInfo {
        std::shared_ptr<SubscriberQueue> queue;
        EventFilter filter;
        std::string name;
    };

    const size_t default_queue_size_;
    const size_t max_subscribers_;

    mutable std::mutex mutex_;
    std::unordered_map<SubscriptionId, SubscriberInfo> subscribers_;
    std::atomic<SubscriptionId> next_subscription_id_;
    std::atomic<uint64_t> next_event_id_;
};

}  // namespace events
}  // namespace avatarlink
