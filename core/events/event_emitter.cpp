#include "event_emitter.hpp"

#include <chrono>
#include <cstring>
#include <utility>
#include <vector>

#include "logging/logger.hpp"

namespace avatarlink {
namespace events {

// ----------------------------------------------------------------------------
// SubscriberQueue
// ----------------------------------------------------------------------------

SubscriberQueue::SubscriberQueue(size_t max_size, const std::string &name)
    : max_size_(max_size), name_(name), dropped_count_(0) {}

bool SubscriberQueue::push(const Event &event) {
    size_t dropped_total = 0;
    uint64_t dropped_id = 0;
    const char *dropped_type = nullptr;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (closed_) {
            return false;
        }

        if (events_.size() >= max_size_ && !events_.empty()) {
            dropped_id = get_event_id(events_.front());
            dropped_type = event_type_name(events_.front());
            events_.pop_front();
            dropped_total = ++dropped_count_;
        }

        events_.push_back(event);
    }

    cv_.notify_one();

    if (dropped_type == nullptr) {
        return true;
    }

    // First drop, then every 100th
    if (dropped_total % 100 == 1) {
        LOG_WARN("[EventEmitter] Subscriber '" << name_ << "' is falling behind: dropped " << dropped_type
                                               << " event " << dropped_id << " (" << dropped_total
                                               << " dropped total)");
    }
    return false;
}

std::optional<Event> SubscriberQueue::pop(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (events_.empty() && timeout_ms > 0 && !closed_) {
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return !events_.empty() || closed_; });
    }

    if (events_.empty()) {
        return std::nullopt;
    }

    Event event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<Event> SubscriberQueue::try_pop() { return pop(0); }

size_t SubscriberQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

bool SubscriberQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.empty();
}

size_t SubscriberQueue::dropped_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_count_;
}

void SubscriberQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool SubscriberQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

// ----------------------------------------------------------------------------
// Subscription
// ----------------------------------------------------------------------------

Subscription::Subscription(SubscriptionId id, std::shared_ptr<SubscriberQueue> queue,
                           std::function<void(SubscriptionId)> unsubscribe_fn)
    : id_(id), queue_(std::move(queue)), unsubscribe_fn_(std::move(unsubscribe_fn)) {}

Subscription::~Subscription() { unsubscribe(); }

Subscription::Subscription(Subscription &&other) noexcept
    : id_(std::exchange(other.id_, 0)),
      queue_(std::move(other.queue_)),
      unsubscribe_fn_(std::move(other.unsubscribe_fn_)) {}

Subscription &Subscription::operator=(Subscription &&other) noexcept {
    if (this != &other) {
        unsubscribe();
        id_ = std::exchange(other.id_, 0);
        queue_ = std::move(other.queue_);
        unsubscribe_fn_ = std::move(other.unsubscribe_fn_);
    }
    return *this;
}

std::optional<Event> Subscription::pop(int timeout_ms) {
    return queue_ ? queue_->pop(timeout_ms) : std::nullopt;
}

std::optional<Event> Subscription::try_pop() { return queue_ ? queue_->try_pop() : std::nullopt; }

Subscription::SubscriptionId Subscription::id() const { return id_; }

bool Subscription::is_active() const { return queue_ && !queue_->is_closed(); }

size_t Subscription::queue_size() const { return queue_ ? queue_->size() : 0; }

size_t Subscription::dropped_count() const { return queue_ ? queue_->dropped_count() : 0; }

void Subscription::unsubscribe() {
    if (id_ == 0) {
        return;
    }
    if (unsubscribe_fn_) {
        unsubscribe_fn_(id_);
    }
    id_ = 0;
    if (queue_) {
        queue_->close();
    }
}

// ----------------------------------------------------------------------------
// EventFilter
// ----------------------------------------------------------------------------

bool EventFilter::matches(const Event &event) const {
    const char *type = event_type_name(event);
    if (std::strcmp(type, "delivery") == 0 && !deliveries) return false;
    if (std::strcmp(type, "health") == 0 && !health) return false;
    if (std::strcmp(type, "reload") == 0 && !reloads) return false;

    if (provider.empty()) {
        return true;
    }
    // Reloads carry no provider and never pass a provider filter
    return provider_of(event) == provider;
}

EventFilter EventFilter::all() { return EventFilter{}; }

// ----------------------------------------------------------------------------
// EventEmitter
// ----------------------------------------------------------------------------

EventEmitter::EventEmitter(size_t default_queue_size, size_t max_subscribers)
    : default_queue_size_(default_queue_size),
      max_subscribers_(max_subscribers),
      next_subscription_id_(1),
      next_event_id_(1) {}

std::unique_ptr<Subscription> EventEmitter::subscribe(const EventFilter &filter, size_t queue_size,
                                                      const std::string &name) {
    const std::string label = name.empty() ? "anonymous" : name;
    std::shared_ptr<SubscriberQueue> queue;
    SubscriptionId id = 0;
    size_t total = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (max_subscribers_ == 0 || subscribers_.size() < max_subscribers_) {
            id = next_subscription_id_++;
            queue = std::make_shared<SubscriberQueue>(queue_size > 0 ? queue_size : default_queue_size_, label);
            subscribers_.emplace(id, SubscriberInfo{queue, filter, label});
            total = subscribers_.size();
        }
    }

    if (!queue) {
        LOG_WARN("[EventEmitter] Rejecting subscriber '" << label << "': limit of " << max_subscribers_
                                                         << " reached");
        return nullptr;
    }

    LOG_DEBUG("[EventEmitter] Subscriber '" << label << "' attached as #" << id << " (" << total << " active)");

    return std::make_unique<Subscription>(id, std::move(queue), [this](SubscriptionId sub_id) { unsubscribe(sub_id); });
}

void EventEmitter::emit(Event event) {
    std::vector<std::shared_ptr<SubscriberQueue>> targets;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        // IDs are consumed even when nobody matches, so gaps are expected
        const uint64_t id = next_event_id_++;
        std::visit([id](auto &e) { e.event_id = id; }, event);

        targets.reserve(subscribers_.size());
        for (const auto &entry : subscribers_) {
            if (entry.second.filter.matches(event)) {
                targets.push_back(entry.second.queue);
            }
        }
    }

    // Queues have their own locks; push outside the registry lock
    for (const auto &queue : targets) {
        queue->push(event);
    }
}

uint64_t EventEmitter::next_event_id() const { return next_event_id_.load(); }

size_t EventEmitter::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

size_t EventEmitter::max_subscribers() const { return max_subscribers_; }

bool EventEmitter::at_capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_subscribers_ > 0 && subscribers_.size() >= max_subscribers_;
}

void EventEmitter::unsubscribe(SubscriptionId id) {
    std::shared_ptr<SubscriberQueue> queue;
    std::string label;
    size_t remaining = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(id);
        if (it == subscribers_.end()) {
            return;
        }
        queue = it->second.queue;
        label = it->second.name;
        subscribers_.erase(it);
        remaining = subscribers_.size();
    }

    queue->close();
    LOG_DEBUG("[EventEmitter] Subscriber '" << label << "' (#" << id << ") detached, " << remaining << " remaining");
}

}  // namespace events
}  // namespace avatarlink
