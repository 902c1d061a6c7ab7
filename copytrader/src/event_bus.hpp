#pragma once

#include "events.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

class EventBus;

// One subscriber's view of the bus. When the subscriber falls more than
// `capacity` events behind, the oldest unread events are dropped.
class EventSubscription {
public:
    explicit EventSubscription(size_t capacity);

    std::optional<Event> recv(std::chrono::milliseconds timeout);
    std::optional<Event> try_recv();

    size_t pending() const;
    uint64_t lagged() const;

private:
    friend class EventBus;
    void deliver(const Event& event);
    void close();

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> queue_;
    uint64_t lagged_ = 0;
    bool closed_ = false;
};

// Process-wide broadcast channel. Emitting never blocks on subscribers.
class EventBus {
public:
    explicit EventBus(size_t capacity = 100);
    ~EventBus();

    std::shared_ptr<EventSubscription> subscribe();

    // Returns the number of live subscribers the event was delivered to.
    size_t emit(const Event& event);

    size_t subscriber_count();

private:
    const size_t capacity_;
    std::mutex mutex_;
    std::vector<std::weak_ptr<EventSubscription>> subscribers_;
};
