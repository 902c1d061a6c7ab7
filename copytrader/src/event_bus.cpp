#include "event_bus.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

EventSubscription::EventSubscription(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

void EventSubscription::deliver(const Event& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            lagged_++;
        }
        queue_.push_back(event);
    }
    cv_.notify_one();
}

void EventSubscription::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::optional<Event> EventSubscription::recv(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    Event event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::optional<Event> EventSubscription::try_recv() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    Event event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

size_t EventSubscription::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

uint64_t EventSubscription::lagged() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lagged_;
}

EventBus::EventBus(size_t capacity) : capacity_(capacity) {}

EventBus::~EventBus() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& weak : subscribers_) {
        if (auto sub = weak.lock()) {
            sub->close();
        }
    }
}

std::shared_ptr<EventSubscription> EventBus::subscribe() {
    auto sub = std::make_shared<EventSubscription>(capacity_);
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(sub);
    return sub;
}

size_t EventBus::emit(const Event& event) {
    std::vector<std::shared_ptr<EventSubscription>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers_.erase(
            std::remove_if(subscribers_.begin(), subscribers_.end(),
                           [](const std::weak_ptr<EventSubscription>& w) { return w.expired(); }),
            subscribers_.end());
        for (auto& weak : subscribers_) {
            if (auto sub = weak.lock()) {
                live.push_back(std::move(sub));
            }
        }
    }

    for (auto& sub : live) {
        sub->deliver(event);
    }

    spdlog::debug("Emitted {} to {} subscriber(s)", event_type(event), live.size());
    return live.size();
}

size_t EventBus::subscriber_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (auto& weak : subscribers_) {
        if (!weak.expired()) count++;
    }
    return count;
}
