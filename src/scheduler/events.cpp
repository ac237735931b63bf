/**
 * @file events.cpp
 * @brief EventBus implementation.
 * @author Dimitris Kafetzis
 */

#include "scheduler/events.hpp"

#include <algorithm>
#include <exception>

namespace backup_scheduler {

EventBus::EventBus(Logger& logger) : logger_(logger) {}

EventBus::SubscriptionId EventBus::subscribe(Listener listener) {
    std::lock_guard lock(mutex_);
    auto id = next_id_++;
    subscribers_.push_back({id, std::move(listener)});
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                           [id](const Subscription& s) { return s.id == id; });
    if (it == subscribers_.end()) return false;
    subscribers_.erase(it);
    return true;
}

void EventBus::publish(SchedulerEvent event) {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(event));
}

size_t EventBus::dispatch() {
    std::deque<SchedulerEvent> batch;
    std::vector<Subscription> subscribers;
    {
        std::lock_guard lock(mutex_);
        batch.swap(queue_);
        subscribers = subscribers_;
    }

    for (const auto& event : batch) {
        for (const auto& sub : subscribers) {
            try {
                sub.listener(event);
            } catch (const std::exception& e) {
                logger_.error("Event listener " + std::to_string(sub.id) + " threw on '"
                              + std::string{to_string(event.kind)} + "': " + e.what());
            }
        }
    }
    return batch.size();
}

size_t EventBus::pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

}  // namespace backup_scheduler
