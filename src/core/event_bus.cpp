// src/core/event_bus.cpp
#include "tcrimer/core/event_bus.hpp"
#include <algorithm>
#include "tcrimer/core/logger.hpp"

namespace tcrimer {

std::string event_type_to_string(MonitoringEventType type) {
    switch (type) {
        case MonitoringEventType::CACHE_STATS:
            return "CACHE_STATS";
        case MonitoringEventType::POOL_OCCUPANCY:
            return "POOL_OCCUPANCY";
        case MonitoringEventType::FAILOVER:
            return "FAILOVER";
        case MonitoringEventType::BACKTEST_OUTCOME:
            return "BACKTEST_OUTCOME";
        case MonitoringEventType::DATA_ACCESS:
            return "DATA_ACCESS";
    }
    return "UNKNOWN";
}

EventBus::EventBus(size_t max_queue_size)
    : max_queue_size_(max_queue_size == 0 ? 1 : max_queue_size) {
    dispatcher_ = std::thread(&EventBus::dispatch_loop, this);
}

EventBus::~EventBus() {
    stop();
}

Result<void> EventBus::subscribe(const SubscriberInfo& subscriber_info) {
    if (subscriber_info.id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Subscriber ID cannot be empty",
                                "EventBus");
    }
    if (subscriber_info.event_types.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Must subscribe to at least one event type", "EventBus");
    }
    if (!subscriber_info.callback) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Callback function cannot be null",
                                "EventBus");
    }

    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    subscriptions_[subscriber_info.id] =
        Subscription{subscriber_info.event_types, subscriber_info.callback};
    DEBUG("Added monitoring subscription " << subscriber_info.id << " for "
                                           << subscriber_info.event_types.size()
                                           << " event types");
    return Result<void>();
}

Result<void> EventBus::unsubscribe(const std::string& subscriber_id) {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    if (subscriptions_.erase(subscriber_id) == 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Subscriber ID not found: " + subscriber_id, "EventBus");
    }
    return Result<void>();
}

bool EventBus::publish(MonitoringEvent event) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_ || queue_.size() >= max_queue_size_) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        queue_.push_back(std::move(event));
    }
    queue_cv_.notify_one();
    return true;
}

void EventBus::flush() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    drained_cv_.wait(lock, [this] { return queue_.empty() && in_flight_ == 0; });
}

void EventBus::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_ && !dispatcher_.joinable()) {
            return;
        }
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
}

void EventBus::dispatch_loop() {
    while (true) {
        MonitoringEvent event;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                drained_cv_.notify_all();
                return;
            }
            event = std::move(queue_.front());
            queue_.pop_front();
            ++in_flight_;
        }

        std::vector<std::pair<std::string, MonitoringCallback>> targets;
        {
            std::lock_guard<std::mutex> lock(subscriptions_mutex_);
            for (const auto& [id, sub] : subscriptions_) {
                if (std::find(sub.event_types.begin(), sub.event_types.end(), event.type) !=
                    sub.event_types.end()) {
                    targets.emplace_back(id, sub.callback);
                }
            }
        }

        for (const auto& [id, callback] : targets) {
            try {
                callback(event);
            } catch (const std::exception& e) {
                ERROR("Error in monitoring subscriber " << id << ": " << e.what());
            }
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --in_flight_;
            if (queue_.empty() && in_flight_ == 0) {
                drained_cv_.notify_all();
            }
        }
    }
}

}  // namespace tcrimer
