// include/tcrimer/core/event_bus.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "tcrimer/core/error.hpp"
#include "tcrimer/core/types.hpp"

namespace tcrimer {

/**
 * @brief Type of monitoring event
 */
enum class MonitoringEventType {
    CACHE_STATS,
    POOL_OCCUPANCY,
    FAILOVER,
    BACKTEST_OUTCOME,
    DATA_ACCESS
};

std::string event_type_to_string(MonitoringEventType type);

/**
 * @brief Structured event delivered to monitoring subscribers
 */
struct MonitoringEvent {
    MonitoringEventType type;
    std::string source;
    Timestamp timestamp;
    std::unordered_map<std::string, double> numeric_fields;
    std::unordered_map<std::string, std::string> string_fields;
};

using MonitoringCallback = std::function<void(const MonitoringEvent&)>;

struct SubscriberInfo {
    std::string id;
    std::vector<MonitoringEventType> event_types;
    MonitoringCallback callback;
};

/**
 * @brief Asynchronous event bus for the monitoring collaborator
 *
 * publish() never blocks on subscribers: events go onto a bounded queue and
 * a dispatcher thread delivers them. When the queue is full the event is
 * dropped and counted.
 */
class EventBus {
public:
    explicit EventBus(size_t max_queue_size = 1024);
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    Result<void> subscribe(const SubscriberInfo& subscriber_info);

    Result<void> unsubscribe(const std::string& subscriber_id);

    /**
     * @brief Enqueue an event for delivery
     * @return false if the event was dropped
     */
    bool publish(MonitoringEvent event);

    /**
     * @brief Block until every queued event has been delivered
     */
    void flush();

    /**
     * @brief Stop the dispatcher. Events still queued are delivered first.
     */
    void stop();

    size_t dropped_events() const {
        return dropped_.load(std::memory_order_relaxed);
    }

private:
    void dispatch_loop();

    struct Subscription {
        std::vector<MonitoringEventType> event_types;
        MonitoringCallback callback;
    };

    const size_t max_queue_size_;
    std::deque<MonitoringEvent> queue_;
    size_t in_flight_{0};
    bool stopping_{false};
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable drained_cv_;

    std::unordered_map<std::string, Subscription> subscriptions_;
    std::mutex subscriptions_mutex_;

    std::atomic<size_t> dropped_{0};
    std::thread dispatcher_;
};

}  // namespace tcrimer
