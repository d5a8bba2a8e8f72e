#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <vector>
#include "test_base.hpp"
#include "tcrimer/core/event_bus.hpp"

using namespace tcrimer;
using namespace tcrimer::testing;

class EventBusTest : public TestBase {
protected:
    static MonitoringEvent make_event(MonitoringEventType type, const std::string& source) {
        MonitoringEvent event;
        event.type = type;
        event.source = source;
        event.timestamp = std::chrono::system_clock::now();
        return event;
    }
};

TEST_F(EventBusTest, DeliversOnlySubscribedTypes) {
    EventBus bus;
    std::mutex mutex;
    std::vector<std::string> received;

    ASSERT_TRUE(bus.subscribe({"monitor",
                               {MonitoringEventType::FAILOVER, MonitoringEventType::CACHE_STATS},
                               [&](const MonitoringEvent& e) {
                                   std::lock_guard<std::mutex> lock(mutex);
                                   received.push_back(e.source);
                               }})
                    .is_ok());

    EXPECT_TRUE(bus.publish(make_event(MonitoringEventType::FAILOVER, "pool")));
    EXPECT_TRUE(bus.publish(make_event(MonitoringEventType::BACKTEST_OUTCOME, "engine")));
    EXPECT_TRUE(bus.publish(make_event(MonitoringEventType::CACHE_STATS, "cache")));
    bus.flush();

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(received, (std::vector<std::string>{"pool", "cache"}));
}

TEST_F(EventBusTest, RejectsInvalidSubscriptions) {
    EventBus bus;
    EXPECT_TRUE(bus.subscribe({"", {MonitoringEventType::FAILOVER}, [](const MonitoringEvent&) {}})
                    .is_error());
    EXPECT_TRUE(bus.subscribe({"x", {}, [](const MonitoringEvent&) {}}).is_error());
    EXPECT_TRUE(bus.subscribe({"x", {MonitoringEventType::FAILOVER}, nullptr}).is_error());
    EXPECT_TRUE(bus.unsubscribe("unknown").is_error());
}

TEST_F(EventBusTest, ThrowingSubscriberDoesNotStopDelivery) {
    EventBus bus;
    std::atomic<int> delivered{0};
    ASSERT_TRUE(bus.subscribe({"bad",
                               {MonitoringEventType::DATA_ACCESS},
                               [](const MonitoringEvent&) { throw std::runtime_error("boom"); }})
                    .is_ok());
    ASSERT_TRUE(bus.subscribe({"good",
                               {MonitoringEventType::DATA_ACCESS},
                               [&](const MonitoringEvent&) { ++delivered; }})
                    .is_ok());

    bus.publish(make_event(MonitoringEventType::DATA_ACCESS, "store"));
    bus.publish(make_event(MonitoringEventType::DATA_ACCESS, "store"));
    bus.flush();
    EXPECT_EQ(delivered.load(), 2);
}

TEST_F(EventBusTest, PublishAfterStopIsDropped) {
    EventBus bus;
    bus.stop();
    EXPECT_FALSE(bus.publish(make_event(MonitoringEventType::POOL_OCCUPANCY, "pool")));
    EXPECT_EQ(bus.dropped_events(), 1u);
}
