#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <thread>
#include "../core/test_base.hpp"
#include "test_db_utils.hpp"
#include "tcrimer/data/database_pooling.hpp"

using namespace tcrimer;
using namespace tcrimer::testing;

class DatabasePoolTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        primary_ = std::make_shared<MockDatabaseControl>();
        fallback_ = std::make_shared<MockDatabaseControl>();
        bus_ = std::make_shared<EventBus>();

        config_.min_size = 1;
        config_.max_size = 2;
        config_.acquire_timeout = std::chrono::milliseconds(100);
        config_.staleness_threshold = std::chrono::milliseconds(30000);
        config_.primary_failure_threshold = 3;
        config_.reconciliation_backoff = std::chrono::seconds(0);
        config_.maintenance_interval = std::chrono::milliseconds(0);
    }

    void TearDown() override {
        if (pool_) {
            pool_->shutdown();
        }
        bus_->stop();
        TestBase::TearDown();
    }

    std::shared_ptr<ConnectionPool> make_pool(bool with_primary = true) {
        selector_ = std::make_shared<BackendSelector>(
            FailoverPolicy{config_.primary_failure_threshold, config_.reconciliation_backoff});
        pool_ = std::make_shared<ConnectionPool>(
            config_, with_primary ? mock_factory(primary_, BackendKind::PRIMARY) : DatabaseFactory{},
            mock_factory(fallback_, BackendKind::FALLBACK), selector_, bus_);
        return pool_;
    }

    PoolConfig config_;
    std::shared_ptr<MockDatabaseControl> primary_;
    std::shared_ptr<MockDatabaseControl> fallback_;
    std::shared_ptr<EventBus> bus_;
    std::shared_ptr<BackendSelector> selector_;
    std::shared_ptr<ConnectionPool> pool_;
};

TEST_F(DatabasePoolTest, InitializePreopensMinConnections) {
    auto pool = make_pool();
    ASSERT_TRUE(pool->initialize().is_ok());

    auto stats = pool->stats(BackendKind::PRIMARY);
    EXPECT_EQ(stats.idle, 1u);
    EXPECT_EQ(stats.total, 1u);
    EXPECT_EQ(selector_->authoritative(), BackendKind::PRIMARY);
}

TEST_F(DatabasePoolTest, RejectsInvalidSizes) {
    config_.min_size = 3;
    config_.max_size = 2;
    auto pool = make_pool();
    auto result = pool->initialize();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(DatabasePoolTest, ExhaustedAfterMaxConcurrentAcquires) {
    auto pool = make_pool();
    ASSERT_TRUE(pool->initialize().is_ok());

    auto first = pool->acquire();
    auto second = pool->acquire();
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    const auto started = std::chrono::steady_clock::now();
    auto third = pool->acquire();
    const auto waited = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(third.is_error());
    EXPECT_EQ(third.error()->code(), ErrorCode::POOL_EXHAUSTED);
    EXPECT_GE(waited, std::chrono::milliseconds(90));
    EXPECT_EQ(pool->stats(BackendKind::PRIMARY).acquire_timeouts, 1u);
    EXPECT_EQ(pool->stats(BackendKind::PRIMARY).total, 2u);
}

TEST_F(DatabasePoolTest, BlockedAcquireProceedsOnRelease) {
    auto pool = make_pool();
    ASSERT_TRUE(pool->initialize().is_ok());

    auto first = pool->acquire();
    auto second = pool->acquire();
    ASSERT_TRUE(first.is_ok() && second.is_ok());

    auto waiter = std::async(std::launch::async, [&pool] {
        auto guard = pool->acquire(std::nullopt, std::chrono::milliseconds(2000));
        return guard.is_ok();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    first.value().release();
    EXPECT_TRUE(waiter.get());
}

TEST_F(DatabasePoolTest, ConcurrentAcquiresUpToMaxNeverDeadlock) {
    config_.max_size = 4;
    config_.acquire_timeout = std::chrono::milliseconds(5000);
    auto pool = make_pool();
    ASSERT_TRUE(pool->initialize().is_ok());

    std::atomic<int> successes{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 25; ++i) {
                auto guard = pool->acquire();
                if (guard.is_ok() && guard.value()->is_connected()) {
                    ++successes;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(successes.load(), 200);
    auto stats = pool->stats(BackendKind::PRIMARY);
    EXPECT_LE(stats.total, 4u);
    EXPECT_EQ(stats.in_use, 0u);
}

TEST_F(DatabasePoolTest, BrokenConnectionIsRetired) {
    auto pool = make_pool();
    ASSERT_TRUE(pool->initialize().is_ok());

    {
        auto guard = pool->acquire();
        ASSERT_TRUE(guard.is_ok());
        guard.value().mark_broken();
    }
    auto stats = pool->stats(BackendKind::PRIMARY);
    EXPECT_EQ(stats.retired, 1u);
    EXPECT_EQ(stats.total, 0u);

    auto next = pool->acquire();
    ASSERT_TRUE(next.is_ok());
    EXPECT_TRUE(next.value()->is_connected());
}

TEST_F(DatabasePoolTest, StaleConnectionFailingProbeIsReplaced) {
    config_.staleness_threshold = std::chrono::milliseconds(0);
    auto pool = make_pool();
    ASSERT_TRUE(pool->initialize().is_ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    primary_->fail_ping = true;
    auto guard = pool->acquire();
    ASSERT_TRUE(guard.is_ok());
    EXPECT_TRUE(guard.value()->is_connected());
    EXPECT_EQ(pool->stats(BackendKind::PRIMARY).retired, 1u);
    EXPECT_EQ(primary_->connects.load(), 2);
}

TEST_F(DatabasePoolTest, StalenessCountsFromLastRelease) {
    config_.staleness_threshold = std::chrono::milliseconds(200);
    auto pool = make_pool();
    ASSERT_TRUE(pool->initialize().is_ok());
    const int pings_after_init = primary_->pings.load();

    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    {
        auto guard = pool->acquire();
        ASSERT_TRUE(guard.is_ok());
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    {
        // Idle for ~120ms since release, well past 200ms since the last check
        auto guard = pool->acquire();
        ASSERT_TRUE(guard.is_ok());
    }
    EXPECT_EQ(primary_->pings.load(), pings_after_init);
    EXPECT_EQ(pool->stats(BackendKind::PRIMARY).retired, 0u);
}

TEST_F(DatabasePoolTest, RetiredConnectionClosedInlineWithoutMaintenance) {
    auto pool = make_pool();
    ASSERT_TRUE(pool->initialize().is_ok());

    {
        auto guard = pool->acquire();
        ASSERT_TRUE(guard.is_ok());
        guard.value().mark_broken();
    }
    EXPECT_EQ(primary_->disconnects.load(), 1);
}

TEST_F(DatabasePoolTest, StaleConnectionFailingCheckClosedInline) {
    config_.staleness_threshold = std::chrono::milliseconds(0);
    auto pool = make_pool();
    ASSERT_TRUE(pool->initialize().is_ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    primary_->fail_ping = true;
    auto guard = pool->acquire();
    ASSERT_TRUE(guard.is_ok());
    EXPECT_EQ(primary_->disconnects.load(), 1);
}

TEST_F(DatabasePoolTest, RetiredConnectionWaitsForMaintenancePass) {
    config_.maintenance_interval = std::chrono::milliseconds(60000);
    auto pool = make_pool();
    ASSERT_TRUE(pool->initialize().is_ok());

    {
        auto guard = pool->acquire();
        ASSERT_TRUE(guard.is_ok());
        guard.value().mark_broken();
    }
    EXPECT_EQ(primary_->disconnects.load(), 0);

    pool->shutdown();
    EXPECT_EQ(primary_->disconnects.load(), 1);
}

TEST_F(DatabasePoolTest, UnreachablePrimaryAtStartupServesFallback) {
    primary_->fail_connect = true;
    auto pool = make_pool();
    ASSERT_TRUE(pool->initialize().is_ok());

    EXPECT_EQ(selector_->authoritative(), BackendKind::FALLBACK);
    EXPECT_EQ(primary_->failed_connects.load(), 3);

    auto guard = pool->acquire();
    ASSERT_TRUE(guard.is_ok());
    EXPECT_EQ(guard.value().backend(), BackendKind::FALLBACK);
}

TEST_F(DatabasePoolTest, ThirdPrimaryFailureRoutesToFallback) {
    config_.min_size = 0;
    auto pool = make_pool();
    ASSERT_TRUE(pool->initialize().is_ok());
    ASSERT_EQ(selector_->authoritative(), BackendKind::PRIMARY);

    std::atomic<int> failovers{0};
    ASSERT_TRUE(bus_->subscribe({"test",
                                 {MonitoringEventType::FAILOVER},
                                 [&](const MonitoringEvent& e) {
                                     if (e.string_fields.at("to") == "fallback") {
                                         ++failovers;
                                     }
                                 }})
                    .is_ok());

    // The probe during initialize left one idle primary; drop it so every
    // acquire must open a new connection
    {
        auto guard = pool->acquire();
        ASSERT_TRUE(guard.is_ok());
        guard.value().mark_broken();
    }
    primary_->fail_connect = true;

    EXPECT_TRUE(pool->acquire().is_error());  // broken release was failure 1, this is 2
    auto routed = pool->acquire();            // failure 3 trips failover
    ASSERT_TRUE(routed.is_ok());
    EXPECT_EQ(routed.value().backend(), BackendKind::FALLBACK);
    EXPECT_EQ(selector_->authoritative(), BackendKind::FALLBACK);

    bus_->flush();
    EXPECT_EQ(failovers.load(), 1);
}

TEST_F(DatabasePoolTest, MaintenanceReconcilesWithRecoveredPrimary) {
    primary_->fail_connect = true;
    auto pool = make_pool();
    ASSERT_TRUE(pool->initialize().is_ok());
    ASSERT_EQ(selector_->authoritative(), BackendKind::FALLBACK);

    pool->run_maintenance();
    EXPECT_EQ(selector_->authoritative(), BackendKind::FALLBACK);

    primary_->fail_connect = false;
    pool->run_maintenance();
    EXPECT_EQ(selector_->authoritative(), BackendKind::PRIMARY);

    auto guard = pool->acquire();
    ASSERT_TRUE(guard.is_ok());
    EXPECT_EQ(guard.value().backend(), BackendKind::PRIMARY);
}

TEST_F(DatabasePoolTest, NoPrimaryConfiguredStartsOnFallback) {
    auto pool = make_pool(false);
    ASSERT_TRUE(pool->initialize().is_ok());
    EXPECT_EQ(selector_->authoritative(), BackendKind::FALLBACK);
    EXPECT_FALSE(pool->has_backend(BackendKind::PRIMARY));
    EXPECT_FALSE(pool->reconcile_primary());
}

TEST_F(DatabasePoolTest, AcquireAfterShutdownFails) {
    auto pool = make_pool();
    ASSERT_TRUE(pool->initialize().is_ok());
    pool->shutdown();

    auto guard = pool->acquire();
    ASSERT_TRUE(guard.is_error());
    EXPECT_EQ(guard.error()->code(), ErrorCode::NOT_INITIALIZED);
}
