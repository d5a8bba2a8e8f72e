#include <gtest/gtest.h>
#include <atomic>
#include "../core/test_base.hpp"
#include "test_db_utils.hpp"
#include "tcrimer/data/data_store.hpp"

using namespace tcrimer;
using namespace tcrimer::testing;

class DataStoreTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        control_ = std::make_shared<MockDatabaseControl>();
        bus_ = std::make_shared<EventBus>();

        pool_config_.min_size = 1;
        pool_config_.max_size = 2;
        pool_config_.acquire_timeout = std::chrono::milliseconds(50);
        pool_config_.maintenance_interval = std::chrono::milliseconds(0);

        store_config_.max_attempts = 3;
        store_config_.initial_backoff = std::chrono::milliseconds(1);
        store_config_.max_backoff = std::chrono::milliseconds(4);
    }

    void TearDown() override {
        store_.reset();
        if (pool_) {
            pool_->shutdown();
        }
        bus_->stop();
        TestBase::TearDown();
    }

    // Fallback-only pool so connection failures never trigger failover
    DataStore& make_store() {
        pool_ = std::make_shared<ConnectionPool>(pool_config_, DatabaseFactory{},
                                                 mock_factory(control_, BackendKind::FALLBACK),
                                                 nullptr, bus_);
        auto init = pool_->initialize();
        EXPECT_TRUE(init.is_ok());
        store_ = std::make_unique<DataStore>(pool_, store_config_, bus_);
        return *store_;
    }

    PoolConfig pool_config_;
    DataStoreConfig store_config_;
    std::shared_ptr<MockDatabaseControl> control_;
    std::shared_ptr<EventBus> bus_;
    std::shared_ptr<ConnectionPool> pool_;
    std::unique_ptr<DataStore> store_;
};

TEST_F(DataStoreTest, QueryReturnsTable) {
    auto& store = make_store();
    control_->query_handler = [](const std::string&, const SqlParams&) {
        return Result<std::shared_ptr<arrow::Table>>(make_int_table("n", {7, 8, 9}));
    };

    auto result = store.query("SELECT n FROM t");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value()->num_rows(), 3);
    EXPECT_EQ(store.retry_count(), 0u);
}

TEST_F(DataStoreTest, TransientFailuresAreRetried) {
    auto& store = make_store();
    control_->fail_next_statements = 2;

    auto result = store.query("SELECT 1");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(control_->queries.load(), 3);
    EXPECT_EQ(store.retry_count(), 2u);
}

TEST_F(DataStoreTest, BrokenConnectionsAreReplacedBetweenAttempts) {
    auto& store = make_store();
    control_->fail_next_statements = 1;

    ASSERT_TRUE(store.execute("DELETE FROM t").is_ok());
    EXPECT_EQ(pool_->stats(BackendKind::FALLBACK).retired, 1u);
    EXPECT_EQ(control_->connects.load(), 2);
}

TEST_F(DataStoreTest, ExhaustedRetriesBecomeDataAccessError) {
    auto& store = make_store();
    control_->statement_error = ErrorCode::TIMEOUT_ERROR;
    control_->fail_next_statements = 10;

    auto result = store.query("SELECT 1");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATA_ACCESS_ERROR);
    EXPECT_NE(std::string(result.error()->what()).find("after 3 attempts"), std::string::npos);
    EXPECT_EQ(control_->queries.load(), 3);
}

TEST_F(DataStoreTest, NonTransientFailureIsNotRetried) {
    auto& store = make_store();
    control_->statement_error = ErrorCode::DATABASE_ERROR;
    control_->fail_next_statements = 1;

    auto result = store.execute("INSERT INTO t VALUES (1)");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATA_ACCESS_ERROR);
    EXPECT_EQ(control_->executes.load(), 1);
    EXPECT_EQ(store.retry_count(), 0u);
}

TEST_F(DataStoreTest, PoolExhaustionPassesThrough) {
    pool_config_.max_size = 1;
    auto& store = make_store();

    auto held = pool_->acquire();
    ASSERT_TRUE(held.is_ok());

    auto result = store.query("SELECT 1");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::POOL_EXHAUSTED);
    EXPECT_EQ(control_->queries.load(), 0);
}

TEST_F(DataStoreTest, TransactionCommitsAllStatements) {
    auto& store = make_store();
    std::vector<SqlStatement> batch{{"INSERT INTO t VALUES (?)", {int64_t{1}}},
                                    {"INSERT INTO t VALUES (?)", {int64_t{2}}}};

    auto result = store.execute_transaction(batch);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 2u);
    EXPECT_EQ(control_->commits.load(), 1);
    EXPECT_EQ(control_->rollbacks.load(), 0);
}

TEST_F(DataStoreTest, FailedTransactionRollsBack) {
    auto& store = make_store();
    control_->statement_error = ErrorCode::DATABASE_ERROR;
    control_->fail_next_statements = 1;

    std::vector<SqlStatement> batch{{"INSERT INTO t VALUES (1)", {}},
                                    {"INSERT INTO t VALUES (2)", {}}};
    auto result = store.execute_transaction(batch);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATA_ACCESS_ERROR);
    EXPECT_EQ(control_->rollbacks.load(), 1);
    EXPECT_EQ(control_->commits.load(), 0);
}

TEST_F(DataStoreTest, TransientTransactionFailureRetriesWholeBatch) {
    auto& store = make_store();
    control_->fail_next_statements = 1;

    std::vector<SqlStatement> batch{{"INSERT INTO t VALUES (1)", {}},
                                    {"INSERT INTO t VALUES (2)", {}}};
    auto result = store.execute_transaction(batch);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 2u);
    EXPECT_EQ(control_->rollbacks.load(), 1);
    EXPECT_EQ(control_->commits.load(), 1);
    EXPECT_EQ(control_->executes.load(), 3);
}

TEST_F(DataStoreTest, EmptyTransactionTouchesNothing) {
    auto& store = make_store();
    auto result = store.execute_transaction({});
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 0u);
    EXPECT_EQ(control_->executes.load(), 0);
}

TEST_F(DataStoreTest, FailurePublishesDataAccessEvent) {
    auto& store = make_store();
    std::atomic<int> events{0};
    std::atomic<double> attempts{0.0};
    ASSERT_TRUE(bus_->subscribe({"test",
                                 {MonitoringEventType::DATA_ACCESS},
                                 [&](const MonitoringEvent& e) {
                                     ++events;
                                     attempts = e.numeric_fields.at("attempts");
                                 }})
                    .is_ok());

    control_->fail_next_statements = 5;
    ASSERT_TRUE(store.query("SELECT 1").is_error());

    bus_->flush();
    EXPECT_EQ(events.load(), 1);
    EXPECT_DOUBLE_EQ(attempts.load(), 3.0);
}

TEST_F(DataStoreTest, SchemaIsAppliedToEveryBackend) {
    auto primary = std::make_shared<MockDatabaseControl>();
    pool_ = std::make_shared<ConnectionPool>(pool_config_,
                                             mock_factory(primary, BackendKind::PRIMARY),
                                             mock_factory(control_, BackendKind::FALLBACK));
    ASSERT_TRUE(pool_->initialize().is_ok());
    DataStore store(pool_, store_config_);

    ASSERT_TRUE(store.initialize_schema({"CREATE TABLE a (x INTEGER)",
                                         "CREATE TABLE b (y INTEGER)"})
                    .is_ok());
    EXPECT_EQ(primary->executes.load(), 2);
    EXPECT_EQ(control_->executes.load(), 2);
    EXPECT_EQ(primary->commits.load(), 1);
    EXPECT_EQ(control_->commits.load(), 1);
}

TEST_F(DataStoreTest, SchemaFailureOnStandbyBackendOnlyWarns) {
    auto primary = std::make_shared<MockDatabaseControl>();
    pool_ = std::make_shared<ConnectionPool>(pool_config_,
                                             mock_factory(primary, BackendKind::PRIMARY),
                                             mock_factory(control_, BackendKind::FALLBACK));
    ASSERT_TRUE(pool_->initialize().is_ok());
    DataStore store(pool_, store_config_);

    control_->fail_connect = true;
    EXPECT_TRUE(store.initialize_schema({"CREATE TABLE a (x INTEGER)"}).is_ok());

    primary->statement_error = ErrorCode::DATABASE_ERROR;
    primary->fail_next_statements = 1;
    auto failed = store.initialize_schema({"CREATE TABLE a (x INTEGER)"});
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error()->code(), ErrorCode::DATA_ACCESS_ERROR);
}
