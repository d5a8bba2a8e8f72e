#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <thread>
#include "../core/test_base.hpp"
#include "test_db_utils.hpp"
#include "tcrimer/data/market_data_service.hpp"

using namespace tcrimer;
using namespace tcrimer::testing;
using ::testing::_;

namespace {

class MockCollector : public UpstreamCollector {
public:
    MOCK_METHOD(Result<std::vector<Bar>>, fetch_series,
                (const std::string&, DataFrequency, const Timestamp&, const Timestamp&),
                (override));
    MOCK_METHOD(Result<Bar>, fetch_latest, (const std::string&, DataFrequency), (override));
    MOCK_METHOD(std::string, name, (), (const, override));
};

const Timestamp kDay0 = from_epoch_seconds(1704067200);  // 2024-01-01

Timestamp day(int n) {
    return kDay0 + std::chrono::hours(24) * n;
}

}  // namespace

class MarketDataServiceTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        stack_ = std::make_unique<SqliteStack>("market_data");
        ohlcv_ = std::make_shared<OhlcvStore>(stack_->store);
        cache_ = std::make_shared<CacheManager>();
        collector_ = std::make_shared<::testing::NiceMock<MockCollector>>();
        ON_CALL(*collector_, name()).WillByDefault(::testing::Return("mock"));

        config_.upstream_timeout = std::chrono::milliseconds(2000);
    }

    void TearDown() override {
        service_.reset();
        cache_.reset();
        ohlcv_.reset();
        stack_.reset();
        TestBase::TearDown();
    }

    MarketDataService& make_service(bool with_collector = true) {
        service_ = std::make_unique<MarketDataService>(
            cache_, ohlcv_, with_collector ? collector_ : nullptr, config_);
        return *service_;
    }

    std::unique_ptr<SqliteStack> stack_;
    std::shared_ptr<OhlcvStore> ohlcv_;
    std::shared_ptr<CacheManager> cache_;
    std::shared_ptr<::testing::NiceMock<MockCollector>> collector_;
    MarketDataConfig config_;
    std::unique_ptr<MarketDataService> service_;
};

TEST_F(MarketDataServiceTest, StoredSeriesIsServedThenCached) {
    ASSERT_TRUE(ohlcv_->store_bars("BTC-USD", DataFrequency::DAILY, make_linear_bars(10, 100, 1))
                    .is_ok());
    EXPECT_CALL(*collector_, fetch_series(_, _, _, _)).Times(0);
    auto& service = make_service();

    auto first = service.get_series("BTC-USD", DataFrequency::DAILY, day(0), day(9));
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value().size(), 10u);

    auto second = service.get_series("BTC-USD", DataFrequency::DAILY, day(0), day(9));
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().bars(), first.value().bars());

    auto stats = cache_->stats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.session_hits, 1u);
}

TEST_F(MarketDataServiceTest, WindowBoundsAreInclusive) {
    ASSERT_TRUE(ohlcv_->store_bars("BTC-USD", DataFrequency::DAILY, make_linear_bars(10, 100, 1))
                    .is_ok());
    auto& service = make_service(false);

    auto series = service.get_series("BTC-USD", DataFrequency::DAILY, day(2), day(5));
    ASSERT_TRUE(series.is_ok());
    ASSERT_EQ(series.value().size(), 4u);
    EXPECT_EQ(series.value().front().timestamp, day(2));
    EXPECT_EQ(series.value().back().timestamp, day(5));
}

TEST_F(MarketDataServiceTest, UpstreamBarsAreNormalizedAndPersisted) {
    // Out of order with a duplicate; the later duplicate wins
    std::vector<Bar> raw{Bar(day(2), 1, 1, 1, 12, 1), Bar(day(0), 1, 1, 1, 10, 1),
                         Bar(day(1), 1, 1, 1, 11, 1), Bar(day(2), 1, 1, 1, 13, 1)};
    EXPECT_CALL(*collector_, fetch_series("ETH-USD", DataFrequency::DAILY, _, _))
        .WillOnce([raw](const std::string&, DataFrequency, const Timestamp&, const Timestamp&) {
            return Result<std::vector<Bar>>(raw);
        });
    auto& service = make_service();

    auto series = service.get_series("ETH-USD", DataFrequency::DAILY, day(0), day(5));
    ASSERT_TRUE(series.is_ok());
    ASSERT_EQ(series.value().size(), 3u);
    EXPECT_DOUBLE_EQ(series.value()[2].close, 13.0);

    auto stored = ohlcv_->load_bars("ETH-USD", DataFrequency::DAILY, day(0), day(5));
    ASSERT_TRUE(stored.is_ok());
    EXPECT_EQ(stored.value().size(), 3u);
}

TEST_F(MarketDataServiceTest, UpstreamFailureIsReturnedAndNotCached) {
    EXPECT_CALL(*collector_, fetch_series(_, _, _, _))
        .Times(2)
        .WillRepeatedly([](const std::string&, DataFrequency, const Timestamp&, const Timestamp&) {
            return make_error<std::vector<Bar>>(ErrorCode::UPSTREAM_ERROR, "feed down", "mock");
        });
    auto& service = make_service();

    for (int i = 0; i < 2; ++i) {
        auto series = service.get_series("SOL-USD", DataFrequency::DAILY, day(0), day(5));
        ASSERT_TRUE(series.is_error());
        EXPECT_EQ(series.error()->code(), ErrorCode::UPSTREAM_ERROR);
    }
    EXPECT_EQ(cache_->stats().session_entries, 0u);
}

TEST_F(MarketDataServiceTest, EmptyResultsAreNotCached) {
    auto& service = make_service(false);
    auto series = service.get_series("NONE", DataFrequency::DAILY, day(0), day(5));
    ASSERT_TRUE(series.is_ok());
    EXPECT_TRUE(series.value().empty());
    EXPECT_FALSE(cache_->contains(
        MarketDataService::series_key("NONE", DataFrequency::DAILY, day(0), day(5)),
        CacheTier::SESSION));
}

TEST_F(MarketDataServiceTest, SlowUpstreamTimesOut) {
    config_.upstream_timeout = std::chrono::milliseconds(20);
    EXPECT_CALL(*collector_, fetch_series(_, _, _, _))
        .WillOnce([](const std::string&, DataFrequency, const Timestamp&, const Timestamp&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            return Result<std::vector<Bar>>(std::vector<Bar>{});
        });
    auto& service = make_service();

    auto series = service.get_series("SLOW", DataFrequency::DAILY, day(0), day(5));
    ASSERT_TRUE(series.is_error());
    EXPECT_EQ(series.error()->code(), ErrorCode::TIMEOUT_ERROR);
}

TEST_F(MarketDataServiceTest, InvalidRequestIsRejected) {
    auto& service = make_service(false);
    auto reversed = service.get_series("BTC-USD", DataFrequency::DAILY, day(5), day(0));
    ASSERT_TRUE(reversed.is_error());
    EXPECT_EQ(reversed.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto unnamed = service.get_series("", DataFrequency::DAILY, day(0), day(5));
    ASSERT_TRUE(unnamed.is_error());
    EXPECT_EQ(unnamed.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(MarketDataServiceTest, NewBarInvalidatesEveryCachedView) {
    ASSERT_TRUE(ohlcv_->store_bars("BTC-USD", DataFrequency::DAILY, make_linear_bars(30, 100, 1))
                    .is_ok());
    auto& service = make_service(false);

    IndicatorQuery query;
    query.kind = indicators::IndicatorKind::SMA;
    query.symbol = "BTC-USD";
    query.start = day(0);
    query.end = day(40);
    query.params = {{"period", 5}};

    ASSERT_TRUE(service.get_indicator(query).is_ok());
    ASSERT_TRUE(service.get_latest("BTC-USD", DataFrequency::DAILY).is_ok());
    const auto series_key = MarketDataService::series_key("BTC-USD", DataFrequency::DAILY,
                                                          day(0), day(40));
    ASSERT_TRUE(cache_->contains(series_key, CacheTier::SESSION));

    ASSERT_TRUE(service.on_new_bar("BTC-USD", DataFrequency::DAILY, Bar(day(30), 1, 1, 1, 500, 1))
                    .is_ok());
    EXPECT_FALSE(cache_->contains(series_key, CacheTier::SESSION));
    EXPECT_FALSE(cache_->contains(MarketDataService::latest_key("BTC-USD", DataFrequency::DAILY),
                                  CacheTier::MEMORY));
    EXPECT_FALSE(cache_->contains(MarketDataService::indicator_key(query, 30), CacheTier::MEMORY));

    auto refreshed = service.get_series("BTC-USD", DataFrequency::DAILY, day(0), day(40));
    ASSERT_TRUE(refreshed.is_ok());
    EXPECT_EQ(refreshed.value().size(), 31u);
    EXPECT_DOUBLE_EQ(refreshed.value().back().close, 500.0);

    auto latest = service.get_latest("BTC-USD", DataFrequency::DAILY);
    ASSERT_TRUE(latest.is_ok());
    EXPECT_DOUBLE_EQ(latest.value().close, 500.0);
}

TEST_F(MarketDataServiceTest, IndicatorIsMemoized) {
    ASSERT_TRUE(ohlcv_->store_bars("BTC-USD", DataFrequency::DAILY, make_linear_bars(20, 100, 1))
                    .is_ok());
    auto& service = make_service(false);

    IndicatorQuery query;
    query.kind = indicators::IndicatorKind::SMA;
    query.symbol = "BTC-USD";
    query.start = day(0);
    query.end = day(19);
    query.params = {{"period", 5}};

    auto first = service.get_indicator(query);
    ASSERT_TRUE(first.is_ok());
    const auto& line = first.value().lines.at("value");
    EXPECT_EQ(line.offset, 4u);
    EXPECT_DOUBLE_EQ(line.values.front(), 102.0);

    auto second = service.get_indicator(query);
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().lines.at("value"), line);
    EXPECT_TRUE(cache_->contains(MarketDataService::indicator_key(query, 20), CacheTier::MEMORY));
}

TEST_F(MarketDataServiceTest, ShortWindowIsInsufficientData) {
    ASSERT_TRUE(ohlcv_->store_bars("BTC-USD", DataFrequency::DAILY, make_linear_bars(3, 100, 1))
                    .is_ok());
    auto& service = make_service(false);

    IndicatorQuery query;
    query.kind = indicators::IndicatorKind::RSI;
    query.symbol = "BTC-USD";
    query.start = day(0);
    query.end = day(2);

    auto result = service.get_indicator(query);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INSUFFICIENT_DATA);
}

TEST_F(MarketDataServiceTest, LatestFallsBackToUpstreamThenNotFound) {
    EXPECT_CALL(*collector_, fetch_latest("DOGE", DataFrequency::DAILY))
        .WillOnce([](const std::string&, DataFrequency) {
            return Result<Bar>(Bar(day(3), 1, 1, 1, 0.1, 5));
        });
    auto& service = make_service();

    auto latest = service.get_latest("DOGE", DataFrequency::DAILY);
    ASSERT_TRUE(latest.is_ok());
    EXPECT_DOUBLE_EQ(latest.value().close, 0.1);

    MarketDataService storage_only(cache_, ohlcv_, nullptr, config_);
    auto missing = storage_only.get_latest("NONE", DataFrequency::DAILY);
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::DATA_NOT_FOUND);
}
