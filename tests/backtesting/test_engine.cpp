#include <gtest/gtest.h>
#include <cmath>
#include <mutex>
#include "../core/test_base.hpp"
#include "data/test_db_utils.hpp"
#include "tcrimer/backtest/backtest_engine.hpp"
#include "tcrimer/strategy/strategy_factory.hpp"

using namespace tcrimer;
using namespace tcrimer::testing;

namespace {

const Timestamp kDay0 = from_epoch_seconds(1704067200);  // 2024-01-01

Timestamp day(int n) {
    return kDay0 + std::chrono::hours(24) * n;
}

BacktestRequest crossover_request(int last_day = 29) {
    BacktestRequest request;
    request.strategy_id = "ma_crossover";
    request.symbol = "BTC-USD";
    request.start = day(0);
    request.end = day(last_day);
    request.params = {{"short_period", 5}, {"long_period", 10}};
    return request;
}

}  // namespace

class BacktestEngineTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        stack_ = std::make_unique<SqliteStack>("engine");
        ohlcv_ = std::make_shared<OhlcvStore>(stack_->store);
        results_ = std::make_shared<BacktestResultsManager>(stack_->store);
        market_data_ = std::make_shared<MarketDataService>(std::make_shared<CacheManager>(),
                                                           ohlcv_, nullptr);
    }

    void TearDown() override {
        market_data_.reset();
        results_.reset();
        ohlcv_.reset();
        stack_.reset();
        TestBase::TearDown();
    }

    void store_linear_bars() {
        ASSERT_TRUE(
            ohlcv_->store_bars("BTC-USD", DataFrequency::DAILY, make_linear_bars(30, 100, 1))
                .is_ok());
    }

    std::unique_ptr<SqliteStack> stack_;
    std::shared_ptr<OhlcvStore> ohlcv_;
    std::shared_ptr<BacktestResultsManager> results_;
    std::shared_ptr<MarketDataService> market_data_;
};

TEST_F(BacktestEngineTest, CrossoverOnRisingSeries) {
    store_linear_bars();
    BacktestEngine engine(market_data_, results_);

    auto result = engine.run(crossover_request());
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    const auto& r = result.value();

    EXPECT_FALSE(r.from_store);
    EXPECT_EQ(r.strategy_id, "ma_crossover");
    EXPECT_EQ(r.symbol, "BTC-USD");

    // One entry where the long average first exists, closed on the last bar
    ASSERT_EQ(r.trades.size(), 1u);
    EXPECT_EQ(r.trades[0].entry_time, day(9));
    EXPECT_DOUBLE_EQ(r.trades[0].entry_price, 109.0);
    EXPECT_EQ(r.trades[0].exit_time, day(29));
    EXPECT_DOUBLE_EQ(r.trades[0].exit_price, 129.0);
    EXPECT_DOUBLE_EQ(r.trades[0].pnl, 20.0);

    ASSERT_EQ(r.signals.size(), 1u);
    EXPECT_EQ(r.signals[0].action, SignalAction::BUY);

    ASSERT_EQ(r.equity_curve.size(), 30u);
    EXPECT_DOUBLE_EQ(r.equity_curve[8].second, 1.0);
    EXPECT_NEAR(r.equity_curve.back().second, 129.0 / 109.0, 1e-12);

    EXPECT_NEAR(r.metrics.total_return_pct, 20.0 / 109.0, 1e-12);
    EXPECT_DOUBLE_EQ(r.metrics.max_drawdown_pct, 0.0);
    EXPECT_EQ(r.metrics.total_trades, 1u);
    EXPECT_DOUBLE_EQ(r.metrics.win_rate, 1.0);
    EXPECT_FALSE(r.metrics.sharpe_ratio.has_value());
    EXPECT_FALSE(r.metrics.profit_factor.has_value());
    EXPECT_EQ(r.metrics.bars_processed, 30u);
}

TEST_F(BacktestEngineTest, OpenPositionIsKeptWhenCloseAtEndIsOff) {
    store_linear_bars();
    BacktestConfig config;
    config.close_at_end = false;
    config.persist_results = false;
    BacktestEngine engine(market_data_, results_, config);

    auto result = engine.run(crossover_request());
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().trades.empty());
    EXPECT_DOUBLE_EQ(result.value().metrics.total_return_pct, 0.0);
    EXPECT_NEAR(result.value().equity_curve.back().second, 129.0 / 109.0, 1e-12);
}

TEST_F(BacktestEngineTest, IdenticalInputsGiveIdenticalTrades) {
    auto strategy = create_strategy("ma_crossover", {{"short_period", 3}, {"long_period", 8}});
    ASSERT_TRUE(strategy.is_ok());

    std::vector<double> closes;
    for (int i = 0; i < 60; ++i) {
        closes.push_back(100.0 + 10.0 * std::sin(i / 5.0));
    }
    auto series = make_series("BTC-USD", make_bars_from_closes(closes));
    auto request = crossover_request(59);

    BacktestEngine engine(nullptr, nullptr);
    auto first = engine.simulate(strategy.value(), series, request);
    auto second = engine.simulate(strategy.value(), series, request);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    EXPECT_GT(first.value().trades.size(), 1u);
    EXPECT_EQ(first.value().trades, second.value().trades);
    EXPECT_EQ(first.value().equity_curve, second.value().equity_curve);
    EXPECT_EQ(first.value().metrics.total_return_pct, second.value().metrics.total_return_pct);
}

TEST_F(BacktestEngineTest, ResultIsPersistedAndReused) {
    store_linear_bars();
    BacktestEngine engine(market_data_, results_);

    auto fresh = engine.run(crossover_request());
    ASSERT_TRUE(fresh.is_ok());

    auto stored = results_->load("ma_crossover", "BTC-USD", day(0), day(29));
    ASSERT_TRUE(stored.is_ok());
    ASSERT_TRUE(stored.value().has_value());
    EXPECT_EQ(stored.value()->trades, fresh.value().trades);

    auto again = engine.run(crossover_request());
    ASSERT_TRUE(again.is_ok());
    EXPECT_TRUE(again.value().from_store);
    EXPECT_EQ(again.value().trades, fresh.value().trades);
    EXPECT_DOUBLE_EQ(again.value().metrics.total_return_pct,
                     fresh.value().metrics.total_return_pct);
}

TEST_F(BacktestEngineTest, StoredResultWithOtherParamsIsNotReused) {
    store_linear_bars();
    BacktestEngine engine(market_data_, results_);
    ASSERT_TRUE(engine.run(crossover_request()).is_ok());

    auto request = crossover_request();
    request.position_size = 2.0;
    auto rerun = engine.run(request);
    ASSERT_TRUE(rerun.is_ok());
    EXPECT_FALSE(rerun.value().from_store);
    ASSERT_EQ(rerun.value().trades.size(), 1u);
    EXPECT_DOUBLE_EQ(rerun.value().trades[0].pnl, 40.0);
}

TEST_F(BacktestEngineTest, StoredResultIsNotReusedAfterNewBarInWindow) {
    store_linear_bars();
    BacktestEngine engine(market_data_, results_);
    auto request = crossover_request(31);

    auto first = engine.run(request);
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value().metrics.bars_processed, 30u);

    ASSERT_TRUE(market_data_
                    ->on_new_bar("BTC-USD", DataFrequency::DAILY,
                                 Bar(day(30), 130.0, 131.3, 128.7, 130.0, 1030.0))
                    .is_ok());

    auto rerun = engine.run(request);
    ASSERT_TRUE(rerun.is_ok());
    EXPECT_FALSE(rerun.value().from_store);
    EXPECT_EQ(rerun.value().metrics.bars_processed, 31u);
    ASSERT_EQ(rerun.value().trades.size(), 1u);
    EXPECT_DOUBLE_EQ(rerun.value().trades[0].exit_price, 130.0);

    auto again = engine.run(request);
    ASSERT_TRUE(again.is_ok());
    EXPECT_TRUE(again.value().from_store);
}

TEST_F(BacktestEngineTest, StopLossExitsBeforeTheStrategySignal) {
    auto strategy = create_strategy("ma_crossover", {{"short_period", 2}, {"long_period", 3}});
    ASSERT_TRUE(strategy.is_ok());
    auto series =
        make_series("BTC-USD", make_bars_from_closes({100, 100, 110, 104, 104, 104}));
    BacktestEngine engine(nullptr, nullptr);

    auto request = crossover_request(5);
    auto plain = engine.simulate(strategy.value(), series, request);
    ASSERT_TRUE(plain.is_ok());
    ASSERT_EQ(plain.value().trades.size(), 1u);
    EXPECT_EQ(plain.value().trades[0].exit_time, day(4));

    request.stop_loss_pct = 0.05;  // stop at 104.5
    auto stopped = engine.simulate(strategy.value(), series, request);
    ASSERT_TRUE(stopped.is_ok());
    ASSERT_EQ(stopped.value().trades.size(), 1u);
    EXPECT_EQ(stopped.value().trades[0].entry_time, day(2));
    EXPECT_EQ(stopped.value().trades[0].exit_time, day(3));
    EXPECT_DOUBLE_EQ(stopped.value().trades[0].exit_price, 104.0);
    EXPECT_DOUBLE_EQ(stopped.value().trades[0].pnl, -6.0);
    ASSERT_EQ(stopped.value().signals.size(), 1u);
    EXPECT_EQ(stopped.value().signals[0].action, SignalAction::BUY);
}

TEST_F(BacktestEngineTest, MetricsCompareAgainstBuyAndHold) {
    auto strategy = create_strategy("ma_crossover", {{"short_period", 2}, {"long_period", 3}});
    ASSERT_TRUE(strategy.is_ok());
    auto series =
        make_series("BTC-USD", make_bars_from_closes({100, 100, 110, 104, 104, 104}));
    BacktestEngine engine(nullptr, nullptr);

    auto result = engine.simulate(strategy.value(), series, crossover_request(5));
    ASSERT_TRUE(result.is_ok());
    const auto& m = result.value().metrics;
    EXPECT_NEAR(m.market_return_pct, 0.04, 1e-12);
    EXPECT_NEAR(m.total_return_pct, 104.0 / 110.0 - 1.0, 1e-12);
    EXPECT_NEAR(m.outperformance_pct, m.total_return_pct - 0.04, 1e-12);
}

TEST_F(BacktestEngineTest, InvalidRequestsAreRejected) {
    BacktestEngine engine(market_data_, results_);

    auto no_symbol = crossover_request();
    no_symbol.symbol.clear();
    auto inverted = crossover_request();
    inverted.end = inverted.start;
    auto no_size = crossover_request();
    no_size.position_size = 0.0;
    auto unknown = crossover_request();
    unknown.strategy_id = "buy_and_pray";
    auto bad_params = crossover_request();
    bad_params.params = {{"short_period", 20}, {"long_period", 10}};
    auto zero_stop = crossover_request();
    zero_stop.stop_loss_pct = 0.0;
    auto full_stop = crossover_request();
    full_stop.stop_loss_pct = 1.0;

    for (const auto& request :
         {no_symbol, inverted, no_size, unknown, bad_params, zero_stop, full_stop}) {
        auto result = engine.run(request);
        ASSERT_TRUE(result.is_error());
        EXPECT_EQ(result.error()->code(), ErrorCode::BACKTEST_INVALID_PARAMS);
        EXPECT_EQ(failure_reason_from_error(result.error()->code()),
                  FailureReason::INVALID_PARAMS);
    }
}

TEST_F(BacktestEngineTest, CancelledRunFails) {
    store_linear_bars();
    BacktestEngine engine(market_data_, results_);
    CancellationToken cancel;
    cancel.cancel();

    auto result = engine.run(crossover_request(), &cancel);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::BACKTEST_CANCELLED);

    auto stored = results_->load("ma_crossover", "BTC-USD", day(0), day(29));
    ASSERT_TRUE(stored.is_ok());
    EXPECT_FALSE(stored.value().has_value());
}

TEST_F(BacktestEngineTest, CancellationIsCheckedBetweenBars) {
    auto strategy = create_strategy("rsi_threshold", nlohmann::json::object());
    ASSERT_TRUE(strategy.is_ok());
    BacktestEngine engine(nullptr, nullptr);
    CancellationToken cancel;
    cancel.cancel();

    auto result = engine.simulate(strategy.value(),
                                  make_series("BTC-USD", make_linear_bars(20, 1, 1)),
                                  crossover_request(19), &cancel);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::BACKTEST_CANCELLED);
}

TEST_F(BacktestEngineTest, ExpiredDeadlineTimesOut) {
    auto strategy = create_strategy("ma_crossover", nlohmann::json::object());
    ASSERT_TRUE(strategy.is_ok());
    BacktestEngine engine(nullptr, nullptr);

    auto result = engine.simulate(strategy.value(),
                                  make_series("BTC-USD", make_linear_bars(20, 100, 1)),
                                  crossover_request(19), nullptr,
                                  std::chrono::steady_clock::now() - std::chrono::seconds(1));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::BACKTEST_TIMEOUT);
    EXPECT_EQ(failure_reason_from_error(result.error()->code()), FailureReason::TIMEOUT);
}

TEST_F(BacktestEngineTest, NonPositiveCloseIsADataFault) {
    auto strategy = create_strategy("ma_crossover", nlohmann::json::object());
    ASSERT_TRUE(strategy.is_ok());
    BacktestEngine engine(nullptr, nullptr);

    auto result = engine.simulate(
        strategy.value(), make_series("BTC-USD", make_bars_from_closes({100, 101, 0, 102})),
        crossover_request(3));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::BACKTEST_DATA_FAULT);
}

TEST_F(BacktestEngineTest, StorageFailureIsADataFault) {
    store_linear_bars();
    BacktestEngine engine(market_data_, results_);
    stack_->pool->shutdown();

    auto result = engine.run(crossover_request());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::BACKTEST_DATA_FAULT);
    EXPECT_EQ(failure_reason_from_error(result.error()->code()), FailureReason::DATA_FAULT);
}

TEST_F(BacktestEngineTest, EmptyWindowCompletesWithoutTrades) {
    BacktestConfig config;
    config.persist_results = false;
    BacktestEngine engine(market_data_, results_, config);

    auto result = engine.run(crossover_request());
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().trades.empty());
    EXPECT_EQ(result.value().metrics.bars_processed, 0u);
}

TEST_F(BacktestEngineTest, OutcomesArePublished) {
    store_linear_bars();
    auto bus = std::make_shared<EventBus>();
    std::mutex mutex;
    std::vector<MonitoringEvent> events;
    ASSERT_TRUE(bus->subscribe({"test",
                                {MonitoringEventType::BACKTEST_OUTCOME},
                                [&](const MonitoringEvent& e) {
                                    std::lock_guard<std::mutex> lock(mutex);
                                    events.push_back(e);
                                }})
                    .is_ok());

    BacktestEngine engine(market_data_, results_, BacktestConfig{}, bus);
    ASSERT_TRUE(engine.run(crossover_request()).is_ok());
    auto unknown = crossover_request();
    unknown.strategy_id = "nope";
    ASSERT_TRUE(engine.run(unknown).is_error());
    bus->flush();

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].string_fields.at("state"), "COMPLETED");
    EXPECT_DOUBLE_EQ(events[0].numeric_fields.at("total_trades"), 1.0);
    EXPECT_EQ(events[1].string_fields.at("state"), "FAILED");
    EXPECT_EQ(events[1].string_fields.at("reason"), "INVALID_PARAMS");
}
