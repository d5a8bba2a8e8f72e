#include <gtest/gtest.h>
#include <stdexcept>
#include "../core/test_base.hpp"
#include "data/test_db_utils.hpp"
#include "tcrimer/strategy/strategy.hpp"

using namespace tcrimer;
using namespace tcrimer::testing;

namespace {

struct Step {
    size_t index;
    SignalAction action;
};

// Walks the series bar by bar the way the backtester does, opening on BUY
// and closing on SELL
std::vector<Step> walk(const Strategy& strategy, const TimeSeries& series) {
    std::vector<Step> steps;
    PositionState position;
    for (size_t i = 0; i < series.size(); ++i) {
        SeriesView view(series, i + 1);
        auto signal = strategy.evaluate(view, position);
        if (signal.action == SignalAction::HOLD) {
            continue;
        }
        steps.push_back({i, signal.action});
        position.open = signal.action == SignalAction::BUY;
        position.entry_price = series[i].close;
        position.entry_time = series[i].timestamp;
    }
    return steps;
}

}  // namespace

class StrategiesTest : public TestBase {};

TEST_F(StrategiesTest, SeriesViewHidesLaterBars) {
    auto series = make_series("BTC-USD", make_linear_bars(5, 100, 1));
    SeriesView view(series, 3);
    EXPECT_EQ(view.size(), 3u);
    EXPECT_DOUBLE_EQ(view.current().close, 102.0);
    EXPECT_EQ(view.closes().size(), 3u);
    EXPECT_THROW(view[3], std::out_of_range);
    EXPECT_THROW(SeriesView(series, 6), std::out_of_range);
    EXPECT_THROW(SeriesView(series, 0).current(), std::out_of_range);
}

TEST_F(StrategiesTest, CrossoverHoldsDuringWarmup) {
    Strategy strategy(MovingAverageCrossover{5, 10, MovingAverageType::SIMPLE});
    auto series = make_series("BTC-USD", make_linear_bars(9, 100, 1));
    for (size_t n = 1; n <= series.size(); ++n) {
        auto signal = strategy.evaluate(SeriesView(series, n), PositionState{});
        EXPECT_EQ(signal.action, SignalAction::HOLD);
        EXPECT_EQ(signal.timestamp, series[n - 1].timestamp);
    }
}

TEST_F(StrategiesTest, CrossoverBuysOnceOnRisingSeries) {
    Strategy strategy(MovingAverageCrossover{5, 10, MovingAverageType::SIMPLE});
    auto series = make_series("BTC-USD", make_linear_bars(30, 100, 1));

    auto steps = walk(strategy, series);
    ASSERT_EQ(steps.size(), 1u);
    EXPECT_EQ(steps[0].index, 9u);
    EXPECT_EQ(steps[0].action, SignalAction::BUY);
}

TEST_F(StrategiesTest, CrossoverSellsWhenTrendReverses) {
    std::vector<double> closes;
    for (int i = 0; i < 20; ++i) {
        closes.push_back(100.0 + i);
    }
    for (int i = 0; i < 20; ++i) {
        closes.push_back(119.0 - 2.0 * i);
    }
    Strategy strategy(MovingAverageCrossover{3, 8, MovingAverageType::SIMPLE});
    auto steps = walk(strategy, make_series("BTC-USD", make_bars_from_closes(closes)));

    ASSERT_EQ(steps.size(), 2u);
    EXPECT_EQ(steps[0].action, SignalAction::BUY);
    EXPECT_EQ(steps[1].action, SignalAction::SELL);
    EXPECT_GT(steps[1].index, 19u);
}

TEST_F(StrategiesTest, CrossoverNeverBuysWhileOpen) {
    Strategy strategy(MovingAverageCrossover{5, 10, MovingAverageType::SIMPLE});
    auto series = make_series("BTC-USD", make_linear_bars(30, 100, 1));
    PositionState open;
    open.open = true;
    open.entry_price = 100.0;
    for (size_t n = 1; n <= series.size(); ++n) {
        EXPECT_NE(strategy.evaluate(SeriesView(series, n), open).action, SignalAction::BUY);
    }
}

TEST_F(StrategiesTest, ExponentialCrossoverAlsoBuysOnRise) {
    Strategy strategy(MovingAverageCrossover{5, 10, MovingAverageType::EXPONENTIAL});
    std::vector<double> closes;
    for (int i = 0; i < 15; ++i) {
        closes.push_back(115.0 - i);
    }
    for (int i = 1; i <= 15; ++i) {
        closes.push_back(101.0 + 2.0 * i);
    }
    auto steps = walk(strategy, make_series("BTC-USD", make_bars_from_closes(closes)));
    ASSERT_FALSE(steps.empty());
    EXPECT_EQ(steps[0].action, SignalAction::BUY);
    EXPECT_GE(steps[0].index, 15u);
}

TEST_F(StrategiesTest, RsiBuysLeavingOversold) {
    Strategy strategy(RsiThreshold{2, 30.0, 70.0});
    auto series = make_series("BTC-USD", make_bars_from_closes({10, 9, 8, 7, 8}));

    auto signal = strategy.evaluate(SeriesView(series, 5), PositionState{});
    EXPECT_EQ(signal.action, SignalAction::BUY);
    EXPECT_DOUBLE_EQ(signal.confidence, 0.5);

    auto earlier = strategy.evaluate(SeriesView(series, 4), PositionState{});
    EXPECT_EQ(earlier.action, SignalAction::HOLD);
}

TEST_F(StrategiesTest, RsiSellsLeavingOverbought) {
    Strategy strategy(RsiThreshold{2, 30.0, 70.0});
    auto series = make_series("BTC-USD", make_bars_from_closes({10, 11, 12, 13, 12}));
    PositionState open;
    open.open = true;

    auto signal = strategy.evaluate(SeriesView(series, 5), open);
    EXPECT_EQ(signal.action, SignalAction::SELL);
    EXPECT_DOUBLE_EQ(signal.confidence, 0.5);

    // Flat positions never receive a sell
    EXPECT_EQ(strategy.evaluate(SeriesView(series, 5), PositionState{}).action,
              SignalAction::HOLD);
}

TEST_F(StrategiesTest, MacdFollowsTurningPoints) {
    std::vector<double> closes;
    for (int i = 0; i < 40; ++i) {
        closes.push_back(200.0 - 0.05 * i * i);
    }
    const double low = closes.back();
    for (int i = 1; i <= 20; ++i) {
        closes.push_back(low + 3.0 * i);
    }
    const double high = closes.back();
    for (int i = 1; i <= 20; ++i) {
        closes.push_back(high - 4.0 * i);
    }

    Strategy strategy(MacdSignal{12, 26, 9});
    auto steps = walk(strategy, make_series("BTC-USD", make_bars_from_closes(closes)));

    ASSERT_GE(steps.size(), 2u);
    EXPECT_EQ(steps[0].action, SignalAction::BUY);
    EXPECT_GE(steps[0].index, 40u);
    EXPECT_LT(steps[0].index, 60u);
    EXPECT_EQ(steps[1].action, SignalAction::SELL);
    EXPECT_GE(steps[1].index, 60u);
}

TEST_F(StrategiesTest, MacdHoldsBeforeSignalLineExists) {
    Strategy strategy(MacdSignal{12, 26, 9});
    auto series = make_series("BTC-USD", make_linear_bars(33, 100, 1));
    EXPECT_EQ(strategy.warmup_bars(), 34u);
    for (size_t n = 1; n <= series.size(); ++n) {
        EXPECT_EQ(strategy.evaluate(SeriesView(series, n), PositionState{}).action,
                  SignalAction::HOLD);
    }
}

TEST_F(StrategiesTest, ConfidenceIsClamped) {
    Strategy strategy(MovingAverageCrossover{2, 3, MovingAverageType::SIMPLE});
    auto series = make_series("BTC-USD", make_bars_from_closes({100, 100, 100, 100, 200}));
    auto signal = strategy.evaluate(SeriesView(series, 5), PositionState{});
    ASSERT_EQ(signal.action, SignalAction::BUY);
    EXPECT_GE(signal.confidence, 0.0);
    EXPECT_LE(signal.confidence, 1.0);
}

TEST_F(StrategiesTest, EvaluationIsDeterministic) {
    Strategy strategy(RsiThreshold{});
    std::vector<double> closes;
    for (int i = 0; i < 60; ++i) {
        closes.push_back(100.0 + ((i * 37) % 11) - 5.0);
    }
    auto series = make_series("BTC-USD", make_bars_from_closes(closes));
    for (size_t n = 1; n <= series.size(); ++n) {
        SeriesView view(series, n);
        EXPECT_EQ(strategy.evaluate(view, PositionState{}), strategy.evaluate(view, PositionState{}));
    }
}

TEST_F(StrategiesTest, WrapperDispatchesToVariant) {
    Strategy crossover(MovingAverageCrossover{});
    Strategy rsi(RsiThreshold{});
    Strategy macd(MacdSignal{});

    EXPECT_EQ(crossover.id(), "ma_crossover");
    EXPECT_EQ(rsi.id(), "rsi_threshold");
    EXPECT_EQ(macd.id(), "macd_signal");

    EXPECT_EQ(crossover.warmup_bars(), 50u);
    EXPECT_EQ(rsi.warmup_bars(), 16u);
    EXPECT_EQ(crossover.params()["ma_type"], "sma");
    EXPECT_EQ(macd.params()["slow"], 26);
    EXPECT_TRUE(std::holds_alternative<RsiThreshold>(rsi.variant()));
}

TEST_F(StrategiesTest, ValidationRejectsInconsistentParameters) {
    EXPECT_TRUE(MovingAverageCrossover{20, 50}.validate().is_ok());
    EXPECT_TRUE(MovingAverageCrossover{50, 20}.validate().is_error());
    EXPECT_TRUE(MovingAverageCrossover{0, 20}.validate().is_error());
    EXPECT_TRUE(RsiThreshold{14, 70.0, 30.0}.validate().is_error());
    EXPECT_TRUE(RsiThreshold{0, 30.0, 70.0}.validate().is_error());
    EXPECT_TRUE(RsiThreshold{14, 30.0, 100.0}.validate().is_error());
    EXPECT_TRUE(MacdSignal{26, 12, 9}.validate().is_error());
    EXPECT_TRUE(MacdSignal{12, 26, 0}.validate().is_error());
}
