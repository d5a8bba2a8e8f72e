#include <gtest/gtest.h>
#include <cmath>
#include "../core/test_base.hpp"
#include "data/test_db_utils.hpp"
#include "tcrimer/indicators/indicators.hpp"

using namespace tcrimer;
using namespace tcrimer::indicators;
using namespace tcrimer::testing;

class IndicatorsTest : public TestBase {
protected:
    static std::vector<double> ramp(size_t n, double start, double step) {
        std::vector<double> prices;
        for (size_t i = 0; i < n; ++i) {
            prices.push_back(start + step * static_cast<double>(i));
        }
        return prices;
    }
};

TEST_F(IndicatorsTest, SmaAlignsToWindowEnd) {
    auto result = sma({1, 2, 3, 4, 5}, 3);
    ASSERT_TRUE(result.is_ok());
    const auto& line = result.value();
    EXPECT_EQ(line.offset, 2u);
    ASSERT_EQ(line.values.size(), 3u);
    EXPECT_DOUBLE_EQ(line.values[0], 2.0);
    EXPECT_DOUBLE_EQ(line.values[2], 4.0);
    EXPECT_FALSE(line.at(1).has_value());
    EXPECT_DOUBLE_EQ(*line.at(4), 4.0);
    EXPECT_DOUBLE_EQ(*line.last(), 4.0);
}

TEST_F(IndicatorsTest, SmaNeedsAFullWindow) {
    auto result = sma({1, 2}, 3);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INSUFFICIENT_DATA);

    auto exact = sma({1, 2, 3}, 3);
    ASSERT_TRUE(exact.is_ok());
    EXPECT_EQ(exact.value().values.size(), 1u);
}

TEST_F(IndicatorsTest, ZeroWindowIsInvalid) {
    EXPECT_EQ(sma({1, 2, 3}, 0).error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(ema({1, 2, 3}, 0).error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(rsi({1, 2, 3}, 0).error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(IndicatorsTest, EmaIsSeededWithSma) {
    auto result = ema({2, 4, 6, 8}, 3);
    ASSERT_TRUE(result.is_ok());
    const auto& line = result.value();
    EXPECT_EQ(line.offset, 2u);
    ASSERT_EQ(line.values.size(), 2u);
    EXPECT_DOUBLE_EQ(line.values[0], 4.0);
    // alpha = 0.5
    EXPECT_DOUBLE_EQ(line.values[1], 0.5 * 8.0 + 0.5 * 4.0);
}

TEST_F(IndicatorsTest, EmaOfConstantSeriesIsConstant) {
    auto result = ema(std::vector<double>(30, 42.0), 10);
    ASSERT_TRUE(result.is_ok());
    for (double v : result.value().values) {
        EXPECT_DOUBLE_EQ(v, 42.0);
    }
}

TEST_F(IndicatorsTest, RsiOfRisingSeriesIsOneHundred) {
    auto result = rsi(ramp(30, 100, 1), 14);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().offset, 14u);
    EXPECT_EQ(result.value().values.size(), 16u);
    for (double v : result.value().values) {
        EXPECT_DOUBLE_EQ(v, 100.0);
    }
}

TEST_F(IndicatorsTest, RsiOfFallingSeriesIsZero) {
    auto result = rsi(ramp(30, 100, -1), 14);
    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(*result.value().last(), 0.0);
}

TEST_F(IndicatorsTest, RsiOfFlatSeriesIsNeutral) {
    auto result = rsi(std::vector<double>(20, 10.0), 14);
    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(*result.value().last(), 50.0);
}

TEST_F(IndicatorsTest, RsiUsesWilderSmoothing) {
    // Two changes: +2 then -1, period 1 seeds from the first change only
    auto result = rsi({10, 12, 11}, 1);
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().values.size(), 2u);
    EXPECT_DOUBLE_EQ(result.value().values[0], 100.0);
    EXPECT_DOUBLE_EQ(result.value().values[1], 0.0);

    // Period 2: avg gain 1, avg loss 0.5 after the seed
    auto smoothed = rsi({10, 12, 11, 11}, 2);
    ASSERT_TRUE(smoothed.is_ok());
    EXPECT_NEAR(smoothed.value().values[0], 100.0 - 100.0 / 3.0, 1e-9);
    // Next change 0: gain (1*1+0)/2 = 0.5, loss (0.5*1+0)/2 = 0.25
    EXPECT_NEAR(smoothed.value().values[1], 100.0 - 100.0 / 3.0, 1e-9);
}

TEST_F(IndicatorsTest, RsiValuesStayInRange) {
    std::vector<double> prices;
    for (int i = 0; i < 200; ++i) {
        prices.push_back(100.0 + 10.0 * std::sin(i * 0.3) + (i % 7));
    }
    auto result = rsi(prices, 14);
    ASSERT_TRUE(result.is_ok());
    for (double v : result.value().values) {
        EXPECT_GE(v, 0.0);
        EXPECT_LE(v, 100.0);
    }
}

TEST_F(IndicatorsTest, RsiNeedsPeriodPlusOnePrices) {
    auto result = rsi(ramp(14, 1, 1), 14);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INSUFFICIENT_DATA);
    EXPECT_TRUE(rsi(ramp(15, 1, 1), 14).is_ok());
}

TEST_F(IndicatorsTest, MacdLinesAreAligned) {
    auto prices = ramp(40, 100, 0.5);
    auto result = macd(prices, 12, 26, 9);
    ASSERT_TRUE(result.is_ok());
    const auto& m = result.value();
    EXPECT_EQ(m.macd.offset, 25u);
    EXPECT_EQ(m.signal.offset, 33u);
    EXPECT_EQ(m.histogram.offset, 33u);
    EXPECT_EQ(m.signal.values.size(), 7u);

    for (size_t i = m.signal.offset; i < prices.size(); ++i) {
        EXPECT_NEAR(*m.histogram.at(i), *m.macd.at(i) - *m.signal.at(i), 1e-12);
    }
    // Fast EMA leads on a rising series
    EXPECT_GT(*m.macd.last(), 0.0);
}

TEST_F(IndicatorsTest, MacdValidatesPeriods) {
    auto prices = ramp(100, 1, 1);
    EXPECT_EQ(macd(prices, 26, 12, 9).error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(macd(prices, 12, 26, 0).error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(macd(ramp(33, 1, 1), 12, 26, 9).error()->code(), ErrorCode::INSUFFICIENT_DATA);
    EXPECT_TRUE(macd(ramp(34, 1, 1), 12, 26, 9).is_ok());
}

TEST_F(IndicatorsTest, BollingerBandsAreSymmetric) {
    auto result = bollinger_bands({1, 2, 3, 4, 5}, 5, 2.0);
    ASSERT_TRUE(result.is_ok());
    const auto& bands = result.value();
    const double stddev = std::sqrt(2.5);
    EXPECT_DOUBLE_EQ(bands.middle.values[0], 3.0);
    EXPECT_NEAR(bands.upper.values[0], 3.0 + 2.0 * stddev, 1e-12);
    EXPECT_NEAR(bands.lower.values[0], 3.0 - 2.0 * stddev, 1e-12);
}

TEST_F(IndicatorsTest, AtrStartsAtSecondBar) {
    auto bars = make_bars_from_closes({100, 100, 100, 100});
    auto result = atr(bars, 2);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().offset, 2u);
    EXPECT_NEAR(result.value().values[0], 2.0, 1e-9);  // high - low = 1% either side
}

TEST_F(IndicatorsTest, ComputeIndicatorUsesDefaultsAndParams) {
    auto series = make_series("BTC-USD", make_linear_bars(40, 100, 1));

    auto default_sma = compute_indicator(IndicatorKind::SMA, nlohmann::json::object(), series);
    ASSERT_TRUE(default_sma.is_ok());
    EXPECT_EQ(default_sma.value().lines.at("value").offset, 19u);

    auto custom = compute_indicator(IndicatorKind::EMA, {{"period", 5}}, series);
    ASSERT_TRUE(custom.is_ok());
    EXPECT_EQ(custom.value().lines.at("value").offset, 4u);

    auto macd_out = compute_indicator(IndicatorKind::MACD, nlohmann::json::object(), series);
    ASSERT_TRUE(macd_out.is_ok());
    EXPECT_EQ(macd_out.value().lines.size(), 3u);

    auto bad = compute_indicator(IndicatorKind::SMA, {{"period", "ten"}}, series);
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(IndicatorsTest, ShortSeriesIsInsufficientData) {
    auto series = make_series("BTC-USD", make_linear_bars(10, 100, 1));
    auto result = compute_indicator(IndicatorKind::RSI, nlohmann::json::object(), series);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INSUFFICIENT_DATA);
}

TEST_F(IndicatorsTest, OutputSurvivesJsonEncoding) {
    auto series = make_series("BTC-USD", make_linear_bars(40, 100, 1));
    auto output = compute_indicator(IndicatorKind::BOLLINGER, {{"period", 10}}, series);
    ASSERT_TRUE(output.is_ok());

    auto decoded = IndicatorOutput::from_json(
        nlohmann::json::from_msgpack(nlohmann::json::to_msgpack(output.value().to_json())));
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().kind, IndicatorKind::BOLLINGER);
    EXPECT_EQ(decoded.value().lines.at("upper"), output.value().lines.at("upper"));

    auto malformed = IndicatorOutput::from_json({{"kind", "sma"}});
    ASSERT_TRUE(malformed.is_error());
    EXPECT_EQ(malformed.error()->code(), ErrorCode::CONVERSION_ERROR);
}

TEST_F(IndicatorsTest, KindNamesRoundTrip) {
    for (auto kind : {IndicatorKind::SMA, IndicatorKind::EMA, IndicatorKind::RSI,
                      IndicatorKind::MACD, IndicatorKind::BOLLINGER, IndicatorKind::ATR}) {
        EXPECT_EQ(indicator_kind_from_string(indicator_kind_to_string(kind)), kind);
    }
    EXPECT_FALSE(indicator_kind_from_string("vwap").has_value());
}
