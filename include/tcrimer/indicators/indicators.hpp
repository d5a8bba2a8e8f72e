// include/tcrimer/indicators/indicators.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "tcrimer/core/error.hpp"
#include "tcrimer/core/types.hpp"

namespace tcrimer {
namespace indicators {

/**
 * @brief Indicator values aligned to the input
 *
 * values[k] belongs to input index offset + k. Indices before offset have no
 * value; nothing is zero- or null-filled.
 */
struct IndicatorSeries {
    size_t offset{0};
    std::vector<double> values;

    /**
     * @brief Value at an input index, if one is defined there
     */
    std::optional<double> at(size_t index) const {
        if (index < offset || index - offset >= values.size()) {
            return std::nullopt;
        }
        return values[index - offset];
    }

    std::optional<double> last() const {
        if (values.empty()) {
            return std::nullopt;
        }
        return values.back();
    }

    bool operator==(const IndicatorSeries& other) const {
        return offset == other.offset && values == other.values;
    }
};

/**
 * @brief Simple moving average over a window of W prices
 * @return INSUFFICIENT_DATA with fewer than W prices
 */
Result<IndicatorSeries> sma(const std::vector<double>& prices, size_t window);

/**
 * @brief Exponential moving average, alpha = 2 / (period + 1)
 *
 * Seeded with the SMA of the first `period` prices.
 */
Result<IndicatorSeries> ema(const std::vector<double>& prices, size_t period);

/**
 * @brief Relative Strength Index with Wilder smoothing, on a 0..100 scale
 *
 * The first average gain and loss are plain means over `period` changes, so
 * period + 1 prices are required. Later averages use
 * avg = (avg * (period - 1) + current) / period. A window with no losses
 * reads 100, and a completely flat window reads 50.
 */
Result<IndicatorSeries> rsi(const std::vector<double>& prices, size_t period);

struct MacdResult {
    IndicatorSeries macd;
    IndicatorSeries signal;
    IndicatorSeries histogram;
};

/**
 * @brief MACD line (EMA fast - EMA slow), its signal EMA and the histogram
 *
 * Requires fast < slow and at least slow + signal - 1 prices.
 */
Result<MacdResult> macd(const std::vector<double>& prices, size_t fast, size_t slow,
                        size_t signal);

struct BollingerBands {
    IndicatorSeries middle;
    IndicatorSeries upper;
    IndicatorSeries lower;
};

// SMA +/- num_std sample standard deviations
Result<BollingerBands> bollinger_bands(const std::vector<double>& prices, size_t window,
                                       double num_std);

/**
 * @brief Average true range as the SMA of true range; needs window + 1 bars
 */
Result<IndicatorSeries> atr(const std::vector<Bar>& bars, size_t window);

enum class IndicatorKind { SMA, EMA, RSI, MACD, BOLLINGER, ATR };

std::string indicator_kind_to_string(IndicatorKind kind);
std::optional<IndicatorKind> indicator_kind_from_string(const std::string& name);

/**
 * @brief Named indicator lines, serializable for the cache
 *
 * Single-line indicators use "value". MACD uses "macd", "signal" and
 * "histogram"; Bollinger uses "middle", "upper" and "lower".
 */
struct IndicatorOutput {
    IndicatorKind kind{IndicatorKind::SMA};
    std::map<std::string, IndicatorSeries> lines;

    nlohmann::json to_json() const;
    static Result<IndicatorOutput> from_json(const nlohmann::json& j);
};

/**
 * @brief Compute an indicator by kind
 *
 * Parameters: "period" for SMA, EMA, RSI and ATR; "fast", "slow", "signal"
 * for MACD; "period", "num_std" for Bollinger. Missing keys use the common
 * defaults (20, 20, 14, 14, 12/26/9, 20/2.0).
 */
Result<IndicatorOutput> compute_indicator(IndicatorKind kind, const nlohmann::json& params,
                                          const TimeSeries& series);

}  // namespace indicators
}  // namespace tcrimer
