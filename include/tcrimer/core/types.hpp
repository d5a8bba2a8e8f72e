// include/tcrimer/core/types.hpp

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "tcrimer/core/error.hpp"

namespace tcrimer {

/**
 * @brief Timestamp type for consistent time representation
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Quantity type, fractional for crypto assets
 */
using Quantity = double;

/**
 * @brief Bar frequencies served by the market data layer
 */
enum class DataFrequency { MINUTE_1, MINUTE_5, MINUTE_15, HOURLY, DAILY };

/**
 * @brief Market data bar structure
 * Represents OHLCV data for any timeframe
 */
struct Bar {
    Timestamp timestamp;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};

    Bar() = default;
    Bar(Timestamp ts, Price o, Price h, Price l, Price c, double v)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v) {}

    bool operator==(const Bar& other) const {
        return timestamp == other.timestamp && open == other.open && high == other.high &&
               low == other.low && close == other.close && volume == other.volume;
    }
};

// Timeframe labels as stored in the ohlcv_bars table ("1m", "5m", "15m", "1h", "1d")
std::string timeframe_to_string(DataFrequency freq);
std::optional<DataFrequency> timeframe_from_string(const std::string& label);

/**
 * @brief Bars per year for annualization. Crypto markets trade around the clock.
 */
int periods_per_year(DataFrequency freq);

std::chrono::seconds bar_interval(DataFrequency freq);

// Epoch-second conversions used by the storage layer
int64_t to_epoch_seconds(const Timestamp& ts);
Timestamp from_epoch_seconds(int64_t seconds);

/**
 * @brief Ordered OHLCV series for one symbol and timeframe
 *
 * Timestamps are strictly increasing with no duplicates. Gaps are allowed and
 * are never filled.
 */
class TimeSeries {
public:
    TimeSeries() = default;
    TimeSeries(std::string symbol, DataFrequency freq)
        : symbol_(std::move(symbol)), frequency_(freq) {}

    /**
     * @brief Build a series from bars that must already be strictly increasing
     * @return INVALID_DATA if ordering is violated
     */
    static Result<TimeSeries> from_bars(const std::string& symbol, DataFrequency freq,
                                        std::vector<Bar> bars);

    /**
     * @brief Build a series from bars in arbitrary order
     *
     * Sorts by timestamp. On duplicate timestamps the bar appearing last in
     * the input wins.
     */
    static TimeSeries normalized(const std::string& symbol, DataFrequency freq,
                                 std::vector<Bar> bars);

    /**
     * @brief Append a bar newer than the current last bar
     */
    Result<void> append(const Bar& bar);

    /**
     * @brief Bars with start <= timestamp <= end
     */
    TimeSeries slice(const Timestamp& start, const Timestamp& end) const;

    std::vector<double> closes() const;

    const std::string& symbol() const {
        return symbol_;
    }
    DataFrequency frequency() const {
        return frequency_;
    }
    const std::vector<Bar>& bars() const {
        return bars_;
    }
    size_t size() const {
        return bars_.size();
    }
    bool empty() const {
        return bars_.empty();
    }
    const Bar& operator[](size_t index) const {
        return bars_[index];
    }
    const Bar& front() const {
        return bars_.front();
    }
    const Bar& back() const {
        return bars_.back();
    }

    /**
     * @brief "<symbol>:<timeframe>", the identity part of memoization keys
     */
    std::string identity() const;

private:
    std::string symbol_;
    DataFrequency frequency_{DataFrequency::DAILY};
    std::vector<Bar> bars_;
};

}  // namespace tcrimer
