// src/core/types.cpp

#include "tcrimer/core/types.hpp"
#include <algorithm>

namespace tcrimer {

std::string timeframe_to_string(DataFrequency freq) {
    switch (freq) {
        case DataFrequency::MINUTE_1:
            return "1m";
        case DataFrequency::MINUTE_5:
            return "5m";
        case DataFrequency::MINUTE_15:
            return "15m";
        case DataFrequency::HOURLY:
            return "1h";
        case DataFrequency::DAILY:
            return "1d";
    }
    return "1d";
}

std::optional<DataFrequency> timeframe_from_string(const std::string& label) {
    if (label == "1m")
        return DataFrequency::MINUTE_1;
    if (label == "5m")
        return DataFrequency::MINUTE_5;
    if (label == "15m")
        return DataFrequency::MINUTE_15;
    if (label == "1h")
        return DataFrequency::HOURLY;
    if (label == "1d")
        return DataFrequency::DAILY;
    return std::nullopt;
}

int periods_per_year(DataFrequency freq) {
    switch (freq) {
        case DataFrequency::MINUTE_1:
            return 525600;
        case DataFrequency::MINUTE_5:
            return 105120;
        case DataFrequency::MINUTE_15:
            return 35040;
        case DataFrequency::HOURLY:
            return 8760;
        case DataFrequency::DAILY:
            return 365;
    }
    return 365;
}

std::chrono::seconds bar_interval(DataFrequency freq) {
    switch (freq) {
        case DataFrequency::MINUTE_1:
            return std::chrono::seconds(60);
        case DataFrequency::MINUTE_5:
            return std::chrono::seconds(300);
        case DataFrequency::MINUTE_15:
            return std::chrono::seconds(900);
        case DataFrequency::HOURLY:
            return std::chrono::seconds(3600);
        case DataFrequency::DAILY:
            return std::chrono::seconds(86400);
    }
    return std::chrono::seconds(86400);
}

int64_t to_epoch_seconds(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

Timestamp from_epoch_seconds(int64_t seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

Result<TimeSeries> TimeSeries::from_bars(const std::string& symbol, DataFrequency freq,
                                         std::vector<Bar> bars) {
    for (size_t i = 1; i < bars.size(); ++i) {
        if (bars[i].timestamp <= bars[i - 1].timestamp) {
            return make_error<TimeSeries>(
                ErrorCode::INVALID_DATA,
                "Bars for " + symbol + " are not strictly increasing at index " +
                    std::to_string(i),
                "TimeSeries");
        }
    }
    TimeSeries series(symbol, freq);
    series.bars_ = std::move(bars);
    return series;
}

TimeSeries TimeSeries::normalized(const std::string& symbol, DataFrequency freq,
                                  std::vector<Bar> bars) {
    std::stable_sort(bars.begin(), bars.end(),
                     [](const Bar& a, const Bar& b) { return a.timestamp < b.timestamp; });

    TimeSeries series(symbol, freq);
    series.bars_.reserve(bars.size());
    for (const auto& bar : bars) {
        if (!series.bars_.empty() && series.bars_.back().timestamp == bar.timestamp) {
            series.bars_.back() = bar;
        } else {
            series.bars_.push_back(bar);
        }
    }
    return series;
}

Result<void> TimeSeries::append(const Bar& bar) {
    if (!bars_.empty() && bar.timestamp <= bars_.back().timestamp) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Bar for " + symbol_ + " is not newer than the last bar",
                                "TimeSeries");
    }
    bars_.push_back(bar);
    return Result<void>();
}

TimeSeries TimeSeries::slice(const Timestamp& start, const Timestamp& end) const {
    TimeSeries out(symbol_, frequency_);
    auto first = std::lower_bound(
        bars_.begin(), bars_.end(), start,
        [](const Bar& bar, const Timestamp& ts) { return bar.timestamp < ts; });
    auto last = std::upper_bound(
        bars_.begin(), bars_.end(), end,
        [](const Timestamp& ts, const Bar& bar) { return ts < bar.timestamp; });
    if (first < last) {
        out.bars_.assign(first, last);
    }
    return out;
}

std::vector<double> TimeSeries::closes() const {
    std::vector<double> out;
    out.reserve(bars_.size());
    for (const auto& bar : bars_) {
        out.push_back(bar.close);
    }
    return out;
}

std::string TimeSeries::identity() const {
    return symbol_ + ":" + timeframe_to_string(frequency_);
}

}  // namespace tcrimer
