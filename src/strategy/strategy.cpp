// src/strategy/strategy.cpp

#include "tcrimer/strategy/strategy.hpp"
#include <algorithm>
#include <cmath>
#include "tcrimer/indicators/indicators.hpp"

namespace tcrimer {

namespace {

StrategySignal hold(const SeriesView& view) {
    StrategySignal signal;
    if (!view.empty()) {
        signal.timestamp = view.current().timestamp;
    }
    return signal;
}

StrategySignal make_signal(const SeriesView& view, SignalAction action, double confidence) {
    StrategySignal signal;
    signal.timestamp = view.current().timestamp;
    signal.action = action;
    signal.confidence = std::clamp(confidence, 0.0, 1.0);
    return signal;
}

Result<void> invalid_params(const std::string& message) {
    return make_error<void>(ErrorCode::INVALID_ARGUMENT, message, "Strategy");
}

}  // namespace

Result<void> MovingAverageCrossover::validate() const {
    if (short_period == 0) {
        return invalid_params("short_period must be positive");
    }
    if (short_period >= long_period) {
        return invalid_params("short_period must be less than long_period");
    }
    return Result<void>();
}

StrategySignal MovingAverageCrossover::evaluate(const SeriesView& view,
                                                const PositionState& position) const {
    if (view.size() < long_period) {
        return hold(view);
    }

    const auto closes = view.closes();
    auto short_ma = ma_type == MovingAverageType::SIMPLE ? indicators::sma(closes, short_period)
                                                         : indicators::ema(closes, short_period);
    auto long_ma = ma_type == MovingAverageType::SIMPLE ? indicators::sma(closes, long_period)
                                                        : indicators::ema(closes, long_period);
    if (short_ma.is_error() || long_ma.is_error()) {
        return hold(view);
    }

    const size_t current = closes.size() - 1;
    const double short_now = *short_ma.value().at(current);
    const double long_now = *long_ma.value().at(current);
    const bool above_now = short_now > long_now;

    bool above_before = false;
    if (current > 0) {
        auto short_prev = short_ma.value().at(current - 1);
        auto long_prev = long_ma.value().at(current - 1);
        above_before = short_prev && long_prev && *short_prev > *long_prev;
    }

    const double confidence =
        long_now != 0.0 ? std::fabs(short_now - long_now) / std::fabs(long_now) / 0.01 : 0.0;

    if (!position.open && above_now && !above_before) {
        return make_signal(view, SignalAction::BUY, confidence);
    }
    if (position.open && !above_now && above_before) {
        return make_signal(view, SignalAction::SELL, confidence);
    }
    return hold(view);
}

nlohmann::json MovingAverageCrossover::params() const {
    return {{"short_period", short_period},
            {"long_period", long_period},
            {"ma_type", ma_type == MovingAverageType::SIMPLE ? "sma" : "ema"}};
}

Result<void> RsiThreshold::validate() const {
    if (period == 0) {
        return invalid_params("RSI period must be positive");
    }
    if (!(oversold > 0.0 && oversold < overbought && overbought < 100.0)) {
        return invalid_params("RSI thresholds must satisfy 0 < oversold < overbought < 100");
    }
    return Result<void>();
}

StrategySignal RsiThreshold::evaluate(const SeriesView& view,
                                      const PositionState& position) const {
    if (view.size() < 2) {
        return hold(view);
    }
    auto values = indicators::rsi(view.closes(), period);
    if (values.is_error()) {
        return hold(view);
    }

    const size_t current = view.size() - 1;
    auto now = values.value().at(current);
    auto before = values.value().at(current - 1);
    if (!now || !before) {
        return hold(view);
    }

    const double band = overbought - oversold;
    if (!position.open && *before <= oversold && *now > oversold) {
        return make_signal(view, SignalAction::BUY, (overbought - *now) / band);
    }
    if (position.open && *before >= overbought && *now < overbought) {
        return make_signal(view, SignalAction::SELL, (*now - oversold) / band);
    }
    return hold(view);
}

nlohmann::json RsiThreshold::params() const {
    return {{"period", period}, {"oversold", oversold}, {"overbought", overbought}};
}

Result<void> MacdSignal::validate() const {
    if (fast == 0 || signal == 0) {
        return invalid_params("MACD periods must be positive");
    }
    if (fast >= slow) {
        return invalid_params("MACD fast period must be less than slow period");
    }
    return Result<void>();
}

StrategySignal MacdSignal::evaluate(const SeriesView& view, const PositionState& position) const {
    if (view.size() < warmup_bars()) {
        return hold(view);
    }
    auto lines = indicators::macd(view.closes(), fast, slow, signal);
    if (lines.is_error()) {
        return hold(view);
    }

    const auto& histogram = lines.value().histogram;
    const size_t current = view.size() - 1;
    auto now = histogram.at(current);
    if (!now) {
        return hold(view);
    }
    std::optional<double> before;
    if (current > 0) {
        before = histogram.at(current - 1);
    }

    const bool above_now = *now > 0.0;
    const bool above_before = before && *before > 0.0;
    const double close = view.current().close;
    const double confidence = close != 0.0 ? std::fabs(*now) / std::fabs(close) * 100.0 : 0.0;

    if (!position.open && above_now && !above_before) {
        return make_signal(view, SignalAction::BUY, confidence);
    }
    if (position.open && !above_now && above_before) {
        return make_signal(view, SignalAction::SELL, confidence);
    }
    return hold(view);
}

nlohmann::json MacdSignal::params() const {
    return {{"fast", fast}, {"slow", slow}, {"signal", signal}};
}

std::string Strategy::id() const {
    return std::visit([](const auto& s) { return std::string(s.kId); }, variant_);
}

StrategySignal Strategy::evaluate(const SeriesView& view, const PositionState& position) const {
    return std::visit([&](const auto& s) { return s.evaluate(view, position); }, variant_);
}

Result<void> Strategy::validate() const {
    return std::visit([](const auto& s) { return s.validate(); }, variant_);
}

size_t Strategy::warmup_bars() const {
    return std::visit([](const auto& s) { return s.warmup_bars(); }, variant_);
}

nlohmann::json Strategy::params() const {
    return std::visit([](const auto& s) { return s.params(); }, variant_);
}

}  // namespace tcrimer
