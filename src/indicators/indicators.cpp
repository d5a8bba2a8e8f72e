// src/indicators/indicators.cpp

#include "tcrimer/indicators/indicators.hpp"
#include <algorithm>
#include <cmath>

namespace tcrimer {
namespace indicators {

namespace {

const char* const kComponent = "Indicators";

template <typename T>
Result<T> insufficient(const std::string& name, size_t needed, size_t got) {
    return make_error<T>(ErrorCode::INSUFFICIENT_DATA,
                         name + " needs " + std::to_string(needed) + " points, got " +
                             std::to_string(got),
                         kComponent);
}

template <typename T>
Result<T> invalid(const std::string& message) {
    return make_error<T>(ErrorCode::INVALID_ARGUMENT, message, kComponent);
}

double rsi_from_averages(double avg_gain, double avg_loss) {
    if (avg_loss == 0.0) {
        return avg_gain == 0.0 ? 50.0 : 100.0;
    }
    double rs = avg_gain / avg_loss;
    return 100.0 - 100.0 / (1.0 + rs);
}

size_t param_size(const nlohmann::json& params, const char* key, size_t fallback) {
    if (!params.is_object() || !params.contains(key)) {
        return fallback;
    }
    int64_t value = params.at(key).get<int64_t>();
    return value < 0 ? 0 : static_cast<size_t>(value);
}

double param_double(const nlohmann::json& params, const char* key, double fallback) {
    if (!params.is_object() || !params.contains(key)) {
        return fallback;
    }
    return params.at(key).get<double>();
}

IndicatorOutput single_line(IndicatorKind kind, IndicatorSeries series) {
    IndicatorOutput output;
    output.kind = kind;
    output.lines["value"] = std::move(series);
    return output;
}

}  // namespace

Result<IndicatorSeries> sma(const std::vector<double>& prices, size_t window) {
    if (window == 0) {
        return invalid<IndicatorSeries>("SMA window must be positive");
    }
    if (prices.size() < window) {
        return insufficient<IndicatorSeries>("SMA(" + std::to_string(window) + ")", window,
                                             prices.size());
    }

    IndicatorSeries result;
    result.offset = window - 1;
    result.values.reserve(prices.size() - window + 1);

    double sum = 0.0;
    for (size_t i = 0; i < window; ++i) {
        sum += prices[i];
    }
    result.values.push_back(sum / static_cast<double>(window));
    for (size_t i = window; i < prices.size(); ++i) {
        sum += prices[i] - prices[i - window];
        result.values.push_back(sum / static_cast<double>(window));
    }
    return result;
}

Result<IndicatorSeries> ema(const std::vector<double>& prices, size_t period) {
    if (period == 0) {
        return invalid<IndicatorSeries>("EMA period must be positive");
    }
    if (prices.size() < period) {
        return insufficient<IndicatorSeries>("EMA(" + std::to_string(period) + ")", period,
                                             prices.size());
    }

    const double alpha = 2.0 / (static_cast<double>(period) + 1.0);

    IndicatorSeries result;
    result.offset = period - 1;
    result.values.reserve(prices.size() - period + 1);

    double seed = 0.0;
    for (size_t i = 0; i < period; ++i) {
        seed += prices[i];
    }
    double value = seed / static_cast<double>(period);
    result.values.push_back(value);
    for (size_t i = period; i < prices.size(); ++i) {
        value = alpha * prices[i] + (1.0 - alpha) * value;
        result.values.push_back(value);
    }
    return result;
}

Result<IndicatorSeries> rsi(const std::vector<double>& prices, size_t period) {
    if (period == 0) {
        return invalid<IndicatorSeries>("RSI period must be positive");
    }
    if (prices.size() < period + 1) {
        return insufficient<IndicatorSeries>("RSI(" + std::to_string(period) + ")", period + 1,
                                             prices.size());
    }

    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (size_t i = 1; i <= period; ++i) {
        double change = prices[i] - prices[i - 1];
        if (change > 0) {
            avg_gain += change;
        } else {
            avg_loss -= change;
        }
    }
    avg_gain /= static_cast<double>(period);
    avg_loss /= static_cast<double>(period);

    IndicatorSeries result;
    result.offset = period;
    result.values.reserve(prices.size() - period);
    result.values.push_back(rsi_from_averages(avg_gain, avg_loss));

    const double p = static_cast<double>(period);
    for (size_t i = period + 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i - 1];
        double gain = change > 0 ? change : 0.0;
        double loss = change < 0 ? -change : 0.0;
        avg_gain = (avg_gain * (p - 1.0) + gain) / p;
        avg_loss = (avg_loss * (p - 1.0) + loss) / p;
        result.values.push_back(rsi_from_averages(avg_gain, avg_loss));
    }
    return result;
}

Result<MacdResult> macd(const std::vector<double>& prices, size_t fast, size_t slow,
                        size_t signal) {
    if (fast == 0 || signal == 0) {
        return invalid<MacdResult>("MACD periods must be positive");
    }
    if (fast >= slow) {
        return invalid<MacdResult>("MACD fast period must be shorter than slow period");
    }
    const size_t needed = slow + signal - 1;
    if (prices.size() < needed) {
        return insufficient<MacdResult>("MACD(" + std::to_string(fast) + "," +
                                            std::to_string(slow) + "," + std::to_string(signal) +
                                            ")",
                                        needed, prices.size());
    }

    auto fast_ema = ema(prices, fast);
    auto slow_ema = ema(prices, slow);
    if (fast_ema.is_error()) {
        return forward_error<MacdResult>(fast_ema.error());
    }
    if (slow_ema.is_error()) {
        return forward_error<MacdResult>(slow_ema.error());
    }

    MacdResult result;
    result.macd.offset = slow - 1;
    for (size_t i = slow - 1; i < prices.size(); ++i) {
        result.macd.values.push_back(*fast_ema.value().at(i) - *slow_ema.value().at(i));
    }

    auto signal_ema = ema(result.macd.values, signal);
    if (signal_ema.is_error()) {
        return forward_error<MacdResult>(signal_ema.error());
    }
    result.signal.offset = result.macd.offset + signal_ema.value().offset;
    result.signal.values = signal_ema.value().values;

    result.histogram.offset = result.signal.offset;
    result.histogram.values.reserve(result.signal.values.size());
    for (size_t k = 0; k < result.signal.values.size(); ++k) {
        size_t index = result.signal.offset + k;
        result.histogram.values.push_back(*result.macd.at(index) - result.signal.values[k]);
    }
    return result;
}

Result<BollingerBands> bollinger_bands(const std::vector<double>& prices, size_t window,
                                       double num_std) {
    if (window < 2) {
        return invalid<BollingerBands>("Bollinger window must be at least 2");
    }
    if (num_std < 0) {
        return invalid<BollingerBands>("Bollinger width must not be negative");
    }
    auto middle = sma(prices, window);
    if (middle.is_error()) {
        return forward_error<BollingerBands>(middle.error());
    }

    BollingerBands bands;
    bands.middle = middle.value();
    bands.upper.offset = bands.middle.offset;
    bands.lower.offset = bands.middle.offset;

    for (size_t k = 0; k < bands.middle.values.size(); ++k) {
        const double mean = bands.middle.values[k];
        double squares = 0.0;
        for (size_t i = k; i < k + window; ++i) {
            squares += (prices[i] - mean) * (prices[i] - mean);
        }
        double stddev = std::sqrt(squares / static_cast<double>(window - 1));
        bands.upper.values.push_back(mean + num_std * stddev);
        bands.lower.values.push_back(mean - num_std * stddev);
    }
    return bands;
}

Result<IndicatorSeries> atr(const std::vector<Bar>& bars, size_t window) {
    if (window == 0) {
        return invalid<IndicatorSeries>("ATR window must be positive");
    }
    if (bars.size() < window + 1) {
        return insufficient<IndicatorSeries>("ATR(" + std::to_string(window) + ")", window + 1,
                                             bars.size());
    }

    std::vector<double> true_range;
    true_range.reserve(bars.size() - 1);
    for (size_t i = 1; i < bars.size(); ++i) {
        const double prev_close = bars[i - 1].close;
        true_range.push_back(std::max({bars[i].high - bars[i].low,
                                       std::fabs(bars[i].high - prev_close),
                                       std::fabs(bars[i].low - prev_close)}));
    }

    auto averaged = sma(true_range, window);
    if (averaged.is_error()) {
        return averaged;
    }
    IndicatorSeries result = averaged.value();
    result.offset += 1;  // true range starts at the second bar
    return result;
}

std::string indicator_kind_to_string(IndicatorKind kind) {
    switch (kind) {
        case IndicatorKind::SMA:
            return "sma";
        case IndicatorKind::EMA:
            return "ema";
        case IndicatorKind::RSI:
            return "rsi";
        case IndicatorKind::MACD:
            return "macd";
        case IndicatorKind::BOLLINGER:
            return "bollinger";
        case IndicatorKind::ATR:
            return "atr";
    }
    return "unknown";
}

std::optional<IndicatorKind> indicator_kind_from_string(const std::string& name) {
    for (IndicatorKind kind : {IndicatorKind::SMA, IndicatorKind::EMA, IndicatorKind::RSI,
                               IndicatorKind::MACD, IndicatorKind::BOLLINGER, IndicatorKind::ATR}) {
        if (indicator_kind_to_string(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

nlohmann::json IndicatorOutput::to_json() const {
    nlohmann::json j;
    j["kind"] = indicator_kind_to_string(kind);
    j["lines"] = nlohmann::json::object();
    for (const auto& [name, series] : lines) {
        j["lines"][name] = {{"offset", series.offset}, {"values", series.values}};
    }
    return j;
}

Result<IndicatorOutput> IndicatorOutput::from_json(const nlohmann::json& j) {
    try {
        auto kind = indicator_kind_from_string(j.at("kind").get<std::string>());
        if (!kind) {
            return make_error<IndicatorOutput>(ErrorCode::CONVERSION_ERROR,
                                               "Unknown indicator kind", kComponent);
        }
        IndicatorOutput output;
        output.kind = *kind;
        for (const auto& [name, line] : j.at("lines").items()) {
            IndicatorSeries series;
            series.offset = line.at("offset").get<size_t>();
            series.values = line.at("values").get<std::vector<double>>();
            output.lines[name] = std::move(series);
        }
        return output;
    } catch (const nlohmann::json::exception& e) {
        return make_error<IndicatorOutput>(ErrorCode::CONVERSION_ERROR,
                                           std::string("Malformed indicator output: ") + e.what(),
                                           kComponent);
    }
}

Result<IndicatorOutput> compute_indicator(IndicatorKind kind, const nlohmann::json& params,
                                          const TimeSeries& series) {
    try {
        const std::vector<double> closes = series.closes();
        switch (kind) {
            case IndicatorKind::SMA:
            case IndicatorKind::EMA:
            case IndicatorKind::RSI: {
                size_t period = param_size(params, "period", kind == IndicatorKind::RSI ? 14 : 20);
                auto line = kind == IndicatorKind::SMA   ? sma(closes, period)
                            : kind == IndicatorKind::EMA ? ema(closes, period)
                                                         : rsi(closes, period);
                if (line.is_error()) {
                    return forward_error<IndicatorOutput>(line.error());
                }
                return single_line(kind, line.value());
            }
            case IndicatorKind::MACD: {
                auto result = macd(closes, param_size(params, "fast", 12),
                                   param_size(params, "slow", 26), param_size(params, "signal", 9));
                if (result.is_error()) {
                    return forward_error<IndicatorOutput>(result.error());
                }
                IndicatorOutput output;
                output.kind = kind;
                output.lines["macd"] = result.value().macd;
                output.lines["signal"] = result.value().signal;
                output.lines["histogram"] = result.value().histogram;
                return output;
            }
            case IndicatorKind::BOLLINGER: {
                auto result = bollinger_bands(closes, param_size(params, "period", 20),
                                              param_double(params, "num_std", 2.0));
                if (result.is_error()) {
                    return forward_error<IndicatorOutput>(result.error());
                }
                IndicatorOutput output;
                output.kind = kind;
                output.lines["middle"] = result.value().middle;
                output.lines["upper"] = result.value().upper;
                output.lines["lower"] = result.value().lower;
                return output;
            }
            case IndicatorKind::ATR: {
                auto line = atr(series.bars(), param_size(params, "period", 14));
                if (line.is_error()) {
                    return forward_error<IndicatorOutput>(line.error());
                }
                return single_line(kind, line.value());
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return invalid<IndicatorOutput>(std::string("Invalid indicator parameters: ") + e.what());
    }
    return invalid<IndicatorOutput>("Unsupported indicator kind");
}

}  // namespace indicators
}  // namespace tcrimer
