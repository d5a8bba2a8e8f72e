// src/strategy/strategy_factory.cpp

#include "tcrimer/strategy/strategy_factory.hpp"

namespace tcrimer {

namespace {

template <typename T>
void read_param(const nlohmann::json& params, const char* key, T& target) {
    if (params.contains(key)) {
        target = params.at(key).get<T>();
    }
}

Result<MovingAverageType> parse_ma_type(const std::string& name) {
    if (name == "sma" || name == "simple") {
        return MovingAverageType::SIMPLE;
    }
    if (name == "ema" || name == "exponential") {
        return MovingAverageType::EXPONENTIAL;
    }
    return make_error<MovingAverageType>(ErrorCode::INVALID_ARGUMENT,
                                         "Unknown moving average type: " + name,
                                         "StrategyFactory");
}

Result<StrategyVariant> build_variant(const std::string& strategy_id,
                                      const nlohmann::json& params) {
    if (strategy_id == MovingAverageCrossover::kId) {
        MovingAverageCrossover s;
        read_param(params, "short_period", s.short_period);
        read_param(params, "long_period", s.long_period);
        if (params.contains("ma_type")) {
            auto type = parse_ma_type(params.at("ma_type").get<std::string>());
            if (type.is_error()) {
                return forward_error<StrategyVariant>(type.error());
            }
            s.ma_type = type.value();
        }
        return StrategyVariant(s);
    }
    if (strategy_id == RsiThreshold::kId) {
        RsiThreshold s;
        read_param(params, "period", s.period);
        read_param(params, "oversold", s.oversold);
        read_param(params, "overbought", s.overbought);
        return StrategyVariant(s);
    }
    if (strategy_id == MacdSignal::kId) {
        MacdSignal s;
        read_param(params, "fast", s.fast);
        read_param(params, "slow", s.slow);
        read_param(params, "signal", s.signal);
        return StrategyVariant(s);
    }
    return make_error<StrategyVariant>(ErrorCode::INVALID_ARGUMENT,
                                       "Unknown strategy: " + strategy_id, "StrategyFactory");
}

}  // namespace

Result<Strategy> create_strategy(const std::string& strategy_id, const nlohmann::json& params) {
    if (!params.is_null() && !params.is_object()) {
        return make_error<Strategy>(ErrorCode::INVALID_ARGUMENT,
                                    "Strategy parameters must be a JSON object",
                                    "StrategyFactory");
    }
    const nlohmann::json effective = params.is_null() ? nlohmann::json::object() : params;

    try {
        auto variant = build_variant(strategy_id, effective);
        if (variant.is_error()) {
            return forward_error<Strategy>(variant.error());
        }
        Strategy strategy(variant.value());
        auto valid = strategy.validate();
        if (valid.is_error()) {
            return make_error<Strategy>(ErrorCode::INVALID_ARGUMENT,
                                        strategy_id + ": " + valid.error()->what(),
                                        "StrategyFactory");
        }
        return strategy;
    } catch (const nlohmann::json::exception& e) {
        return make_error<Strategy>(ErrorCode::INVALID_ARGUMENT,
                                    "Malformed parameters for " + strategy_id + ": " + e.what(),
                                    "StrategyFactory");
    }
}

std::vector<std::string> strategy_ids() {
    return {MovingAverageCrossover::kId, RsiThreshold::kId, MacdSignal::kId};
}

std::vector<StrategyPreset> available_strategies() {
    return {
        {"MA Crossover (20/50)", MovingAverageCrossover::kId,
         {{"short_period", 20}, {"long_period", 50}, {"ma_type", "sma"}},
         "Classic moving average crossover"},
        {"MA Crossover (10/30)", MovingAverageCrossover::kId,
         {{"short_period", 10}, {"long_period", 30}, {"ma_type", "sma"}},
         "Faster moving average crossover"},
        {"MA Crossover (5/20)", MovingAverageCrossover::kId,
         {{"short_period", 5}, {"long_period", 20}, {"ma_type", "sma"}},
         "Short-term moving average crossover"},
        {"RSI (14, 70/30)", RsiThreshold::kId,
         {{"period", 14}, {"overbought", 70.0}, {"oversold", 30.0}},
         "Standard RSI mean reversion"},
        {"RSI (7, 75/25)", RsiThreshold::kId,
         {{"period", 7}, {"overbought", 75.0}, {"oversold", 25.0}},
         "Aggressive RSI mean reversion"},
        {"MACD (12/26/9)", MacdSignal::kId, {{"fast", 12}, {"slow", 26}, {"signal", 9}},
         "Standard MACD signal line cross"},
        {"MACD (8/17/9)", MacdSignal::kId, {{"fast", 8}, {"slow", 17}, {"signal", 9}},
         "Fast MACD signal line cross"},
    };
}

}  // namespace tcrimer
