// include/tcrimer/strategy/strategy.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include "tcrimer/core/error.hpp"
#include "tcrimer/strategy/types.hpp"

namespace tcrimer {

enum class MovingAverageType { SIMPLE, EXPONENTIAL };

/**
 * @brief Buy when the short moving average crosses above the long one,
 * sell when it crosses back below
 */
struct MovingAverageCrossover {
    size_t short_period{20};
    size_t long_period{50};
    MovingAverageType ma_type{MovingAverageType::SIMPLE};

    static constexpr const char* kId = "ma_crossover";

    Result<void> validate() const;
    size_t warmup_bars() const {
        return long_period;
    }
    StrategySignal evaluate(const SeriesView& view, const PositionState& position) const;
    nlohmann::json params() const;
};

/**
 * @brief Buy when RSI climbs out of the oversold band, sell when it drops
 * out of the overbought band
 */
struct RsiThreshold {
    size_t period{14};
    double oversold{30.0};
    double overbought{70.0};

    static constexpr const char* kId = "rsi_threshold";

    Result<void> validate() const;
    size_t warmup_bars() const {
        return period + 2;
    }
    StrategySignal evaluate(const SeriesView& view, const PositionState& position) const;
    nlohmann::json params() const;
};

/**
 * @brief Buy when the MACD line crosses above its signal line, sell on the
 * cross below
 */
struct MacdSignal {
    size_t fast{12};
    size_t slow{26};
    size_t signal{9};

    static constexpr const char* kId = "macd_signal";

    Result<void> validate() const;
    size_t warmup_bars() const {
        return slow + signal - 1;
    }
    StrategySignal evaluate(const SeriesView& view, const PositionState& position) const;
    nlohmann::json params() const;
};

using StrategyVariant = std::variant<MovingAverageCrossover, RsiThreshold, MacdSignal>;

/**
 * @brief One evaluation interface over the strategy variants
 *
 * Evaluation is a pure function of the visible prefix and the position
 * state. A new strategy is a new alternative in StrategyVariant providing
 * validate, warmup_bars, evaluate and params.
 */
class Strategy {
public:
    Strategy() = default;
    explicit Strategy(StrategyVariant variant) : variant_(std::move(variant)) {}

    std::string id() const;

    StrategySignal evaluate(const SeriesView& view, const PositionState& position) const;

    Result<void> validate() const;

    // Bars needed before the first signal other than an insufficient-data hold
    size_t warmup_bars() const;

    nlohmann::json params() const;

    const StrategyVariant& variant() const {
        return variant_;
    }

private:
    StrategyVariant variant_;
};

}  // namespace tcrimer
