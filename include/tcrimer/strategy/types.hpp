// include/tcrimer/strategy/types.hpp
#pragma once

#include <string>
#include <vector>
#include "tcrimer/core/types.hpp"

namespace tcrimer {

enum class SignalAction { BUY, SELL, HOLD };

std::string signal_action_to_string(SignalAction action);

/**
 * @brief Output of one strategy evaluation step
 */
struct StrategySignal {
    Timestamp timestamp;
    SignalAction action{SignalAction::HOLD};
    double confidence{0.0};  // [0, 1]

    bool operator==(const StrategySignal& other) const {
        return timestamp == other.timestamp && action == other.action &&
               confidence == other.confidence;
    }
};

/**
 * @brief Open-position state passed into every evaluation
 */
struct PositionState {
    bool open{false};
    Timestamp entry_time;
    Price entry_price{0.0};
    Quantity quantity{0.0};
};

/**
 * @brief Read-only prefix of a series, up to and including the current bar
 *
 * Strategies receive only this view, so bars after the evaluation point are
 * unreachable.
 */
class SeriesView {
public:
    /**
     * @throws std::out_of_range if length exceeds the series size
     */
    SeriesView(const TimeSeries& series, size_t length);

    size_t size() const {
        return length_;
    }
    bool empty() const {
        return length_ == 0;
    }

    /**
     * @throws std::out_of_range for an index at or beyond size()
     */
    const Bar& operator[](size_t index) const;

    const Bar& current() const;

    std::vector<double> closes() const;

    const std::string& symbol() const {
        return series_.symbol();
    }
    DataFrequency frequency() const {
        return series_.frequency();
    }

private:
    const TimeSeries& series_;
    size_t length_;
};

}  // namespace tcrimer
