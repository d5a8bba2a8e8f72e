// src/strategy/types.cpp

#include "tcrimer/strategy/types.hpp"
#include <stdexcept>

namespace tcrimer {

std::string signal_action_to_string(SignalAction action) {
    switch (action) {
        case SignalAction::BUY:
            return "buy";
        case SignalAction::SELL:
            return "sell";
        case SignalAction::HOLD:
            return "hold";
    }
    return "hold";
}

SeriesView::SeriesView(const TimeSeries& series, size_t length) : series_(series), length_(length) {
    if (length > series.size()) {
        throw std::out_of_range("SeriesView length " + std::to_string(length) +
                                " exceeds series size " + std::to_string(series.size()));
    }
}

const Bar& SeriesView::operator[](size_t index) const {
    if (index >= length_) {
        throw std::out_of_range("Bar " + std::to_string(index) + " is beyond the visible prefix");
    }
    return series_[index];
}

const Bar& SeriesView::current() const {
    if (length_ == 0) {
        throw std::out_of_range("Empty series view has no current bar");
    }
    return series_[length_ - 1];
}

std::vector<double> SeriesView::closes() const {
    std::vector<double> result;
    result.reserve(length_);
    for (size_t i = 0; i < length_; ++i) {
        result.push_back(series_[i].close);
    }
    return result;
}

}  // namespace tcrimer
