// include/tcrimer/backtest/backtest_metrics_calculator.hpp
#pragma once

#include <optional>
#include <utility>
#include <vector>
#include "tcrimer/backtest/backtest_types.hpp"
#include "tcrimer/core/types.hpp"

namespace tcrimer {

/**
 * @brief Pure stateless calculation of backtest metrics
 *
 * All methods are const, have no side effects and do no logging. Returns
 * and drawdowns are fractions (0.10 = 10%).
 */
class BacktestMetricsCalculator {
public:
    /**
     * @brief Compounded return of a sequence of trade returns
     * @return prod(1 + r) - 1, or 0 for no trades
     */
    double calculate_total_return(const std::vector<double>& trade_returns) const;

    /**
     * @brief Drawdown from the running peak at every point of the curve
     */
    std::vector<std::pair<Timestamp, double>> calculate_drawdowns(
        const EquityCurve& equity_curve) const;

    /**
     * @brief Largest peak-to-trough decline of the equity curve
     */
    double calculate_max_drawdown(const EquityCurve& equity_curve) const;

    /**
     * @brief Mean over sample standard deviation, scaled by sqrt(periods_per_year)
     * @return Empty with fewer than two returns or zero variance
     */
    std::optional<double> calculate_sharpe_ratio(const std::vector<double>& returns,
                                                 int periods_per_year) const;

    struct TradeStatistics {
        size_t total_trades{0};
        size_t winning_trades{0};
        double win_rate{0.0};
        std::optional<double> profit_factor;
        double total_profit{0.0};
        double total_loss{0.0};
        double avg_win{0.0};
        double avg_loss{0.0};
    };

    TradeStatistics calculate_trade_statistics(const std::vector<TradeRecord>& trades) const;

    /**
     * @brief Buy-and-hold return from the first to the last close
     * @return 0 for fewer than two bars
     */
    double calculate_market_return(const TimeSeries& series) const;

    /**
     * @brief Every metric of a finished run
     */
    BacktestMetrics calculate_all(const std::vector<TradeRecord>& trades,
                                  const EquityCurve& equity_curve, DataFrequency freq,
                                  size_t bars_processed, double market_return = 0.0) const;

private:
    double calculate_mean(const std::vector<double>& values) const;
    double calculate_sample_stddev(const std::vector<double>& values, double mean) const;
};

}  // namespace tcrimer
