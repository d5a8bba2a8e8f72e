// src/backtest/backtest_metrics_calculator.cpp

#include "tcrimer/backtest/backtest_metrics_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace tcrimer {

double BacktestMetricsCalculator::calculate_mean(const std::vector<double>& values) const {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double BacktestMetricsCalculator::calculate_sample_stddev(const std::vector<double>& values,
                                                          double mean) const {
    if (values.size() < 2) {
        return 0.0;
    }
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - mean) * (v - mean);
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
}

double BacktestMetricsCalculator::calculate_total_return(
    const std::vector<double>& trade_returns) const {
    double growth = 1.0;
    for (double r : trade_returns) {
        growth *= 1.0 + r;
    }
    return growth - 1.0;
}

std::vector<std::pair<Timestamp, double>> BacktestMetricsCalculator::calculate_drawdowns(
    const EquityCurve& equity_curve) const {
    std::vector<std::pair<Timestamp, double>> drawdowns;
    drawdowns.reserve(equity_curve.size());

    double peak = 0.0;
    for (const auto& [timestamp, equity] : equity_curve) {
        peak = std::max(peak, equity);
        double drawdown = peak > 0.0 ? (peak - equity) / peak : 0.0;
        drawdowns.emplace_back(timestamp, drawdown);
    }
    return drawdowns;
}

double BacktestMetricsCalculator::calculate_max_drawdown(const EquityCurve& equity_curve) const {
    auto drawdowns = calculate_drawdowns(equity_curve);
    if (drawdowns.empty()) {
        return 0.0;
    }

    auto max_it =
        std::max_element(drawdowns.begin(), drawdowns.end(),
                         [](const auto& a, const auto& b) { return a.second < b.second; });
    return max_it->second;
}

std::optional<double> BacktestMetricsCalculator::calculate_sharpe_ratio(
    const std::vector<double>& returns, int periods_per_year) const {
    if (returns.size() < 2 || periods_per_year <= 0) {
        return std::nullopt;
    }

    double mean_return = calculate_mean(returns);
    double stddev = calculate_sample_stddev(returns, mean_return);
    if (stddev <= 0.0 || !std::isfinite(stddev)) {
        return std::nullopt;
    }

    return mean_return / stddev * std::sqrt(static_cast<double>(periods_per_year));
}

BacktestMetricsCalculator::TradeStatistics BacktestMetricsCalculator::calculate_trade_statistics(
    const std::vector<TradeRecord>& trades) const {
    TradeStatistics stats;
    stats.total_trades = trades.size();
    if (trades.empty()) {
        return stats;
    }

    size_t losing_trades = 0;
    for (const auto& trade : trades) {
        if (trade.pnl > 0.0) {
            ++stats.winning_trades;
            stats.total_profit += trade.pnl;
        } else if (trade.pnl < 0.0) {
            ++losing_trades;
            stats.total_loss += -trade.pnl;
        }
    }

    stats.win_rate =
        static_cast<double>(stats.winning_trades) / static_cast<double>(stats.total_trades);
    if (stats.winning_trades > 0) {
        stats.avg_win = stats.total_profit / static_cast<double>(stats.winning_trades);
    }
    if (losing_trades > 0) {
        stats.avg_loss = stats.total_loss / static_cast<double>(losing_trades);
    }
    if (stats.total_loss > 0.0) {
        stats.profit_factor = stats.total_profit / stats.total_loss;
    }
    return stats;
}

double BacktestMetricsCalculator::calculate_market_return(const TimeSeries& series) const {
    if (series.size() < 2 || !(series.front().close > 0.0)) {
        return 0.0;
    }
    return series[series.size() - 1].close / series.front().close - 1.0;
}

BacktestMetrics BacktestMetricsCalculator::calculate_all(const std::vector<TradeRecord>& trades,
                                                         const EquityCurve& equity_curve,
                                                         DataFrequency freq,
                                                         size_t bars_processed,
                                                         double market_return) const {
    std::vector<double> trade_returns;
    trade_returns.reserve(trades.size());
    for (const auto& trade : trades) {
        trade_returns.push_back(trade.return_pct);
    }

    auto stats = calculate_trade_statistics(trades);

    BacktestMetrics metrics;
    metrics.total_return_pct = calculate_total_return(trade_returns);
    metrics.max_drawdown_pct = calculate_max_drawdown(equity_curve);
    metrics.sharpe_ratio = calculate_sharpe_ratio(trade_returns, periods_per_year(freq));
    metrics.total_trades = stats.total_trades;
    metrics.winning_trades = stats.winning_trades;
    metrics.win_rate = stats.win_rate;
    metrics.profit_factor = stats.profit_factor;
    metrics.bars_processed = bars_processed;
    metrics.market_return_pct = market_return;
    metrics.outperformance_pct = metrics.total_return_pct - market_return;
    return metrics;
}

}  // namespace tcrimer
