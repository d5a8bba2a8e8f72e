// include/tcrimer/backtest/backtest_engine.hpp
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include "tcrimer/backtest/backtest_metrics_calculator.hpp"
#include "tcrimer/backtest/backtest_types.hpp"
#include "tcrimer/core/event_bus.hpp"
#include "tcrimer/data/market_data_service.hpp"
#include "tcrimer/storage/backtest_results_manager.hpp"
#include "tcrimer/strategy/strategy.hpp"

namespace tcrimer {

/**
 * @brief Runs one strategy over one symbol and window, bar by bar
 *
 * Fill model: a BUY opens a long position of request.position_size units at
 * the bar's close when flat, a SELL closes it at the bar's close, HOLD does
 * nothing. With request.stop_loss_pct set, an open position is also closed at
 * the first close at or below entry * (1 - stop_loss_pct). There is no
 * leverage, no partial fill, no fee and no slippage.
 *
 * A stored result is reused only when its parameters and timeframe match and
 * it processed as many bars as the window holds now.
 *
 * A run is all or nothing. Any failure returns an error and no partial
 * result. The engine holds no per-run state, so independent runs may call
 * run() concurrently.
 */
class BacktestEngine {
public:
    /**
     * @param results May be null; results are then neither reused nor stored
     * @param event_bus May be null
     */
    BacktestEngine(std::shared_ptr<MarketDataService> market_data,
                   std::shared_ptr<BacktestResultsManager> results, BacktestConfig config = {},
                   std::shared_ptr<EventBus> event_bus = nullptr);

    /**
     * @brief Load, simulate, score and persist a run
     * @return BACKTEST_INVALID_PARAMS, BACKTEST_DATA_FAULT,
     *         BACKTEST_CANCELLED or BACKTEST_TIMEOUT on failure
     */
    Result<BacktestResult> run(const BacktestRequest& request,
                               const CancellationToken* cancel = nullptr);

    /**
     * @brief Simulate over an in-memory series
     *
     * Every bar of the series is evaluated; the caller is responsible for
     * slicing it to the window.
     */
    Result<BacktestResult> simulate(const Strategy& strategy, const TimeSeries& series,
                                    const BacktestRequest& request,
                                    const CancellationToken* cancel = nullptr,
                                    std::optional<std::chrono::steady_clock::time_point> deadline =
                                        std::nullopt) const;

    static Result<void> validate_request(const BacktestRequest& request);

    /**
     * @brief Strategy parameters after defaults, plus position_size and any
     * stop_loss_pct
     *
     * Stored results are reused only when these match exactly.
     */
    static nlohmann::json effective_params(const Strategy& strategy,
                                           const BacktestRequest& request);

    const BacktestConfig& config() const {
        return config_;
    }

private:
    Result<BacktestResult> execute(const BacktestRequest& request, const CancellationToken* cancel);
    void publish_outcome(const BacktestRequest& request, const Result<BacktestResult>& outcome,
                         std::chrono::steady_clock::duration elapsed) const;

    std::shared_ptr<MarketDataService> market_data_;
    std::shared_ptr<BacktestResultsManager> results_;
    BacktestConfig config_;
    std::shared_ptr<EventBus> event_bus_;
    BacktestMetricsCalculator metrics_calculator_;
};

}  // namespace tcrimer
