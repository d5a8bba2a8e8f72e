// src/backtest/backtest_engine.cpp

#include "tcrimer/backtest/backtest_engine.hpp"
#include <stdexcept>
#include "tcrimer/core/logger.hpp"
#include "tcrimer/core/time_utils.hpp"
#include "tcrimer/strategy/strategy_factory.hpp"

namespace tcrimer {

namespace {

TradeRecord close_trade(const PositionState& position, const Bar& bar) {
    TradeRecord trade;
    trade.entry_time = position.entry_time;
    trade.exit_time = bar.timestamp;
    trade.entry_price = position.entry_price;
    trade.exit_price = bar.close;
    trade.quantity = position.quantity;
    trade.pnl = (bar.close - position.entry_price) * position.quantity;
    trade.return_pct = (bar.close - position.entry_price) / position.entry_price;
    return trade;
}

}  // namespace

BacktestEngine::BacktestEngine(std::shared_ptr<MarketDataService> market_data,
                               std::shared_ptr<BacktestResultsManager> results,
                               BacktestConfig config, std::shared_ptr<EventBus> event_bus)
    : market_data_(std::move(market_data)),
      results_(std::move(results)),
      config_(std::move(config)),
      event_bus_(std::move(event_bus)) {}

Result<void> BacktestEngine::validate_request(const BacktestRequest& request) {
    if (request.symbol.empty()) {
        return make_error<void>(ErrorCode::BACKTEST_INVALID_PARAMS, "Backtest needs a symbol",
                                "BacktestEngine");
    }
    if (request.start >= request.end) {
        return make_error<void>(ErrorCode::BACKTEST_INVALID_PARAMS,
                                "Backtest window start " + core::format_utc(request.start) +
                                    " is not before end " + core::format_utc(request.end),
                                "BacktestEngine");
    }
    if (!(request.position_size > 0.0)) {
        return make_error<void>(ErrorCode::BACKTEST_INVALID_PARAMS,
                                "position_size must be positive", "BacktestEngine");
    }
    if (request.stop_loss_pct && !(*request.stop_loss_pct > 0.0 && *request.stop_loss_pct < 1.0)) {
        return make_error<void>(ErrorCode::BACKTEST_INVALID_PARAMS,
                                "stop_loss_pct must be in (0, 1)", "BacktestEngine");
    }
    return Result<void>();
}

nlohmann::json BacktestEngine::effective_params(const Strategy& strategy,
                                                const BacktestRequest& request) {
    nlohmann::json params = strategy.params();
    params["position_size"] = request.position_size;
    if (request.stop_loss_pct) {
        params["stop_loss_pct"] = *request.stop_loss_pct;
    }
    return params;
}

Result<BacktestResult> BacktestEngine::run(const BacktestRequest& request,
                                           const CancellationToken* cancel) {
    const auto started = std::chrono::steady_clock::now();
    INFO("Backtest " << request.strategy_id << "/" << request.symbol << " RUNNING");

    auto outcome = execute(request, cancel);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    if (outcome.is_ok()) {
        const auto& m = outcome.value().metrics;
        INFO("Backtest " << request.strategy_id << "/" << request.symbol << " COMPLETED: "
                         << m.total_trades << " trades, return " << m.total_return_pct
                         << ", max drawdown " << m.max_drawdown_pct
                         << (outcome.value().from_store ? " (stored)" : ""));
    } else {
        WARN("Backtest " << request.strategy_id << "/" << request.symbol << " FAILED ("
                         << failure_reason_to_string(
                                failure_reason_from_error(outcome.error()->code()))
                         << "): " << outcome.error()->what());
    }
    publish_outcome(request, outcome, elapsed);
    return outcome;
}

Result<BacktestResult> BacktestEngine::execute(const BacktestRequest& request,
                                               const CancellationToken* cancel) {
    auto valid = validate_request(request);
    if (valid.is_error()) {
        return forward_error<BacktestResult>(valid.error());
    }

    auto strategy = create_strategy(request.strategy_id, request.params);
    if (strategy.is_error()) {
        return make_error<BacktestResult>(ErrorCode::BACKTEST_INVALID_PARAMS,
                                          strategy.error()->what(), "BacktestEngine");
    }

    const auto deadline = std::chrono::steady_clock::now() + config_.run_timeout;
    const nlohmann::json params = effective_params(strategy.value(), request);

    if (cancel && cancel->is_cancelled()) {
        return make_error<BacktestResult>(ErrorCode::BACKTEST_CANCELLED,
                                          "Cancelled before data load", "BacktestEngine");
    }

    auto series =
        market_data_->get_series(request.symbol, request.timeframe, request.start, request.end);
    if (series.is_error()) {
        return make_error<BacktestResult>(ErrorCode::BACKTEST_DATA_FAULT,
                                          std::string("Loading ") + request.symbol +
                                              " failed: " + series.error()->what(),
                                          "BacktestEngine");
    }

    // A stored run is only current if it saw every bar the window holds now
    if (results_ && config_.reuse_stored_results) {
        auto stored = results_->load(request.strategy_id, request.symbol, request.start,
                                     request.end);
        if (stored.is_error()) {
            WARN("Could not check stored backtests: " << stored.error()->what());
        } else if (stored.value() && stored.value()->params == params &&
                   stored.value()->timeframe == request.timeframe &&
                   stored.value()->metrics.bars_processed == series.value().size()) {
            DEBUG("Reusing stored backtest for " << request.strategy_id << "/" << request.symbol);
            return std::move(*stored.value());
        }
    }

    auto result = simulate(strategy.value(), series.value(), request, cancel, deadline);
    if (result.is_error()) {
        return result;
    }

    if (results_ && config_.persist_results) {
        auto saved = results_->store(result.value());
        if (saved.is_error()) {
            WARN("Backtest result not persisted: " << saved.error()->what());
        }
    }
    return result;
}

Result<BacktestResult> BacktestEngine::simulate(
    const Strategy& strategy, const TimeSeries& series, const BacktestRequest& request,
    const CancellationToken* cancel,
    std::optional<std::chrono::steady_clock::time_point> deadline) const {
    BacktestResult result;
    result.strategy_id = strategy.id();
    result.symbol = request.symbol;
    result.timeframe = request.timeframe;
    result.start_time = request.start;
    result.end_time = request.end;
    result.params = effective_params(strategy, request);
    result.created_at = std::chrono::system_clock::now();

    PositionState position;
    double realized_equity = 1.0;

    for (size_t i = 0; i < series.size(); ++i) {
        if (cancel && cancel->is_cancelled()) {
            return make_error<BacktestResult>(
                ErrorCode::BACKTEST_CANCELLED,
                "Cancelled after " + std::to_string(i) + " of " + std::to_string(series.size()) +
                    " bars",
                "BacktestEngine");
        }
        if (deadline && std::chrono::steady_clock::now() > *deadline) {
            return make_error<BacktestResult>(
                ErrorCode::BACKTEST_TIMEOUT,
                "Run exceeded " + std::to_string(config_.run_timeout.count()) + "ms at bar " +
                    std::to_string(i),
                "BacktestEngine");
        }

        const Bar& bar = series[i];
        if (!(bar.close > 0.0)) {
            return make_error<BacktestResult>(
                ErrorCode::BACKTEST_DATA_FAULT,
                "Non-positive close at " + core::format_utc(bar.timestamp), "BacktestEngine");
        }

        StrategySignal signal;
        try {
            signal = strategy.evaluate(SeriesView(series, i + 1), position);
        } catch (const std::out_of_range& e) {
            return make_error<BacktestResult>(ErrorCode::BACKTEST_DATA_FAULT,
                                              std::string("Strategy read past its view: ") +
                                                  e.what(),
                                              "BacktestEngine");
        }

        if (signal.action == SignalAction::BUY && !position.open) {
            position.open = true;
            position.entry_time = bar.timestamp;
            position.entry_price = bar.close;
            position.quantity = request.position_size;
            result.signals.push_back(signal);
        } else if (signal.action == SignalAction::SELL && position.open) {
            TradeRecord trade = close_trade(position, bar);
            realized_equity *= 1.0 + trade.return_pct;
            result.trades.push_back(trade);
            position = PositionState{};
            result.signals.push_back(signal);
        } else if (position.open && request.stop_loss_pct &&
                   bar.close <= position.entry_price * (1.0 - *request.stop_loss_pct)) {
            TradeRecord trade = close_trade(position, bar);
            realized_equity *= 1.0 + trade.return_pct;
            result.trades.push_back(trade);
            position = PositionState{};
        }

        if (config_.close_at_end && position.open && i + 1 == series.size()) {
            TradeRecord trade = close_trade(position, bar);
            realized_equity *= 1.0 + trade.return_pct;
            result.trades.push_back(trade);
            position = PositionState{};
        }

        const double equity =
            position.open ? realized_equity * bar.close / position.entry_price : realized_equity;
        result.equity_curve.emplace_back(bar.timestamp, equity);
    }

    result.metrics = metrics_calculator_.calculate_all(
        result.trades, result.equity_curve, request.timeframe, series.size(),
        metrics_calculator_.calculate_market_return(series));
    return result;
}

void BacktestEngine::publish_outcome(const BacktestRequest& request,
                                     const Result<BacktestResult>& outcome,
                                     std::chrono::steady_clock::duration elapsed) const {
    if (!event_bus_) {
        return;
    }
    MonitoringEvent event;
    event.type = MonitoringEventType::BACKTEST_OUTCOME;
    event.source = "BacktestEngine";
    event.timestamp = std::chrono::system_clock::now();
    event.string_fields["strategy_id"] = request.strategy_id;
    event.string_fields["symbol"] = request.symbol;
    event.numeric_fields["elapsed_ms"] = static_cast<double>(
        std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());

    if (outcome.is_ok()) {
        const auto& m = outcome.value().metrics;
        event.string_fields["state"] = run_state_to_string(RunState::COMPLETED);
        event.string_fields["from_store"] = outcome.value().from_store ? "true" : "false";
        event.numeric_fields["total_trades"] = static_cast<double>(m.total_trades);
        event.numeric_fields["total_return_pct"] = m.total_return_pct;
        event.numeric_fields["max_drawdown_pct"] = m.max_drawdown_pct;
        if (m.sharpe_ratio) {
            event.numeric_fields["sharpe_ratio"] = *m.sharpe_ratio;
        }
    } else {
        event.string_fields["state"] = run_state_to_string(RunState::FAILED);
        event.string_fields["reason"] =
            failure_reason_to_string(failure_reason_from_error(outcome.error()->code()));
        event.string_fields["message"] = outcome.error()->what();
    }
    event_bus_->publish(std::move(event));
}

}  // namespace tcrimer
