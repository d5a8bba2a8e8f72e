// include/tcrimer/backtest/backtest_types.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "tcrimer/core/config_base.hpp"
#include "tcrimer/core/error.hpp"
#include "tcrimer/core/types.hpp"
#include "tcrimer/strategy/types.hpp"

namespace tcrimer {

enum class RunState { PENDING, RUNNING, COMPLETED, FAILED };

/**
 * @brief Why a run ended in FAILED
 */
enum class FailureReason { NONE, DATA_FAULT, CANCELLED, INVALID_PARAMS, TIMEOUT };

std::string run_state_to_string(RunState state);
std::string failure_reason_to_string(FailureReason reason);

/**
 * @brief Map a BACKTEST_* error code to its failure reason
 */
FailureReason failure_reason_from_error(ErrorCode code);

struct BacktestConfig : public ConfigBase {
    std::chrono::milliseconds run_timeout{std::chrono::seconds(60)};
    size_t workers{4};
    bool reuse_stored_results{true};
    bool persist_results{true};
    bool close_at_end{true};  // force-close an open position on the last bar
    size_t max_retained_runs{256};  // finished runs the coordinator keeps queryable

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

struct BacktestRequest {
    std::string strategy_id;
    std::string symbol;
    DataFrequency timeframe{DataFrequency::DAILY};
    Timestamp start;
    Timestamp end;
    nlohmann::json params = nlohmann::json::object();
    Quantity position_size{1.0};  // units per trade; no leverage or partial fills
    // Exit when the close falls to entry * (1 - stop_loss_pct); off when empty
    std::optional<double> stop_loss_pct;
};

/**
 * @brief A closed round trip. Only long positions are modeled.
 */
struct TradeRecord {
    Timestamp entry_time;
    Timestamp exit_time;
    Price entry_price{0.0};
    Price exit_price{0.0};
    Quantity quantity{0.0};
    double pnl{0.0};
    double return_pct{0.0};  // fraction, (exit - entry) / entry

    bool operator==(const TradeRecord& other) const {
        return entry_time == other.entry_time && exit_time == other.exit_time &&
               entry_price == other.entry_price && exit_price == other.exit_price &&
               quantity == other.quantity && pnl == other.pnl && return_pct == other.return_pct;
    }
};

/**
 * @brief Run metrics. Percentages are fractions (0.05 = 5%).
 */
struct BacktestMetrics {
    double total_return_pct{0.0};
    double max_drawdown_pct{0.0};
    std::optional<double> sharpe_ratio;  // empty when fewer than two trades or zero variance
    size_t total_trades{0};
    size_t winning_trades{0};
    double win_rate{0.0};
    std::optional<double> profit_factor;  // empty without losing trades
    size_t bars_processed{0};
    double market_return_pct{0.0};  // buy and hold over the window
    double outperformance_pct{0.0};  // total_return_pct - market_return_pct
};

using EquityCurve = std::vector<std::pair<Timestamp, double>>;

struct BacktestResult {
    std::string strategy_id;
    std::string symbol;
    DataFrequency timeframe{DataFrequency::DAILY};
    Timestamp start_time;
    Timestamp end_time;
    nlohmann::json params = nlohmann::json::object();
    std::vector<TradeRecord> trades;
    BacktestMetrics metrics;

    // Populated by a fresh run only; not persisted
    std::vector<StrategySignal> signals;
    EquityCurve equity_curve;

    Timestamp created_at;
    bool from_store{false};
};

/**
 * @brief Cancellation signal checked by the engine between bars
 */
class CancellationToken {
public:
    void cancel() {
        cancelled_.store(true);
    }
    bool is_cancelled() const {
        return cancelled_.load();
    }

private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace tcrimer
