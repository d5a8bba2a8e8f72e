// src/storage/backtest_results_manager.cpp

#include "tcrimer/storage/backtest_results_manager.hpp"
#include "tcrimer/core/logger.hpp"
#include "tcrimer/data/conversion_utils.hpp"

namespace tcrimer {

namespace {

const char* const kUpsertResult =
    "INSERT INTO backtest_results (strategy_id, symbol, start_ts, end_ts, timeframe, params, "
    "total_return, max_drawdown, sharpe_ratio, total_trades, winning_trades, win_rate, "
    "profit_factor, bars_processed, market_return, created_at) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
    "ON CONFLICT (strategy_id, symbol, start_ts, end_ts) DO UPDATE SET "
    "timeframe = excluded.timeframe, params = excluded.params, "
    "total_return = excluded.total_return, max_drawdown = excluded.max_drawdown, "
    "sharpe_ratio = excluded.sharpe_ratio, total_trades = excluded.total_trades, "
    "winning_trades = excluded.winning_trades, "
    "win_rate = excluded.win_rate, profit_factor = excluded.profit_factor, "
    "bars_processed = excluded.bars_processed, market_return = excluded.market_return, "
    "created_at = excluded.created_at";

const char* const kInsertTrade =
    "INSERT INTO backtest_trades (strategy_id, symbol, start_ts, end_ts, trade_index, entry_ts, "
    "exit_ts, entry_price, exit_price, quantity, pnl, return_pct) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

const char* const kKeyFilter =
    "WHERE strategy_id = ? AND symbol = ? AND start_ts = ? AND end_ts = ?";

// Results of one symbol and timeframe whose window contains a timestamp
const char* const kCoveringFilter =
    "WHERE symbol = ? AND timeframe = ? AND start_ts <= ? AND end_ts >= ?";

const char* const kDeleteCoveringTrades =
    "DELETE FROM backtest_trades WHERE EXISTS (SELECT 1 FROM backtest_results r "
    "WHERE r.strategy_id = backtest_trades.strategy_id AND r.symbol = backtest_trades.symbol "
    "AND r.start_ts = backtest_trades.start_ts AND r.end_ts = backtest_trades.end_ts "
    "AND r.symbol = ? AND r.timeframe = ? AND r.start_ts <= ? AND r.end_ts >= ?)";

const char* const kSummaryColumns =
    "SELECT strategy_id, symbol, start_ts, end_ts, timeframe, params, total_return, max_drawdown, "
    "sharpe_ratio, total_trades, winning_trades, win_rate, profit_factor, bars_processed, "
    "market_return, created_at "
    "FROM backtest_results ";

SqlValue optional_value(const std::optional<double>& value) {
    if (value) {
        return *value;
    }
    return std::monostate{};
}

SqlParams key_params(const std::string& strategy_id, const std::string& symbol,
                     const Timestamp& start, const Timestamp& end) {
    return {strategy_id, symbol, to_epoch_seconds(start), to_epoch_seconds(end)};
}

Result<BacktestSummary> summary_from_row(const std::shared_ptr<arrow::Table>& table, int64_t row) {
    using Conv = DataConversionUtils;
    auto strategy_id = Conv::get_string(table, "strategy_id", row);
    auto symbol = Conv::get_string(table, "symbol", row);
    auto start_ts = Conv::get_int64(table, "start_ts", row);
    auto end_ts = Conv::get_int64(table, "end_ts", row);
    auto timeframe = Conv::get_string(table, "timeframe", row);
    auto params = Conv::get_string(table, "params", row);
    auto total_return = Conv::get_double(table, "total_return", row);
    auto max_drawdown = Conv::get_double(table, "max_drawdown", row);
    auto sharpe = Conv::get_optional_double(table, "sharpe_ratio", row);
    auto total_trades = Conv::get_int64(table, "total_trades", row);
    auto winning_trades = Conv::get_int64(table, "winning_trades", row);
    auto win_rate = Conv::get_double(table, "win_rate", row);
    auto profit_factor = Conv::get_optional_double(table, "profit_factor", row);
    auto bars_processed = Conv::get_int64(table, "bars_processed", row);
    auto market_return = Conv::get_double(table, "market_return", row);
    auto created_at = Conv::get_int64(table, "created_at", row);

    for (const TcrimerError* error :
         {strategy_id.error(), symbol.error(), start_ts.error(), end_ts.error(), timeframe.error(),
          params.error(), total_return.error(), max_drawdown.error(), sharpe.error(),
          total_trades.error(), winning_trades.error(), win_rate.error(), profit_factor.error(),
          bars_processed.error(), market_return.error(), created_at.error()}) {
        if (error != nullptr) {
            return forward_error<BacktestSummary>(error);
        }
    }

    auto freq = timeframe_from_string(timeframe.value());
    if (!freq) {
        return make_error<BacktestSummary>(ErrorCode::INVALID_DATA,
                                           "Unknown timeframe '" + timeframe.value() + "'",
                                           "BacktestResultsManager");
    }

    BacktestSummary summary;
    summary.strategy_id = strategy_id.value();
    summary.symbol = symbol.value();
    summary.timeframe = *freq;
    summary.start_time = from_epoch_seconds(start_ts.value());
    summary.end_time = from_epoch_seconds(end_ts.value());
    try {
        summary.params = nlohmann::json::parse(params.value());
    } catch (const nlohmann::json::exception& e) {
        return make_error<BacktestSummary>(ErrorCode::INVALID_DATA,
                                           std::string("Stored params are not JSON: ") + e.what(),
                                           "BacktestResultsManager");
    }
    summary.metrics.total_return_pct = total_return.value();
    summary.metrics.max_drawdown_pct = max_drawdown.value();
    summary.metrics.sharpe_ratio = sharpe.value();
    summary.metrics.total_trades = static_cast<size_t>(total_trades.value());
    summary.metrics.winning_trades = static_cast<size_t>(winning_trades.value());
    summary.metrics.win_rate = win_rate.value();
    summary.metrics.profit_factor = profit_factor.value();
    summary.metrics.bars_processed = static_cast<size_t>(bars_processed.value());
    summary.metrics.market_return_pct = market_return.value();
    summary.metrics.outperformance_pct = total_return.value() - market_return.value();
    summary.created_at = from_epoch_seconds(created_at.value());
    return summary;
}

}  // namespace

BacktestResultsManager::BacktestResultsManager(std::shared_ptr<DataStore> store)
    : store_(std::move(store)) {}

Result<void> BacktestResultsManager::store(const BacktestResult& result) {
    const SqlParams key =
        key_params(result.strategy_id, result.symbol, result.start_time, result.end_time);
    const auto& m = result.metrics;

    std::vector<SqlStatement> statements;
    statements.reserve(result.trades.size() + 2);

    SqlParams row = key;
    row.insert(row.end(),
               {timeframe_to_string(result.timeframe), result.params.dump(), m.total_return_pct,
                m.max_drawdown_pct, optional_value(m.sharpe_ratio),
                static_cast<int64_t>(result.trades.size()),
                static_cast<int64_t>(m.winning_trades), m.win_rate,
                optional_value(m.profit_factor), static_cast<int64_t>(m.bars_processed),
                m.market_return_pct, to_epoch_seconds(result.created_at)});
    statements.push_back(SqlStatement{kUpsertResult, std::move(row)});
    statements.push_back(
        SqlStatement{std::string("DELETE FROM backtest_trades ") + kKeyFilter, key});

    for (size_t i = 0; i < result.trades.size(); ++i) {
        const auto& trade = result.trades[i];
        SqlParams params = key;
        params.insert(params.end(),
                      {static_cast<int64_t>(i), to_epoch_seconds(trade.entry_time),
                       to_epoch_seconds(trade.exit_time), trade.entry_price, trade.exit_price,
                       trade.quantity, trade.pnl, trade.return_pct});
        statements.push_back(SqlStatement{kInsertTrade, std::move(params)});
    }

    auto written = store_->execute_transaction(statements);
    if (written.is_error()) {
        return forward_error<void>(written.error());
    }
    INFO("Stored backtest " << result.strategy_id << "/" << result.symbol << " with "
                            << result.trades.size() << " trades");
    return Result<void>();
}

Result<std::optional<BacktestResult>> BacktestResultsManager::load(const std::string& strategy_id,
                                                                   const std::string& symbol,
                                                                   const Timestamp& start,
                                                                   const Timestamp& end) {
    using Loaded = std::optional<BacktestResult>;
    const SqlParams key = key_params(strategy_id, symbol, start, end);

    auto table = store_->query(std::string(kSummaryColumns) + kKeyFilter, key);
    if (table.is_error()) {
        return forward_error<Loaded>(table.error());
    }
    if (table.value()->num_rows() == 0) {
        return Loaded();
    }

    auto summary = summary_from_row(table.value(), 0);
    if (summary.is_error()) {
        return forward_error<Loaded>(summary.error());
    }

    auto trades = store_->query(
        "SELECT entry_ts, exit_ts, entry_price, exit_price, quantity, pnl, return_pct "
        "FROM backtest_trades " +
            std::string(kKeyFilter) + " ORDER BY trade_index",
        key);
    if (trades.is_error()) {
        return forward_error<Loaded>(trades.error());
    }

    BacktestResult result;
    result.strategy_id = summary.value().strategy_id;
    result.symbol = summary.value().symbol;
    result.timeframe = summary.value().timeframe;
    result.start_time = summary.value().start_time;
    result.end_time = summary.value().end_time;
    result.params = summary.value().params;
    result.metrics = summary.value().metrics;
    result.created_at = summary.value().created_at;
    result.from_store = true;

    const auto& t = trades.value();
    for (int64_t i = 0; i < t->num_rows(); ++i) {
        auto entry_ts = DataConversionUtils::get_int64(t, "entry_ts", i);
        auto exit_ts = DataConversionUtils::get_int64(t, "exit_ts", i);
        auto entry_price = DataConversionUtils::get_double(t, "entry_price", i);
        auto exit_price = DataConversionUtils::get_double(t, "exit_price", i);
        auto quantity = DataConversionUtils::get_double(t, "quantity", i);
        auto pnl = DataConversionUtils::get_double(t, "pnl", i);
        auto return_pct = DataConversionUtils::get_double(t, "return_pct", i);
        if (entry_ts.is_error() || exit_ts.is_error() || entry_price.is_error() ||
            exit_price.is_error() || quantity.is_error() || pnl.is_error() ||
            return_pct.is_error()) {
            return make_error<Loaded>(ErrorCode::CONVERSION_ERROR,
                                      "Malformed trade row " + std::to_string(i),
                                      "BacktestResultsManager");
        }

        TradeRecord trade;
        trade.entry_time = from_epoch_seconds(entry_ts.value());
        trade.exit_time = from_epoch_seconds(exit_ts.value());
        trade.entry_price = entry_price.value();
        trade.exit_price = exit_price.value();
        trade.quantity = quantity.value();
        trade.pnl = pnl.value();
        trade.return_pct = return_pct.value();
        result.trades.push_back(trade);
    }
    return Loaded(std::move(result));
}

Result<std::vector<BacktestSummary>> BacktestResultsManager::list_recent(size_t limit) {
    auto table = store_->query(std::string(kSummaryColumns) +
                                   "ORDER BY created_at DESC, strategy_id, symbol LIMIT ?",
                               {static_cast<int64_t>(limit)});
    if (table.is_error()) {
        return forward_error<std::vector<BacktestSummary>>(table.error());
    }

    std::vector<BacktestSummary> summaries;
    for (int64_t i = 0; i < table.value()->num_rows(); ++i) {
        auto summary = summary_from_row(table.value(), i);
        if (summary.is_error()) {
            return forward_error<std::vector<BacktestSummary>>(summary.error());
        }
        summaries.push_back(std::move(summary.value()));
    }
    return summaries;
}

Result<size_t> BacktestResultsManager::remove(const std::string& strategy_id,
                                              const std::string& symbol, const Timestamp& start,
                                              const Timestamp& end) {
    const SqlParams key = key_params(strategy_id, symbol, start, end);
    auto existing = store_->query(
        std::string("SELECT COUNT(*) AS n FROM backtest_results ") + kKeyFilter, key);
    if (existing.is_error()) {
        return forward_error<size_t>(existing.error());
    }
    auto count = DataConversionUtils::get_int64(existing.value(), "n", 0);
    if (count.is_error()) {
        return forward_error<size_t>(count.error());
    }
    if (count.value() == 0) {
        return size_t{0};
    }

    auto removed = store_->execute_transaction(
        {SqlStatement{std::string("DELETE FROM backtest_trades ") + kKeyFilter, key},
         SqlStatement{std::string("DELETE FROM backtest_results ") + kKeyFilter, key}});
    if (removed.is_error()) {
        return removed;
    }
    return static_cast<size_t>(count.value());
}

Result<size_t> BacktestResultsManager::remove_covering(const std::string& symbol,
                                                       DataFrequency timeframe,
                                                       const Timestamp& timestamp) {
    const int64_t ts = to_epoch_seconds(timestamp);
    const SqlParams filter = {symbol, timeframe_to_string(timeframe), ts, ts};

    auto existing = store_->query(
        std::string("SELECT COUNT(*) AS n FROM backtest_results ") + kCoveringFilter, filter);
    if (existing.is_error()) {
        return forward_error<size_t>(existing.error());
    }
    auto count = DataConversionUtils::get_int64(existing.value(), "n", 0);
    if (count.is_error()) {
        return forward_error<size_t>(count.error());
    }
    if (count.value() == 0) {
        return size_t{0};
    }

    auto removed = store_->execute_transaction(
        {SqlStatement{kDeleteCoveringTrades, filter},
         SqlStatement{std::string("DELETE FROM backtest_results ") + kCoveringFilter, filter}});
    if (removed.is_error()) {
        return removed;
    }
    INFO("Dropped " << count.value() << " stored backtests of " << symbol
                    << " covering a new bar");
    return static_cast<size_t>(count.value());
}

}  // namespace tcrimer
