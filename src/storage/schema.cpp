// src/storage/schema.cpp

#include "tcrimer/storage/schema.hpp"

namespace tcrimer {

std::vector<std::string> schema_statements() {
    return {
        "CREATE TABLE IF NOT EXISTS ohlcv_bars ("
        " symbol TEXT NOT NULL,"
        " timeframe TEXT NOT NULL,"
        " ts BIGINT NOT NULL,"
        " open DOUBLE PRECISION NOT NULL,"
        " high DOUBLE PRECISION NOT NULL,"
        " low DOUBLE PRECISION NOT NULL,"
        " close DOUBLE PRECISION NOT NULL,"
        " volume DOUBLE PRECISION NOT NULL,"
        " PRIMARY KEY (symbol, timeframe, ts))",

        "CREATE INDEX IF NOT EXISTS idx_ohlcv_bars_ts ON ohlcv_bars (ts)",

        "CREATE TABLE IF NOT EXISTS backtest_results ("
        " strategy_id TEXT NOT NULL,"
        " symbol TEXT NOT NULL,"
        " start_ts BIGINT NOT NULL,"
        " end_ts BIGINT NOT NULL,"
        " timeframe TEXT NOT NULL,"
        " params TEXT NOT NULL,"
        " total_return DOUBLE PRECISION NOT NULL,"
        " max_drawdown DOUBLE PRECISION NOT NULL,"
        " sharpe_ratio DOUBLE PRECISION,"
        " total_trades BIGINT NOT NULL,"
        " winning_trades BIGINT NOT NULL,"
        " win_rate DOUBLE PRECISION NOT NULL,"
        " profit_factor DOUBLE PRECISION,"
        " bars_processed BIGINT NOT NULL,"
        " market_return DOUBLE PRECISION NOT NULL,"
        " created_at BIGINT NOT NULL,"
        " PRIMARY KEY (strategy_id, symbol, start_ts, end_ts))",

        "CREATE INDEX IF NOT EXISTS idx_backtest_results_symbol ON backtest_results (symbol)",

        "CREATE INDEX IF NOT EXISTS idx_backtest_results_created ON backtest_results (created_at)",

        "CREATE TABLE IF NOT EXISTS backtest_trades ("
        " strategy_id TEXT NOT NULL,"
        " symbol TEXT NOT NULL,"
        " start_ts BIGINT NOT NULL,"
        " end_ts BIGINT NOT NULL,"
        " trade_index BIGINT NOT NULL,"
        " entry_ts BIGINT NOT NULL,"
        " exit_ts BIGINT NOT NULL,"
        " entry_price DOUBLE PRECISION NOT NULL,"
        " exit_price DOUBLE PRECISION NOT NULL,"
        " quantity DOUBLE PRECISION NOT NULL,"
        " pnl DOUBLE PRECISION NOT NULL,"
        " return_pct DOUBLE PRECISION NOT NULL,"
        " PRIMARY KEY (strategy_id, symbol, start_ts, end_ts, trade_index))",
    };
}

}  // namespace tcrimer
