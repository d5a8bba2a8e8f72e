// src/storage/ohlcv_store.cpp

#include "tcrimer/storage/ohlcv_store.hpp"
#include "tcrimer/core/logger.hpp"
#include "tcrimer/data/conversion_utils.hpp"

namespace tcrimer {

namespace {

const char* const kUpsertBar =
    "INSERT INTO ohlcv_bars (symbol, timeframe, ts, open, high, low, close, volume) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?) "
    "ON CONFLICT (symbol, timeframe, ts) DO UPDATE SET "
    "open = excluded.open, high = excluded.high, low = excluded.low, "
    "close = excluded.close, volume = excluded.volume";

const char* const kBarColumns = "SELECT ts, open, high, low, close, volume FROM ohlcv_bars ";

}  // namespace

OhlcvStore::OhlcvStore(std::shared_ptr<DataStore> store) : store_(std::move(store)) {}

Result<size_t> OhlcvStore::store_bars(const std::string& symbol, DataFrequency freq,
                                      const std::vector<Bar>& bars) {
    if (symbol.empty()) {
        return make_error<size_t>(ErrorCode::INVALID_ARGUMENT, "Symbol is empty", "OhlcvStore");
    }

    const std::string timeframe = timeframe_to_string(freq);
    std::vector<SqlStatement> statements;
    statements.reserve(bars.size());
    for (const auto& bar : bars) {
        statements.push_back(SqlStatement{
            kUpsertBar,
            {symbol, timeframe, to_epoch_seconds(bar.timestamp), bar.open, bar.high, bar.low,
             bar.close, bar.volume}});
    }

    auto result = store_->execute_transaction(statements);
    if (result.is_ok()) {
        DEBUG("Stored " << bars.size() << " " << timeframe << " bars for " << symbol);
    }
    return result;
}

Result<TimeSeries> OhlcvStore::load_bars(const std::string& symbol, DataFrequency freq,
                                         const Timestamp& start, const Timestamp& end) {
    auto table = store_->query(
        std::string(kBarColumns) +
            "WHERE symbol = ? AND timeframe = ? AND ts >= ? AND ts <= ? ORDER BY ts",
        {symbol, timeframe_to_string(freq), to_epoch_seconds(start), to_epoch_seconds(end)});
    if (table.is_error()) {
        return forward_error<TimeSeries>(table.error());
    }
    return DataConversionUtils::arrow_table_to_series(table.value(), symbol, freq);
}

Result<std::optional<Bar>> OhlcvStore::latest_bar(const std::string& symbol, DataFrequency freq) {
    auto table = store_->query(std::string(kBarColumns) +
                                   "WHERE symbol = ? AND timeframe = ? ORDER BY ts DESC LIMIT 1",
                               {symbol, timeframe_to_string(freq)});
    if (table.is_error()) {
        return forward_error<std::optional<Bar>>(table.error());
    }

    auto bars = DataConversionUtils::arrow_table_to_bars(table.value());
    if (bars.is_error()) {
        return forward_error<std::optional<Bar>>(bars.error());
    }
    if (bars.value().empty()) {
        return std::optional<Bar>();
    }
    return std::optional<Bar>(bars.value().front());
}

Result<std::vector<std::string>> OhlcvStore::symbols() {
    auto table = store_->query("SELECT DISTINCT symbol FROM ohlcv_bars ORDER BY symbol");
    if (table.is_error()) {
        return forward_error<std::vector<std::string>>(table.error());
    }

    std::vector<std::string> result;
    for (int64_t i = 0; i < table.value()->num_rows(); ++i) {
        auto symbol = DataConversionUtils::get_string(table.value(), "symbol", i);
        if (symbol.is_error()) {
            return forward_error<std::vector<std::string>>(symbol.error());
        }
        result.push_back(symbol.value());
    }
    return result;
}

Result<size_t> OhlcvStore::purge_before(const Timestamp& cutoff) {
    auto result =
        store_->execute("DELETE FROM ohlcv_bars WHERE ts < ?", {to_epoch_seconds(cutoff)});
    if (result.is_ok()) {
        INFO("Purged " << result.value() << " bars older than " << to_epoch_seconds(cutoff));
    }
    return result;
}

}  // namespace tcrimer
