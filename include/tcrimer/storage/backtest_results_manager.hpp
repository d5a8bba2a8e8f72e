// include/tcrimer/storage/backtest_results_manager.hpp
// Persists completed backtests for re-display without rerunning
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "tcrimer/backtest/backtest_types.hpp"
#include "tcrimer/data/data_store.hpp"

namespace tcrimer {

/**
 * @brief Result row without trades, for listings
 */
struct BacktestSummary {
    std::string strategy_id;
    std::string symbol;
    DataFrequency timeframe{DataFrequency::DAILY};
    Timestamp start_time;
    Timestamp end_time;
    nlohmann::json params;
    BacktestMetrics metrics;
    Timestamp created_at;
};

/**
 * @brief Stores BacktestResult records keyed by (strategy_id, symbol, start, end)
 *
 * Storing a result replaces any earlier one with the same key, trades
 * included, in a single transaction. Signals and the equity curve are not
 * persisted.
 */
class BacktestResultsManager {
public:
    explicit BacktestResultsManager(std::shared_ptr<DataStore> store);

    Result<void> store(const BacktestResult& result);

    /**
     * @return An empty optional if nothing is stored under the key
     */
    Result<std::optional<BacktestResult>> load(const std::string& strategy_id,
                                               const std::string& symbol, const Timestamp& start,
                                               const Timestamp& end);

    // Most recent first
    Result<std::vector<BacktestSummary>> list_recent(size_t limit);

    /**
     * @return Result rows deleted (0 or 1)
     */
    Result<size_t> remove(const std::string& strategy_id, const std::string& symbol,
                          const Timestamp& start, const Timestamp& end);

    /**
     * @brief Delete every result of the symbol and timeframe whose window
     * contains the timestamp
     * @return Result rows deleted
     */
    Result<size_t> remove_covering(const std::string& symbol, DataFrequency timeframe,
                                   const Timestamp& timestamp);

private:
    std::shared_ptr<DataStore> store_;
};

}  // namespace tcrimer
