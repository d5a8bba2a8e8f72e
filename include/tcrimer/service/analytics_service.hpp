// include/tcrimer/service/analytics_service.hpp
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "tcrimer/backtest/backtest_coordinator.hpp"
#include "tcrimer/backtest/backtest_engine.hpp"
#include "tcrimer/cache/cache_manager.hpp"
#include "tcrimer/core/event_bus.hpp"
#include "tcrimer/data/backend_selector.hpp"
#include "tcrimer/data/data_store.hpp"
#include "tcrimer/data/database_pooling.hpp"
#include "tcrimer/data/market_data_service.hpp"
#include "tcrimer/data/upstream_collector.hpp"
#include "tcrimer/service/system_config.hpp"
#include "tcrimer/storage/backtest_results_manager.hpp"
#include "tcrimer/storage/ohlcv_store.hpp"

namespace tcrimer {

/**
 * @brief Entry point for the presentation layer
 *
 * Owns the whole stack and never lets an exception escape: every call
 * returns a Result, with unexpected exceptions reported as UNKNOWN_ERROR.
 */
class AnalyticsService {
public:
    /**
     * @brief Build and start every component from configuration
     * @param collector Optional upstream source for bars missing from storage
     * @return CONNECTION_ERROR if no backend can be opened,
     *         DATA_ACCESS_ERROR if the schema cannot be applied
     */
    static Result<std::shared_ptr<AnalyticsService>> create(
        const SystemConfig& config, std::shared_ptr<UpstreamCollector> collector = nullptr);

    ~AnalyticsService();

    AnalyticsService(const AnalyticsService&) = delete;
    AnalyticsService& operator=(const AnalyticsService&) = delete;

    /**
     * @param params Strategy parameters; position_size and stop_loss_pct are
     *        taken out and applied to the run
     * @return BACKTEST_INVALID_PARAMS when either of those is not a number
     */
    Result<BacktestResult> run_backtest(const std::string& strategy_id, const std::string& symbol,
                                        const Timestamp& start, const Timestamp& end,
                                        const nlohmann::json& params = nlohmann::json::object(),
                                        DataFrequency timeframe = DataFrequency::DAILY);

    Result<std::string> submit_backtest(const BacktestRequest& request);
    Result<BacktestResult> wait_backtest(const std::string& run_id);
    Result<bool> cancel_backtest(const std::string& run_id);
    Result<RunStatus> backtest_status(const std::string& run_id);

    /**
     * @param start Defaults to the epoch
     * @param end Defaults to the latest bar of the symbol
     * @return DATA_NOT_FOUND when end is omitted and the symbol has no bars
     */
    Result<indicators::IndicatorOutput> get_indicator(
        indicators::IndicatorKind kind, const std::string& symbol,
        const nlohmann::json& params = nlohmann::json::object(),
        DataFrequency timeframe = DataFrequency::DAILY,
        std::optional<Timestamp> start = std::nullopt, std::optional<Timestamp> end = std::nullopt);

    /**
     * @brief Store a bar, invalidate cached views of the symbol and drop stored
     * backtests whose window contains it
     */
    Result<void> ingest_bar(const std::string& symbol, DataFrequency timeframe, const Bar& bar);

    Result<std::vector<BacktestSummary>> recent_backtests(size_t limit = 20);

    /**
     * @brief Delete stored bars older than now - retention and drop every
     * cached series
     * @return Bars deleted
     */
    Result<size_t> purge_market_data(std::chrono::hours retention);

    CacheStats cache_stats() const;
    PoolStats pool_stats() const;
    BackendKind authoritative_backend() const;

    const std::shared_ptr<EventBus>& event_bus() const {
        return event_bus_;
    }

    void shutdown();

private:
    AnalyticsService() = default;

    SystemConfig config_;
    std::shared_ptr<EventBus> event_bus_;
    std::shared_ptr<BackendSelector> selector_;
    std::shared_ptr<ConnectionPool> pool_;
    std::shared_ptr<DataStore> data_store_;
    std::shared_ptr<CacheManager> cache_;
    std::shared_ptr<OhlcvStore> ohlcv_store_;
    std::shared_ptr<BacktestResultsManager> results_;
    std::shared_ptr<MarketDataService> market_data_;
    std::shared_ptr<BacktestEngine> engine_;
    std::unique_ptr<BacktestCoordinator> coordinator_;
    bool shut_down_{false};
};

}  // namespace tcrimer
