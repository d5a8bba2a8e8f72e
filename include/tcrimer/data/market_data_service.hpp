// include/tcrimer/data/market_data_service.hpp
#pragma once

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include "tcrimer/cache/cache_manager.hpp"
#include "tcrimer/core/config_base.hpp"
#include "tcrimer/core/types.hpp"
#include "tcrimer/core/worker_pool.hpp"
#include "tcrimer/data/upstream_collector.hpp"
#include "tcrimer/indicators/indicators.hpp"
#include "tcrimer/storage/ohlcv_store.hpp"

namespace tcrimer {

struct MarketDataConfig : public ConfigBase {
    std::chrono::milliseconds upstream_timeout{10000};
    std::chrono::milliseconds series_ttl{std::chrono::seconds(300)};
    std::chrono::milliseconds indicator_ttl{std::chrono::seconds(180)};
    std::chrono::milliseconds latest_ttl{std::chrono::seconds(60)};
    size_t upstream_workers{2};
    bool persist_upstream{true};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

struct IndicatorQuery {
    indicators::IndicatorKind kind{indicators::IndicatorKind::SMA};
    std::string symbol;
    DataFrequency timeframe{DataFrequency::DAILY};
    Timestamp start;
    Timestamp end;
    nlohmann::json params = nlohmann::json::object();
};

/**
 * @brief Cache-fronted access to market data
 *
 * Series reads go cache, then storage, then the upstream collector; fetched
 * bars are normalized and persisted before they are cached. Empty results
 * are never cached. Callers announce new bars through on_new_bar, which
 * invalidates every cached view of that symbol.
 */
class MarketDataService {
public:
    /**
     * @param collector May be null; storage is then the only source
     */
    MarketDataService(std::shared_ptr<CacheManager> cache, std::shared_ptr<OhlcvStore> store,
                      std::shared_ptr<UpstreamCollector> collector, MarketDataConfig config = {});
    ~MarketDataService();

    MarketDataService(const MarketDataService&) = delete;
    MarketDataService& operator=(const MarketDataService&) = delete;

    /**
     * @brief Bars with start <= timestamp <= end
     * @return DATA_ACCESS_ERROR on storage failure, UPSTREAM_ERROR or
     *         TIMEOUT_ERROR when the collector fails or is too slow
     */
    Result<TimeSeries> get_series(const std::string& symbol, DataFrequency freq,
                                  const Timestamp& start, const Timestamp& end);

    /**
     * @return DATA_NOT_FOUND if no source has a bar for the symbol
     */
    Result<Bar> get_latest(const std::string& symbol, DataFrequency freq);

    /**
     * @brief Indicator over the requested window, memoized by series identity
     * and length
     * @return INSUFFICIENT_DATA when the window is too short
     */
    Result<indicators::IndicatorOutput> get_indicator(const IndicatorQuery& query);

    /**
     * @brief Persist a new bar and invalidate every cached view of the symbol
     */
    Result<void> on_new_bar(const std::string& symbol, DataFrequency freq, const Bar& bar);

    static std::string series_key(const std::string& symbol, DataFrequency freq,
                                  const Timestamp& start, const Timestamp& end);
    static std::string indicator_key(const IndicatorQuery& query, size_t series_length);
    static std::string latest_key(const std::string& symbol, DataFrequency freq);

    const std::shared_ptr<CacheManager>& cache() const {
        return cache_;
    }

private:
    Result<std::vector<Bar>> fetch_upstream(const std::string& symbol, DataFrequency freq,
                                            const Timestamp& start, const Timestamp& end);
    Result<Bar> fetch_upstream_latest(const std::string& symbol, DataFrequency freq);

    std::shared_ptr<CacheManager> cache_;
    std::shared_ptr<OhlcvStore> store_;
    std::shared_ptr<UpstreamCollector> collector_;
    MarketDataConfig config_;
    std::unique_ptr<WorkerPool> upstream_pool_;
};

}  // namespace tcrimer
