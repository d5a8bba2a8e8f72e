// include/tcrimer/service/system_config.hpp
#pragma once

#include <string>
#include "tcrimer/backtest/backtest_types.hpp"
#include "tcrimer/cache/cache_manager.hpp"
#include "tcrimer/core/logger.hpp"
#include "tcrimer/data/data_store.hpp"
#include "tcrimer/data/database_pooling.hpp"
#include "tcrimer/data/market_data_service.hpp"

namespace tcrimer {

/**
 * @brief Backend locations
 *
 * An empty primary connection string starts the system on the SQLite
 * fallback.
 */
struct DatabaseConfig : public ConfigBase {
    std::string primary_connection_string;
    std::string sqlite_path{"tcrimer.db"};
    int sqlite_busy_timeout_ms{5000};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

struct SystemConfig : public ConfigBase {
    LoggerConfig logging;
    CacheConfig cache;
    PoolConfig pool;
    DatabaseConfig database;
    DataStoreConfig data_store;
    MarketDataConfig market_data;
    BacktestConfig backtest;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Apply DATABASE_URL and TCRIMER_SQLITE_PATH when set
     */
    void apply_environment();
};

/**
 * @brief Load the system configuration
 *
 * A missing file yields the defaults. Environment overrides are applied in
 * both cases.
 * @return JSON_PARSE_ERROR if the file exists but is not a valid config
 */
Result<SystemConfig> load_system_config(const std::string& path);

}  // namespace tcrimer
