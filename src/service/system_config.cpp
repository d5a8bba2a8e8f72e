// src/service/system_config.cpp

#include "tcrimer/service/system_config.hpp"
#include <cstdlib>
#include <fstream>

namespace tcrimer {

nlohmann::json DatabaseConfig::to_json() const {
    nlohmann::json j;
    j["primary_connection_string"] = primary_connection_string;
    j["sqlite_path"] = sqlite_path;
    j["sqlite_busy_timeout_ms"] = sqlite_busy_timeout_ms;
    return j;
}

void DatabaseConfig::from_json(const nlohmann::json& j) {
    if (j.contains("primary_connection_string"))
        primary_connection_string = j.at("primary_connection_string").get<std::string>();
    if (j.contains("sqlite_path"))
        sqlite_path = j.at("sqlite_path").get<std::string>();
    if (j.contains("sqlite_busy_timeout_ms"))
        sqlite_busy_timeout_ms = j.at("sqlite_busy_timeout_ms").get<int>();
}

nlohmann::json SystemConfig::to_json() const {
    nlohmann::json j;
    j["logging"] = logging.to_json();
    j["cache"] = cache.to_json();
    j["pool"] = pool.to_json();
    j["database"] = database.to_json();
    j["data_store"] = data_store.to_json();
    j["market_data"] = market_data.to_json();
    j["backtest"] = backtest.to_json();
    return j;
}

void SystemConfig::from_json(const nlohmann::json& j) {
    if (j.contains("logging"))
        logging.from_json(j.at("logging"));
    if (j.contains("cache"))
        cache.from_json(j.at("cache"));
    if (j.contains("pool"))
        pool.from_json(j.at("pool"));
    if (j.contains("database"))
        database.from_json(j.at("database"));
    if (j.contains("data_store"))
        data_store.from_json(j.at("data_store"));
    if (j.contains("market_data"))
        market_data.from_json(j.at("market_data"));
    if (j.contains("backtest"))
        backtest.from_json(j.at("backtest"));
}

void SystemConfig::apply_environment() {
    if (const char* url = std::getenv("DATABASE_URL")) {
        database.primary_connection_string = url;
    }
    if (const char* sqlite_path = std::getenv("TCRIMER_SQLITE_PATH")) {
        database.sqlite_path = sqlite_path;
    }
}

Result<SystemConfig> load_system_config(const std::string& path) {
    SystemConfig config;

    std::ifstream probe(path);
    if (!probe.is_open()) {
        WARN("Config file " << path << " not found, using defaults");
    } else {
        probe.close();
        auto loaded = config.load_from_file(path);
        if (loaded.is_error()) {
            return make_error<SystemConfig>(ErrorCode::JSON_PARSE_ERROR, loaded.error()->what(),
                                            "SystemConfig");
        }
    }

    config.apply_environment();
    return config;
}

}  // namespace tcrimer
