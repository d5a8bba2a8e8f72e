// src/service/analytics_service.cpp

#include "tcrimer/service/analytics_service.hpp"
#include "tcrimer/core/logger.hpp"
#include "tcrimer/data/postgres_database.hpp"
#include "tcrimer/data/sqlite_database.hpp"
#include "tcrimer/storage/schema.hpp"

namespace tcrimer {

namespace {

template <typename T, typename F>
Result<T> guarded(const char* operation, F&& body) {
    try {
        return body();
    } catch (const std::exception& e) {
        ERROR("AnalyticsService::" << operation << " raised: " << e.what());
        return make_error<T>(ErrorCode::UNKNOWN_ERROR,
                             std::string(operation) + " failed: " + e.what(), "AnalyticsService");
    }
}

// Moves the engine settings out of the strategy parameters
Result<void> take_engine_params(BacktestRequest& request) {
    if (!request.params.is_object()) {
        return Result<void>();
    }
    if (request.params.contains("position_size")) {
        const auto& size = request.params.at("position_size");
        if (!size.is_number()) {
            return make_error<void>(ErrorCode::BACKTEST_INVALID_PARAMS,
                                    "position_size must be a number, got " + size.dump(),
                                    "AnalyticsService");
        }
        request.position_size = size.get<double>();
        request.params.erase("position_size");
    }
    if (request.params.contains("stop_loss_pct")) {
        const auto& stop = request.params.at("stop_loss_pct");
        if (!stop.is_null() && !stop.is_number()) {
            return make_error<void>(ErrorCode::BACKTEST_INVALID_PARAMS,
                                    "stop_loss_pct must be a number, got " + stop.dump(),
                                    "AnalyticsService");
        }
        if (stop.is_number()) {
            request.stop_loss_pct = stop.get<double>();
        }
        request.params.erase("stop_loss_pct");
    }
    return Result<void>();
}

}  // namespace

Result<std::shared_ptr<AnalyticsService>> AnalyticsService::create(
    const SystemConfig& config, std::shared_ptr<UpstreamCollector> collector) {
    using ServicePtr = std::shared_ptr<AnalyticsService>;
    return guarded<ServicePtr>("create", [&]() -> Result<ServicePtr> {
        ServicePtr service(new AnalyticsService());
        service->config_ = config;
        service->event_bus_ = std::make_shared<EventBus>();

        const auto& db = config.database;
        const bool has_primary = !db.primary_connection_string.empty();
        FailoverPolicy policy;
        policy.primary_failure_threshold = config.pool.primary_failure_threshold;
        policy.reconciliation_backoff = config.pool.reconciliation_backoff;
        service->selector_ = std::make_shared<BackendSelector>(
            policy, has_primary ? BackendKind::PRIMARY : BackendKind::FALLBACK);

        DatabaseFactory primary_factory;
        if (has_primary) {
            const std::string conn = db.primary_connection_string;
            primary_factory = [conn]() { return std::make_shared<PostgresDatabase>(conn); };
        } else {
            INFO("No primary connection string configured, serving from " << db.sqlite_path);
        }
        const std::string sqlite_path = db.sqlite_path;
        const int busy_timeout = db.sqlite_busy_timeout_ms;
        DatabaseFactory fallback_factory = [sqlite_path, busy_timeout]() {
            return std::make_shared<SqliteDatabase>(sqlite_path, busy_timeout);
        };

        service->pool_ = std::make_shared<ConnectionPool>(config.pool, primary_factory,
                                                          fallback_factory, service->selector_,
                                                          service->event_bus_);
        auto started = service->pool_->initialize();
        if (started.is_error()) {
            return forward_error<ServicePtr>(started.error());
        }

        service->data_store_ = std::make_shared<DataStore>(service->pool_, config.data_store,
                                                           service->event_bus_);
        auto schema = service->data_store_->initialize_schema(schema_statements());
        if (schema.is_error()) {
            return forward_error<ServicePtr>(schema.error());
        }

        service->cache_ = std::make_shared<CacheManager>(config.cache, service->event_bus_);
        service->ohlcv_store_ = std::make_shared<OhlcvStore>(service->data_store_);
        service->results_ = std::make_shared<BacktestResultsManager>(service->data_store_);
        service->market_data_ = std::make_shared<MarketDataService>(
            service->cache_, service->ohlcv_store_, std::move(collector), config.market_data);
        service->engine_ = std::make_shared<BacktestEngine>(
            service->market_data_, service->results_, config.backtest, service->event_bus_);
        service->coordinator_ = std::make_unique<BacktestCoordinator>(
            service->engine_, config.backtest.workers, config.backtest.max_retained_runs);

        INFO("Analytics service ready on "
             << backend_kind_to_string(service->selector_->authoritative()) << " backend");
        return service;
    });
}

AnalyticsService::~AnalyticsService() {
    shutdown();
}

Result<BacktestResult> AnalyticsService::run_backtest(const std::string& strategy_id,
                                                      const std::string& symbol,
                                                      const Timestamp& start, const Timestamp& end,
                                                      const nlohmann::json& params,
                                                      DataFrequency timeframe) {
    return guarded<BacktestResult>("run_backtest", [&]() -> Result<BacktestResult> {
        BacktestRequest request;
        request.strategy_id = strategy_id;
        request.symbol = symbol;
        request.timeframe = timeframe;
        request.start = start;
        request.end = end;
        request.params = params;
        auto split = take_engine_params(request);
        if (split.is_error()) {
            return forward_error<BacktestResult>(split.error());
        }
        return coordinator_->run(request);
    });
}

Result<std::string> AnalyticsService::submit_backtest(const BacktestRequest& request) {
    return guarded<std::string>("submit_backtest", [&]() { return coordinator_->submit(request); });
}

Result<BacktestResult> AnalyticsService::wait_backtest(const std::string& run_id) {
    return guarded<BacktestResult>("wait_backtest", [&]() { return coordinator_->wait(run_id); });
}

Result<bool> AnalyticsService::cancel_backtest(const std::string& run_id) {
    return guarded<bool>("cancel_backtest",
                         [&]() { return Result<bool>(coordinator_->cancel(run_id)); });
}

Result<RunStatus> AnalyticsService::backtest_status(const std::string& run_id) {
    return guarded<RunStatus>("backtest_status", [&]() { return coordinator_->status(run_id); });
}

Result<indicators::IndicatorOutput> AnalyticsService::get_indicator(
    indicators::IndicatorKind kind, const std::string& symbol, const nlohmann::json& params,
    DataFrequency timeframe, std::optional<Timestamp> start, std::optional<Timestamp> end) {
    using Output = indicators::IndicatorOutput;
    return guarded<Output>("get_indicator", [&]() -> Result<Output> {
        IndicatorQuery query;
        query.kind = kind;
        query.symbol = symbol;
        query.timeframe = timeframe;
        query.start = start.value_or(from_epoch_seconds(0));
        if (end) {
            query.end = *end;
        } else {
            // Open-ended windows stop at the latest bar, so repeated calls
            // share cache keys until a new bar arrives
            auto latest = market_data_->get_latest(symbol, timeframe);
            if (latest.is_error()) {
                return forward_error<Output>(latest.error());
            }
            query.end = latest.value().timestamp;
        }
        query.params = params;
        return market_data_->get_indicator(query);
    });
}

Result<void> AnalyticsService::ingest_bar(const std::string& symbol, DataFrequency timeframe,
                                          const Bar& bar) {
    return guarded<void>("ingest_bar", [&]() -> Result<void> {
        auto stored = market_data_->on_new_bar(symbol, timeframe, bar);
        if (stored.is_error()) {
            return stored;
        }
        auto dropped = results_->remove_covering(symbol, timeframe, bar.timestamp);
        if (dropped.is_error()) {
            WARN("Stored backtests of " << symbol << " may be stale: " << dropped.error()->what());
        }
        return Result<void>();
    });
}

Result<std::vector<BacktestSummary>> AnalyticsService::recent_backtests(size_t limit) {
    return guarded<std::vector<BacktestSummary>>("recent_backtests",
                                                 [&]() { return results_->list_recent(limit); });
}

Result<size_t> AnalyticsService::purge_market_data(std::chrono::hours retention) {
    return guarded<size_t>("purge_market_data", [&]() -> Result<size_t> {
        const Timestamp cutoff = std::chrono::system_clock::now() - retention;
        auto purged = ohlcv_store_->purge_before(cutoff);
        if (purged.is_error()) {
            return purged;
        }
        cache_->invalidate_prefix("series:");
        cache_->invalidate_prefix("indicator:");
        cache_->invalidate_prefix("latest:");
        INFO("Purged " << purged.value() << " bars older than " << retention.count() << "h");
        return purged;
    });
}

CacheStats AnalyticsService::cache_stats() const {
    return cache_->stats();
}

PoolStats AnalyticsService::pool_stats() const {
    return pool_->stats(selector_->authoritative());
}

BackendKind AnalyticsService::authoritative_backend() const {
    return selector_->authoritative();
}

void AnalyticsService::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    if (coordinator_) {
        coordinator_->shutdown();
    }
    if (cache_) {
        cache_->publish_stats();
    }
    if (pool_) {
        pool_->shutdown();
    }
    if (event_bus_) {
        event_bus_->stop();
    }
    INFO("Analytics service stopped");
}

}  // namespace tcrimer
