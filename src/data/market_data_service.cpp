// src/data/market_data_service.cpp

#include "tcrimer/data/market_data_service.hpp"
#include <future>
#include "tcrimer/core/logger.hpp"
#include "tcrimer/data/conversion_utils.hpp"

namespace tcrimer {

namespace {

CacheBlob bar_to_blob(const Bar& bar) {
    nlohmann::json j = {to_epoch_seconds(bar.timestamp), bar.open, bar.high, bar.low, bar.close,
                        bar.volume};
    return nlohmann::json::to_msgpack(j);
}

std::optional<Bar> bar_from_blob(const CacheBlob& blob) {
    try {
        auto j = nlohmann::json::from_msgpack(blob);
        return Bar(from_epoch_seconds(j.at(0).get<int64_t>()), j.at(1).get<double>(),
                   j.at(2).get<double>(), j.at(3).get<double>(), j.at(4).get<double>(),
                   j.at(5).get<double>());
    } catch (const nlohmann::json::exception& e) {
        WARN("Discarding corrupt cached bar: " << e.what());
        return std::nullopt;
    }
}

template <typename T>
Result<T> storage_failure(const TcrimerError* error) {
    if (error->code() == ErrorCode::POOL_EXHAUSTED || error->code() == ErrorCode::DATA_ACCESS_ERROR) {
        return forward_error<T>(error);
    }
    return make_error<T>(ErrorCode::DATA_ACCESS_ERROR, error->what(), "MarketDataService");
}

}  // namespace

nlohmann::json MarketDataConfig::to_json() const {
    nlohmann::json j;
    j["upstream_timeout_ms"] = upstream_timeout.count();
    j["series_ttl_ms"] = series_ttl.count();
    j["indicator_ttl_ms"] = indicator_ttl.count();
    j["latest_ttl_ms"] = latest_ttl.count();
    j["upstream_workers"] = upstream_workers;
    j["persist_upstream"] = persist_upstream;
    return j;
}

void MarketDataConfig::from_json(const nlohmann::json& j) {
    if (j.contains("upstream_timeout_ms"))
        upstream_timeout = std::chrono::milliseconds(j.at("upstream_timeout_ms").get<int64_t>());
    if (j.contains("series_ttl_ms"))
        series_ttl = std::chrono::milliseconds(j.at("series_ttl_ms").get<int64_t>());
    if (j.contains("indicator_ttl_ms"))
        indicator_ttl = std::chrono::milliseconds(j.at("indicator_ttl_ms").get<int64_t>());
    if (j.contains("latest_ttl_ms"))
        latest_ttl = std::chrono::milliseconds(j.at("latest_ttl_ms").get<int64_t>());
    if (j.contains("upstream_workers"))
        upstream_workers = j.at("upstream_workers").get<size_t>();
    if (j.contains("persist_upstream"))
        persist_upstream = j.at("persist_upstream").get<bool>();
}

MarketDataService::MarketDataService(std::shared_ptr<CacheManager> cache,
                                     std::shared_ptr<OhlcvStore> store,
                                     std::shared_ptr<UpstreamCollector> collector,
                                     MarketDataConfig config)
    : cache_(std::move(cache)),
      store_(std::move(store)),
      collector_(std::move(collector)),
      config_(std::move(config)) {
    if (collector_) {
        upstream_pool_ = std::make_unique<WorkerPool>(
            config_.upstream_workers > 0 ? config_.upstream_workers : 1, "upstream");
    }
}

MarketDataService::~MarketDataService() {
    if (upstream_pool_) {
        upstream_pool_->shutdown();
    }
}

std::string MarketDataService::series_key(const std::string& symbol, DataFrequency freq,
                                          const Timestamp& start, const Timestamp& end) {
    return "series:" + symbol + ":" + timeframe_to_string(freq) + ":" +
           std::to_string(to_epoch_seconds(start)) + ":" + std::to_string(to_epoch_seconds(end));
}

std::string MarketDataService::indicator_key(const IndicatorQuery& query, size_t series_length) {
    return "indicator:" + query.symbol + ":" + timeframe_to_string(query.timeframe) + ":" +
           indicators::indicator_kind_to_string(query.kind) + ":" + query.params.dump() + ":" +
           std::to_string(to_epoch_seconds(query.start)) + ":" +
           std::to_string(to_epoch_seconds(query.end)) + ":" + std::to_string(series_length);
}

std::string MarketDataService::latest_key(const std::string& symbol, DataFrequency freq) {
    return "latest:" + symbol + ":" + timeframe_to_string(freq);
}

Result<std::vector<Bar>> MarketDataService::fetch_upstream(const std::string& symbol,
                                                           DataFrequency freq,
                                                           const Timestamp& start,
                                                           const Timestamp& end) {
    auto collector = collector_;
    std::future<Result<std::vector<Bar>>> pending;
    try {
        pending = upstream_pool_->submit([collector, symbol, freq, start, end]() {
            return collector->fetch_series(symbol, freq, start, end);
        });
    } catch (const std::runtime_error& e) {
        return make_error<std::vector<Bar>>(ErrorCode::UPSTREAM_ERROR, e.what(),
                                            "MarketDataService");
    }

    if (pending.wait_for(config_.upstream_timeout) != std::future_status::ready) {
        WARN("Upstream " << collector->name() << " timed out fetching " << symbol);
        return make_error<std::vector<Bar>>(
            ErrorCode::TIMEOUT_ERROR,
            "Upstream fetch for " + symbol + " exceeded " +
                std::to_string(config_.upstream_timeout.count()) + "ms",
            "MarketDataService");
    }

    try {
        return pending.get();
    } catch (const std::exception& e) {
        return make_error<std::vector<Bar>>(ErrorCode::UPSTREAM_ERROR,
                                            "Upstream " + collector->name() + " failed: " + e.what(),
                                            "MarketDataService");
    }
}

Result<Bar> MarketDataService::fetch_upstream_latest(const std::string& symbol, DataFrequency freq) {
    auto collector = collector_;
    std::future<Result<Bar>> pending;
    try {
        pending = upstream_pool_->submit(
            [collector, symbol, freq]() { return collector->fetch_latest(symbol, freq); });
    } catch (const std::runtime_error& e) {
        return make_error<Bar>(ErrorCode::UPSTREAM_ERROR, e.what(), "MarketDataService");
    }

    if (pending.wait_for(config_.upstream_timeout) != std::future_status::ready) {
        return make_error<Bar>(ErrorCode::TIMEOUT_ERROR,
                               "Upstream latest-bar fetch for " + symbol + " timed out",
                               "MarketDataService");
    }
    try {
        return pending.get();
    } catch (const std::exception& e) {
        return make_error<Bar>(ErrorCode::UPSTREAM_ERROR,
                               "Upstream " + collector->name() + " failed: " + e.what(),
                               "MarketDataService");
    }
}

Result<TimeSeries> MarketDataService::get_series(const std::string& symbol, DataFrequency freq,
                                                 const Timestamp& start, const Timestamp& end) {
    if (symbol.empty() || start > end) {
        return make_error<TimeSeries>(ErrorCode::INVALID_ARGUMENT,
                                      "Series request needs a symbol and start <= end",
                                      "MarketDataService");
    }

    const std::string key = series_key(symbol, freq, start, end);
    auto cached = cache_->get(key);
    if (cached.hit) {
        auto decoded = DataConversionUtils::series_from_blob(cached.value);
        if (decoded.is_ok()) {
            return decoded;
        }
        WARN("Dropping undecodable cache entry " << key << ": " << decoded.error()->what());
        cache_->invalidate(key);
    }

    auto stored = store_->load_bars(symbol, freq, start, end);
    if (stored.is_error()) {
        return storage_failure<TimeSeries>(stored.error());
    }
    TimeSeries series = std::move(stored.value());

    if (series.empty() && collector_) {
        auto fetched = fetch_upstream(symbol, freq, start, end);
        if (fetched.is_error()) {
            return forward_error<TimeSeries>(fetched.error());
        }
        series = TimeSeries::normalized(symbol, freq, std::move(fetched.value()))
                     .slice(start, end);

        if (!series.empty() && config_.persist_upstream) {
            auto saved = store_->store_bars(symbol, freq, series.bars());
            if (saved.is_error()) {
                WARN("Could not persist upstream bars for " << symbol << ": "
                                                            << saved.error()->what());
            }
        }
    }

    if (!series.empty()) {
        cache_->put(key, DataConversionUtils::series_to_blob(series), config_.series_ttl,
                    CacheTier::SESSION);
    }
    return series;
}

Result<Bar> MarketDataService::get_latest(const std::string& symbol, DataFrequency freq) {
    const std::string key = latest_key(symbol, freq);
    auto cached = cache_->get(key);
    if (cached.hit) {
        if (auto bar = bar_from_blob(cached.value)) {
            return *bar;
        }
        cache_->invalidate(key);
    }

    auto stored = store_->latest_bar(symbol, freq);
    if (stored.is_error()) {
        return storage_failure<Bar>(stored.error());
    }

    std::optional<Bar> latest = stored.value();
    if (!latest && collector_) {
        auto fetched = fetch_upstream_latest(symbol, freq);
        if (fetched.is_error()) {
            return fetched;
        }
        latest = fetched.value();
    }
    if (!latest) {
        return make_error<Bar>(ErrorCode::DATA_NOT_FOUND, "No bars for " + symbol,
                               "MarketDataService");
    }

    cache_->put(key, bar_to_blob(*latest), config_.latest_ttl, CacheTier::MEMORY);
    return *latest;
}

Result<indicators::IndicatorOutput> MarketDataService::get_indicator(const IndicatorQuery& query) {
    auto series = get_series(query.symbol, query.timeframe, query.start, query.end);
    if (series.is_error()) {
        return forward_error<indicators::IndicatorOutput>(series.error());
    }

    const std::string key = indicator_key(query, series.value().size());
    auto cached = cache_->get(key);
    if (cached.hit) {
        try {
            auto decoded = indicators::IndicatorOutput::from_json(
                nlohmann::json::from_msgpack(cached.value));
            if (decoded.is_ok()) {
                return decoded;
            }
        } catch (const nlohmann::json::exception& e) {
            WARN("Dropping undecodable cache entry " << key << ": " << e.what());
        }
        cache_->invalidate(key);
    }

    auto output = indicators::compute_indicator(query.kind, query.params, series.value());
    if (output.is_error()) {
        return output;
    }
    cache_->put(key, nlohmann::json::to_msgpack(output.value().to_json()), config_.indicator_ttl,
                CacheTier::MEMORY);
    return output;
}

Result<void> MarketDataService::on_new_bar(const std::string& symbol, DataFrequency freq,
                                           const Bar& bar) {
    auto stored = store_->store_bars(symbol, freq, {bar});
    if (stored.is_error()) {
        return storage_failure<void>(stored.error());
    }

    size_t removed = cache_->invalidate_prefix("series:" + symbol + ":") +
                     cache_->invalidate_prefix("indicator:" + symbol + ":") +
                     cache_->invalidate_prefix("latest:" + symbol + ":");
    DEBUG("New " << timeframe_to_string(freq) << " bar for " << symbol << " invalidated "
                 << removed << " cache entries");
    return Result<void>();
}

}  // namespace tcrimer
