// src/data/data_store.cpp

#include "tcrimer/data/data_store.hpp"
#include <algorithm>
#include <thread>
#include "tcrimer/core/logger.hpp"

namespace tcrimer {

nlohmann::json DataStoreConfig::to_json() const {
    nlohmann::json j;
    j["max_attempts"] = max_attempts;
    j["initial_backoff_ms"] = initial_backoff.count();
    j["backoff_multiplier"] = backoff_multiplier;
    j["max_backoff_ms"] = max_backoff.count();
    return j;
}

void DataStoreConfig::from_json(const nlohmann::json& j) {
    if (j.contains("max_attempts"))
        max_attempts = j.at("max_attempts").get<int>();
    if (j.contains("initial_backoff_ms"))
        initial_backoff = std::chrono::milliseconds(j.at("initial_backoff_ms").get<int64_t>());
    if (j.contains("backoff_multiplier"))
        backoff_multiplier = j.at("backoff_multiplier").get<double>();
    if (j.contains("max_backoff_ms"))
        max_backoff = std::chrono::milliseconds(j.at("max_backoff_ms").get<int64_t>());
}

DataStore::DataStore(std::shared_ptr<ConnectionPool> pool, DataStoreConfig config,
                     std::shared_ptr<EventBus> event_bus)
    : pool_(std::move(pool)), config_(std::move(config)), event_bus_(std::move(event_bus)) {
    if (config_.max_attempts < 1) {
        config_.max_attempts = 1;
    }
}

template <typename T, typename Operation>
Result<T> DataStore::with_retry(const std::string& operation, Operation&& op) {
    auto delay = config_.initial_backoff;
    std::unique_ptr<TcrimerError> last_error;

    for (int attempt = 1; attempt <= config_.max_attempts; ++attempt) {
        {
            auto guard = pool_->acquire();
            if (guard.is_error()) {
                if (guard.error()->code() == ErrorCode::POOL_EXHAUSTED) {
                    return forward_error<T>(guard.error());
                }
                last_error = std::make_unique<TcrimerError>(*guard.error());
            } else {
                auto result = op(*guard.value());
                if (result.is_ok()) {
                    return result;
                }
                if (result.error()->code() == ErrorCode::CONNECTION_ERROR) {
                    guard.value().mark_broken();
                }
                last_error = std::make_unique<TcrimerError>(*result.error());
            }
        }

        if (!is_transient(last_error->code())) {
            report_failure(operation, attempt, *last_error);
            return make_error<T>(ErrorCode::DATA_ACCESS_ERROR,
                                 operation + " failed: " + last_error->what(), "DataStore");
        }

        if (attempt < config_.max_attempts) {
            WARN(operation << " failed, retrying (attempt " << attempt << " of "
                           << config_.max_attempts << "): " << last_error->what());
            std::this_thread::sleep_for(delay);
            delay = std::min(config_.max_backoff,
                             std::chrono::milliseconds(static_cast<int64_t>(
                                 static_cast<double>(delay.count()) * config_.backoff_multiplier)));
            ++retries_;
        }
    }

    report_failure(operation, config_.max_attempts, *last_error);
    return make_error<T>(ErrorCode::DATA_ACCESS_ERROR,
                         operation + " failed after " + std::to_string(config_.max_attempts) +
                             " attempts: " + last_error->what(),
                         "DataStore");
}

void DataStore::report_failure(const std::string& operation, int attempts,
                               const TcrimerError& cause) {
    ERROR(operation << " failed after " << attempts << " attempt(s): " << cause.what() << " ("
                    << error_code_to_string(cause.code()) << ")");
    if (!event_bus_) {
        return;
    }
    MonitoringEvent event;
    event.type = MonitoringEventType::DATA_ACCESS;
    event.source = "DataStore";
    event.timestamp = std::chrono::system_clock::now();
    event.string_fields["operation"] = operation;
    event.string_fields["cause"] = error_code_to_string(cause.code());
    event.numeric_fields["attempts"] = static_cast<double>(attempts);
    event_bus_->publish(std::move(event));
}

Result<std::shared_ptr<arrow::Table>> DataStore::query(const std::string& statement,
                                                       const SqlParams& params) {
    return with_retry<std::shared_ptr<arrow::Table>>(
        "query", [&](DatabaseInterface& db) { return db.query(statement, params); });
}

Result<size_t> DataStore::execute(const std::string& statement, const SqlParams& params) {
    return with_retry<size_t>("execute",
                              [&](DatabaseInterface& db) { return db.execute(statement, params); });
}

Result<size_t> DataStore::run_batch(DatabaseInterface& db,
                                    const std::vector<SqlStatement>& statements) {
    auto tx = ScopedTransaction::begin(db);
    if (tx.is_error()) {
        return forward_error<size_t>(tx.error());
    }

    size_t affected = 0;
    for (const auto& statement : statements) {
        auto result = db.execute(statement.sql, statement.params);
        if (result.is_error()) {
            return forward_error<size_t>(result.error());  // scope exit rolls back
        }
        affected += result.value();
    }

    auto committed = tx.value()->commit();
    if (committed.is_error()) {
        return forward_error<size_t>(committed.error());
    }
    return affected;
}

Result<size_t> DataStore::execute_transaction(const std::vector<SqlStatement>& statements) {
    if (statements.empty()) {
        return size_t{0};
    }
    return with_retry<size_t>("transaction", [&](DatabaseInterface& db) {
        return run_batch(db, statements);
    });
}

Result<void> DataStore::initialize_schema(const std::vector<std::string>& ddl) {
    std::vector<SqlStatement> statements;
    statements.reserve(ddl.size());
    for (const auto& sql : ddl) {
        statements.push_back(SqlStatement{sql, {}});
    }

    const BackendKind authoritative = pool_->selector()->authoritative();
    for (BackendKind backend : {BackendKind::PRIMARY, BackendKind::FALLBACK}) {
        if (!pool_->has_backend(backend)) {
            continue;
        }

        auto guard = pool_->acquire(backend);
        Result<size_t> applied = guard.is_error() ? forward_error<size_t>(guard.error())
                                                  : run_batch(*guard.value(), statements);
        if (applied.is_ok()) {
            INFO("Schema ready on " << backend_kind_to_string(backend) << " backend");
            continue;
        }

        if (backend == authoritative) {
            return make_error<void>(ErrorCode::DATA_ACCESS_ERROR,
                                    "Schema setup failed on authoritative " +
                                        backend_kind_to_string(backend) +
                                        " backend: " + applied.error()->what(),
                                    "DataStore");
        }
        WARN("Schema setup skipped on " << backend_kind_to_string(backend)
                                        << " backend: " << applied.error()->what());
    }
    return Result<void>();
}

}  // namespace tcrimer
