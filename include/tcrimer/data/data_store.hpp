// include/tcrimer/data/data_store.hpp
#pragma once

#include <arrow/api.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "tcrimer/core/config_base.hpp"
#include "tcrimer/core/event_bus.hpp"
#include "tcrimer/data/database_interface.hpp"
#include "tcrimer/data/database_pooling.hpp"

namespace tcrimer {

struct DataStoreConfig : public ConfigBase {
    int max_attempts{3};
    std::chrono::milliseconds initial_backoff{100};
    double backoff_multiplier{2.0};
    std::chrono::milliseconds max_backoff{2000};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Backend-agnostic query and write access through the connection pool
 *
 * Transient failures (CONNECTION_ERROR, TIMEOUT_ERROR) are retried with
 * exponential backoff on a fresh connection. Once attempts are exhausted, or
 * for any non-transient failure, the caller receives DATA_ACCESS_ERROR.
 * POOL_EXHAUSTED is returned as is so callers can tell capacity apart from
 * storage faults.
 */
class DataStore {
public:
    DataStore(std::shared_ptr<ConnectionPool> pool, DataStoreConfig config = {},
              std::shared_ptr<EventBus> event_bus = nullptr);

    Result<std::shared_ptr<arrow::Table>> query(const std::string& statement,
                                                const SqlParams& params = {});

    Result<size_t> execute(const std::string& statement, const SqlParams& params = {});

    /**
     * @brief Run statements atomically
     *
     * The transaction is rolled back before any error is returned. A
     * transient failure retries the whole batch.
     * @return Total rows affected
     */
    Result<size_t> execute_transaction(const std::vector<SqlStatement>& statements);

    /**
     * @brief Apply DDL to every configured backend so a failover target is ready
     *
     * Failing on a non-authoritative backend only logs a warning.
     */
    Result<void> initialize_schema(const std::vector<std::string>& ddl);

    const DataStoreConfig& config() const {
        return config_;
    }

    // Attempts beyond the first, across all operations
    size_t retry_count() const {
        return retries_.load();
    }

    const std::shared_ptr<ConnectionPool>& pool() const {
        return pool_;
    }

private:
    template <typename T, typename Operation>
    Result<T> with_retry(const std::string& operation, Operation&& op);

    static Result<size_t> run_batch(DatabaseInterface& db,
                                    const std::vector<SqlStatement>& statements);

    void report_failure(const std::string& operation, int attempts, const TcrimerError& cause);

    std::shared_ptr<ConnectionPool> pool_;
    DataStoreConfig config_;
    std::shared_ptr<EventBus> event_bus_;
    std::atomic<size_t> retries_{0};
};

}  // namespace tcrimer
