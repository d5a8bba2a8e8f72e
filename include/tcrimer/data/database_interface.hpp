// include/tcrimer/data/database_interface.hpp

#pragma once

#include <arrow/api.h>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "tcrimer/core/error.hpp"

namespace tcrimer {

/**
 * @brief Backends the pool can route to
 */
enum class BackendKind { PRIMARY, FALLBACK };

std::string backend_kind_to_string(BackendKind kind);

/**
 * @brief Bound statement parameter. std::monostate binds SQL NULL.
 */
using SqlValue = std::variant<std::monostate, int64_t, double, std::string>;
using SqlParams = std::vector<SqlValue>;

/**
 * @brief A statement with its parameters, used for transactional batches
 */
struct SqlStatement {
    std::string sql;
    SqlParams params;
};

/**
 * @brief Backend-agnostic connection to a relational store
 *
 * Statements use '?' placeholders and must stay within the dialect shared
 * by PostgreSQL and SQLite. Query results are returned as Arrow tables with
 * int64, double or utf8 columns.
 *
 * An instance is used by one caller at a time; the pool guarantees this.
 */
class DatabaseInterface {
public:
    virtual ~DatabaseInterface() = default;

    virtual Result<void> connect() = 0;

    virtual void disconnect() = 0;

    virtual bool is_connected() const = 0;

    /**
     * @brief Lightweight round trip used by the pool health check
     */
    virtual Result<void> ping() = 0;

    /**
     * @brief Run a statement that returns rows
     * @return CONNECTION_ERROR or TIMEOUT_ERROR for transient failures,
     *         DATABASE_ERROR for everything else
     */
    virtual Result<std::shared_ptr<arrow::Table>> query(const std::string& statement,
                                                        const SqlParams& params = {}) = 0;

    /**
     * @brief Run a statement that modifies data
     * @return Number of rows affected
     */
    virtual Result<size_t> execute(const std::string& statement,
                                   const SqlParams& params = {}) = 0;

    virtual Result<void> begin_transaction() = 0;
    virtual Result<void> commit() = 0;
    virtual Result<void> rollback() = 0;
    virtual bool in_transaction() const = 0;

    virtual BackendKind backend() const = 0;
    virtual std::string backend_name() const = 0;
};

/**
 * @brief RAII transaction scope
 *
 * Rolls back on destruction unless commit() succeeded, so any early return
 * from the owning scope leaves the database unchanged.
 */
class ScopedTransaction {
public:
    /**
     * @brief Begin a transaction on the given connection
     */
    static Result<std::unique_ptr<ScopedTransaction>> begin(DatabaseInterface& db);

    ~ScopedTransaction();

    ScopedTransaction(const ScopedTransaction&) = delete;
    ScopedTransaction& operator=(const ScopedTransaction&) = delete;

    Result<void> commit();

    bool active() const {
        return active_;
    }

private:
    explicit ScopedTransaction(DatabaseInterface& db) : db_(db), active_(true) {}

    DatabaseInterface& db_;
    bool active_;
};

}  // namespace tcrimer
