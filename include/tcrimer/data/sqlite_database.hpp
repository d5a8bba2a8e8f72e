// include/tcrimer/data/sqlite_database.hpp
#pragma once

#include <sqlite3.h>
#include <memory>
#include <mutex>
#include <string>
#include "tcrimer/data/conversion_utils.hpp"
#include "tcrimer/data/database_interface.hpp"

namespace tcrimer {

/**
 * @brief Embedded SQLite backend used as the local fallback store
 *
 * Opens the database in WAL mode with a busy timeout so that several pooled
 * connections to the same file can coexist. SQLITE_BUSY, SQLITE_LOCKED and
 * SQLITE_IOERR are reported as transient (CONNECTION_ERROR).
 */
class SqliteDatabase : public DatabaseInterface {
public:
    explicit SqliteDatabase(std::string db_path, int busy_timeout_ms = 5000);
    ~SqliteDatabase() override;

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    Result<void> connect() override;
    void disconnect() override;
    bool is_connected() const override;
    Result<void> ping() override;

    Result<std::shared_ptr<arrow::Table>> query(const std::string& statement,
                                                const SqlParams& params = {}) override;
    Result<size_t> execute(const std::string& statement, const SqlParams& params = {}) override;

    Result<void> begin_transaction() override;
    Result<void> commit() override;
    Result<void> rollback() override;
    bool in_transaction() const override;

    BackendKind backend() const override {
        return BackendKind::FALLBACK;
    }
    std::string backend_name() const override {
        return "sqlite";
    }

    const std::string& path() const {
        return db_path_;
    }

private:
    struct StatementDeleter {
        void operator()(sqlite3_stmt* stmt) const {
            sqlite3_finalize(stmt);
        }
    };
    using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

    Result<StatementPtr> prepare(const std::string& statement, const SqlParams& params);
    Result<void> exec_simple(const std::string& sql);
    ErrorCode classify(int rc) const;

    template <typename T>
    Result<T> sqlite_error(int rc, const std::string& context) const;

    std::string db_path_;
    int busy_timeout_ms_;
    sqlite3* db_{nullptr};
    bool in_transaction_{false};
    mutable std::mutex mutex_;
};

}  // namespace tcrimer
