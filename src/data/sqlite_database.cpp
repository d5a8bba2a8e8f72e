// src/data/sqlite_database.cpp

#include "tcrimer/data/sqlite_database.hpp"
#include "tcrimer/core/logger.hpp"

namespace tcrimer {

SqliteDatabase::SqliteDatabase(std::string db_path, int busy_timeout_ms)
    : db_path_(std::move(db_path)), busy_timeout_ms_(busy_timeout_ms) {}

SqliteDatabase::~SqliteDatabase() {
    disconnect();
}

ErrorCode SqliteDatabase::classify(int rc) const {
    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_IOERR:
        case SQLITE_CANTOPEN:
        case SQLITE_PROTOCOL:
            return ErrorCode::CONNECTION_ERROR;
        default:
            return ErrorCode::DATABASE_ERROR;
    }
}

template <typename T>
Result<T> SqliteDatabase::sqlite_error(int rc, const std::string& context) const {
    std::string detail = db_ != nullptr ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    return make_error<T>(classify(rc), context + ": " + detail, "SqliteDatabase");
}

Result<void> SqliteDatabase::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ != nullptr) {
        return Result<void>();
    }

    int rc = sqlite3_open_v2(db_path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        auto error = sqlite_error<void>(rc, "Cannot open SQLite database '" + db_path_ + "'");
        sqlite3_close(db_);  // the handle is allocated even when open fails
        db_ = nullptr;
        return error;
    }

    sqlite3_busy_timeout(db_, busy_timeout_ms_);

    for (const char* pragma :
         {"PRAGMA journal_mode=WAL;", "PRAGMA synchronous=NORMAL;", "PRAGMA foreign_keys=ON;"}) {
        auto result = exec_simple(pragma);
        if (result.is_error()) {
            sqlite3_close(db_);
            db_ = nullptr;
            return result;
        }
    }

    DEBUG("Connected to SQLite database " << db_path_);
    return Result<void>();
}

void SqliteDatabase::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return;
    }
    if (in_transaction_) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        in_transaction_ = false;
    }
    int rc = sqlite3_close(db_);
    if (rc != SQLITE_OK) {
        WARN("Error closing SQLite database " << db_path_ << ": " << sqlite3_errmsg(db_));
        sqlite3_close_v2(db_);
    }
    db_ = nullptr;
}

bool SqliteDatabase::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

Result<void> SqliteDatabase::exec_simple(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string message = error_msg != nullptr ? error_msg : sqlite3_errstr(rc);
        sqlite3_free(error_msg);
        return make_error<void>(classify(rc), "SQL error in '" + sql + "': " + message,
                                "SqliteDatabase");
    }
    return Result<void>();
}

Result<SqliteDatabase::StatementPtr> SqliteDatabase::prepare(const std::string& statement,
                                                             const SqlParams& params) {
    if (db_ == nullptr) {
        return make_error<StatementPtr>(ErrorCode::CONNECTION_ERROR, "Not connected to database",
                                        "SqliteDatabase");
    }

    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, statement.c_str(), -1, &raw, nullptr);
    StatementPtr stmt(raw);
    if (rc != SQLITE_OK) {
        return sqlite_error<StatementPtr>(rc, "Failed to prepare statement");
    }

    int expected = sqlite3_bind_parameter_count(stmt.get());
    if (expected != static_cast<int>(params.size())) {
        return make_error<StatementPtr>(
            ErrorCode::INVALID_ARGUMENT,
            "Statement expects " + std::to_string(expected) + " parameters, got " +
                std::to_string(params.size()),
            "SqliteDatabase");
    }

    for (size_t i = 0; i < params.size(); ++i) {
        const int index = static_cast<int>(i) + 1;
        const auto& value = params[i];
        if (std::holds_alternative<int64_t>(value)) {
            rc = sqlite3_bind_int64(stmt.get(), index, std::get<int64_t>(value));
        } else if (std::holds_alternative<double>(value)) {
            rc = sqlite3_bind_double(stmt.get(), index, std::get<double>(value));
        } else if (std::holds_alternative<std::string>(value)) {
            const auto& text = std::get<std::string>(value);
            rc = sqlite3_bind_text(stmt.get(), index, text.c_str(), static_cast<int>(text.size()),
                                   SQLITE_TRANSIENT);
        } else {
            rc = sqlite3_bind_null(stmt.get(), index);
        }
        if (rc != SQLITE_OK) {
            return sqlite_error<StatementPtr>(rc, "Failed to bind parameter " +
                                                      std::to_string(index));
        }
    }

    return Result<StatementPtr>(std::move(stmt));
}

Result<void> SqliteDatabase::ping() {
    auto result = query("SELECT 1");
    if (result.is_error()) {
        return forward_error<void>(result.error());
    }
    return Result<void>();
}

Result<std::shared_ptr<arrow::Table>> SqliteDatabase::query(const std::string& statement,
                                                            const SqlParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto prepared = prepare(statement, params);
    if (prepared.is_error()) {
        return forward_error<std::shared_ptr<arrow::Table>>(prepared.error());
    }
    sqlite3_stmt* stmt = prepared.value().get();

    const int column_count = sqlite3_column_count(stmt);
    std::vector<std::string> columns;
    columns.reserve(static_cast<size_t>(column_count));
    for (int c = 0; c < column_count; ++c) {
        columns.emplace_back(sqlite3_column_name(stmt, c));
    }

    std::vector<SqlRow> rows;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        SqlRow row;
        row.reserve(columns.size());
        for (int c = 0; c < column_count; ++c) {
            switch (sqlite3_column_type(stmt, c)) {
                case SQLITE_INTEGER:
                    row.emplace_back(static_cast<int64_t>(sqlite3_column_int64(stmt, c)));
                    break;
                case SQLITE_FLOAT:
                    row.emplace_back(sqlite3_column_double(stmt, c));
                    break;
                case SQLITE_NULL:
                    row.emplace_back(std::monostate{});
                    break;
                default: {
                    const auto* text = sqlite3_column_text(stmt, c);
                    row.emplace_back(std::string(reinterpret_cast<const char*>(text),
                                                 static_cast<size_t>(sqlite3_column_bytes(stmt, c))));
                    break;
                }
            }
        }
        rows.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        return sqlite_error<std::shared_ptr<arrow::Table>>(rc, "Query failed");
    }

    return DataConversionUtils::rows_to_arrow_table(columns, rows);
}

Result<size_t> SqliteDatabase::execute(const std::string& statement, const SqlParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto prepared = prepare(statement, params);
    if (prepared.is_error()) {
        return forward_error<size_t>(prepared.error());
    }
    sqlite3_stmt* stmt = prepared.value().get();

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    }
    if (rc != SQLITE_DONE) {
        return sqlite_error<size_t>(rc, "Statement failed");
    }
    return static_cast<size_t>(sqlite3_changes(db_));
}

Result<void> SqliteDatabase::begin_transaction() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "Not connected to database",
                                "SqliteDatabase");
    }
    if (in_transaction_) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Transaction already in progress",
                                "SqliteDatabase");
    }
    // IMMEDIATE takes the write lock up front so concurrent writers wait on
    // the busy timeout instead of failing at commit
    auto result = exec_simple("BEGIN IMMEDIATE;");
    if (result.is_ok()) {
        in_transaction_ = true;
    }
    return result;
}

Result<void> SqliteDatabase::commit() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!in_transaction_) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "No transaction in progress",
                                "SqliteDatabase");
    }
    auto result = exec_simple("COMMIT;");
    if (result.is_ok()) {
        in_transaction_ = false;
    }
    return result;
}

Result<void> SqliteDatabase::rollback() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!in_transaction_ || db_ == nullptr) {
        in_transaction_ = false;
        return Result<void>();
    }
    in_transaction_ = false;
    return exec_simple("ROLLBACK;");
}

bool SqliteDatabase::in_transaction() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_transaction_;
}

}  // namespace tcrimer
