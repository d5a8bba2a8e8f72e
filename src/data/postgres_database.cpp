// src/data/postgres_database.cpp

#include "tcrimer/data/postgres_database.hpp"
#include "tcrimer/core/logger.hpp"

namespace tcrimer {

namespace {

// Type OIDs from pg_type
constexpr pqxx::oid BOOL_OID = 16;
constexpr pqxx::oid INT8_OID = 20;
constexpr pqxx::oid INT2_OID = 21;
constexpr pqxx::oid INT4_OID = 23;
constexpr pqxx::oid FLOAT4_OID = 700;
constexpr pqxx::oid FLOAT8_OID = 701;
constexpr pqxx::oid NUMERIC_OID = 1700;

pqxx::params to_pqxx_params(const SqlParams& params) {
    pqxx::params out;
    for (const auto& value : params) {
        if (std::holds_alternative<int64_t>(value)) {
            out.append(std::get<int64_t>(value));
        } else if (std::holds_alternative<double>(value)) {
            out.append(std::get<double>(value));
        } else if (std::holds_alternative<std::string>(value)) {
            out.append(std::get<std::string>(value));
        } else {
            out.append();
        }
    }
    return out;
}

SqlValue field_to_value(const pqxx::field& field, pqxx::oid type) {
    if (field.is_null()) {
        return std::monostate{};
    }
    switch (type) {
        case BOOL_OID:
            return static_cast<int64_t>(field.as<bool>() ? 1 : 0);
        case INT2_OID:
        case INT4_OID:
        case INT8_OID:
            return field.as<int64_t>();
        case FLOAT4_OID:
        case FLOAT8_OID:
        case NUMERIC_OID:
            return field.as<double>();
        default:
            return std::string(field.c_str());
    }
}

}  // namespace

PostgresDatabase::PostgresDatabase(std::string connection_string)
    : connection_string_(std::move(connection_string)) {}

PostgresDatabase::~PostgresDatabase() {
    disconnect();
}

Result<void> PostgresDatabase::connect() {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        connection_ = std::make_unique<pqxx::connection>(connection_string_);
        if (!connection_->is_open()) {
            connection_.reset();
            return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                    "Failed to open database connection", "PostgresDatabase");
        }
        DEBUG("Connected to PostgreSQL database " << connection_->dbname());
        return Result<void>();
    } catch (const std::exception& e) {
        connection_.reset();
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Database connection error: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

void PostgresDatabase::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        if (transaction_) {
            transaction_->abort();
            transaction_.reset();
        }
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    } catch (const std::exception& e) {
        WARN("Error closing PostgreSQL connection: " << e.what());
    }
    transaction_.reset();
    connection_.reset();
}

bool PostgresDatabase::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_ && connection_->is_open();
}

Result<void> PostgresDatabase::validate_connection() const {
    if (!connection_ || !connection_->is_open()) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "Not connected to database",
                                "PostgresDatabase");
    }
    return Result<void>();
}

std::string PostgresDatabase::rewrite_placeholders(const std::string& statement) {
    std::string out;
    out.reserve(statement.size() + 8);
    int index = 0;
    bool in_literal = false;
    for (char c : statement) {
        if (c == '\'') {
            in_literal = !in_literal;
            out += c;
        } else if (c == '?' && !in_literal) {
            out += "$" + std::to_string(++index);
        } else {
            out += c;
        }
    }
    return out;
}

ErrorCode PostgresDatabase::classify(const std::exception& e) {
    if (dynamic_cast<const pqxx::broken_connection*>(&e) != nullptr) {
        // The session is gone; a later connect() is required
        transaction_.reset();
        connection_.reset();
        return ErrorCode::CONNECTION_ERROR;
    }
    if (dynamic_cast<const pqxx::transaction_rollback*>(&e) != nullptr) {
        return ErrorCode::CONNECTION_ERROR;  // serialization failure, deadlock
    }
    if (auto sql = dynamic_cast<const pqxx::sql_error*>(&e)) {
        const std::string state = sql->sqlstate();
        // 08: connection exception, 53: insufficient resources, 57P0x: shutdown
        if (state.rfind("08", 0) == 0 || state.rfind("53", 0) == 0 ||
            state.rfind("57P0", 0) == 0) {
            return ErrorCode::CONNECTION_ERROR;
        }
        if (state == "57014") {
            return ErrorCode::TIMEOUT_ERROR;  // statement timeout
        }
    }
    return ErrorCode::DATABASE_ERROR;
}

pqxx::result PostgresDatabase::run(const std::string& statement, const SqlParams& params) {
    const std::string sql = rewrite_placeholders(statement);
    if (transaction_) {
        return transaction_->exec_params(sql, to_pqxx_params(params));
    }
    pqxx::nontransaction ntx(*connection_);
    return ntx.exec_params(sql, to_pqxx_params(params));
}

Result<void> PostgresDatabase::ping() {
    auto result = query("SELECT 1");
    if (result.is_error()) {
        return forward_error<void>(result.error());
    }
    return Result<void>();
}

Result<std::shared_ptr<arrow::Table>> PostgresDatabase::query(const std::string& statement,
                                                              const SqlParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<std::shared_ptr<arrow::Table>>(validation.error());
    }

    try {
        pqxx::result result = run(statement, params);

        std::vector<std::string> columns;
        std::vector<pqxx::oid> types;
        for (pqxx::row::size_type c = 0; c < result.columns(); ++c) {
            columns.emplace_back(result.column_name(c));
            types.push_back(result.column_type(c));
        }

        std::vector<SqlRow> rows;
        rows.reserve(result.size());
        for (const auto& row : result) {
            SqlRow values;
            values.reserve(columns.size());
            for (pqxx::row::size_type c = 0; c < row.size(); ++c) {
                values.push_back(field_to_value(row[c], types[c]));
            }
            rows.push_back(std::move(values));
        }

        return DataConversionUtils::rows_to_arrow_table(columns, rows);
    } catch (const std::exception& e) {
        ErrorCode code = classify(e);
        return make_error<std::shared_ptr<arrow::Table>>(
            code, "Query failed: " + std::string(e.what()), "PostgresDatabase");
    }
}

Result<size_t> PostgresDatabase::execute(const std::string& statement, const SqlParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<size_t>(validation.error());
    }

    try {
        pqxx::result result = run(statement, params);
        return static_cast<size_t>(result.affected_rows());
    } catch (const std::exception& e) {
        ErrorCode code = classify(e);
        return make_error<size_t>(code, "Statement failed: " + std::string(e.what()),
                                  "PostgresDatabase");
    }
}

Result<void> PostgresDatabase::begin_transaction() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }
    if (transaction_) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Transaction already in progress",
                                "PostgresDatabase");
    }

    try {
        transaction_ = std::make_unique<pqxx::work>(*connection_);
        return Result<void>();
    } catch (const std::exception& e) {
        ErrorCode code = classify(e);
        return make_error<void>(code, "Failed to begin transaction: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

Result<void> PostgresDatabase::commit() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!transaction_) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "No transaction in progress",
                                "PostgresDatabase");
    }

    try {
        transaction_->commit();
        transaction_.reset();
        return Result<void>();
    } catch (const std::exception& e) {
        transaction_.reset();
        ErrorCode code = classify(e);
        return make_error<void>(code, "Commit failed: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

Result<void> PostgresDatabase::rollback() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!transaction_) {
        return Result<void>();
    }

    try {
        transaction_->abort();
        transaction_.reset();
        return Result<void>();
    } catch (const std::exception& e) {
        transaction_.reset();
        ErrorCode code = classify(e);
        return make_error<void>(code, "Rollback failed: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

bool PostgresDatabase::in_transaction() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transaction_ != nullptr;
}

}  // namespace tcrimer
