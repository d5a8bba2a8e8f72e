// include/tcrimer/data/postgres_database.hpp
#pragma once

#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include "tcrimer/data/conversion_utils.hpp"
#include "tcrimer/data/database_interface.hpp"

namespace tcrimer {

/**
 * @brief PostgreSQL backend, the primary store
 */
class PostgresDatabase : public DatabaseInterface {
public:
    /**
     * @param connection_string libpq connection string or URL
     */
    explicit PostgresDatabase(std::string connection_string);
    ~PostgresDatabase() override;

    PostgresDatabase(const PostgresDatabase&) = delete;
    PostgresDatabase& operator=(const PostgresDatabase&) = delete;

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
        return BackendKind::PRIMARY;
    }
    std::string backend_name() const override {
        return "postgres";
    }

    /**
     * @brief Rewrite '?' placeholders to $1..$n, leaving quoted literals alone
     */
    static std::string rewrite_placeholders(const std::string& statement);

private:
    Result<void> validate_connection() const;

    /**
     * @brief Run a statement on the open transaction, or in autocommit mode
     */
    pqxx::result run(const std::string& statement, const SqlParams& params);

    /**
     * @brief Map a libpqxx exception to a transient or permanent error code
     */
    ErrorCode classify(const std::exception& e);

    std::string connection_string_;
    std::unique_ptr<pqxx::connection> connection_;
    std::unique_ptr<pqxx::work> transaction_;
    mutable std::mutex mutex_;
};

}  // namespace tcrimer
