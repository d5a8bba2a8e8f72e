// include/tcrimer/storage/schema.hpp
#pragma once

#include <string>
#include <vector>

namespace tcrimer {

/**
 * @brief DDL for every tcrimer table
 *
 * Written against the subset shared by PostgreSQL and SQLite: TEXT, BIGINT
 * and DOUBLE PRECISION columns, composite primary keys and IF NOT EXISTS.
 * Timestamps are epoch seconds.
 */
std::vector<std::string> schema_statements();

}  // namespace tcrimer
