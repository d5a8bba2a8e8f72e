// include/tcrimer/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "tcrimer/core/error.hpp"
#include "tcrimer/core/types.hpp"
#include "tcrimer/data/database_interface.hpp"

namespace tcrimer {

using SqlRow = std::vector<SqlValue>;

/**
 * @brief Conversions between backend rows, Arrow tables, domain types and
 * cache blobs
 */
class DataConversionUtils {
public:
    /**
     * @brief Build an Arrow table from rows fetched by a backend
     *
     * Each column's type follows its non-null values: any text makes it
     * utf8, otherwise any real makes it float64, otherwise int64. A column
     * holding only NULLs becomes an all-null utf8 column.
     */
    static Result<std::shared_ptr<arrow::Table>> rows_to_arrow_table(
        const std::vector<std::string>& column_names, const std::vector<SqlRow>& rows);

    /**
     * @brief Convert an ohlcv_bars result (ts, open, high, low, close, volume)
     * to bars in table order
     */
    static Result<std::vector<Bar>> arrow_table_to_bars(const std::shared_ptr<arrow::Table>& table);

    /**
     * @brief Convert an ohlcv_bars result into a validated series
     */
    static Result<TimeSeries> arrow_table_to_series(const std::shared_ptr<arrow::Table>& table,
                                                    const std::string& symbol,
                                                    DataFrequency freq);

    // Typed cell access by column name. Numeric accessors accept both int64
    // and float64 columns.
    static Result<int64_t> get_int64(const std::shared_ptr<arrow::Table>& table,
                                     const std::string& column, int64_t row);
    static Result<double> get_double(const std::shared_ptr<arrow::Table>& table,
                                     const std::string& column, int64_t row);
    static Result<std::optional<double>> get_optional_double(
        const std::shared_ptr<arrow::Table>& table, const std::string& column, int64_t row);
    static Result<std::string> get_string(const std::shared_ptr<arrow::Table>& table,
                                          const std::string& column, int64_t row);

    // MessagePack encoding of a series for the cache
    static std::vector<uint8_t> series_to_blob(const TimeSeries& series);
    static Result<TimeSeries> series_from_blob(const std::vector<uint8_t>& blob);

private:
    struct Cell {
        std::shared_ptr<arrow::Array> array;
        int64_t index;
    };

    static Result<Cell> locate(const std::shared_ptr<arrow::Table>& table,
                               const std::string& column, int64_t row);
};

}  // namespace tcrimer
