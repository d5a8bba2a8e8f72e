// src/data/conversion_utils.cpp
#include "tcrimer/data/conversion_utils.hpp"
#include <nlohmann/json.hpp>

namespace tcrimer {

namespace {

enum class ColumnKind { INT64, FLOAT64, UTF8 };

ColumnKind infer_column_kind(const std::vector<SqlRow>& rows, size_t column) {
    bool has_double = false;
    bool has_int = false;
    for (const auto& row : rows) {
        const auto& value = row[column];
        if (std::holds_alternative<std::string>(value)) {
            return ColumnKind::UTF8;
        }
        if (std::holds_alternative<double>(value)) {
            has_double = true;
        } else if (std::holds_alternative<int64_t>(value)) {
            has_int = true;
        }
    }
    if (has_double)
        return ColumnKind::FLOAT64;
    if (has_int)
        return ColumnKind::INT64;
    return ColumnKind::UTF8;
}

std::string value_to_text(const SqlValue& value) {
    if (std::holds_alternative<int64_t>(value))
        return std::to_string(std::get<int64_t>(value));
    if (std::holds_alternative<double>(value))
        return std::to_string(std::get<double>(value));
    return std::get<std::string>(value);
}

}  // namespace

Result<std::shared_ptr<arrow::Table>> DataConversionUtils::rows_to_arrow_table(
    const std::vector<std::string>& column_names, const std::vector<SqlRow>& rows) {
    auto handle_builder_error = [](const std::string& operation, const arrow::Status& status) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Arrow builder error during " + operation + ": " + status.ToString(),
            "DataConversionUtils");
    };

    arrow::MemoryPool* pool = arrow::default_memory_pool();
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    fields.reserve(column_names.size());
    arrays.reserve(column_names.size());

    for (size_t col = 0; col < column_names.size(); ++col) {
        for (const auto& row : rows) {
            if (row.size() != column_names.size()) {
                return make_error<std::shared_ptr<arrow::Table>>(
                    ErrorCode::CONVERSION_ERROR, "Row width does not match column count",
                    "DataConversionUtils");
            }
        }

        ColumnKind kind = infer_column_kind(rows, col);
        std::shared_ptr<arrow::Array> array;
        arrow::Status status;

        if (kind == ColumnKind::INT64) {
            arrow::Int64Builder builder(pool);
            status = builder.Reserve(static_cast<int64_t>(rows.size()));
            for (size_t r = 0; status.ok() && r < rows.size(); ++r) {
                const auto& value = rows[r][col];
                status = std::holds_alternative<int64_t>(value)
                             ? builder.Append(std::get<int64_t>(value))
                             : builder.AppendNull();
            }
            if (status.ok())
                status = builder.Finish(&array);
            fields.push_back(arrow::field(column_names[col], arrow::int64()));
        } else if (kind == ColumnKind::FLOAT64) {
            arrow::DoubleBuilder builder(pool);
            status = builder.Reserve(static_cast<int64_t>(rows.size()));
            for (size_t r = 0; status.ok() && r < rows.size(); ++r) {
                const auto& value = rows[r][col];
                if (std::holds_alternative<double>(value)) {
                    status = builder.Append(std::get<double>(value));
                } else if (std::holds_alternative<int64_t>(value)) {
                    status = builder.Append(static_cast<double>(std::get<int64_t>(value)));
                } else {
                    status = builder.AppendNull();
                }
            }
            if (status.ok())
                status = builder.Finish(&array);
            fields.push_back(arrow::field(column_names[col], arrow::float64()));
        } else {
            arrow::StringBuilder builder(pool);
            for (size_t r = 0; status.ok() && r < rows.size(); ++r) {
                const auto& value = rows[r][col];
                status = std::holds_alternative<std::monostate>(value)
                             ? builder.AppendNull()
                             : builder.Append(value_to_text(value));
            }
            if (status.ok())
                status = builder.Finish(&array);
            fields.push_back(arrow::field(column_names[col], arrow::utf8()));
        }

        if (!status.ok()) {
            return handle_builder_error("column " + column_names[col], status);
        }
        arrays.push_back(array);
    }

    return arrow::Table::Make(arrow::schema(fields), arrays,
                              static_cast<int64_t>(rows.size()));
}

Result<DataConversionUtils::Cell> DataConversionUtils::locate(
    const std::shared_ptr<arrow::Table>& table, const std::string& column, int64_t row) {
    if (!table) {
        return make_error<Cell>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                "DataConversionUtils");
    }
    auto chunked = table->GetColumnByName(column);
    if (!chunked) {
        return make_error<Cell>(ErrorCode::INVALID_DATA, "Missing required column: " + column,
                                "DataConversionUtils");
    }
    if (row < 0 || row >= chunked->length()) {
        return make_error<Cell>(ErrorCode::INVALID_ARGUMENT,
                                "Row " + std::to_string(row) + " out of range for " + column,
                                "DataConversionUtils");
    }

    int64_t offset = row;
    for (const auto& chunk : chunked->chunks()) {
        if (offset < chunk->length()) {
            return Cell{chunk, offset};
        }
        offset -= chunk->length();
    }
    return make_error<Cell>(ErrorCode::CONVERSION_ERROR, "Row not found in column chunks",
                            "DataConversionUtils");
}

Result<int64_t> DataConversionUtils::get_int64(const std::shared_ptr<arrow::Table>& table,
                                               const std::string& column, int64_t row) {
    auto cell = locate(table, column, row);
    if (cell.is_error()) {
        return forward_error<int64_t>(cell.error());
    }
    const auto& [array, index] = cell.value();
    if (array->IsNull(index)) {
        return make_error<int64_t>(ErrorCode::INVALID_DATA,
                                   "Null value in " + column + " at row " + std::to_string(row),
                                   "DataConversionUtils");
    }
    switch (array->type_id()) {
        case arrow::Type::INT64:
            return std::static_pointer_cast<arrow::Int64Array>(array)->Value(index);
        case arrow::Type::DOUBLE:
            return static_cast<int64_t>(
                std::static_pointer_cast<arrow::DoubleArray>(array)->Value(index));
        default:
            return make_error<int64_t>(ErrorCode::CONVERSION_ERROR,
                                       "Column " + column + " is not numeric",
                                       "DataConversionUtils");
    }
}

Result<std::optional<double>> DataConversionUtils::get_optional_double(
    const std::shared_ptr<arrow::Table>& table, const std::string& column, int64_t row) {
    auto cell = locate(table, column, row);
    if (cell.is_error()) {
        return forward_error<std::optional<double>>(cell.error());
    }
    const auto& [array, index] = cell.value();
    if (array->IsNull(index)) {
        return std::optional<double>();
    }
    switch (array->type_id()) {
        case arrow::Type::DOUBLE:
            return std::optional<double>(
                std::static_pointer_cast<arrow::DoubleArray>(array)->Value(index));
        case arrow::Type::INT64:
            return std::optional<double>(static_cast<double>(
                std::static_pointer_cast<arrow::Int64Array>(array)->Value(index)));
        default:
            return make_error<std::optional<double>>(ErrorCode::CONVERSION_ERROR,
                                                     "Column " + column + " is not numeric",
                                                     "DataConversionUtils");
    }
}

Result<double> DataConversionUtils::get_double(const std::shared_ptr<arrow::Table>& table,
                                               const std::string& column, int64_t row) {
    auto value = get_optional_double(table, column, row);
    if (value.is_error()) {
        return forward_error<double>(value.error());
    }
    if (!value.value()) {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  "Null value in " + column + " at row " + std::to_string(row),
                                  "DataConversionUtils");
    }
    return *value.value();
}

Result<std::string> DataConversionUtils::get_string(const std::shared_ptr<arrow::Table>& table,
                                                    const std::string& column, int64_t row) {
    auto cell = locate(table, column, row);
    if (cell.is_error()) {
        return forward_error<std::string>(cell.error());
    }
    const auto& [array, index] = cell.value();
    if (array->IsNull(index)) {
        return make_error<std::string>(
            ErrorCode::INVALID_DATA, "Null value in " + column + " at row " + std::to_string(row),
            "DataConversionUtils");
    }
    if (array->type_id() != arrow::Type::STRING) {
        return make_error<std::string>(ErrorCode::CONVERSION_ERROR,
                                       "Column " + column + " is not text",
                                       "DataConversionUtils");
    }
    return std::static_pointer_cast<arrow::StringArray>(array)->GetString(index);
}

Result<std::vector<Bar>> DataConversionUtils::arrow_table_to_bars(
    const std::shared_ptr<arrow::Table>& table) {
    if (!table) {
        return make_error<std::vector<Bar>>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                            "DataConversionUtils");
    }

    std::vector<Bar> bars;
    bars.reserve(static_cast<size_t>(table->num_rows()));

    for (int64_t i = 0; i < table->num_rows(); ++i) {
        auto ts = get_int64(table, "ts", i);
        auto open = get_double(table, "open", i);
        auto high = get_double(table, "high", i);
        auto low = get_double(table, "low", i);
        auto close = get_double(table, "close", i);
        auto volume = get_double(table, "volume", i);

        if (ts.is_error()) {
            return forward_error<std::vector<Bar>>(ts.error());
        }
        if (open.is_error() || high.is_error() || low.is_error() || close.is_error() ||
            volume.is_error()) {
            return make_error<std::vector<Bar>>(
                ErrorCode::CONVERSION_ERROR,
                "Error extracting OHLCV values at row " + std::to_string(i),
                "DataConversionUtils");
        }

        bars.emplace_back(from_epoch_seconds(ts.value()), open.value(), high.value(),
                          low.value(), close.value(), volume.value());
    }

    return bars;
}

Result<TimeSeries> DataConversionUtils::arrow_table_to_series(
    const std::shared_ptr<arrow::Table>& table, const std::string& symbol, DataFrequency freq) {
    auto bars = arrow_table_to_bars(table);
    if (bars.is_error()) {
        return forward_error<TimeSeries>(bars.error());
    }
    return TimeSeries::from_bars(symbol, freq, std::move(bars.value()));
}

std::vector<uint8_t> DataConversionUtils::series_to_blob(const TimeSeries& series) {
    nlohmann::json j;
    j["symbol"] = series.symbol();
    j["timeframe"] = timeframe_to_string(series.frequency());

    nlohmann::json bars = nlohmann::json::array();
    for (const auto& bar : series.bars()) {
        bars.push_back({to_epoch_seconds(bar.timestamp), bar.open, bar.high, bar.low, bar.close,
                        bar.volume});
    }
    j["bars"] = std::move(bars);
    return nlohmann::json::to_msgpack(j);
}

Result<TimeSeries> DataConversionUtils::series_from_blob(const std::vector<uint8_t>& blob) {
    try {
        auto j = nlohmann::json::from_msgpack(blob);
        auto freq = timeframe_from_string(j.at("timeframe").get<std::string>());
        if (!freq) {
            return make_error<TimeSeries>(ErrorCode::CONVERSION_ERROR,
                                          "Unknown timeframe in cached series",
                                          "DataConversionUtils");
        }

        std::vector<Bar> bars;
        bars.reserve(j.at("bars").size());
        for (const auto& b : j.at("bars")) {
            bars.emplace_back(from_epoch_seconds(b.at(0).get<int64_t>()), b.at(1).get<double>(),
                              b.at(2).get<double>(), b.at(3).get<double>(),
                              b.at(4).get<double>(), b.at(5).get<double>());
        }
        return TimeSeries::from_bars(j.at("symbol").get<std::string>(), *freq, std::move(bars));
    } catch (const nlohmann::json::exception& e) {
        return make_error<TimeSeries>(ErrorCode::CONVERSION_ERROR,
                                      std::string("Corrupt cached series: ") + e.what(),
                                      "DataConversionUtils");
    }
}

}  // namespace tcrimer
