// src/data/csv_collector.cpp

#include "tcrimer/data/csv_collector.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include "tcrimer/core/logger.hpp"
#include "tcrimer/core/time_utils.hpp"

namespace tcrimer {

namespace {

std::optional<Timestamp> parse_timestamp(const std::string& text) {
    if (!text.empty() && std::all_of(text.begin(), text.end(),
                                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return from_epoch_seconds(std::stoll(text));
    }
    return core::parse_utc(text);
}

}  // namespace

CsvCollector::CsvCollector(std::string directory) : directory_(std::move(directory)) {}

std::string CsvCollector::file_path(const std::string& symbol, DataFrequency freq) const {
    return (std::filesystem::path(directory_) / (symbol + "_" + timeframe_to_string(freq) + ".csv"))
        .string();
}

Result<std::vector<Bar>> CsvCollector::read_file(const std::string& symbol,
                                                 DataFrequency freq) const {
    const std::string path = file_path(symbol, freq);
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<std::vector<Bar>>(ErrorCode::UPSTREAM_ERROR,
                                            "No data file for " + symbol + ": " + path,
                                            "CsvCollector");
    }

    std::vector<Bar> bars;
    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || (line_number == 1 && line.rfind("timestamp", 0) == 0)) {
            continue;
        }

        std::stringstream ss(line);
        std::vector<std::string> fields;
        std::string field;
        while (std::getline(ss, field, ',')) {
            fields.push_back(field);
        }
        if (fields.size() != 6) {
            return make_error<std::vector<Bar>>(
                ErrorCode::UPSTREAM_ERROR,
                path + ":" + std::to_string(line_number) + ": expected 6 fields",
                "CsvCollector");
        }

        try {
            auto ts = parse_timestamp(fields[0]);
            if (!ts) {
                throw std::invalid_argument("bad timestamp '" + fields[0] + "'");
            }
            bars.emplace_back(*ts, std::stod(fields[1]), std::stod(fields[2]),
                              std::stod(fields[3]), std::stod(fields[4]), std::stod(fields[5]));
        } catch (const std::exception& e) {
            return make_error<std::vector<Bar>>(
                ErrorCode::UPSTREAM_ERROR,
                path + ":" + std::to_string(line_number) + ": " + e.what(), "CsvCollector");
        }
    }

    DEBUG("Read " << bars.size() << " bars from " << path);
    return bars;
}

Result<std::vector<Bar>> CsvCollector::fetch_series(const std::string& symbol, DataFrequency freq,
                                                    const Timestamp& start, const Timestamp& end) {
    auto bars = read_file(symbol, freq);
    if (bars.is_error()) {
        return bars;
    }
    std::vector<Bar> in_range;
    for (const auto& bar : bars.value()) {
        if (bar.timestamp >= start && bar.timestamp <= end) {
            in_range.push_back(bar);
        }
    }
    return in_range;
}

Result<Bar> CsvCollector::fetch_latest(const std::string& symbol, DataFrequency freq) {
    auto bars = read_file(symbol, freq);
    if (bars.is_error()) {
        return forward_error<Bar>(bars.error());
    }
    if (bars.value().empty()) {
        return make_error<Bar>(ErrorCode::UPSTREAM_ERROR, "No bars for " + symbol,
                               "CsvCollector");
    }
    auto latest = std::max_element(
        bars.value().begin(), bars.value().end(),
        [](const Bar& a, const Bar& b) { return a.timestamp < b.timestamp; });
    return *latest;
}

}  // namespace tcrimer
