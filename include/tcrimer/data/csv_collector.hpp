// include/tcrimer/data/csv_collector.hpp
#pragma once

#include <string>
#include <vector>
#include "tcrimer/data/upstream_collector.hpp"

namespace tcrimer {

/**
 * @brief Collector reading "<directory>/<SYMBOL>_<timeframe>.csv"
 *
 * Files start with the header "timestamp,open,high,low,close,volume". The
 * timestamp is epoch seconds or a UTC date ("YYYY-MM-DD[ HH:MM:SS]").
 */
class CsvCollector : public UpstreamCollector {
public:
    explicit CsvCollector(std::string directory);

    Result<std::vector<Bar>> fetch_series(const std::string& symbol, DataFrequency freq,
                                          const Timestamp& start, const Timestamp& end) override;

    Result<Bar> fetch_latest(const std::string& symbol, DataFrequency freq) override;

    std::string name() const override {
        return "csv:" + directory_;
    }

    std::string file_path(const std::string& symbol, DataFrequency freq) const;

private:
    Result<std::vector<Bar>> read_file(const std::string& symbol, DataFrequency freq) const;

    std::string directory_;
};

}  // namespace tcrimer
