// include/tcrimer/storage/ohlcv_store.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "tcrimer/core/types.hpp"
#include "tcrimer/data/data_store.hpp"

namespace tcrimer {

/**
 * @brief Persistence for OHLCV bars in the ohlcv_bars table
 */
class OhlcvStore {
public:
    explicit OhlcvStore(std::shared_ptr<DataStore> store);

    /**
     * @brief Upsert bars in one transaction; an existing bar at the same
     * timestamp is overwritten
     * @return Rows written
     */
    Result<size_t> store_bars(const std::string& symbol, DataFrequency freq,
                              const std::vector<Bar>& bars);

    /**
     * @brief Bars with start <= timestamp <= end, oldest first
     */
    Result<TimeSeries> load_bars(const std::string& symbol, DataFrequency freq,
                                 const Timestamp& start, const Timestamp& end);

    Result<std::optional<Bar>> latest_bar(const std::string& symbol, DataFrequency freq);

    // Distinct symbols with stored bars, sorted
    Result<std::vector<std::string>> symbols();

    /**
     * @brief Delete bars older than the cutoff, for every symbol
     * @return Rows deleted
     */
    Result<size_t> purge_before(const Timestamp& cutoff);

private:
    std::shared_ptr<DataStore> store_;
};

}  // namespace tcrimer
