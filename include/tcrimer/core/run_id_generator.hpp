// include/tcrimer/core/run_id_generator.hpp
// Utility for generating backtest run IDs
#pragma once

#include <atomic>
#include <string>
#include "tcrimer/core/types.hpp"

namespace tcrimer {

/**
 * @brief Generates backtest run IDs
 *
 * Format: "<strategy>_<symbol>_<YYYYMMDD_HHMMSS>_<seq>", e.g.
 * "ma_crossover_BTC-USD_20250301_101500_7". The sequence is process-wide so
 * runs submitted within the same second stay distinct.
 */
class RunIdGenerator {
public:
    static std::string generate_backtest_run_id(const std::string& strategy_id,
                                                const std::string& symbol,
                                                const Timestamp& timestamp);

    /**
     * @brief Timestamp string "YYYYMMDD_HHMMSS" in UTC
     */
    static std::string generate_timestamp_string(const Timestamp& timestamp);

private:
    static std::atomic<uint64_t> sequence_;
};

}  // namespace tcrimer
