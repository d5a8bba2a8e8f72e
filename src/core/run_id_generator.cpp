// src/core/run_id_generator.cpp

#include "tcrimer/core/run_id_generator.hpp"
#include "tcrimer/core/time_utils.hpp"

namespace tcrimer {

std::atomic<uint64_t> RunIdGenerator::sequence_{0};

std::string RunIdGenerator::generate_timestamp_string(const Timestamp& timestamp) {
    return core::format_utc(timestamp, "%Y%m%d_%H%M%S");
}

std::string RunIdGenerator::generate_backtest_run_id(const std::string& strategy_id,
                                                     const std::string& symbol,
                                                     const Timestamp& timestamp) {
    uint64_t seq = sequence_.fetch_add(1, std::memory_order_relaxed) + 1;
    return strategy_id + "_" + symbol + "_" + generate_timestamp_string(timestamp) + "_" +
           std::to_string(seq);
}

}  // namespace tcrimer
