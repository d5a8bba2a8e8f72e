// include/tcrimer/strategy/strategy_factory.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "tcrimer/core/error.hpp"
#include "tcrimer/strategy/strategy.hpp"

namespace tcrimer {

/**
 * @brief A named parameter set offered to users
 */
struct StrategyPreset {
    std::string name;
    std::string strategy_id;
    nlohmann::json params;
    std::string description;
};

/**
 * @brief Build and validate a strategy from its id and JSON parameters
 *
 * Ids are "ma_crossover", "rsi_threshold" and "macd_signal". Missing
 * parameters take the variant defaults.
 * @return INVALID_ARGUMENT for an unknown id, malformed parameters or
 *         parameters that fail validation
 */
Result<Strategy> create_strategy(const std::string& strategy_id, const nlohmann::json& params);

std::vector<std::string> strategy_ids();

std::vector<StrategyPreset> available_strategies();

}  // namespace tcrimer
