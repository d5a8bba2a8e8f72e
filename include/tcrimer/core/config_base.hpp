// include/tcrimer/core/config_base.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include "tcrimer/core/error.hpp"

namespace tcrimer {

/**
 * @brief Base class for all configuration sections
 *
 * from_json() overrides only the keys it finds, so a partial document leaves
 * the remaining fields at their defaults.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Save configuration to JSON file
     * @param filepath Path to save the file
     * @return Result indicating success or failure
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Load configuration from JSON file
     * @param filepath Path to the file
     * @return FILE_NOT_FOUND if the file cannot be opened, JSON_PARSE_ERROR if
     *         it is not valid JSON or holds values of the wrong type
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace tcrimer
