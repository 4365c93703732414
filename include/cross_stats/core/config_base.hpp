// include/cross_stats/core/config_base.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include "cross_stats/core/error.hpp"

namespace cross_stats {

/**
 * @brief Base class for all configuration types
 * Provides common JSON serialization and file persistence
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
     * @return Result indicating success or failure
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Load configuration from JSON, keeping defaults for absent keys
     */
    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace cross_stats
