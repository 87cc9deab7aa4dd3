// include/backfolio/core/config_base.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include "backfolio/core/error.hpp"

namespace backfolio {

/**
 * @brief Base class for all configuration types
 * Provides common serialization and deserialization methods
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Save configuration to JSON file
     * @param filepath Path to save the file
     * @return Result indicating success or failure, FILE_IO_ERROR when the
     *         file cannot be written
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Load configuration from JSON file
     * @param filepath Path to the file
     * @return Result indicating success or failure. FILE_IO_ERROR when the
     *         file cannot be opened, JSON_PARSE_ERROR on malformed JSON and
     *         INVALID_ARGUMENT when from_json rejects the content
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    /**
     * @brief Convert configuration to JSON
     * @return JSON representation holding every field
     */
    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Load configuration from JSON
     * @param j JSON object to load from. Keys that are absent keep their
     *          current values
     * @throws nlohmann::json::exception when a present key has the wrong type
     */
    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace backfolio
