// include/quanttrade/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "quanttrade/core/error.hpp"

namespace quanttrade {

/**
 * @brief Base class for the JSON-backed configuration sections
 *
 * from_json only overwrites the keys that are present, so a partial document
 * layers over the defaults. Range checks live in validate(), which
 * load_from_file runs after parsing.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Write the configuration as indented JSON
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Read, parse and validate a configuration file
     * @return FILE_NOT_FOUND, JSON_PARSE_ERROR or the validate() error on failure
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;
    virtual void from_json(const nlohmann::json& j) = 0;

    /**
     * @brief Check value ranges; sections without constraints accept anything
     */
    virtual Result<void> validate() const {
        return Result<void>();
    }
};

}  // namespace quanttrade
