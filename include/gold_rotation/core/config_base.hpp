// include/gold_rotation/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "gold_rotation/core/error.hpp"

namespace gold_rotation {

/**
 * @brief JSON-backed settings block (rotation, data, backtest sections)
 *
 * Subclasses map their fields in to_json()/from_json(). from_json() may throw
 * EngineError for values it cannot interpret; load_from_file() turns that
 * into a Result. A loaded file is checked with validate() before it is
 * accepted.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Write the block as indented JSON, creating parent directories
     * @return FILE_IO_ERROR if the file cannot be written
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Read, apply and validate a JSON file
     * @return FILE_NOT_FOUND, JSON_PARSE_ERROR, or the code raised by
     *         from_json()/validate()
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;
    virtual void from_json(const nlohmann::json& j) = 0;

    // Range checks; blocks without constraints accept everything
    virtual Result<void> validate() const { return Result<void>(); }
};

}  // namespace gold_rotation
