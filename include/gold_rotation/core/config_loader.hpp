// include/gold_rotation/core/config_loader.hpp

#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "gold_rotation/core/error.hpp"
#include "gold_rotation/core/logger.hpp"
#include "gold_rotation/core/types.hpp"
#include "gold_rotation/data/data_acquisition.hpp"
#include "gold_rotation/strategy/rotation_config.hpp"

namespace gold_rotation {

/**
 * @brief Backtest-specific configuration
 */
struct BacktestSettings {
    std::string equity_symbol{"510300"};
    std::string start_date{"2015-01-01"};
    std::string end_date;  // empty means today
    std::optional<bool> is_etf;

    /**
     * @brief Parsed start date
     */
    Result<Timestamp> start() const;

    /**
     * @brief Parsed end date, or today when unset
     */
    Result<Timestamp> end() const;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["equity_symbol"] = equity_symbol;
        j["start_date"] = start_date;
        j["end_date"] = end_date;
        if (is_etf.has_value()) {
            j["is_etf"] = *is_etf;
        } else {
            j["is_etf"] = nullptr;
        }
        return j;
    }

    void from_json(const nlohmann::json& j) {
        if (j.contains("equity_symbol"))
            equity_symbol = j.at("equity_symbol").get<std::string>();
        if (j.contains("start_date"))
            start_date = j.at("start_date").get<std::string>();
        if (j.contains("end_date")) {
            end_date = j.at("end_date").is_null() ? "" : j.at("end_date").get<std::string>();
        }
        if (j.contains("is_etf")) {
            if (j.at("is_etf").is_null())
                is_etf.reset();
            else
                is_etf = j.at("is_etf").get<bool>();
        }
    }
};

/**
 * @brief Consolidated application configuration
 *
 * Sections of config/defaults.json:
 * - logger: LoggerConfig
 * - data: DataConfig (cache, providers, fetch defaults)
 * - rotation: strategy::RotationConfig
 * - backtest: BacktestSettings
 * - output_directory: where the backtest CSV goes
 */
struct AppConfig {
    LoggerConfig logger;
    DataConfig data;
    strategy::RotationConfig rotation;
    BacktestSettings backtest;
    std::string output_directory{"results"};

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["logger"] = logger.to_json();
        j["data"] = data.to_json();
        j["rotation"] = rotation.to_json();
        j["backtest"] = backtest.to_json();
        j["output_directory"] = output_directory;
        return j;
    }
};

/**
 * @brief Loads AppConfig from a defaults file and an optional override file
 *
 * Values in the override file are deep-merged over the defaults.
 */
class ConfigLoader {
public:
    /**
     * @brief Load, merge, extract and validate
     * @param defaults_path Path to the defaults file (e.g. "config/defaults.json")
     * @param override_path Optional file whose values win over the defaults
     * @return Result containing AppConfig or error
     */
    static Result<AppConfig> load(const std::filesystem::path& defaults_path,
                                  const std::optional<std::filesystem::path>& override_path =
                                      std::nullopt);

    /**
     * @brief Extract and validate an AppConfig from an already merged document
     */
    static Result<AppConfig> from_json(const nlohmann::json& merged);

    /**
     * @brief Recursively merge JSON objects
     * @param target Target JSON object (modified in place)
     * @param source Source JSON object to merge from
     *
     * For nested objects, performs deep merge. For other types, source overwrites target.
     */
    static void merge_json(nlohmann::json& target, const nlohmann::json& source);

private:
    static Result<nlohmann::json> load_json_file(const std::filesystem::path& file_path);

    static Result<AppConfig> extract_config(const nlohmann::json& merged);

    static Result<void> validate_config(const AppConfig& config);

    static void log_config_summary(const AppConfig& config);
};

}  // namespace gold_rotation
