// src/core/config_loader.cpp

#include "gold_rotation/core/config_loader.hpp"

#include <fstream>

#include "gold_rotation/core/time_utils.hpp"

namespace gold_rotation {

Result<Timestamp> BacktestSettings::start() const {
    return core::parse_date(start_date);
}

Result<Timestamp> BacktestSettings::end() const {
    if (end_date.empty()) {
        return core::today();
    }
    return core::parse_date(end_date);
}

Result<nlohmann::json> ConfigLoader::load_json_file(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return make_error<nlohmann::json>(ErrorCode::FILE_NOT_FOUND,
                                          "Failed to open config file: " + file_path.string(),
                                          "ConfigLoader");
    }

    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<nlohmann::json>(
            ErrorCode::JSON_PARSE_ERROR,
            "Failed to parse JSON file " + file_path.string() + ": " + e.what(), "ConfigLoader");
    } catch (const std::exception& e) {
        return make_error<nlohmann::json>(ErrorCode::FILE_IO_ERROR,
                                          "Error reading config file " + file_path.string() + ": " +
                                              e.what(),
                                          "ConfigLoader");
    }
}

void ConfigLoader::merge_json(nlohmann::json& target, const nlohmann::json& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto& key = it.key();
        const auto& value = it.value();

        if (target.contains(key) && target[key].is_object() && value.is_object()) {
            merge_json(target[key], value);
        } else {
            target[key] = value;
        }
    }
}

Result<AppConfig> ConfigLoader::extract_config(const nlohmann::json& merged) {
    try {
        AppConfig config;

        if (merged.contains("logger")) {
            config.logger.from_json(merged.at("logger"));
        }
        if (merged.contains("data")) {
            config.data.from_json(merged.at("data"));
        }
        if (merged.contains("rotation")) {
            config.rotation.from_json(merged.at("rotation"));
        }
        if (merged.contains("backtest")) {
            config.backtest.from_json(merged.at("backtest"));
        }
        if (merged.contains("output_directory")) {
            config.output_directory = merged.at("output_directory").get<std::string>();
        }

        return config;

    } catch (const EngineError& e) {
        return make_error<AppConfig>(e.code(), e.what(), "ConfigLoader");
    } catch (const std::exception& e) {
        return make_error<AppConfig>(ErrorCode::CONFIG_ERROR,
                                     "Failed to extract config: " + std::string(e.what()),
                                     "ConfigLoader");
    }
}

Result<void> ConfigLoader::validate_config(const AppConfig& config) {
    auto rotation_valid = config.rotation.validate();
    if (rotation_valid.is_error()) {
        return rotation_valid;
    }
    if (config.backtest.equity_symbol.empty()) {
        return make_error<void>(ErrorCode::CONFIG_ERROR, "Missing backtest.equity_symbol",
                                "ConfigLoader");
    }
    if (config.data.gold_symbol.empty()) {
        return make_error<void>(ErrorCode::CONFIG_ERROR, "Missing data.gold_symbol",
                                "ConfigLoader");
    }
    if (config.data.default_options.backoff_seconds < 0.0) {
        return make_error<void>(ErrorCode::CONFIG_ERROR,
                                "data.fetch.backoff_seconds must be non-negative", "ConfigLoader");
    }
    if (config.data.request_timeout_seconds <= 0) {
        return make_error<void>(ErrorCode::CONFIG_ERROR,
                                "data.request_timeout_seconds must be positive", "ConfigLoader");
    }

    auto start = config.backtest.start();
    if (start.is_error()) {
        return make_error<void>(ErrorCode::CONFIG_ERROR,
                                "Invalid backtest.start_date: " + config.backtest.start_date,
                                "ConfigLoader");
    }
    auto end = config.backtest.end();
    if (end.is_error()) {
        return make_error<void>(ErrorCode::CONFIG_ERROR,
                                "Invalid backtest.end_date: " + config.backtest.end_date,
                                "ConfigLoader");
    }
    if (start.value() > end.value()) {
        return make_error<void>(ErrorCode::CONFIG_ERROR,
                                "backtest.start_date is after backtest.end_date", "ConfigLoader");
    }
    return Result<void>();
}

void ConfigLoader::log_config_summary(const AppConfig& config) {
    auto& logger = Logger::instance();
    if (!logger.is_initialized()) {
        return;
    }
    INFO("Config summary: gold=" + config.data.gold_symbol +
         ", equity=" + config.backtest.equity_symbol + ", range=" + config.backtest.start_date +
         ".." + (config.backtest.end_date.empty() ? "today" : config.backtest.end_date));
    INFO("Config summary: lookback=" + std::to_string(config.rotation.lookback_days) +
         ", rebalance=" + strategy::rebalance_mode_to_string(config.rotation.rebalance) +
         ", fee_bps=" + std::to_string(config.rotation.fee_bps) +
         ", alignment=" + strategy::alignment_policy_to_string(config.rotation.alignment));
    INFO("Config summary: cache=" + config.data.cache_directory +
         ", retries=" + std::to_string(config.data.default_options.retries) +
         ", output=" + config.output_directory);
}

Result<AppConfig> ConfigLoader::from_json(const nlohmann::json& merged) {
    auto config_result = extract_config(merged);
    if (config_result.is_error()) {
        return config_result;
    }

    auto validation_result = validate_config(config_result.value());
    if (validation_result.is_error()) {
        return make_error<AppConfig>(validation_result.error()->code(),
                                     validation_result.error()->what(), "ConfigLoader");
    }

    log_config_summary(config_result.value());
    return config_result;
}

Result<AppConfig> ConfigLoader::load(const std::filesystem::path& defaults_path,
                                     const std::optional<std::filesystem::path>& override_path) {
    auto defaults_result = load_json_file(defaults_path);
    if (defaults_result.is_error()) {
        return make_error<AppConfig>(defaults_result.error()->code(),
                                     "Failed to load " + defaults_path.filename().string() + ": " +
                                         std::string(defaults_result.error()->what()),
                                     "ConfigLoader");
    }
    nlohmann::json merged = defaults_result.value();

    if (override_path) {
        auto override_result = load_json_file(*override_path);
        if (override_result.is_error()) {
            return make_error<AppConfig>(override_result.error()->code(),
                                         "Failed to load " + override_path->filename().string() +
                                             ": " + std::string(override_result.error()->what()),
                                         "ConfigLoader");
        }
        merge_json(merged, override_result.value());
    }

    return from_json(merged);
}

}  // namespace gold_rotation
