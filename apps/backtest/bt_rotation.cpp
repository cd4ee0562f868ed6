#include <cmath>
#include <iomanip>
#include <iostream>
#include <optional>
#include "gold_rotation/backtest/rotation_backtest.hpp"
#include "gold_rotation/core/config_loader.hpp"
#include "gold_rotation/core/logger.hpp"
#include "gold_rotation/data/data_acquisition.hpp"

using namespace gold_rotation;
using namespace gold_rotation::backtest;

namespace {

void print_metric(const std::string& name, double value) {
    std::cout << "  " << name << ": ";
    if (std::isnan(value)) {
        std::cout << "nan";
    } else {
        std::cout << std::fixed << std::setprecision(4) << value;
    }
    std::cout << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        Logger::reset_for_tests();

        // Console logging until the configured logger takes over
        auto& logger = Logger::instance();
        LoggerConfig bootstrap_config;
        bootstrap_config.min_level = LogLevel::INFO;
        bootstrap_config.destination = LogDestination::CONSOLE;
        logger.initialize(bootstrap_config);

        const std::filesystem::path defaults_path =
            argc > 1 ? std::filesystem::path(argv[1]) : std::filesystem::path("config/defaults.json");
        std::optional<std::filesystem::path> override_path;
        if (argc > 2) {
            override_path = std::filesystem::path(argv[2]);
        }

        auto config_result = ConfigLoader::load(defaults_path, override_path);
        if (config_result.is_error()) {
            std::cerr << "Failed to load configuration: " << config_result.error()->to_string()
                      << std::endl;
            return 1;
        }
        AppConfig config = config_result.take_value();

        logger.initialize(config.logger);
        INFO("Logger initialized successfully");

        auto data = DataAcquisition::create_default(config.data);
        RotationBacktest backtest(config, data);

        auto report_result = backtest.run();
        if (report_result.is_error()) {
            const EngineError* error = report_result.error();
            ERROR("Backtest failed: " << error->to_string());
            if (const auto* unavailable = dynamic_cast<const DataUnavailableError*>(error)) {
                for (const auto& attempt : unavailable->attempts()) {
                    std::cerr << "  " << attempt.to_string() << std::endl;
                }
            }
            std::cerr << "Backtest failed: " << error->what() << std::endl;
            return 1;
        }

        const BacktestReport& report = report_result.value();
        std::cout << "Saved backtest results to " << report.output_path.string() << std::endl;
        if (!report.summary) {
            std::cout << "No overlapping observations; metrics unavailable" << std::endl;
            return 0;
        }

        std::cout << "Metrics:" << std::endl;
        print_metric("cagr", report.summary->cagr);
        print_metric("vol", report.summary->annualized_vol);
        print_metric("sharpe", report.summary->sharpe);
        print_metric("max_drawdown", report.summary->max_drawdown);
        print_metric("last_value", report.summary->terminal_value);
        std::cout << "  observations: " << report.summary->num_observations << std::endl;

        INFO("Backtest completed");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
