// include/gold_rotation/backtest/rotation_backtest.hpp
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "gold_rotation/backtest/performance_analyzer.hpp"
#include "gold_rotation/core/config_loader.hpp"
#include "gold_rotation/core/error.hpp"
#include "gold_rotation/data/data_acquisition.hpp"
#include "gold_rotation/strategy/rotation_engine.hpp"

namespace gold_rotation {
namespace backtest {

/**
 * @brief Everything a backtest run produced
 */
struct BacktestReport {
    std::string gold_symbol;
    std::string equity_symbol;
    Timestamp start_date;
    Timestamp end_date;
    std::vector<strategy::SignalRecord> signals;
    std::vector<double> curve;
    std::optional<PerformanceSummary> summary;  // empty when no rows survived alignment
    std::filesystem::path output_path;
};

/**
 * @brief One end-to-end run: fetch both legs, generate signals, summarize, export
 */
class RotationBacktest {
public:
    RotationBacktest(AppConfig config, std::shared_ptr<DataAcquisition> data);

    /**
     * @brief Execute the run
     * @return The report, or the first failure re-wrapped with the asset and
     *         date range it concerned
     */
    Result<BacktestReport> run();

    const AppConfig& config() const {
        return config_;
    }

private:
    AppConfig config_;
    std::shared_ptr<DataAcquisition> data_;
    PerformanceAnalyzer analyzer_;
};

}  // namespace backtest
}  // namespace gold_rotation
