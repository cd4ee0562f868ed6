// include/gold_rotation/backtest/backtest_csv_exporter.hpp
#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "gold_rotation/core/error.hpp"
#include "gold_rotation/strategy/rotation_engine.hpp"

namespace gold_rotation {
namespace backtest {

/**
 * @brief Writes the per-day backtest table to CSV
 *
 * Columns: date,signal,position,gold_ret,equity_ret,fee,portfolio_ret,portfolio_curve
 */
class BacktestCSVExporter {
public:
    explicit BacktestCSVExporter(const std::string& output_directory);

    /**
     * @brief Write one row per signal record
     * @param filename File name inside the output directory
     * @param signals Engine output
     * @param curve Cumulative value per row, same length as signals
     * @param cash_symbol Label used for the cash holding
     * @return Path of the written file
     */
    Result<std::filesystem::path> export_signals(const std::string& filename,
                                                 const std::vector<strategy::SignalRecord>& signals,
                                                 const std::vector<double>& curve,
                                                 const std::string& cash_symbol) const;

    const std::string& output_directory() const {
        return output_directory_;
    }

private:
    std::string output_directory_;
};

}  // namespace backtest
}  // namespace gold_rotation
