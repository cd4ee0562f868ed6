// src/backtest/backtest_csv_exporter.cpp
#include "gold_rotation/backtest/backtest_csv_exporter.hpp"
#include <fstream>
#include <iomanip>
#include <limits>
#include "gold_rotation/core/logger.hpp"
#include "gold_rotation/core/time_utils.hpp"

namespace gold_rotation {
namespace backtest {

BacktestCSVExporter::BacktestCSVExporter(const std::string& output_directory)
    : output_directory_(output_directory) {}

Result<std::filesystem::path> BacktestCSVExporter::export_signals(
    const std::string& filename, const std::vector<strategy::SignalRecord>& signals,
    const std::vector<double>& curve, const std::string& cash_symbol) const {
    if (curve.size() != signals.size()) {
        return make_error<std::filesystem::path>(
            ErrorCode::INVALID_ARGUMENT,
            "Curve has " + std::to_string(curve.size()) + " values for " +
                std::to_string(signals.size()) + " signal rows",
            "BacktestCSVExporter");
    }

    try {
        std::filesystem::create_directories(output_directory_);
        const std::filesystem::path path = std::filesystem::path(output_directory_) / filename;

        std::ofstream file(path, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            return make_error<std::filesystem::path>(
                ErrorCode::FILE_IO_ERROR, "Failed to open " + path.string() + " for writing",
                "BacktestCSVExporter");
        }

        file << std::setprecision(std::numeric_limits<double>::max_digits10);
        file << "date,signal,position,gold_ret,equity_ret,fee,portfolio_ret,portfolio_curve\n";
        for (size_t i = 0; i < signals.size(); ++i) {
            const auto& row = signals[i];
            file << core::format_date(row.date) << ","
                 << strategy::holding_label(row.raw_signal, cash_symbol) << ","
                 << strategy::holding_label(row.executed_position, cash_symbol) << ","
                 << row.gold_ret << "," << row.equity_ret << "," << row.fee << ","
                 << row.portfolio_ret << "," << curve[i] << "\n";
        }

        file.flush();
        if (!file) {
            return make_error<std::filesystem::path>(
                ErrorCode::FILE_IO_ERROR, "Failed to write " + path.string(),
                "BacktestCSVExporter");
        }

        INFO("Wrote " << signals.size() << " rows to " << path.string());
        return path;
    } catch (const std::filesystem::filesystem_error& e) {
        return make_error<std::filesystem::path>(
            ErrorCode::FILE_IO_ERROR, std::string("Error exporting backtest: ") + e.what(),
            "BacktestCSVExporter");
    }
}

}  // namespace backtest
}  // namespace gold_rotation
