// src/backtest/rotation_backtest.cpp
#include "gold_rotation/backtest/rotation_backtest.hpp"
#include <utility>
#include "gold_rotation/backtest/backtest_csv_exporter.hpp"
#include "gold_rotation/core/logger.hpp"
#include "gold_rotation/core/time_utils.hpp"
#include "gold_rotation/data/instrument_classifier.hpp"

namespace gold_rotation {
namespace backtest {

namespace {

// Keeps the attempt list of a DataUnavailableError while adding context
template <typename T>
Result<T> wrap_fetch_error(const EngineError& error, const std::string& context) {
    const std::string message = context + ": " + error.what();
    if (const auto* unavailable = dynamic_cast<const DataUnavailableError*>(&error)) {
        std::unique_ptr<EngineError> wrapped = std::make_unique<DataUnavailableError>(
            message, unavailable->attempts(), "RotationBacktest");
        return Result<T>(std::move(wrapped));
    }
    return make_error<T>(error.code(), message, "RotationBacktest");
}

}  // namespace

RotationBacktest::RotationBacktest(AppConfig config, std::shared_ptr<DataAcquisition> data)
    : config_(std::move(config)), data_(std::move(data)) {
    if (!data_) {
        throw EngineError(ErrorCode::INVALID_ARGUMENT, "Data acquisition layer is required",
                          "RotationBacktest");
    }
}

Result<BacktestReport> RotationBacktest::run() {
    Logger::register_component("RotationBacktest");

    auto start = config_.backtest.start();
    if (start.is_error()) {
        return make_error<BacktestReport>(ErrorCode::CONFIG_ERROR,
                                          "Invalid start date: " + config_.backtest.start_date,
                                          "RotationBacktest");
    }
    auto end = config_.backtest.end();
    if (end.is_error()) {
        return make_error<BacktestReport>(ErrorCode::CONFIG_ERROR,
                                          "Invalid end date: " + config_.backtest.end_date,
                                          "RotationBacktest");
    }

    BacktestReport report;
    report.gold_symbol = data_->config().gold_symbol;
    report.equity_symbol = InstrumentClassifier::strip_suffix(config_.backtest.equity_symbol);
    report.start_date = start.value();
    report.end_date = end.value();
    const std::string range =
        core::format_date(report.start_date) + ".." + core::format_date(report.end_date);

    INFO("Backtesting " << report.gold_symbol << " vs " << report.equity_symbol << " over "
                        << range);

    FetchOptions gold_options = data_->config().default_options;
    gold_options.is_etf.reset();
    auto gold = data_->fetch_gold(report.start_date, report.end_date, gold_options);
    if (gold.is_error()) {
        return wrap_fetch_error<BacktestReport>(
            *gold.error(), "Failed to fetch gold " + report.gold_symbol + " for " + range);
    }

    FetchOptions equity_options = data_->config().default_options;
    equity_options.is_etf = config_.backtest.is_etf;
    auto equity = data_->fetch_equity(config_.backtest.equity_symbol, report.start_date,
                                      report.end_date, equity_options);
    if (equity.is_error()) {
        return wrap_fetch_error<BacktestReport>(
            *equity.error(),
            "Failed to fetch equity " + config_.backtest.equity_symbol + " for " + range);
    }

    auto signals = strategy::generate_signals(gold.value(), equity.value(), config_.rotation);
    if (signals.is_error()) {
        return forward_error<BacktestReport>(*signals.error(), "RotationBacktest");
    }
    report.signals = signals.take_value();

    std::vector<double> returns;
    std::vector<std::pair<Timestamp, double>> dated_returns;
    returns.reserve(report.signals.size());
    dated_returns.reserve(report.signals.size());
    for (const auto& row : report.signals) {
        returns.push_back(row.portfolio_ret);
        dated_returns.emplace_back(row.date, row.portfolio_ret);
    }
    report.curve = analyzer_.cumulative_curve(returns);
    report.summary = analyzer_.summarize(dated_returns);

    if (report.summary) {
        INFO("CAGR " << report.summary->cagr << ", vol " << report.summary->annualized_vol
                     << ", Sharpe " << report.summary->sharpe << ", max drawdown "
                     << report.summary->max_drawdown << ", terminal "
                     << report.summary->terminal_value);
    } else {
        WARN("No overlapping observations for " << report.gold_symbol << " and "
                                                << report.equity_symbol << " over " << range);
    }

    BacktestCSVExporter exporter(config_.output_directory);
    auto exported = exporter.export_signals("backtest_" + report.equity_symbol + ".csv",
                                            report.signals, report.curve,
                                            config_.rotation.cash_symbol);
    if (exported.is_error()) {
        return forward_error<BacktestReport>(*exported.error(), "RotationBacktest");
    }
    report.output_path = exported.value();

    return report;
}

}  // namespace backtest
}  // namespace gold_rotation
