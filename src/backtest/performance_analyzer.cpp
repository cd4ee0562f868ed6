// src/backtest/performance_analyzer.cpp
#include "gold_rotation/backtest/performance_analyzer.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include "gold_rotation/core/time_utils.hpp"

namespace gold_rotation {
namespace backtest {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

}  // namespace

std::vector<double> PerformanceAnalyzer::cumulative_curve(
    const std::vector<double>& returns) const {
    std::vector<double> curve;
    curve.reserve(returns.size());
    double value = 1.0;
    for (double r : returns) {
        value *= 1.0 + r;
        curve.push_back(value);
    }
    return curve;
}

double PerformanceAnalyzer::sample_stdev(const std::vector<double>& values) const {
    if (values.size() < 2) {
        return kNaN;
    }
    Eigen::Map<const Eigen::VectorXd> v(values.data(), static_cast<Eigen::Index>(values.size()));
    const double mean = v.mean();
    const double sum_sq = (v.array() - mean).square().sum();
    return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
}

double PerformanceAnalyzer::max_drawdown(const std::vector<double>& curve) const {
    double peak = -std::numeric_limits<double>::infinity();
    double worst = 0.0;
    for (double value : curve) {
        peak = std::max(peak, value);
        if (peak > 0.0) {
            worst = std::min(worst, value / peak - 1.0);
        }
    }
    return worst;
}

std::optional<PerformanceSummary> PerformanceAnalyzer::summarize(
    const std::vector<std::pair<Timestamp, double>>& daily_returns) const {
    if (daily_returns.empty()) {
        return std::nullopt;
    }

    std::vector<double> returns;
    returns.reserve(daily_returns.size());
    for (const auto& entry : daily_returns) {
        returns.push_back(entry.second);
    }

    const std::vector<double> curve = cumulative_curve(returns);

    PerformanceSummary summary;
    summary.num_observations = returns.size();
    summary.terminal_value = curve.back();
    summary.years = static_cast<double>(core::days_between(daily_returns.front().first,
                                                           daily_returns.back().first)) /
                    kDaysPerYear;

    if (summary.years > 0.0) {
        summary.cagr = std::pow(summary.terminal_value, 1.0 / summary.years) - 1.0;
    } else {
        summary.cagr = kNaN;
    }

    const double stdev = sample_stdev(returns);
    summary.annualized_vol = stdev * std::sqrt(kTradingDaysPerYear);

    if (std::isnan(stdev) || stdev == 0.0) {
        summary.sharpe = kNaN;
    } else {
        Eigen::Map<const Eigen::VectorXd> v(returns.data(),
                                            static_cast<Eigen::Index>(returns.size()));
        summary.sharpe = v.mean() / stdev * std::sqrt(kTradingDaysPerYear);
    }

    summary.max_drawdown = max_drawdown(curve);
    return summary;
}

}  // namespace backtest
}  // namespace gold_rotation
