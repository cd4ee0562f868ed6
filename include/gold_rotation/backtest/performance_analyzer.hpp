// include/gold_rotation/backtest/performance_analyzer.hpp
#pragma once

#include <optional>
#include <utility>
#include <vector>
#include "gold_rotation/core/types.hpp"

namespace gold_rotation {
namespace backtest {

/**
 * @brief Risk/return statistics of a daily return series
 *
 * NaN marks a statistic that is undefined for the input (e.g. CAGR over a
 * zero-length period, volatility of a single observation).
 */
struct PerformanceSummary {
    double cagr{0.0};
    double annualized_vol{0.0};
    double sharpe{0.0};
    double max_drawdown{0.0};   // non-positive
    double terminal_value{1.0}; // growth of 1.0
    size_t num_observations{0};
    double years{0.0};          // calendar span / 365.25
};

/**
 * @brief Stateless calculator for curve and summary statistics
 */
class PerformanceAnalyzer {
public:
    static constexpr double kTradingDaysPerYear = 252.0;
    static constexpr double kDaysPerYear = 365.25;

    PerformanceAnalyzer() = default;

    /**
     * @brief Running product of (1 + r), starting from the first return
     */
    std::vector<double> cumulative_curve(const std::vector<double>& returns) const;

    /**
     * @brief Summarize a dated daily return series
     * @return std::nullopt for an empty series
     */
    std::optional<PerformanceSummary> summarize(
        const std::vector<std::pair<Timestamp, double>>& daily_returns) const;

    /**
     * @brief Sample standard deviation (n-1); NaN for fewer than two values
     */
    double sample_stdev(const std::vector<double>& values) const;

    /**
     * @brief Worst peak-to-trough decline of a value curve, as a fraction <= 0
     */
    double max_drawdown(const std::vector<double>& curve) const;
};

}  // namespace backtest
}  // namespace gold_rotation
