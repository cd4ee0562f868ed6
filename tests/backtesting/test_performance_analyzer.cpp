#include <gtest/gtest.h>
#include <cmath>
#include "../core/test_base.hpp"
#include "gold_rotation/backtest/performance_analyzer.hpp"

using namespace gold_rotation;
using namespace gold_rotation::backtest;
using namespace gold_rotation::testing;

class PerformanceAnalyzerTest : public TestBase {
protected:
    static std::vector<std::pair<Timestamp, double>> dated(Timestamp first,
                                                           const std::vector<double>& returns) {
        std::vector<std::pair<Timestamp, double>> result;
        int64_t day = core::days_since_epoch(first);
        for (double r : returns) {
            result.emplace_back(core::date_from_days(day++), r);
        }
        return result;
    }

    PerformanceAnalyzer analyzer_;
};

TEST_F(PerformanceAnalyzerTest, CumulativeCurveCompounds) {
    auto curve = analyzer_.cumulative_curve({0.1, -0.5, 0.0});
    ASSERT_EQ(curve.size(), 3u);
    EXPECT_NEAR(curve[0], 1.1, 1e-12);
    EXPECT_NEAR(curve[1], 0.55, 1e-12);
    EXPECT_NEAR(curve[2], 0.55, 1e-12);
    EXPECT_TRUE(analyzer_.cumulative_curve({}).empty());
}

TEST_F(PerformanceAnalyzerTest, MaxDrawdown) {
    EXPECT_DOUBLE_EQ(analyzer_.max_drawdown({1.0, 2.0, 1.0, 3.0, 1.5}), -0.5);
    EXPECT_DOUBLE_EQ(analyzer_.max_drawdown({1.0, 1.1, 1.2}), 0.0);
    EXPECT_DOUBLE_EQ(analyzer_.max_drawdown({}), 0.0);
    EXPECT_NEAR(analyzer_.max_drawdown({0.9, 0.8, 1.0, 0.7}), -0.3, 1e-12);
}

TEST_F(PerformanceAnalyzerTest, SampleStdev) {
    EXPECT_NEAR(analyzer_.sample_stdev({1.0, 2.0, 3.0, 4.0}), std::sqrt(5.0 / 3.0), 1e-12);
    EXPECT_DOUBLE_EQ(analyzer_.sample_stdev({2.0, 2.0}), 0.0);
    EXPECT_TRUE(std::isnan(analyzer_.sample_stdev({1.0})));
    EXPECT_TRUE(std::isnan(analyzer_.sample_stdev({})));
}

TEST_F(PerformanceAnalyzerTest, EmptySeriesHasNoSummary) {
    EXPECT_FALSE(analyzer_.summarize({}).has_value());
}

TEST_F(PerformanceAnalyzerTest, FlatSeries) {
    auto summary = analyzer_.summarize(dated(date(2023, 1, 1), std::vector<double>(100, 0.0)));
    ASSERT_TRUE(summary.has_value());
    EXPECT_DOUBLE_EQ(summary->cagr, 0.0);
    EXPECT_DOUBLE_EQ(summary->annualized_vol, 0.0);
    EXPECT_TRUE(std::isnan(summary->sharpe));
    EXPECT_DOUBLE_EQ(summary->max_drawdown, 0.0);
    EXPECT_DOUBLE_EQ(summary->terminal_value, 1.0);
    EXPECT_EQ(summary->num_observations, 100u);
}

TEST_F(PerformanceAnalyzerTest, SingleObservation) {
    auto summary = analyzer_.summarize(dated(date(2024, 1, 2), {0.01}));
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->num_observations, 1u);
    EXPECT_DOUBLE_EQ(summary->years, 0.0);
    EXPECT_TRUE(std::isnan(summary->cagr));
    EXPECT_TRUE(std::isnan(summary->annualized_vol));
    EXPECT_TRUE(std::isnan(summary->sharpe));
    EXPECT_DOUBLE_EQ(summary->terminal_value, 1.01);
    EXPECT_DOUBLE_EQ(summary->max_drawdown, 0.0);
}

TEST_F(PerformanceAnalyzerTest, CagrUsesCalendarYears) {
    std::vector<std::pair<Timestamp, double>> returns = {{date(2020, 1, 1), 0.1},
                                                         {date(2021, 12, 31), 0.1}};
    auto summary = analyzer_.summarize(returns);
    ASSERT_TRUE(summary.has_value());

    const double years = 730.0 / 365.25;
    EXPECT_NEAR(summary->years, years, 1e-12);
    EXPECT_NEAR(summary->terminal_value, 1.21, 1e-12);
    EXPECT_NEAR(summary->cagr, std::pow(1.21, 1.0 / years) - 1.0, 1e-12);
}

TEST_F(PerformanceAnalyzerTest, VolatilityAndSharpeAreAnnualized) {
    const std::vector<double> values = {0.01, -0.005, 0.02, 0.0};
    auto summary = analyzer_.summarize(dated(date(2024, 1, 1), values));
    ASSERT_TRUE(summary.has_value());

    const double mean = 0.00625;
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - mean) * (v - mean);
    }
    const double stdev = std::sqrt(sum_sq / 3.0);
    EXPECT_NEAR(summary->annualized_vol, stdev * std::sqrt(252.0), 1e-12);
    EXPECT_NEAR(summary->sharpe, mean / stdev * std::sqrt(252.0), 1e-9);
    EXPECT_NEAR(summary->max_drawdown, 1.01 * 0.995 / 1.01 - 1.0, 1e-12);
}
