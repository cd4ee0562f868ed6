#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <fstream>
#include "../core/test_base.hpp"
#include "../data/mock_price_provider.hpp"
#include "gold_rotation/backtest/rotation_backtest.hpp"

using namespace gold_rotation;
using namespace gold_rotation::backtest;
using namespace gold_rotation::testing;
using ::testing::_;
using ::testing::Invoke;
using ::testing::StrictMock;

class RotationBacktestTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        futures_ = std::make_shared<StrictMock<MockPriceProvider>>("futures");
        proxy_ = std::make_shared<StrictMock<MockPriceProvider>>("proxy");
        fallback_ = std::make_shared<StrictMock<MockPriceProvider>>("fallback");
        etf_ = std::make_shared<StrictMock<MockPriceProvider>>("etf");
        index_ = std::make_shared<StrictMock<MockPriceProvider>>("index");

        config_.data.cache_directory = (temp_dir_ / "cache").string();
        config_.data.default_options.retries = 1;
        config_.output_directory = (temp_dir_ / "results").string();
        config_.backtest.equity_symbol = "510300";
        config_.backtest.start_date = "2024-01-01";
        config_.backtest.end_date = "2024-03-31";
        config_.rotation.lookback_days = 5;
        config_.rotation.rebalance = strategy::RebalanceMode::DAILY;
    }

    std::shared_ptr<DataAcquisition> make_acquisition() {
        ProviderSet providers;
        providers.gold_futures = futures_;
        providers.gold_proxy = proxy_;
        providers.gold_fallback = fallback_;
        providers.equity_etf = etf_;
        providers.equity_index = index_;
        return std::make_shared<DataAcquisition>(config_.data, providers,
                                                 [](std::chrono::milliseconds) {});
    }

    // 91 days, 2024-01-01 .. 2024-03-31
    static std::vector<double> zigzag(double base, double step) {
        std::vector<double> values;
        for (int i = 0; i < 91; ++i) {
            values.push_back(base + step * static_cast<double>((i / 10) % 2 == 0 ? i % 10 : 10 - i % 10));
        }
        return values;
    }

    void expect_equity(const std::string& identifier) {
        EXPECT_CALL(*etf_, fetch_raw(identifier, date(2024, 1, 1), date(2024, 3, 31)))
            .WillOnce(Invoke([](const std::string&, Timestamp, Timestamp) {
                return table_ok(make_raw_table(core::make_date(2024, 1, 1), zigzag(3.5, 0.05)));
            }));
    }

    std::shared_ptr<StrictMock<MockPriceProvider>> futures_;
    std::shared_ptr<StrictMock<MockPriceProvider>> proxy_;
    std::shared_ptr<StrictMock<MockPriceProvider>> fallback_;
    std::shared_ptr<StrictMock<MockPriceProvider>> etf_;
    std::shared_ptr<StrictMock<MockPriceProvider>> index_;
    AppConfig config_;
};

TEST_F(RotationBacktestTest, RequiresDataLayer) {
    EXPECT_THROW(RotationBacktest(config_, nullptr), EngineError);
}

TEST_F(RotationBacktestTest, RunProducesReportAndCsv) {
    auto data = make_acquisition();
    ASSERT_TRUE(
        data->cache().store(make_series("GC=F", date(2023, 12, 1), zigzag(2000.0, 15.0))).is_ok());
    expect_equity("1.510300");

    RotationBacktest backtest(config_, data);
    auto report = backtest.run();
    ASSERT_TRUE(report.is_ok()) << report.error()->what();

    const BacktestReport& r = report.value();
    EXPECT_EQ(r.gold_symbol, "GC=F");
    EXPECT_EQ(r.equity_symbol, "510300");
    EXPECT_EQ(r.start_date, date(2024, 1, 1));
    EXPECT_EQ(r.end_date, date(2024, 3, 31));

    // Cached gold ends 2024-02-29; forward fill carries it to the last equity bar
    ASSERT_FALSE(r.signals.empty());
    EXPECT_EQ(r.signals.front().date, date(2024, 1, 1));
    EXPECT_EQ(r.signals.size(), r.curve.size());
    ASSERT_TRUE(r.summary.has_value());
    EXPECT_EQ(r.summary->num_observations, r.signals.size());
    EXPECT_DOUBLE_EQ(r.summary->terminal_value, r.curve.back());

    ASSERT_TRUE(std::filesystem::exists(r.output_path));
    EXPECT_EQ(r.output_path.filename().string(), "backtest_510300.csv");

    std::ifstream in(r.output_path);
    size_t lines = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++lines;
    }
    EXPECT_EQ(lines, r.signals.size() + 1);
}

TEST_F(RotationBacktestTest, SuffixedSymbolNamesOutputByCode) {
    config_.backtest.equity_symbol = "510300.SH";
    auto data = make_acquisition();
    ASSERT_TRUE(
        data->cache().store(make_series("GC=F", date(2024, 1, 1), zigzag(2000.0, 15.0))).is_ok());
    expect_equity("1.510300");

    auto report = RotationBacktest(config_, data).run();
    ASSERT_TRUE(report.is_ok()) << report.error()->what();
    EXPECT_EQ(report.value().equity_symbol, "510300");
    EXPECT_EQ(report.value().signals.size(), 91u);
    EXPECT_EQ(report.value().output_path.filename().string(), "backtest_510300.csv");
}

TEST_F(RotationBacktestTest, GoldOutageKeepsAttemptsAndAddsContext) {
    auto data = make_acquisition();
    auto fail = [](const std::string&, Timestamp, Timestamp) {
        return table_error(ErrorCode::CONNECTION_ERROR, "unreachable");
    };
    EXPECT_CALL(*futures_, fetch_raw(_, _, _)).Times(2).WillRepeatedly(Invoke(fail));
    EXPECT_CALL(*proxy_, fetch_raw("1.518880", _, _)).WillOnce(Invoke(fail));
    EXPECT_CALL(*fallback_, fetch_raw("GC=F", _, _)).WillOnce(Invoke(fail));

    auto report = RotationBacktest(config_, data).run();
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error()->code(), ErrorCode::DATA_UNAVAILABLE);

    const std::string message = report.error()->what();
    EXPECT_NE(message.find("gold"), std::string::npos);
    EXPECT_NE(message.find("2024-01-01..2024-03-31"), std::string::npos);

    const auto* unavailable = dynamic_cast<const DataUnavailableError*>(report.error());
    ASSERT_NE(unavailable, nullptr);
    EXPECT_EQ(unavailable->attempts().size(), 4u);
    EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "results"));
}

TEST_F(RotationBacktestTest, UnclassifiableEquityFails) {
    config_.backtest.equity_symbol = "HS300";
    auto data = make_acquisition();
    ASSERT_TRUE(
        data->cache().store(make_series("GC=F", date(2024, 1, 1), zigzag(2000.0, 15.0))).is_ok());

    auto report = RotationBacktest(config_, data).run();
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_NE(std::string(report.error()->what()).find("HS300"), std::string::npos);
}

TEST_F(RotationBacktestTest, InvalidStartDateIsConfigError) {
    config_.backtest.start_date = "not-a-date";
    auto report = RotationBacktest(config_, make_acquisition()).run();
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error()->code(), ErrorCode::CONFIG_ERROR);
}
