#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <vector>
#include "../core/test_base.hpp"
#include "gold_rotation/data/data_acquisition.hpp"
#include "gold_rotation/data/price_normalizer.hpp"
#include "mock_price_provider.hpp"

using namespace gold_rotation;
using namespace gold_rotation::testing;
using ::testing::_;
using ::testing::Invoke;
using ::testing::StrictMock;

class DataAcquisitionTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        futures_ = std::make_shared<StrictMock<MockPriceProvider>>("futures");
        proxy_ = std::make_shared<StrictMock<MockPriceProvider>>("proxy");
        fallback_ = std::make_shared<StrictMock<MockPriceProvider>>("fallback");
        etf_ = std::make_shared<StrictMock<MockPriceProvider>>("etf");
        index_ = std::make_shared<StrictMock<MockPriceProvider>>("index");

        config_.cache_directory = (temp_dir_ / "cache").string();
        start_ = date(2024, 1, 1);
        end_ = date(2024, 1, 31);
    }

    std::unique_ptr<DataAcquisition> make_acquisition() {
        ProviderSet providers;
        providers.gold_futures = futures_;
        providers.gold_proxy = proxy_;
        providers.gold_fallback = fallback_;
        providers.equity_etf = etf_;
        providers.equity_index = index_;
        return std::make_unique<DataAcquisition>(
            config_, providers, [this](std::chrono::milliseconds wait) { sleeps_.push_back(wait); });
    }

    void expect_futures_fail(ErrorCode code) {
        EXPECT_CALL(*futures_, fetch_raw("101.GC00Y", _, _))
            .WillOnce(Invoke([code](const std::string&, Timestamp, Timestamp) {
                return table_error(code, "futures down");
            }));
        EXPECT_CALL(*futures_, fetch_raw("101.GCM", _, _))
            .WillOnce(Invoke([code](const std::string&, Timestamp, Timestamp) {
                return table_error(code, "futures down");
            }));
    }

    void expect_proxy_fail(ErrorCode code) {
        EXPECT_CALL(*proxy_, fetch_raw("1.518880", _, _))
            .WillOnce(Invoke([code](const std::string&, Timestamp, Timestamp) {
                return table_error(code, "proxy down");
            }));
    }

    std::shared_ptr<StrictMock<MockPriceProvider>> futures_;
    std::shared_ptr<StrictMock<MockPriceProvider>> proxy_;
    std::shared_ptr<StrictMock<MockPriceProvider>> fallback_;
    std::shared_ptr<StrictMock<MockPriceProvider>> etf_;
    std::shared_ptr<StrictMock<MockPriceProvider>> index_;
    DataConfig config_;
    std::vector<std::chrono::milliseconds> sleeps_;
    Timestamp start_;
    Timestamp end_;
};

TEST_F(DataAcquisitionTest, CacheHitMakesNoProviderCall) {
    auto acquisition = make_acquisition();
    PriceSeries cached = make_series("GC=F", date(2023, 12, 1), closes_of(90));
    ASSERT_TRUE(acquisition->cache().store(cached).is_ok());

    auto result = acquisition->fetch("GC=F", start_, end_, FetchOptions{});

    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_EQ(result.value().size(), 31u);
    EXPECT_EQ(result.value(), cached.slice(start_, end_));
    EXPECT_TRUE(acquisition->last_attempts().empty());
}

TEST_F(DataAcquisitionTest, FirstFuturesCandidateWinsAndIsCached) {
    auto acquisition = make_acquisition();
    EXPECT_CALL(*futures_, fetch_raw("101.GC00Y", start_, end_))
        .WillOnce(Invoke([](const std::string&, Timestamp, Timestamp) {
            return table_ok(make_raw_table(core::make_date(2023, 12, 20), std::vector<double>(60, 2000.0)));
        }));

    auto result = acquisition->fetch_gold(start_, end_, FetchOptions{});

    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_EQ(result.value().symbol(), "GC=F");
    EXPECT_EQ(result.value().size(), 31u);

    // Full normalized series is persisted, not just the slice
    auto cached = acquisition->cache().load("GC=F");
    ASSERT_TRUE(cached.is_ok());
    EXPECT_EQ(cached.value().size(), 60u);
}

TEST_F(DataAcquisitionTest, SecondCandidateTriedAfterEmptySlice) {
    auto acquisition = make_acquisition();
    EXPECT_CALL(*futures_, fetch_raw("101.GC00Y", _, _))
        .WillOnce(Invoke([](const std::string&, Timestamp, Timestamp) {
            // Entirely before the requested range
            return table_ok(make_raw_table(core::make_date(2023, 6, 1), closes_of(10)));
        }));
    EXPECT_CALL(*futures_, fetch_raw("101.GCM", _, _))
        .WillOnce(Invoke([](const std::string&, Timestamp, Timestamp) {
            return table_ok(make_raw_table(core::make_date(2024, 1, 1), closes_of(10)));
        }));

    auto result = acquisition->fetch_gold(start_, end_, FetchOptions{});

    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_EQ(result.value().size(), 10u);
    ASSERT_EQ(acquisition->last_attempts().size(), 1u);
    EXPECT_EQ(acquisition->last_attempts()[0].identifier, "101.GC00Y");
    EXPECT_EQ(acquisition->last_attempts()[0].code, ErrorCode::EMPTY_DATA);
}

TEST_F(DataAcquisitionTest, FallsThroughToRetriedProviderWithLinearBackoff) {
    auto acquisition = make_acquisition();
    // Older cache that does not cover the range must be replaced, not served
    const PriceSeries old_cache = make_series("GC=F", date(2023, 6, 1), closes_of(20, 1500.0));
    ASSERT_TRUE(acquisition->cache().store(old_cache).is_ok());

    const auto fallback_raw = make_raw_table(core::make_date(2023, 12, 25), closes_of(45));
    expect_futures_fail(ErrorCode::CONNECTION_ERROR);
    EXPECT_CALL(*proxy_, fetch_raw("1.518880", _, _))
        .WillOnce(Invoke([](const std::string&, Timestamp, Timestamp) {
            return table_ok(make_table_without_close(core::make_date(2024, 1, 2)));
        }));
    EXPECT_CALL(*fallback_, fetch_raw("GC=F", _, _))
        .WillOnce(Invoke([](const std::string&, Timestamp, Timestamp) {
            return table_error(ErrorCode::TIMEOUT_ERROR, "timed out");
        }))
        .WillOnce(Invoke([fallback_raw](const std::string&, Timestamp, Timestamp) {
            return table_ok(fallback_raw);
        }));

    auto result = acquisition->fetch_gold(start_, end_, FetchOptions{});

    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    auto expected = PriceNormalizer::normalize(fallback_raw, "GC=F");
    ASSERT_TRUE(expected.is_ok());
    EXPECT_EQ(result.value().size(), 31u);
    EXPECT_EQ(result.value(), expected.value().slice(start_, end_));

    ASSERT_EQ(sleeps_.size(), 1u);
    EXPECT_EQ(sleeps_[0], std::chrono::milliseconds(2000));

    const auto& attempts = acquisition->last_attempts();
    ASSERT_EQ(attempts.size(), 4u);
    EXPECT_EQ(attempts[2].provider, "proxy");
    EXPECT_EQ(attempts[2].code, ErrorCode::SCHEMA_ERROR);
    EXPECT_EQ(attempts[3].provider, "fallback");
    EXPECT_EQ(attempts[3].code, ErrorCode::TIMEOUT_ERROR);

    auto cached = acquisition->cache().load("GC=F");
    ASSERT_TRUE(cached.is_ok()) << cached.error()->what();
    EXPECT_EQ(cached.value(), expected.value());
}

TEST_F(DataAcquisitionTest, ExhaustionReportsEveryAttempt) {
    auto acquisition = make_acquisition();
    expect_futures_fail(ErrorCode::API_ERROR);
    expect_proxy_fail(ErrorCode::CONNECTION_ERROR);
    EXPECT_CALL(*fallback_, fetch_raw("GC=F", _, _))
        .Times(3)
        .WillRepeatedly(Invoke([](const std::string&, Timestamp, Timestamp) {
            return table_error(ErrorCode::TIMEOUT_ERROR, "timed out");
        }));

    auto result = acquisition->fetch_gold(start_, end_, FetchOptions{});

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATA_UNAVAILABLE);
    const auto* unavailable = dynamic_cast<const DataUnavailableError*>(result.error());
    ASSERT_NE(unavailable, nullptr);
    EXPECT_EQ(unavailable->attempts().size(), 6u);
    ASSERT_NE(unavailable->last_error(), nullptr);
    EXPECT_EQ(unavailable->last_error()->code, ErrorCode::TIMEOUT_ERROR);
    EXPECT_EQ(unavailable->last_error()->attempt, 3);

    // No wait after the final attempt
    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(sleeps_[0], std::chrono::milliseconds(2000));
    EXPECT_EQ(sleeps_[1], std::chrono::milliseconds(4000));
}

TEST_F(DataAcquisitionTest, SchemaFailureIsNotRetried) {
    auto acquisition = make_acquisition();
    expect_futures_fail(ErrorCode::CONNECTION_ERROR);
    expect_proxy_fail(ErrorCode::CONNECTION_ERROR);
    EXPECT_CALL(*fallback_, fetch_raw("GC=F", _, _))
        .WillOnce(Invoke([](const std::string&, Timestamp, Timestamp) {
            return table_ok(make_table_without_close(core::make_date(2024, 1, 2)));
        }));

    auto result = acquisition->fetch_gold(start_, end_, FetchOptions{});

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATA_UNAVAILABLE);
    EXPECT_TRUE(sleeps_.empty());
    EXPECT_EQ(acquisition->last_attempts().back().code, ErrorCode::SCHEMA_ERROR);
}

TEST_F(DataAcquisitionTest, StaleCacheUsedWhenEverythingFails) {
    auto acquisition = make_acquisition();
    ASSERT_TRUE(acquisition->cache().store(make_series("GC=F", date(2023, 12, 1), closes_of(45))).is_ok());
    expect_futures_fail(ErrorCode::CONNECTION_ERROR);
    expect_proxy_fail(ErrorCode::CONNECTION_ERROR);
    EXPECT_CALL(*fallback_, fetch_raw("GC=F", _, _))
        .WillOnce(Invoke([](const std::string&, Timestamp, Timestamp) {
            return table_error(ErrorCode::EMPTY_DATA, "no bars");
        }));

    FetchOptions options;
    options.use_cache = false;
    auto result = acquisition->fetch_gold(start_, end_, options);

    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_EQ(result.value().front().date, start_);
    EXPECT_EQ(result.value().back().date, date(2024, 1, 14));
}

TEST_F(DataAcquisitionTest, StaleCacheOutsideRangeStillFails) {
    auto acquisition = make_acquisition();
    ASSERT_TRUE(acquisition->cache().store(make_series("GC=F", date(2022, 1, 1), closes_of(10))).is_ok());
    expect_futures_fail(ErrorCode::CONNECTION_ERROR);
    expect_proxy_fail(ErrorCode::CONNECTION_ERROR);
    EXPECT_CALL(*fallback_, fetch_raw("GC=F", _, _))
        .WillOnce(Invoke([](const std::string&, Timestamp, Timestamp) {
            return table_error(ErrorCode::EMPTY_DATA, "no bars");
        }));

    auto result = acquisition->fetch_gold(start_, end_, FetchOptions{});

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATA_UNAVAILABLE);
}

TEST_F(DataAcquisitionTest, EtfFetchedThroughEtfProvider) {
    auto acquisition = make_acquisition();
    EXPECT_CALL(*etf_, fetch_raw("1.510300", start_, end_))
        .WillOnce(Invoke([](const std::string&, Timestamp, Timestamp) {
            return table_ok(make_raw_table(core::make_date(2024, 1, 2), closes_of(20)));
        }));

    auto result = acquisition->fetch("510300.SH", start_, end_, FetchOptions{});

    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_EQ(result.value().symbol(), "510300");
    EXPECT_EQ(result.value().size(), 20u);
    EXPECT_FALSE(acquisition->cache().exists("510300"));
}

TEST_F(DataAcquisitionTest, IndexFetchedThroughIndexProvider) {
    auto acquisition = make_acquisition();
    EXPECT_CALL(*index_, fetch_raw("0.399001", _, _))
        .WillOnce(Invoke([](const std::string&, Timestamp, Timestamp) {
            return table_ok(make_raw_table(core::make_date(2024, 1, 2), closes_of(5)));
        }));

    auto result = acquisition->fetch_equity("399001.sz", start_, end_, FetchOptions{});

    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_EQ(result.value().symbol(), "399001");
}

TEST_F(DataAcquisitionTest, EtfOverrideRoutesUnknownCode) {
    auto acquisition = make_acquisition();
    EXPECT_CALL(*etf_, fetch_raw("1.123456", _, _))
        .WillOnce(Invoke([](const std::string&, Timestamp, Timestamp) {
            return table_ok(make_raw_table(core::make_date(2024, 1, 2), closes_of(5)));
        }));

    FetchOptions options;
    options.is_etf = true;
    auto result = acquisition->fetch_equity("123456.SH", start_, end_, options);

    ASSERT_TRUE(result.is_ok()) << result.error()->what();
}

TEST_F(DataAcquisitionTest, UnclassifiableEquityIsInvalidArgument) {
    auto acquisition = make_acquisition();

    auto result = acquisition->fetch_equity("CSI300", start_, end_, FetchOptions{});

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(DataAcquisitionTest, EmptyEquityIsDataUnavailable) {
    auto acquisition = make_acquisition();
    EXPECT_CALL(*etf_, fetch_raw("1.510300", _, _))
        .WillOnce(Invoke([](const std::string&, Timestamp, Timestamp) {
            return table_error(ErrorCode::EMPTY_DATA, "Kline payload is empty");
        }));

    auto result = acquisition->fetch_equity("510300", start_, end_, FetchOptions{});

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATA_UNAVAILABLE);
    const auto* unavailable = dynamic_cast<const DataUnavailableError*>(result.error());
    ASSERT_NE(unavailable, nullptr);
    ASSERT_EQ(unavailable->attempts().size(), 1u);
    EXPECT_EQ(unavailable->attempts()[0].code, ErrorCode::EMPTY_DATA);
}

TEST_F(DataAcquisitionTest, StartAfterEndRejected) {
    auto acquisition = make_acquisition();

    auto result = acquisition->fetch("GC=F", end_, start_, FetchOptions{});

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}
