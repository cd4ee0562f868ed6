#include <gtest/gtest.h>
#include <fstream>
#include "../core/test_base.hpp"
#include "gold_rotation/data/price_cache.hpp"

using namespace gold_rotation;
using namespace gold_rotation::testing;

class PriceCacheTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        cache_ = std::make_unique<PriceCache>(temp_dir_ / "cache");
    }

    std::unique_ptr<PriceCache> cache_;
};

TEST_F(PriceCacheTest, MissingCacheIsFileNotFound) {
    EXPECT_FALSE(cache_->exists("GC=F"));
    auto result = cache_->load("GC=F");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(PriceCacheTest, StoreThenLoadReturnsSameSeries) {
    auto series = make_series("GC=F", date(2024, 1, 2), {2063.1, 2041.75, 2050.0 / 3.0});
    ASSERT_TRUE(cache_->store(series).is_ok());
    EXPECT_TRUE(cache_->exists("GC=F"));

    auto loaded = cache_->load("GC=F");
    ASSERT_TRUE(loaded.is_ok()) << loaded.error()->what();
    EXPECT_EQ(loaded.value(), series);
}

TEST_F(PriceCacheTest, StoreReplacesWholeFile) {
    ASSERT_TRUE(cache_->store(make_series("GC=F", date(2024, 1, 2), {1, 2, 3, 4})).is_ok());
    ASSERT_TRUE(cache_->store(make_series("GC=F", date(2024, 2, 1), {5})).is_ok());

    auto loaded = cache_->load("GC=F");
    ASSERT_TRUE(loaded.is_ok());
    ASSERT_EQ(loaded.value().size(), 1u);
    EXPECT_EQ(loaded.value().front().date, date(2024, 2, 1));

    auto temp_path = cache_->path_for("GC=F");
    temp_path += ".tmp";
    EXPECT_FALSE(std::filesystem::exists(temp_path));
}

TEST_F(PriceCacheTest, PathIsSanitized) {
    EXPECT_EQ(cache_->path_for("GC=F").filename().string(), "GC_F_daily.csv");
    EXPECT_EQ(cache_->path_for("1.518880").filename().string(), "1.518880_daily.csv");
}

TEST_F(PriceCacheTest, CsvLayout) {
    auto series = make_series("GC=F", date(2024, 1, 2), {2063.5});
    EXPECT_EQ(PriceCache::to_csv(series),
              "Date,Open,High,Low,Close,Volume,Symbol\n"
              "2024-01-02,2063.5,2063.5,2063.5,2063.5,1000,GC=F\n");
}

TEST_F(PriceCacheTest, HandEditedCacheIsNormalized) {
    std::filesystem::create_directories(cache_->directory());
    std::ofstream out(cache_->path_for("GC=F"));
    out << "Date,Open,High,Low,Close,Volume,Symbol\r\n"
        << "2024-01-03,2,2,2,2,,GC=F\r\n"
        << "2024-01-02,1,1,1,1,10,GC=F\r\n"
        << "\r\n";
    out.close();

    auto loaded = cache_->load("GC=F");
    ASSERT_TRUE(loaded.is_ok()) << loaded.error()->what();
    ASSERT_EQ(loaded.value().size(), 2u);
    EXPECT_EQ(loaded.value().front().date, date(2024, 1, 2));
    EXPECT_DOUBLE_EQ(loaded.value().bars()[1].volume, 0.0);
}

TEST_F(PriceCacheTest, HeaderOnlyCacheIsEmptyData) {
    std::filesystem::create_directories(cache_->directory());
    std::ofstream out(cache_->path_for("GC=F"));
    out << "Date,Open,High,Low,Close,Volume,Symbol\n";
    out.close();

    auto loaded = cache_->load("GC=F");
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error()->code(), ErrorCode::EMPTY_DATA);
}
