// test_config_base.cpp
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "../core/test_base.hpp"
#include "gold_rotation/core/config_base.hpp"
#include "gold_rotation/data/data_acquisition.hpp"
#include "gold_rotation/strategy/rotation_config.hpp"

using namespace gold_rotation;
using namespace gold_rotation::strategy;
using namespace gold_rotation::testing;

class ConfigBaseTest : public TestBase {
protected:
    void write_file(const std::filesystem::path& path, const std::string& content) {
        std::ofstream out(path);
        out << content;
    }
};

TEST_F(ConfigBaseTest, SaveAndLoadRotationConfig) {
    RotationConfig config;
    config.lookback_days = 20;
    config.rebalance = RebalanceMode::MONTHLY;
    config.fee_bps = 2.5;
    config.cash_symbol = "RMB";
    config.alignment = AlignmentPolicy::INNER_JOIN;

    std::filesystem::path file_path = temp_dir_ / "rotation.json";
    auto save_result = config.save_to_file(file_path.string());
    ASSERT_TRUE(save_result.is_ok())
        << "Failed to save config: "
        << (save_result.error() ? save_result.error()->what() : "unknown error");
    ASSERT_TRUE(std::filesystem::exists(file_path));

    RotationConfig loaded;
    auto load_result = loaded.load_from_file(file_path.string());
    ASSERT_TRUE(load_result.is_ok())
        << "Failed to load config: "
        << (load_result.error() ? load_result.error()->what() : "unknown error");

    EXPECT_EQ(loaded.lookback_days, 20);
    EXPECT_EQ(loaded.rebalance, RebalanceMode::MONTHLY);
    EXPECT_DOUBLE_EQ(loaded.fee_bps, 2.5);
    EXPECT_EQ(loaded.cash_symbol, "RMB");
    EXPECT_EQ(loaded.alignment, AlignmentPolicy::INNER_JOIN);
}

TEST_F(ConfigBaseTest, MissingFile) {
    RotationConfig config;
    auto result = config.load_from_file((temp_dir_ / "absent.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ConfigBaseTest, MalformedJson) {
    auto path = temp_dir_ / "broken.json";
    write_file(path, "{ \"lookback_days\": ");

    RotationConfig config;
    auto result = config.load_from_file(path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(ConfigBaseTest, UnknownRebalanceIsConfigError) {
    auto path = temp_dir_ / "quarterly.json";
    write_file(path, R"({"rebalance": "quarterly"})");

    RotationConfig config;
    auto result = config.load_from_file(path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONFIG_ERROR);
    EXPECT_EQ(config.rebalance, RebalanceMode::WEEKLY);
}

TEST_F(ConfigBaseTest, SaveCreatesMissingDirectories) {
    RotationConfig config;
    auto path = temp_dir_ / "runs" / "2024" / "rotation.json";

    auto result = config.save_to_file(path.string());
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(ConfigBaseTest, LoadedValuesAreValidated) {
    auto path = temp_dir_ / "zero_lookback.json";
    write_file(path, R"({"lookback_days": 0})");

    RotationConfig config;
    auto result = config.load_from_file(path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONFIG_ERROR);
    EXPECT_NE(std::string(result.error()->what()).find("lookback_days"), std::string::npos);

    path = temp_dir_ / "gold_cash.json";
    write_file(path, R"({"cash_symbol": "GOLD"})");
    RotationConfig other;
    auto collision = other.load_from_file(path.string());
    ASSERT_TRUE(collision.is_error());
    EXPECT_EQ(collision.error()->code(), ErrorCode::CONFIG_ERROR);
}

TEST_F(ConfigBaseTest, DataConfigRoundTrip) {
    DataConfig config;
    config.cache_directory = "/tmp/prices";
    config.futures_candidates = {"101.GC00Y"};
    config.default_options.retries = 5;
    config.default_options.backoff_seconds = 0.5;
    config.default_options.use_cache = false;
    config.default_options.is_etf = true;

    DataConfig loaded;
    loaded.from_json(config.to_json());

    EXPECT_EQ(loaded.cache_directory, "/tmp/prices");
    ASSERT_EQ(loaded.futures_candidates.size(), 1u);
    EXPECT_EQ(loaded.futures_candidates[0], "101.GC00Y");
    EXPECT_EQ(loaded.proxy_identifier, "1.518880");
    EXPECT_EQ(loaded.default_options.retries, 5);
    EXPECT_DOUBLE_EQ(loaded.default_options.backoff_seconds, 0.5);
    EXPECT_FALSE(loaded.default_options.use_cache);
    ASSERT_TRUE(loaded.default_options.is_etf.has_value());
    EXPECT_TRUE(*loaded.default_options.is_etf);
}
