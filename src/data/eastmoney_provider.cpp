// src/data/eastmoney_provider.cpp
#include "gold_rotation/data/eastmoney_provider.hpp"
#include <nlohmann/json.hpp>
#include <sstream>
#include "gold_rotation/core/logger.hpp"
#include "gold_rotation/core/time_utils.hpp"
#include "gold_rotation/data/conversion_utils.hpp"

namespace gold_rotation {

namespace {

const std::vector<std::string> kKlineColumns = {"日期", "开盘", "收盘", "最高",
                                                "最低", "成交量", "成交额"};

std::vector<TextCell> split_kline(const std::string& line) {
    std::vector<TextCell> cells;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        if (cell.empty() || cell == "-") {
            cells.emplace_back(std::nullopt);
        } else {
            cells.emplace_back(cell);
        }
    }
    return cells;
}

}  // namespace

EastMoneyProvider::EastMoneyProvider(std::string name, std::shared_ptr<ApiClient> client,
                                     PriceAdjustment adjustment)
    : name_(std::move(name)), client_(std::move(client)), adjustment_(adjustment) {}

Result<std::shared_ptr<arrow::Table>> EastMoneyProvider::fetch_raw(const std::string& identifier,
                                                                   Timestamp start,
                                                                   Timestamp end) {
    if (!client_) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::INVALID_ARGUMENT, "No HTTP client configured", name_);
    }

    std::map<std::string, std::string> query = {
        {"secid", identifier},
        {"fields1", "f1,f2,f3,f4,f5,f6"},
        {"fields2", "f51,f52,f53,f54,f55,f56,f57"},
        {"klt", "101"},  // daily
        {"fqt", std::to_string(static_cast<int>(adjustment_))},
        {"beg", core::format_compact_date(start)},
        {"end", core::format_compact_date(end)},
    };

    auto body = client_->get("/api/qt/stock/kline/get", query);
    if (body.is_error()) {
        return forward_error<std::shared_ptr<arrow::Table>>(*body.error(), name_, identifier);
    }

    auto table = parse_klines(body.value());
    if (table.is_error()) {
        return forward_error<std::shared_ptr<arrow::Table>>(*table.error(), name_, identifier);
    }
    DEBUG(name_ << " returned " << table.value()->num_rows() << " rows for " << identifier);
    return table;
}

Result<std::shared_ptr<arrow::Table>> EastMoneyProvider::parse_klines(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::JSON_PARSE_ERROR, std::string("Malformed kline payload: ") + e.what(),
            "EastMoneyProvider");
    }

    if (!j.is_object() || !j.contains("data") || j.at("data").is_null()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::EMPTY_DATA, "Kline payload has no data section", "EastMoneyProvider");
    }

    const auto& data = j.at("data");
    if (!data.contains("klines") || !data.at("klines").is_array()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::JSON_PARSE_ERROR, "Kline payload has no klines array",
            "EastMoneyProvider");
    }

    std::vector<std::vector<TextCell>> rows;
    for (const auto& line : data.at("klines")) {
        if (!line.is_string()) {
            continue;
        }
        rows.push_back(split_kline(line.get<std::string>()));
    }

    if (rows.empty()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::EMPTY_DATA, "Kline payload is empty", "EastMoneyProvider");
    }

    return DataConversionUtils::make_string_table(kKlineColumns, rows);
}

}  // namespace gold_rotation
