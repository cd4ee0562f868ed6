// include/gold_rotation/data/eastmoney_provider.hpp
#pragma once

#include <memory>
#include <string>
#include "gold_rotation/data/api_client.hpp"
#include "gold_rotation/data/price_provider.hpp"

namespace gold_rotation {

/**
 * @brief Price adjustment requested from the kline API
 */
enum class PriceAdjustment {
    NONE = 0,      // raw prices
    FORWARD = 1,   // qfq, forward-adjusted
    BACKWARD = 2   // hfq, backward-adjusted
};

/**
 * @brief Daily klines from the EastMoney quote history API
 *
 * Serves A-share ETFs and indices as well as the overseas futures board.
 * Identifiers are EastMoney "secid"s: "<market>.<code>", e.g. "1.510300"
 * (Shanghai), "0.399001" (Shenzhen), "101.GC00Y" (COMEX).
 *
 * The table keeps the Chinese headers the upstream documents
 * (日期, 开盘, 收盘, 最高, 最低, 成交量, 成交额) as text columns.
 */
class EastMoneyProvider : public PriceProvider {
public:
    static constexpr const char* kDefaultBaseUrl = "https://push2his.eastmoney.com";

    EastMoneyProvider(std::string name, std::shared_ptr<ApiClient> client,
                      PriceAdjustment adjustment = PriceAdjustment::NONE);

    std::string name() const override {
        return name_;
    }

    Result<std::shared_ptr<arrow::Table>> fetch_raw(const std::string& identifier,
                                                    Timestamp start, Timestamp end) override;

    /**
     * @brief Parse a kline response body
     * @return Text table; EMPTY_DATA when the payload carries no klines,
     *         JSON_PARSE_ERROR when the body is not the expected JSON
     */
    static Result<std::shared_ptr<arrow::Table>> parse_klines(const std::string& body);

private:
    std::string name_;
    std::shared_ptr<ApiClient> client_;
    PriceAdjustment adjustment_;
};

}  // namespace gold_rotation
