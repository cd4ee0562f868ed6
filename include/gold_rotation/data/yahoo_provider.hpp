// include/gold_rotation/data/yahoo_provider.hpp
#pragma once

#include <memory>
#include <string>
#include "gold_rotation/data/api_client.hpp"
#include "gold_rotation/data/price_provider.hpp"

namespace gold_rotation {

/**
 * @brief Daily bars from the Yahoo Finance chart API (e.g. "GC=F")
 *
 * Bars are stamped in the exchange's timezone; the Date column carries the
 * local wall-clock time with its UTC offset so the normalizer keeps the
 * exchange's trading date. Adj Close is returned alongside Close when the
 * payload carries it.
 */
class YahooChartProvider : public PriceProvider {
public:
    static constexpr const char* kDefaultBaseUrl = "https://query1.finance.yahoo.com";

    YahooChartProvider(std::string name, std::shared_ptr<ApiClient> client);

    std::string name() const override {
        return name_;
    }

    Result<std::shared_ptr<arrow::Table>> fetch_raw(const std::string& identifier,
                                                    Timestamp start, Timestamp end) override;

    /**
     * @brief Parse a chart response body
     * @return Table with Date (utf8), Open, High, Low, Close, Volume and,
     *         when present, Adj Close (float64, nullable); EMPTY_DATA when no
     *         bars came back
     */
    static Result<std::shared_ptr<arrow::Table>> parse_chart(const std::string& body);

private:
    std::string name_;
    std::shared_ptr<ApiClient> client_;
};

}  // namespace gold_rotation
