// include/gold_rotation/core/types.hpp

#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace gold_rotation {

/**
 * @brief Timestamp type for consistent time representation
 * Calendar dates are stored as the timestamp of 00:00 UTC on that day
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Quantity type for order sizes
 */
using Quantity = double;

/**
 * @brief Trading side enumeration
 */
enum class Side {
    BUY,
    SELL,
    NONE
};

/**
 * @brief Order type enumeration
 */
enum class OrderType {
    MARKET,
    LIMIT,
    NONE
};

inline std::string side_to_string(Side side) {
    switch (side) {
        case Side::BUY:
            return "BUY";
        case Side::SELL:
            return "SELL";
        default:
            return "NONE";
    }
}

inline std::string order_type_to_string(OrderType type) {
    switch (type) {
        case OrderType::MARKET:
            return "MARKET";
        case OrderType::LIMIT:
            return "LIMIT";
        default:
            return "NONE";
    }
}

/**
 * @brief Daily OHLCV bar for one symbol
 */
struct PriceBar {
    Timestamp date;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};
    std::string symbol;

    PriceBar() = default;
    PriceBar(Timestamp d, Price o, Price h, Price l, Price c, double v, std::string s)
        : date(d), open(o), high(h), low(l), close(c), volume(v), symbol(std::move(s)) {}

    bool operator==(const PriceBar& other) const {
        return date == other.date && open == other.open && high == other.high &&
               low == other.low && close == other.close && volume == other.volume &&
               symbol == other.symbol;
    }
};

/**
 * @brief Date-ordered, date-unique bars for a single symbol
 *
 * Built once by the normalizer and never modified afterwards; consumers
 * only get const access.
 */
class PriceSeries {
public:
    PriceSeries() = default;
    PriceSeries(std::string symbol, std::vector<PriceBar> bars)
        : symbol_(std::move(symbol)), bars_(std::move(bars)) {}

    const std::string& symbol() const {
        return symbol_;
    }

    const std::vector<PriceBar>& bars() const {
        return bars_;
    }

    size_t size() const {
        return bars_.size();
    }

    bool empty() const {
        return bars_.empty();
    }

    const PriceBar& front() const {
        return bars_.front();
    }

    const PriceBar& back() const {
        return bars_.back();
    }

    std::vector<PriceBar>::const_iterator begin() const {
        return bars_.begin();
    }

    std::vector<PriceBar>::const_iterator end() const {
        return bars_.end();
    }

    /**
     * @brief Bars whose date lies in [start, end], both inclusive
     */
    PriceSeries slice(Timestamp start, Timestamp end) const {
        std::vector<PriceBar> selected;
        for (const auto& bar : bars_) {
            if (bar.date >= start && bar.date <= end) {
                selected.push_back(bar);
            }
        }
        return PriceSeries(symbol_, std::move(selected));
    }

    bool operator==(const PriceSeries& other) const {
        return symbol_ == other.symbol_ && bars_ == other.bars_;
    }

private:
    std::string symbol_;
    std::vector<PriceBar> bars_;
};

}  // namespace gold_rotation
