// include/gold_rotation/execution/variety_adapter.hpp
#pragma once

#include <optional>
#include <string>
#include "gold_rotation/core/error.hpp"
#include "gold_rotation/core/types.hpp"

namespace gold_rotation {

/**
 * @brief Latest quote as reported by a venue
 */
struct Quote {
    std::string symbol;
    std::string status;
    std::optional<Price> price;  // empty when the venue gave no price
};

/**
 * @brief Venue acknowledgement of a submitted order
 */
struct OrderAck {
    std::string symbol;
    Quantity quantity{0.0};
    Side side{Side::NONE};
    OrderType type{OrderType::MARKET};
    std::string status;
};

/**
 * @brief Boundary between the strategy and a trading venue (futures, ETFs)
 *
 * The backtest never goes through this interface.
 */
class VarietyAdapter {
public:
    virtual ~VarietyAdapter() = default;

    virtual Result<Quote> fetch_quote(const std::string& symbol) = 0;

    virtual Result<OrderAck> place_order(const std::string& symbol, Quantity quantity, Side side,
                                         OrderType type = OrderType::MARKET) = 0;
};

/**
 * @brief No-op adapter for research and backtesting; everything is a "stub"
 */
class DummyAdapter : public VarietyAdapter {
public:
    static constexpr const char* kStatus = "stub";

    Result<Quote> fetch_quote(const std::string& symbol) override;

    Result<OrderAck> place_order(const std::string& symbol, Quantity quantity, Side side,
                                 OrderType type = OrderType::MARKET) override;
};

}  // namespace gold_rotation
