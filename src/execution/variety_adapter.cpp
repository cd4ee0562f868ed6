// src/execution/variety_adapter.cpp
#include "gold_rotation/execution/variety_adapter.hpp"
#include "gold_rotation/core/logger.hpp"

namespace gold_rotation {

Result<Quote> DummyAdapter::fetch_quote(const std::string& symbol) {
    if (symbol.empty()) {
        return make_error<Quote>(ErrorCode::INVALID_ARGUMENT, "Empty symbol", "DummyAdapter");
    }
    Quote quote;
    quote.symbol = symbol;
    quote.status = kStatus;
    return quote;
}

Result<OrderAck> DummyAdapter::place_order(const std::string& symbol, Quantity quantity,
                                           Side side, OrderType type) {
    if (symbol.empty()) {
        return make_error<OrderAck>(ErrorCode::INVALID_ARGUMENT, "Empty symbol", "DummyAdapter");
    }
    DEBUG("Stub order " << side_to_string(side) << " " << quantity << " " << symbol << " ("
                        << order_type_to_string(type) << ")");
    OrderAck ack;
    ack.symbol = symbol;
    ack.quantity = quantity;
    ack.side = side;
    ack.type = type;
    ack.status = kStatus;
    return ack;
}

}  // namespace gold_rotation
