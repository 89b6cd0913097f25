#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace kestrel::core {

enum class OrderSide {
    BUY,
    SELL
};

enum class OrderType {
    MARKET,
    LIMIT
};

enum class OrderStatus {
    PENDING,
    PARTIALLY_FILLED,
    FILLED,
    REJECTED,
    CANCELLED
};

enum class RejectReason {
    NONE,
    INSUFFICIENT_FUNDS,
    INSUFFICIENT_POSITION,
    INVALID_QUANTITY,
    INVALID_PRICE
};

const char* to_string(OrderSide side);
const char* to_string(OrderType type);
const char* to_string(OrderStatus status);
const char* to_string(RejectReason reason);

// Execution result of one order against one bar
struct Fill {
    uint64_t order_id = 0;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;    // always positive
    double price = 0.0;       // execution price after slippage
    double commission = 0.0;  // commission plus stamp duty
    int64_t timestamp = 0;

    // Signed share change the fill applies to a position
    double signed_quantity() const;
    double notional() const;
};

bool operator==(const Fill& a, const Fill& b);

struct Order {
    uint64_t id = 0;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    OrderType type = OrderType::MARKET;
    double quantity = 0.0;  // requested, always positive
    double filled_quantity = 0.0;
    std::optional<double> limit_price;
    double average_fill_price = 0.0;
    double total_commission = 0.0;
    OrderStatus status = OrderStatus::PENDING;
    RejectReason reject_reason = RejectReason::NONE;
    int64_t created_at = 0;
    int64_t updated_at = 0;
    int bars_open = 0;
    double target_position = 0.0;  // signed position the submitting signal aimed for
    std::string note;

    Order();
    Order(const std::string& sym, OrderSide s, double qty);

    double remaining_quantity() const;
    bool is_terminal() const;
    bool is_buy() const { return side == OrderSide::BUY; }

    // Folds a fill into filled quantity, average price and status
    void record_fill(const Fill& fill);
};

bool operator==(const Order& a, const Order& b);

} // namespace kestrel::core
