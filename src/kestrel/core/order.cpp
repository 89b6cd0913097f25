#include <kestrel/core/order.hpp>

namespace kestrel::core {

const char* to_string(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

const char* to_string(OrderType type) {
    return type == OrderType::MARKET ? "MARKET" : "LIMIT";
}

const char* to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "PENDING";
        case OrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case OrderStatus::FILLED: return "FILLED";
        case OrderStatus::REJECTED: return "REJECTED";
        case OrderStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

const char* to_string(RejectReason reason) {
    switch (reason) {
        case RejectReason::NONE: return "NONE";
        case RejectReason::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
        case RejectReason::INSUFFICIENT_POSITION: return "INSUFFICIENT_POSITION";
        case RejectReason::INVALID_QUANTITY: return "INVALID_QUANTITY";
        case RejectReason::INVALID_PRICE: return "INVALID_PRICE";
    }
    return "UNKNOWN";
}

double Fill::signed_quantity() const {
    return side == OrderSide::BUY ? quantity : -quantity;
}

double Fill::notional() const {
    return quantity * price;
}

bool operator==(const Fill& a, const Fill& b) {
    return a.order_id == b.order_id && a.symbol == b.symbol && a.side == b.side &&
           a.quantity == b.quantity && a.price == b.price &&
           a.commission == b.commission && a.timestamp == b.timestamp;
}

Order::Order() = default;

Order::Order(const std::string& sym, OrderSide s, double qty)
    : symbol(sym), side(s), quantity(qty) {}

double Order::remaining_quantity() const {
    return quantity - filled_quantity;
}

bool Order::is_terminal() const {
    return status == OrderStatus::FILLED || status == OrderStatus::REJECTED ||
           status == OrderStatus::CANCELLED;
}

void Order::record_fill(const Fill& fill) {
    double new_filled = filled_quantity + fill.quantity;
    average_fill_price = (average_fill_price * filled_quantity + fill.price * fill.quantity) / new_filled;
    filled_quantity = new_filled;
    total_commission += fill.commission;
    updated_at = fill.timestamp;
    status = remaining_quantity() <= 0.0 ? OrderStatus::FILLED : OrderStatus::PARTIALLY_FILLED;
}

bool operator==(const Order& a, const Order& b) {
    return a.id == b.id && a.symbol == b.symbol && a.side == b.side && a.type == b.type &&
           a.quantity == b.quantity && a.filled_quantity == b.filled_quantity &&
           a.limit_price == b.limit_price && a.average_fill_price == b.average_fill_price &&
           a.total_commission == b.total_commission && a.status == b.status &&
           a.reject_reason == b.reject_reason && a.created_at == b.created_at &&
           a.updated_at == b.updated_at && a.target_position == b.target_position;
}

} // namespace kestrel::core
