#include <kestrel/execution/execution_simulator.hpp>
#include <kestrel/core/errors.hpp>
#include <kestrel/utils/logger.hpp>
#include <algorithm>
#include <cmath>

namespace kestrel::execution {

namespace {

double signed_quantity(core::OrderSide side, double quantity) {
    return side == core::OrderSide::BUY ? quantity : -quantity;
}

bool crosses_zero(double before, double after) {
    return before != 0.0 && after != 0.0 && (before > 0.0) != (after > 0.0);
}

const core::Bar* find_bar(const std::vector<core::Bar>& batch, const std::string& symbol) {
    for (const auto& bar : batch) {
        if (bar.symbol == symbol) {
            return &bar;
        }
    }
    return nullptr;
}

} // namespace

const char* to_string(FillModel model) {
    return model == FillModel::NEXT_BAR_OPEN ? "next_open" : "close_slippage";
}

FillModel parse_fill_model(const std::string& text) {
    if (text == "next_open") {
        return FillModel::NEXT_BAR_OPEN;
    }
    if (text == "close_slippage") {
        return FillModel::CLOSE_WITH_SLIPPAGE;
    }
    throw core::InvalidParameter("fill_model", "expected next_open or close_slippage, got '" + text + "'");
}

void ExecutionConfig::validate() const {
    if (!(slippage_rate >= 0.0 && slippage_rate < 1.0)) {
        throw core::InvalidParameter("slippage_rate", "must be in [0, 1)");
    }
    if (!(impact_coefficient >= 0.0)) {
        throw core::InvalidParameter("impact_coefficient", "must not be negative");
    }
    if (!(commission_rate >= 0.0 && commission_rate < 1.0)) {
        throw core::InvalidParameter("commission_rate", "must be in [0, 1)");
    }
    if (!(min_commission >= 0.0)) {
        throw core::InvalidParameter("min_commission", "must not be negative");
    }
    if (!(stamp_duty_rate >= 0.0 && stamp_duty_rate < 1.0)) {
        throw core::InvalidParameter("stamp_duty_rate", "must be in [0, 1)");
    }
    if (!(lot_size >= 1.0) || std::floor(lot_size) != lot_size) {
        throw core::InvalidParameter("lot_size", "must be a whole number of at least 1");
    }
    if (!(max_volume_participation > 0.0 && max_volume_participation <= 1.0)) {
        throw core::InvalidParameter("max_volume_participation", "must be in (0, 1]");
    }
    if (limit_order_ttl_bars < 0) {
        throw core::InvalidParameter("limit_order_ttl_bars", "must not be negative");
    }
    if (!(position_fraction > 0.0 && position_fraction <= 1.0)) {
        throw core::InvalidParameter("position_fraction", "must be in (0, 1]");
    }
}

double CostModel::execution_price(core::OrderSide side, double reference_price, double quantity,
                                  double bar_volume) const {
    double impact = bar_volume > 0.0 ? config_.impact_coefficient * quantity / bar_volume : 0.0;
    double slippage = reference_price * (config_.slippage_rate + impact);
    return side == core::OrderSide::BUY ? reference_price + slippage : reference_price - slippage;
}

double CostModel::commission(core::OrderSide side, double notional) const {
    double fee = std::max(config_.min_commission, notional * config_.commission_rate);
    if (side == core::OrderSide::SELL) {
        fee += notional * config_.stamp_duty_rate;
    }
    return fee;
}

double CostModel::liquidity_cap(double bar_volume) const {
    if (!(bar_volume > 0.0)) {
        return 0.0;
    }
    return std::floor(bar_volume * config_.max_volume_participation / config_.lot_size) * config_.lot_size;
}

ExecutionSimulator::ExecutionSimulator(const ExecutionConfig& config, const core::LedgerConfig& ledger_config)
    : config_(config), ledger_config_(ledger_config), costs_(config) {
    config_.validate();
}

double ExecutionSimulator::round_to_lots(double quantity) const {
    return std::floor(quantity / config_.lot_size) * config_.lot_size;
}

double ExecutionSimulator::pending_quantity(const std::string& symbol) const {
    double pending = 0.0;
    for (const auto& order : open_orders_) {
        if (order.symbol == symbol) {
            pending += signed_quantity(order.side, order.remaining_quantity());
        }
    }
    return pending;
}

double ExecutionSimulator::desired_position(const core::Signal& signal, const core::Bar& bar,
                                            const core::Account& account, double effective) const {
    if (signal.type == core::SignalType::FLAT) {
        return 0.0;
    }

    double direction = signal.type == core::SignalType::LONG ? 1.0 : -1.0;
    if (signal.target_quantity) {
        return direction * std::floor(*signal.target_quantity);
    }
    if (signal.target_weight) {
        return direction * round_to_lots(*signal.target_weight * account.equity / bar.close);
    }

    // Default sizing only opens; an existing position in the same direction stands
    if (effective * direction > 0.0) {
        return effective;
    }
    double size = round_to_lots(account.cash * config_.position_fraction / bar.close);
    return direction * std::max(size, config_.lot_size);
}

core::Order ExecutionSimulator::make_order(const std::string& symbol, const core::Bar& bar, core::OrderSide side,
                                           double quantity, double target, const std::string& note,
                                           std::optional<double> limit_price) {
    core::Order order(symbol, side, quantity);
    order.id = next_order_id_++;
    order.created_at = bar.timestamp;
    order.updated_at = bar.timestamp;
    order.target_position = target;
    order.note = note;
    if (limit_price) {
        order.type = core::OrderType::LIMIT;
        order.limit_price = limit_price;
    }
    return order;
}

core::Fill ExecutionSimulator::estimate_fill(const core::Order& order, const core::Bar& bar,
                                            double quantity) const {
    // The fill price is unknown until the order trades; estimate from the
    // limit or the signal bar's close
    double reference = order.limit_price ? *order.limit_price : bar.close;

    core::Fill estimate;
    estimate.order_id = order.id;
    estimate.symbol = order.symbol;
    estimate.side = order.side;
    estimate.quantity = quantity;
    estimate.price = costs_.execution_price(order.side, reference, quantity, bar.volume);
    estimate.commission = costs_.commission(order.side, quantity * estimate.price);
    estimate.timestamp = bar.timestamp;
    return estimate;
}

core::RejectReason ExecutionSimulator::pre_trade_check(const core::Order& order, const core::Bar& bar,
                                                       const core::Account& projected) const {
    if (!(order.quantity > 0.0) || !std::isfinite(order.quantity)) {
        return core::RejectReason::INVALID_QUANTITY;
    }
    core::Fill estimate = estimate_fill(order, bar, order.quantity);
    if (!(estimate.price > 0.0)) {
        return core::RejectReason::INVALID_PRICE;
    }
    return core::fill_violation(projected, estimate, ledger_config_);
}

void ExecutionSimulator::reject(core::Order& order, core::RejectReason reason) {
    order.status = core::OrderStatus::REJECTED;
    order.reject_reason = reason;
    utils::Logger::warn() << "Order " << order.id << " " << core::to_string(order.side) << " "
                          << order.quantity << " " << order.symbol << " rejected: "
                          << core::to_string(reason) << utils::Logger::endl;
    completed_.push_back(order);
}

std::vector<core::Order> ExecutionSimulator::submit(const core::Signal& signal, const core::Bar& bar,
                                                    const core::Account& account) {
    std::vector<core::Order> orders;
    if (signal.type == core::SignalType::HOLD) {
        return orders;
    }
    if (signal.symbol != bar.symbol) {
        throw core::ExecutionError("Signal for " + signal.symbol + " submitted against a bar of " + bar.symbol);
    }

    double effective = account.position_quantity(signal.symbol) + pending_quantity(signal.symbol);
    double desired = desired_position(signal, bar, account, effective);
    double delta = desired - effective;
    if (delta == 0.0) {
        utils::Logger::debug() << "Signal " << core::to_string(signal.type) << " " << signal.symbol
                               << " already covered by position and open orders" << utils::Logger::endl;
        return orders;
    }

    return place(signal.symbol, effective, desired, bar, account, signal.reason, signal.limit_price);
}

std::vector<core::Order> ExecutionSimulator::place(const std::string& symbol, double effective, double desired,
                                                   const core::Bar& bar, const core::Account& account,
                                                   const std::string& note, std::optional<double> limit_price) {
    std::vector<core::Order> orders;

    // Checks run against the account as if open orders had filled
    core::Account projected = account;
    for (const auto& open : open_orders_) {
        if (open.symbol != symbol) {
            continue;
        }
        core::Fill estimate = estimate_fill(open, bar, open.remaining_quantity());
        if (core::fill_violation(projected, estimate, ledger_config_) == core::RejectReason::NONE) {
            projected = core::project_fill(projected, estimate, ledger_config_).account;
        }
    }

    // Reversals go through flat: close first, then open the other side
    std::vector<std::pair<core::OrderSide, double>> legs;
    double delta = desired - effective;
    if (crosses_zero(effective, desired)) {
        legs.emplace_back(effective > 0.0 ? core::OrderSide::SELL : core::OrderSide::BUY, std::abs(effective));
        legs.emplace_back(desired > 0.0 ? core::OrderSide::BUY : core::OrderSide::SELL, std::abs(desired));
    } else {
        legs.emplace_back(delta > 0.0 ? core::OrderSide::BUY : core::OrderSide::SELL, std::abs(delta));
    }

    for (const auto& [side, quantity] : legs) {
        core::Order order = make_order(symbol, bar, side, quantity, desired, note, limit_price);
        core::RejectReason reason = pre_trade_check(order, bar, projected);
        if (reason != core::RejectReason::NONE) {
            reject(order, reason);
            orders.push_back(order);
            continue;
        }

        // Later legs are checked as if this one had filled at the estimate
        projected = core::project_fill(projected, estimate_fill(order, bar, order.quantity), ledger_config_).account;

        utils::Logger::debug() << "Order " << order.id << " accepted: " << core::to_string(order.side) << " "
                               << order.quantity << " " << order.symbol << " (" << order.note << ")"
                               << utils::Logger::endl;
        open_orders_.push_back(order);
        orders.push_back(order);
    }
    return orders;
}

void ExecutionSimulator::resize_after(const std::string& symbol, uint64_t ended_id, const core::Bar& bar,
                                      const core::Account& working, std::vector<ExecutionReport>& reports) {
    // Orders submitted after the one that ended were netted against its
    // unfilled shares; replace them with orders sized from what is held
    std::optional<core::Order> latest;
    std::vector<core::Order> kept;
    for (auto& order : open_orders_) {
        if (order.symbol != symbol || order.id < ended_id) {
            kept.push_back(std::move(order));
            continue;
        }
        order.status = core::OrderStatus::CANCELLED;
        order.updated_at = bar.timestamp;
        order.note = "resized after order " + std::to_string(ended_id) + " ended";
        latest = order;
        reports.push_back({order, std::nullopt});
        completed_.push_back(std::move(order));
    }
    open_orders_ = std::move(kept);
    if (!latest) {
        return;
    }

    double effective = working.position_quantity(symbol) + pending_quantity(symbol);
    double desired = latest->target_position;
    if (desired == effective) {
        return;
    }
    utils::Logger::info() << "Re-sizing " << symbol << " orders after order " << ended_id << " ended: "
                          << effective << " -> " << desired << utils::Logger::endl;
    for (const auto& order : place(symbol, effective, desired, bar, working, "resized", latest->limit_price)) {
        if (order.status == core::OrderStatus::REJECTED) {
            reports.push_back({order, std::nullopt});
        }
    }
}

std::vector<ExecutionReport> ExecutionSimulator::advance(const std::vector<core::Bar>& batch,
                                                         core::Account working) {
    std::vector<ExecutionReport> reports;
    std::map<std::string, double> consumed;  // volume used per instrument this bar
    std::vector<core::Order> still_open;
    std::map<std::string, uint64_t> ended_short;  // first order per instrument that ended unfilled
    const bool next_open = config_.fill_model == FillModel::NEXT_BAR_OPEN;

    for (auto& order : open_orders_) {
        const core::Bar* bar = find_bar(batch, order.symbol);
        bool eligible = bar && (next_open ? bar->timestamp > order.created_at
                                          : bar->timestamp >= order.created_at);
        if (!eligible) {
            still_open.push_back(std::move(order));
            continue;
        }
        ++order.bars_open;

        bool reached = true;
        if (order.limit_price) {
            reached = order.is_buy() ? bar->low <= *order.limit_price : bar->high >= *order.limit_price;
        }

        double available = costs_.liquidity_cap(bar->volume) - consumed[order.symbol];
        double quantity = std::min(order.remaining_quantity(), std::max(0.0, available));
        double held = working.position_quantity(order.symbol);

        // A closing leg still working keeps the opening leg waiting
        bool waits_for_flat = crosses_zero(held, held + signed_quantity(order.side, quantity));

        if (reached && quantity > 0.0 && !waits_for_flat) {
            double reference = next_open ? bar->open : bar->close;
            double price = costs_.execution_price(order.side, reference, quantity, bar->volume);
            if (order.limit_price) {
                price = order.is_buy() ? std::min(price, *order.limit_price) : std::max(price, *order.limit_price);
            }

            core::Fill fill;
            fill.order_id = order.id;
            fill.symbol = order.symbol;
            fill.side = order.side;
            fill.quantity = quantity;
            fill.price = price;
            fill.commission = costs_.commission(order.side, quantity * price);
            fill.timestamp = bar->timestamp;

            core::RejectReason reason = core::fill_violation(working, fill, ledger_config_);
            if (reason == core::RejectReason::NONE) {
                working = core::project_fill(working, fill, ledger_config_).account;
                consumed[order.symbol] += quantity;
                order.record_fill(fill);
                reports.push_back({order, fill});
            } else {
                order.updated_at = bar->timestamp;
                if (order.filled_quantity == 0.0) {
                    order.status = core::OrderStatus::REJECTED;
                    order.reject_reason = reason;
                } else {
                    order.status = core::OrderStatus::CANCELLED;
                    order.note = std::string("remainder cancelled: ") + core::to_string(reason);
                }
                utils::Logger::warn() << "Order " << order.id << " " << order.symbol << " stopped at fill time: "
                                      << core::to_string(reason) << utils::Logger::endl;
                reports.push_back({order, std::nullopt});
            }
        }

        if (!order.is_terminal() && order.limit_price && config_.limit_order_ttl_bars > 0 &&
            order.bars_open >= config_.limit_order_ttl_bars) {
            order.status = core::OrderStatus::CANCELLED;
            order.updated_at = bar->timestamp;
            order.note = "expired after " + std::to_string(order.bars_open) + " bars";
            reports.push_back({order, std::nullopt});
        }

        if (order.is_terminal()) {
            if (order.status != core::OrderStatus::FILLED) {
                ended_short.emplace(order.symbol, order.id);
            }
            completed_.push_back(std::move(order));
        } else {
            still_open.push_back(std::move(order));
        }
    }

    open_orders_ = std::move(still_open);
    for (const auto& [symbol, ended_id] : ended_short) {
        resize_after(symbol, ended_id, *find_bar(batch, symbol), working, reports);
    }
    return reports;
}

std::vector<core::Order> ExecutionSimulator::take_completed() {
    std::vector<core::Order> taken;
    taken.swap(completed_);
    return taken;
}

std::vector<core::Order> ExecutionSimulator::cancel_all(int64_t timestamp, const std::string& note) {
    std::vector<core::Order> cancelled;
    for (auto& order : open_orders_) {
        order.status = core::OrderStatus::CANCELLED;
        order.updated_at = timestamp;
        order.note = note;
        cancelled.push_back(order);
        completed_.push_back(std::move(order));
    }
    open_orders_.clear();
    if (!cancelled.empty()) {
        utils::Logger::info() << "Cancelled " << cancelled.size() << " open orders: " << note << utils::Logger::endl;
    }
    return cancelled;
}

} // namespace kestrel::execution
