#include <kestrel/core/portfolio.hpp>
#include <kestrel/core/errors.hpp>
#include <kestrel/utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>

namespace kestrel::core {

namespace {

// Tolerance for cash and leverage checks, relative to the account size
constexpr double kRelativeTolerance = 1e-9;

double tolerance_for(double scale) {
    return kRelativeTolerance * std::max(1.0, std::abs(scale));
}

} // namespace

bool operator==(const Position& a, const Position& b) {
    return a.symbol == b.symbol && a.quantity == b.quantity &&
           a.average_cost == b.average_cost && a.last_price == b.last_price &&
           a.opened_at == b.opened_at;
}

double Account::position_quantity(const std::string& symbol) const {
    auto it = positions.find(symbol);
    return it != positions.end() ? it->second.quantity : 0.0;
}

double Account::gross_exposure() const {
    double gross = 0.0;
    for (const auto& [symbol, position] : positions) {
        gross += std::abs(position.market_value());
    }
    return gross;
}

double Account::mark_to_market_equity() const {
    double total = cash;
    for (const auto& [symbol, position] : positions) {
        total += position.quantity * position.last_price;
    }
    return total;
}

bool operator==(const Account& a, const Account& b) {
    return a.timestamp == b.timestamp && a.cash == b.cash && a.positions == b.positions &&
           a.market_value == b.market_value && a.equity == b.equity &&
           a.realized_pnl == b.realized_pnl && a.total_commission == b.total_commission;
}

bool operator!=(const Account& a, const Account& b) {
    return !(a == b);
}

const char* to_string(PositionChange change) {
    switch (change) {
        case PositionChange::OPENED: return "OPENED";
        case PositionChange::INCREASED: return "INCREASED";
        case PositionChange::REDUCED: return "REDUCED";
        case PositionChange::FLAT: return "FLAT";
    }
    return "UNKNOWN";
}

namespace {

void recompute(Account& account) {
    double market_value = 0.0;
    for (const auto& [symbol, position] : account.positions) {
        market_value += position.quantity * position.last_price;
    }
    account.market_value = market_value;
    account.equity = account.cash + market_value;
}

struct Violation {
    RejectReason reason = RejectReason::NONE;
    std::string message;
};

Violation check_fill_shape(const Account& account, const Fill& fill, const LedgerConfig& config) {
    Violation violation;
    if (fill.symbol.empty() || !(fill.quantity > 0.0) || !std::isfinite(fill.quantity)) {
        violation.reason = RejectReason::INVALID_QUANTITY;
        violation.message = "Malformed fill quantity for order " + std::to_string(fill.order_id);
        return violation;
    }
    if (!(fill.price > 0.0) || !std::isfinite(fill.price) || !(fill.commission >= 0.0)) {
        violation.reason = RejectReason::INVALID_PRICE;
        violation.message = "Malformed fill price for order " + std::to_string(fill.order_id);
        return violation;
    }

    double before_qty = account.position_quantity(fill.symbol);
    double after_qty = before_qty + fill.signed_quantity();
    if (before_qty != 0.0 && after_qty != 0.0 && (before_qty > 0.0) != (after_qty > 0.0)) {
        std::ostringstream oss;
        oss << "Fill for order " << fill.order_id << " would flip " << fill.symbol
            << " from " << before_qty << " to " << after_qty << " without passing through flat";
        violation.reason = RejectReason::INSUFFICIENT_POSITION;
        violation.message = oss.str();
        return violation;
    }
    if (after_qty < 0.0 && !config.allow_short) {
        violation.reason = RejectReason::INSUFFICIENT_POSITION;
        violation.message = "Short position in " + fill.symbol + " with shorting disabled";
    }
    return violation;
}

Violation check_result(const Account& before, const Account& after, const Fill& fill,
                       const LedgerConfig& config) {
    Violation violation;
    if (!std::isfinite(after.cash) || !std::isfinite(after.equity)) {
        violation.reason = RejectReason::INVALID_PRICE;
        violation.message = "Non-finite account value after fill of order " + std::to_string(fill.order_id);
        return violation;
    }

    double tolerance = tolerance_for(config.initial_cash);
    if (!config.allow_margin && after.cash < -tolerance) {
        std::ostringstream oss;
        oss << "Cash would go negative (" << after.cash << ") after fill of order "
            << fill.order_id << " with margin disabled";
        violation.reason = RejectReason::INSUFFICIENT_FUNDS;
        violation.message = oss.str();
        return violation;
    }

    // Leverage only has to hold when a fill adds exposure; price moves alone
    // are not a ledger defect.
    double exposure_before = before.gross_exposure();
    double exposure_after = after.gross_exposure();
    if (exposure_after > exposure_before + tolerance &&
        exposure_after > config.max_leverage * after.equity + tolerance) {
        std::ostringstream oss;
        oss << "Gross exposure " << exposure_after << " exceeds leverage limit "
            << config.max_leverage << " x equity " << after.equity
            << " after fill of order " << fill.order_id;
        violation.reason = RejectReason::INSUFFICIENT_FUNDS;
        violation.message = oss.str();
    }
    return violation;
}

// Fill arithmetic without validation; callers check shape first
FillOutcome project_unchecked(const Account& account, const Fill& fill) {
    FillOutcome outcome;
    outcome.account = account;
    Account& next = outcome.account;

    double before_qty = next.position_quantity(fill.symbol);
    double delta = fill.signed_quantity();
    double after_qty = before_qty + delta;

    next.cash -= delta * fill.price + fill.commission;
    next.total_commission += fill.commission;
    next.timestamp = std::max(next.timestamp, fill.timestamp);

    PositionEvent& event = outcome.event;
    event.timestamp = fill.timestamp;
    event.symbol = fill.symbol;
    event.quantity_before = before_qty;
    event.quantity_after = after_qty;

    if (before_qty == 0.0) {
        Position position;
        position.symbol = fill.symbol;
        position.quantity = after_qty;
        position.average_cost = fill.price;
        position.last_price = fill.price;
        position.opened_at = fill.timestamp;
        next.positions[fill.symbol] = position;

        event.change = PositionChange::OPENED;
        event.average_cost = position.average_cost;
    } else {
        Position& position = next.positions.at(fill.symbol);
        bool increasing = (before_qty > 0.0) == (delta > 0.0);

        if (increasing) {
            // Weighted average over the enlarged position
            position.average_cost = (std::abs(before_qty) * position.average_cost +
                                     fill.quantity * fill.price) / std::abs(after_qty);
            position.quantity = after_qty;

            event.change = PositionChange::INCREASED;
            event.average_cost = position.average_cost;
        } else {
            double direction = before_qty > 0.0 ? 1.0 : -1.0;
            double realized = (fill.price - position.average_cost) * fill.quantity * direction;
            next.realized_pnl += realized;

            Trade& trade = outcome.trade;
            outcome.closed_trade = true;
            trade.symbol = fill.symbol;
            trade.is_long = before_qty > 0.0;
            trade.quantity = fill.quantity;
            trade.entry_price = position.average_cost;
            trade.exit_price = fill.price;
            trade.entry_time = position.opened_at;
            trade.exit_time = fill.timestamp;
            trade.pnl = realized - fill.commission;

            if (after_qty == 0.0) {
                // Cost basis resets with the position
                next.positions.erase(fill.symbol);
                event.change = PositionChange::FLAT;
                event.average_cost = 0.0;
            } else {
                position.quantity = after_qty;
                event.change = PositionChange::REDUCED;
                event.average_cost = position.average_cost;
            }
        }
    }

    recompute(next);
    return outcome;
}

} // namespace

FillOutcome project_fill(const Account& account, const Fill& fill, const LedgerConfig& config) {
    Violation shape = check_fill_shape(account, fill, config);
    if (shape.reason != RejectReason::NONE) {
        throw LedgerInvariantViolation(shape.message);
    }
    FillOutcome outcome = project_unchecked(account, fill);
    Violation result = check_result(account, outcome.account, fill, config);
    if (result.reason != RejectReason::NONE) {
        throw LedgerInvariantViolation(result.message);
    }
    return outcome;
}

RejectReason fill_violation(const Account& account, const Fill& fill, const LedgerConfig& config) {
    Violation shape = check_fill_shape(account, fill, config);
    if (shape.reason != RejectReason::NONE) {
        return shape.reason;
    }
    FillOutcome outcome = project_unchecked(account, fill);
    return check_result(account, outcome.account, fill, config).reason;
}

PortfolioLedger::PortfolioLedger(const LedgerConfig& config) : config_(config) {
    if (config_.initial_cash < 0.0) {
        throw InvalidParameter("initial_cash", "must not be negative");
    }
    if (config_.max_leverage < 1.0) {
        throw InvalidParameter("max_leverage", "must be at least 1.0");
    }

    account_.cash = config_.initial_cash;
    recompute(account_);
}

const Account& PortfolioLedger::apply(const Fill& fill) {
    // Validated against a scratch copy; account_ is untouched until commit
    FillOutcome outcome = project_fill(account_, fill, config_);

    // Commit
    account_ = std::move(outcome.account);
    position_events_.push_back(outcome.event);
    if (outcome.closed_trade) {
        trades_.push_back(outcome.trade);
    }
    ++fill_count_;

    utils::Logger::debug() << "Applied fill: order=" << fill.order_id << " " << to_string(fill.side)
                           << " " << fill.quantity << " " << fill.symbol << " @ " << fill.price
                           << " cash=" << account_.cash << " equity=" << account_.equity
                           << utils::Logger::endl;
    return account_;
}

const Account& PortfolioLedger::mark(const std::vector<Bar>& batch, int64_t timestamp) {
    for (const auto& bar : batch) {
        auto it = account_.positions.find(bar.symbol);
        if (it != account_.positions.end()) {
            it->second.last_price = bar.close;
        }
    }
    account_.timestamp = std::max(account_.timestamp, timestamp);
    recompute(account_);

    if (!std::isfinite(account_.equity)) {
        throw LedgerInvariantViolation("Non-finite equity after marking at " + std::to_string(timestamp));
    }
    return account_;
}

void PortfolioLedger::record_order(Order order) {
    if (!order.is_terminal()) {
        throw LedgerInvariantViolation("Order " + std::to_string(order.id) +
                                       " handed to the ledger before reaching a terminal state");
    }
    order_history_.push_back(std::move(order));
}

} // namespace kestrel::core
