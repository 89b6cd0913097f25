#pragma once
#include <kestrel/core/bar.hpp>
#include <kestrel/core/order.hpp>
#include <string>
#include <map>
#include <vector>
#include <cstdint>

namespace kestrel::core {

struct Position {
    std::string symbol;
    double quantity = 0.0;      // signed: + long, - short
    double average_cost = 0.0;  // weighted average execution price
    double last_price = 0.0;    // mark price
    int64_t opened_at = 0;

    double market_value() const { return quantity * last_price; }
    double unrealized_pnl() const { return (last_price - average_cost) * quantity; }
};

bool operator==(const Position& a, const Position& b);

// Immutable-by-convention copy of account state. Positions are keyed by
// symbol and never hold a zero quantity.
struct Account {
    int64_t timestamp = 0;
    double cash = 0.0;
    std::map<std::string, Position> positions;
    double market_value = 0.0;
    double equity = 0.0;
    double realized_pnl = 0.0;
    double total_commission = 0.0;

    double position_quantity(const std::string& symbol) const;
    double gross_exposure() const;

    // cash + sum(quantity * mark price), in key order
    double mark_to_market_equity() const;
};

bool operator==(const Account& a, const Account& b);
bool operator!=(const Account& a, const Account& b);

// Round trip (or part of one) closed by a reducing fill
struct Trade {
    std::string symbol;
    bool is_long = true;
    double quantity = 0.0;
    double entry_price = 0.0;
    double exit_price = 0.0;
    int64_t entry_time = 0;
    int64_t exit_time = 0;
    double pnl = 0.0;  // gross realized P&L less the closing commission
};

// Position lifecycle record. A FLAT entry is written every time a position
// returns to exactly zero, so a long-to-short reversal always shows one.
enum class PositionChange {
    OPENED,
    INCREASED,
    REDUCED,
    FLAT
};

const char* to_string(PositionChange change);

struct PositionEvent {
    int64_t timestamp = 0;
    std::string symbol;
    PositionChange change = PositionChange::OPENED;
    double quantity_before = 0.0;
    double quantity_after = 0.0;
    double average_cost = 0.0;
};

struct LedgerConfig {
    double initial_cash = 100000.0;
    bool allow_short = false;
    bool allow_margin = false;
    double max_leverage = 1.0;  // gross exposure / equity ceiling
};

// Result of applying one fill to an account
struct FillOutcome {
    Account account;
    PositionEvent event;
    bool closed_trade = false;
    Trade trade;
};

// Pure projection of a fill onto an account, with every ledger check.
// Throws LedgerInvariantViolation.
FillOutcome project_fill(const Account& account, const Fill& fill, const LedgerConfig& config);

// The constraint a fill would break, NONE when project_fill accepts it.
// Short and zero-crossing problems map to INSUFFICIENT_POSITION, cash and
// leverage problems to INSUFFICIENT_FUNDS.
RejectReason fill_violation(const Account& account, const Fill& fill, const LedgerConfig& config);

// Single source of truth for account state. Mutated only through apply()
// (fills) and mark() (prices). Each fill is validated against a scratch copy
// and committed whole, so readers never observe half of a fill.
class PortfolioLedger {
private:
    LedgerConfig config_;
    Account account_;
    std::vector<Order> order_history_;
    std::vector<Trade> trades_;
    std::vector<PositionEvent> position_events_;
    size_t fill_count_ = 0;

public:
    explicit PortfolioLedger(const LedgerConfig& config = LedgerConfig());

    const Account& apply(const Fill& fill);

    // Marks positions in the batch at their close and recomputes equity
    const Account& mark(const std::vector<Bar>& batch, int64_t timestamp);

    Account snapshot() const { return account_; }

    // Takes ownership of an order that reached a terminal state
    void record_order(Order order);

    double cash() const { return account_.cash; }
    double equity() const { return account_.equity; }
    double position(const std::string& symbol) const { return account_.position_quantity(symbol); }
    const LedgerConfig& config() const { return config_; }

    const std::vector<Order>& order_history() const { return order_history_; }
    const std::vector<Trade>& trades() const { return trades_; }
    const std::vector<PositionEvent>& position_events() const { return position_events_; }
    size_t fill_count() const { return fill_count_; }
};

} // namespace kestrel::core
