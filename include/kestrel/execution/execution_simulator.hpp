#pragma once
#include <kestrel/core/bar.hpp>
#include <kestrel/core/order.hpp>
#include <kestrel/core/portfolio.hpp>
#include <kestrel/core/signal.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kestrel::execution {

enum class FillModel {
    NEXT_BAR_OPEN,       // fill at the instrument's next bar open
    CLOSE_WITH_SLIPPAGE  // fill in the submitting step at its close
};

const char* to_string(FillModel model);

// "next_open" or "close_slippage"; throws InvalidParameter otherwise
FillModel parse_fill_model(const std::string& text);

struct ExecutionConfig {
    FillModel fill_model = FillModel::NEXT_BAR_OPEN;

    double slippage_rate = 0.001;       // fraction of price
    double impact_coefficient = 0.0;    // extra fraction per unit of quantity / bar volume
    double commission_rate = 0.0003;    // fraction of notional, both sides
    double min_commission = 0.0;
    double stamp_duty_rate = 0.001;     // fraction of notional, sells only

    double lot_size = 100;
    double max_volume_participation = 1.0;  // share of bar volume one bar can fill
    int limit_order_ttl_bars = 0;           // 0 = good till end of run

    double position_fraction = 0.95;  // default sizing as a share of cash

    // Throws InvalidParameter
    void validate() const;
};

// Deterministic frictions. Only order size and bar fields go in, so two runs
// over the same inputs produce bit-identical prices and costs.
class CostModel {
private:
    ExecutionConfig config_;

public:
    explicit CostModel(const ExecutionConfig& config) : config_(config) {}

    // Reference price moved against the trader
    double execution_price(core::OrderSide side, double reference_price, double quantity,
                           double bar_volume) const;

    // Commission plus stamp duty
    double commission(core::OrderSide side, double notional) const;

    // Largest quantity one bar can fill, in whole lots
    double liquidity_cap(double bar_volume) const;
};

// One order's change during advance(); fill is set when shares traded
struct ExecutionReport {
    core::Order order;
    std::optional<core::Fill> fill;
};

// Turns signals into orders and orders into fills.
//
// Orders are owned here until terminal. take_completed() hands terminal
// orders over (by value) for the ledger's history. Funds and position checks
// use the same arithmetic as the ledger, so an accepted fill can always be
// applied.
class ExecutionSimulator {
private:
    ExecutionConfig config_;
    core::LedgerConfig ledger_config_;
    CostModel costs_;
    std::vector<core::Order> open_orders_;   // submission order
    std::vector<core::Order> completed_;
    uint64_t next_order_id_ = 1;

    core::Order make_order(const std::string& symbol, const core::Bar& bar, core::OrderSide side,
                           double quantity, double target, const std::string& note,
                           std::optional<double> limit_price);
    std::vector<core::Order> place(const std::string& symbol, double effective, double desired,
                                   const core::Bar& bar, const core::Account& account,
                                   const std::string& note, std::optional<double> limit_price);
    void resize_after(const std::string& symbol, uint64_t ended_id, const core::Bar& bar,
                      const core::Account& working, std::vector<ExecutionReport>& reports);
    double desired_position(const core::Signal& signal, const core::Bar& bar,
                            const core::Account& account, double effective) const;
    core::RejectReason pre_trade_check(const core::Order& order, const core::Bar& bar,
                                       const core::Account& projected) const;
    void reject(core::Order& order, core::RejectReason reason);
    core::Fill estimate_fill(const core::Order& order, const core::Bar& bar, double quantity) const;
    double round_to_lots(double quantity) const;

public:
    ExecutionSimulator(const ExecutionConfig& config = ExecutionConfig(),
                       const core::LedgerConfig& ledger_config = core::LedgerConfig());

    // Orders for one signal against the bar it was produced on. The target
    // is netted against the position plus the instrument's open orders,
    // which stay in force (they may already be due at this bar's open), so
    // only the difference is ordered. A target on the other side of zero
    // yields a closing and an opening order. Rejected orders are returned
    // with status REJECTED and queued as completed; they never touch
    // account state.
    std::vector<core::Order> submit(const core::Signal& signal, const core::Bar& bar,
                                    const core::Account& account);

    // Matches open orders against the batch, in submission order. working
    // is a copy of the ledger's account, updated fill by fill so later
    // orders see earlier ones. Reports come back in the order fills must
    // be applied. When an order ends without filling completely, later
    // orders for its instrument are cancelled and replaced by orders sized
    // from the position actually held; rejected replacements are reported,
    // accepted ones show up in open_orders().
    std::vector<ExecutionReport> advance(const std::vector<core::Bar>& batch, core::Account working);

    // Terminal orders since the last call, oldest first
    std::vector<core::Order> take_completed();

    // Cancels everything still open (end of run, cancellation)
    std::vector<core::Order> cancel_all(int64_t timestamp, const std::string& note);

    const std::vector<core::Order>& open_orders() const { return open_orders_; }

    // Signed unfilled quantity of open orders for an instrument
    double pending_quantity(const std::string& symbol) const;

    const ExecutionConfig& config() const { return config_; }
    const CostModel& costs() const { return costs_; }
};

} // namespace kestrel::execution
