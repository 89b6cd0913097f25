#include <gtest/gtest.h>
#include <kestrel/core/errors.hpp>
#include <kestrel/core/portfolio.hpp>
#include <kestrel/execution/execution_simulator.hpp>
#include <kestrel/utils/logger.hpp>

#include <vector>
#include <string>

using namespace kestrel;
using core::Bar;
using core::OrderSide;
using core::OrderStatus;
using core::RejectReason;
using core::Signal;
using core::SignalType;

namespace {

// Frictionless, one share lots
execution::ExecutionConfig frictionless(execution::FillModel model) {
    execution::ExecutionConfig config;
    config.fill_model = model;
    config.slippage_rate = 0.0;
    config.commission_rate = 0.0;
    config.stamp_duty_rate = 0.0;
    config.lot_size = 1;
    return config;
}

Signal sized(const std::string& symbol, SignalType type, double quantity) {
    Signal signal(symbol, type);
    signal.target_quantity = quantity;
    return signal;
}

} // namespace

TEST(CostModelTest, SlippageMovesAgainstTheTrader) {
    execution::ExecutionConfig config;
    execution::CostModel costs(config);

    EXPECT_DOUBLE_EQ(costs.execution_price(OrderSide::BUY, 100.0, 10, 1000), 100.1);
    EXPECT_DOUBLE_EQ(costs.execution_price(OrderSide::SELL, 100.0, 10, 1000), 99.9);
}

TEST(CostModelTest, MarketImpactScalesWithParticipation) {
    execution::ExecutionConfig config;
    config.slippage_rate = 0.0;
    config.impact_coefficient = 0.1;
    execution::CostModel costs(config);

    // 500 of 1000 shares: 0.1 * 0.5 = 5%
    EXPECT_DOUBLE_EQ(costs.execution_price(OrderSide::BUY, 100.0, 500, 1000), 105.0);
    EXPECT_DOUBLE_EQ(costs.execution_price(OrderSide::BUY, 100.0, 500, 0), 100.0);
}

TEST(CostModelTest, CommissionAndStampDuty) {
    execution::ExecutionConfig config;
    config.min_commission = 5.0;
    execution::CostModel costs(config);

    EXPECT_DOUBLE_EQ(costs.commission(OrderSide::BUY, 100000.0), 30.0);
    EXPECT_DOUBLE_EQ(costs.commission(OrderSide::SELL, 100000.0), 130.0);
    EXPECT_DOUBLE_EQ(costs.commission(OrderSide::BUY, 1000.0), 5.0);
}

TEST(CostModelTest, LiquidityCapInWholeLots) {
    execution::ExecutionConfig config;
    config.max_volume_participation = 0.1;
    execution::CostModel costs(config);

    EXPECT_DOUBLE_EQ(costs.liquidity_cap(12345), 1200.0);
    EXPECT_DOUBLE_EQ(costs.liquidity_cap(0), 0.0);
}

TEST(ExecutionConfigTest, Validation) {
    execution::ExecutionConfig config;
    EXPECT_NO_THROW(config.validate());

    config.lot_size = 0.5;
    EXPECT_THROW(config.validate(), core::InvalidParameter);

    config = execution::ExecutionConfig();
    config.max_volume_participation = 0.0;
    EXPECT_THROW(config.validate(), core::InvalidParameter);

    config = execution::ExecutionConfig();
    config.slippage_rate = -0.1;
    EXPECT_THROW(execution::ExecutionSimulator{config}, core::InvalidParameter);
}

TEST(ExecutionConfigTest, ParseFillModel) {
    EXPECT_EQ(execution::parse_fill_model("next_open"), execution::FillModel::NEXT_BAR_OPEN);
    EXPECT_EQ(execution::parse_fill_model("close_slippage"), execution::FillModel::CLOSE_WITH_SLIPPAGE);
    EXPECT_THROW(execution::parse_fill_model("vwap"), core::InvalidParameter);
    EXPECT_STREQ(execution::to_string(execution::FillModel::CLOSE_WITH_SLIPPAGE), "close_slippage");
}

// Test fixture for simulator tests
class SimulatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::set_level(utils::LogLevel::LOG_ERROR);
        ledger_config.initial_cash = 10000.0;
    }

    core::LedgerConfig ledger_config;
    Bar bar100{"AAPL", 100, 100.0, 101.0, 99.0, 100.0, 1000000};
    Bar bar200{"AAPL", 200, 102.0, 104.0, 101.0, 103.0, 1000000};
};

TEST_F(SimulatorTest, DefaultSizingUsesCashFraction) {
    execution::ExecutionSimulator simulator(frictionless(execution::FillModel::NEXT_BAR_OPEN), ledger_config);
    core::PortfolioLedger ledger(ledger_config);

    auto orders = simulator.submit(Signal::long_entry("AAPL"), bar100, ledger.snapshot());
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_EQ(orders[0].side, OrderSide::BUY);
    EXPECT_DOUBLE_EQ(orders[0].quantity, 95.0);
    EXPECT_EQ(orders[0].status, OrderStatus::PENDING);
    EXPECT_EQ(orders[0].created_at, 100);
    EXPECT_DOUBLE_EQ(simulator.pending_quantity("AAPL"), 95.0);
}

TEST_F(SimulatorTest, DefaultSizingBuysAtLeastOneLot) {
    auto config = frictionless(execution::FillModel::NEXT_BAR_OPEN);
    config.lot_size = 100;
    execution::ExecutionSimulator simulator(config, ledger_config);
    core::PortfolioLedger ledger(ledger_config);

    // 95 shares round down to zero lots; one lot still fits the cash
    auto orders = simulator.submit(Signal::long_entry("AAPL"), bar100, ledger.snapshot());
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_DOUBLE_EQ(orders[0].quantity, 100.0);
    EXPECT_EQ(orders[0].status, OrderStatus::PENDING);
}

TEST_F(SimulatorTest, TargetWeightSizesFromEquity) {
    execution::ExecutionSimulator simulator(frictionless(execution::FillModel::NEXT_BAR_OPEN), ledger_config);
    core::PortfolioLedger ledger(ledger_config);

    Signal signal = Signal::long_entry("AAPL");
    signal.target_weight = 0.5;
    auto orders = simulator.submit(signal, bar100, ledger.snapshot());
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_DOUBLE_EQ(orders[0].quantity, 50.0);
}

TEST_F(SimulatorTest, RejectsOrderBeyondCash) {
    ledger_config.initial_cash = 1000.0;
    execution::ExecutionSimulator simulator(frictionless(execution::FillModel::NEXT_BAR_OPEN), ledger_config);
    core::PortfolioLedger ledger(ledger_config);
    core::Account before = ledger.snapshot();

    auto orders = simulator.submit(sized("AAPL", SignalType::LONG, 1000), bar100, before);
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_EQ(orders[0].status, OrderStatus::REJECTED);
    EXPECT_EQ(orders[0].reject_reason, RejectReason::INSUFFICIENT_FUNDS);
    EXPECT_TRUE(simulator.open_orders().empty());

    auto completed = simulator.take_completed();
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].id, orders[0].id);
    EXPECT_TRUE(simulator.take_completed().empty());

    EXPECT_EQ(ledger.snapshot(), before);
}

TEST_F(SimulatorTest, ShortRejectedWhenDisabled) {
    execution::ExecutionSimulator simulator(frictionless(execution::FillModel::NEXT_BAR_OPEN), ledger_config);
    core::PortfolioLedger ledger(ledger_config);

    auto orders = simulator.submit(Signal::short_entry("AAPL"), bar100, ledger.snapshot());
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_EQ(orders[0].reject_reason, RejectReason::INSUFFICIENT_POSITION);
}

TEST_F(SimulatorTest, RepeatedSignalIsNettedAgainstOpenOrders) {
    execution::ExecutionSimulator simulator(frictionless(execution::FillModel::NEXT_BAR_OPEN), ledger_config);
    core::PortfolioLedger ledger(ledger_config);

    ASSERT_EQ(simulator.submit(Signal::long_entry("AAPL"), bar100, ledger.snapshot()).size(), 1u);
    EXPECT_TRUE(simulator.submit(Signal::long_entry("AAPL"), bar100, ledger.snapshot()).empty());
    EXPECT_EQ(simulator.open_orders().size(), 1u);

    // Going flat offsets the open buy instead of cancelling it
    auto orders = simulator.submit(Signal::flat("AAPL"), bar100, ledger.snapshot());
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_EQ(orders[0].side, OrderSide::SELL);
    EXPECT_DOUBLE_EQ(orders[0].quantity, 95.0);
    EXPECT_EQ(orders[0].status, OrderStatus::PENDING);
    EXPECT_EQ(simulator.open_orders().size(), 2u);
    EXPECT_DOUBLE_EQ(simulator.pending_quantity("AAPL"), 0.0);
}

TEST_F(SimulatorTest, HoldAndFlatWithoutPositionDoNothing) {
    execution::ExecutionSimulator simulator(frictionless(execution::FillModel::NEXT_BAR_OPEN), ledger_config);
    core::PortfolioLedger ledger(ledger_config);

    EXPECT_TRUE(simulator.submit(Signal("AAPL", SignalType::HOLD), bar100, ledger.snapshot()).empty());
    EXPECT_TRUE(simulator.submit(Signal::flat("AAPL"), bar100, ledger.snapshot()).empty());
    EXPECT_TRUE(simulator.take_completed().empty());
}

TEST_F(SimulatorTest, SignalForAnotherInstrumentIsMisuse) {
    execution::ExecutionSimulator simulator(frictionless(execution::FillModel::NEXT_BAR_OPEN), ledger_config);
    core::PortfolioLedger ledger(ledger_config);

    EXPECT_THROW(simulator.submit(Signal::long_entry("MSFT"), bar100, ledger.snapshot()), core::ExecutionError);
}

TEST_F(SimulatorTest, NextBarOpenWaitsForALaterBar) {
    auto config = frictionless(execution::FillModel::NEXT_BAR_OPEN);
    config.slippage_rate = 0.001;
    execution::ExecutionSimulator simulator(config, ledger_config);
    core::PortfolioLedger ledger(ledger_config);

    simulator.submit(sized("AAPL", SignalType::LONG, 10), bar100, ledger.snapshot());
    EXPECT_TRUE(simulator.advance({bar100}, ledger.snapshot()).empty());
    EXPECT_EQ(simulator.open_orders().size(), 1u);

    auto reports = simulator.advance({bar200}, ledger.snapshot());
    ASSERT_EQ(reports.size(), 1u);
    ASSERT_TRUE(reports[0].fill.has_value());
    EXPECT_DOUBLE_EQ(reports[0].fill->price, 102.0 * 1.001);
    EXPECT_EQ(reports[0].fill->timestamp, 200);
    EXPECT_EQ(reports[0].order.status, OrderStatus::FILLED);
    EXPECT_TRUE(simulator.open_orders().empty());
    EXPECT_EQ(simulator.take_completed().size(), 1u);
}

TEST_F(SimulatorTest, CloseWithSlippageFillsInTheSameStep) {
    auto config = frictionless(execution::FillModel::CLOSE_WITH_SLIPPAGE);
    config.slippage_rate = 0.001;
    config.commission_rate = 0.0003;
    execution::ExecutionSimulator simulator(config, ledger_config);
    core::PortfolioLedger ledger(ledger_config);

    simulator.submit(sized("AAPL", SignalType::LONG, 10), bar100, ledger.snapshot());
    auto reports = simulator.advance({bar100}, ledger.snapshot());
    ASSERT_EQ(reports.size(), 1u);
    ASSERT_TRUE(reports[0].fill.has_value());
    EXPECT_DOUBLE_EQ(reports[0].fill->price, 100.1);
    EXPECT_NEAR(reports[0].fill->commission, 1001.0 * 0.0003, 1e-12);

    ledger.apply(*reports[0].fill);
    EXPECT_NEAR(ledger.cash(), 10000.0 - 1001.0 - 0.3003, 1e-9);
}

TEST_F(SimulatorTest, FillTimeFundsCheckRejectsGapUp) {
    ledger_config.initial_cash = 1000.0;
    auto config = frictionless(execution::FillModel::NEXT_BAR_OPEN);
    config.slippage_rate = 0.001;
    config.commission_rate = 0.0003;
    execution::ExecutionSimulator simulator(config, ledger_config);
    core::PortfolioLedger ledger(ledger_config);

    Bar signal_bar("AAPL", 100, 12.0, 13.0, 11.5, 13.0, 1000000);
    Bar gap_up("AAPL", 200, 14.0, 14.5, 13.8, 14.2, 1000000);

    auto orders = simulator.submit(Signal::long_entry("AAPL"), signal_bar, ledger.snapshot());
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_DOUBLE_EQ(orders[0].quantity, 73.0);
    EXPECT_EQ(orders[0].status, OrderStatus::PENDING);

    auto reports = simulator.advance({gap_up}, ledger.snapshot());
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_FALSE(reports[0].fill.has_value());
    EXPECT_EQ(reports[0].order.status, OrderStatus::REJECTED);
    EXPECT_EQ(reports[0].order.reject_reason, RejectReason::INSUFFICIENT_FUNDS);
    EXPECT_DOUBLE_EQ(ledger.cash(), 1000.0);
}

TEST_F(SimulatorTest, ReversalGoesThroughFlat) {
    ledger_config.allow_short = true;
    execution::ExecutionSimulator simulator(frictionless(execution::FillModel::NEXT_BAR_OPEN), ledger_config);
    core::PortfolioLedger ledger(ledger_config);

    core::Fill opening;
    opening.order_id = 99;
    opening.symbol = "AAPL";
    opening.side = OrderSide::BUY;
    opening.quantity = 10;
    opening.price = 100.0;
    opening.timestamp = 50;
    ledger.apply(opening);

    auto orders = simulator.submit(sized("AAPL", SignalType::SHORT, 5), bar100, ledger.snapshot());
    ASSERT_EQ(orders.size(), 2u);
    EXPECT_EQ(orders[0].side, OrderSide::SELL);
    EXPECT_DOUBLE_EQ(orders[0].quantity, 10.0);
    EXPECT_EQ(orders[1].side, OrderSide::SELL);
    EXPECT_DOUBLE_EQ(orders[1].quantity, 5.0);

    auto reports = simulator.advance({bar200}, ledger.snapshot());
    ASSERT_EQ(reports.size(), 2u);
    for (const auto& report : reports) {
        ASSERT_TRUE(report.fill.has_value());
        ledger.apply(*report.fill);
    }
    EXPECT_DOUBLE_EQ(ledger.position("AAPL"), -5.0);

    const auto& events = ledger.position_events();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[1].change, core::PositionChange::FLAT);
    EXPECT_EQ(events[2].change, core::PositionChange::OPENED);
}

TEST_F(SimulatorTest, LiquidityCapSplitsFillsAcrossBars) {
    auto config = frictionless(execution::FillModel::NEXT_BAR_OPEN);
    config.max_volume_participation = 0.5;
    execution::ExecutionSimulator simulator(config, ledger_config);
    core::PortfolioLedger ledger(ledger_config);

    simulator.submit(sized("AAPL", SignalType::LONG, 80), bar100, ledger.snapshot());

    Bar thin("AAPL", 200, 100.0, 101.0, 99.0, 100.0, 100);
    auto reports = simulator.advance({thin}, ledger.snapshot());
    ASSERT_EQ(reports.size(), 1u);
    ASSERT_TRUE(reports[0].fill.has_value());
    EXPECT_DOUBLE_EQ(reports[0].fill->quantity, 50.0);
    EXPECT_EQ(reports[0].order.status, OrderStatus::PARTIALLY_FILLED);
    ledger.apply(*reports[0].fill);
    EXPECT_DOUBLE_EQ(simulator.pending_quantity("AAPL"), 30.0);

    Bar next("AAPL", 300, 100.0, 101.0, 99.0, 100.0, 100);
    reports = simulator.advance({next}, ledger.snapshot());
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_DOUBLE_EQ(reports[0].fill->quantity, 30.0);
    EXPECT_EQ(reports[0].order.status, OrderStatus::FILLED);
    EXPECT_DOUBLE_EQ(reports[0].order.filled_quantity, 80.0);
}

TEST_F(SimulatorTest, LimitOrderFillsAtLimitWhenReached) {
    auto config = frictionless(execution::FillModel::NEXT_BAR_OPEN);
    config.slippage_rate = 0.01;
    execution::ExecutionSimulator simulator(config, ledger_config);
    core::PortfolioLedger ledger(ledger_config);

    Signal signal = sized("AAPL", SignalType::LONG, 10);
    signal.limit_price = 95.0;
    auto orders = simulator.submit(signal, bar100, ledger.snapshot());
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_EQ(orders[0].type, core::OrderType::LIMIT);

    Bar above("AAPL", 200, 97.0, 98.0, 96.0, 97.0, 1000000);
    EXPECT_TRUE(simulator.advance({above}, ledger.snapshot()).empty());

    Bar through("AAPL", 300, 97.0, 98.0, 94.0, 95.5, 1000000);
    auto reports = simulator.advance({through}, ledger.snapshot());
    ASSERT_EQ(reports.size(), 1u);
    ASSERT_TRUE(reports[0].fill.has_value());
    EXPECT_DOUBLE_EQ(reports[0].fill->price, 95.0);
}

TEST_F(SimulatorTest, LimitOrderExpires) {
    auto config = frictionless(execution::FillModel::NEXT_BAR_OPEN);
    config.limit_order_ttl_bars = 2;
    execution::ExecutionSimulator simulator(config, ledger_config);
    core::PortfolioLedger ledger(ledger_config);

    Signal signal = sized("AAPL", SignalType::LONG, 10);
    signal.limit_price = 90.0;
    simulator.submit(signal, bar100, ledger.snapshot());

    EXPECT_TRUE(simulator.advance({bar200}, ledger.snapshot()).empty());
    Bar third("AAPL", 300, 102.0, 104.0, 101.0, 103.0, 1000000);
    auto reports = simulator.advance({third}, ledger.snapshot());
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].order.status, OrderStatus::CANCELLED);
    EXPECT_EQ(reports[0].order.note, "expired after 2 bars");
    EXPECT_TRUE(simulator.open_orders().empty());
}

TEST_F(SimulatorTest, ExitIsResizedWhenANettedLimitOrderExpires) {
    auto config = frictionless(execution::FillModel::CLOSE_WITH_SLIPPAGE);
    config.limit_order_ttl_bars = 2;
    execution::ExecutionSimulator simulator(config, ledger_config);
    core::PortfolioLedger ledger(ledger_config);

    auto apply = [&ledger](const std::vector<execution::ExecutionReport>& reports) {
        for (const auto& report : reports) {
            if (report.fill) {
                ledger.apply(*report.fill);
            }
        }
    };

    simulator.submit(sized("AAPL", SignalType::LONG, 10), bar100, ledger.snapshot());
    apply(simulator.advance({bar100}, ledger.snapshot()));
    ASSERT_DOUBLE_EQ(ledger.snapshot().position_quantity("AAPL"), 10.0);

    // Never reached: the bar lows stay above 50
    Signal add = sized("AAPL", SignalType::LONG, 20);
    add.limit_price = 50.0;
    simulator.submit(add, bar200, ledger.snapshot());
    apply(simulator.advance({bar200}, ledger.snapshot()));

    // Sized against 10 held plus 10 pending
    Bar third("AAPL", 300, 102.0, 104.0, 101.0, 103.0, 1000000);
    auto exit = simulator.submit(Signal("AAPL", SignalType::FLAT), third, ledger.snapshot());
    ASSERT_EQ(exit.size(), 1u);
    EXPECT_DOUBLE_EQ(exit[0].quantity, 20.0);

    auto reports = simulator.advance({third}, ledger.snapshot());
    apply(reports);
    ASSERT_EQ(reports.size(), 2u);
    EXPECT_EQ(reports[0].order.note, "expired after 2 bars");
    EXPECT_EQ(reports[1].order.id, exit[0].id);
    EXPECT_EQ(reports[1].order.status, OrderStatus::CANCELLED);

    ASSERT_EQ(simulator.open_orders().size(), 1u);
    const core::Order& replacement = simulator.open_orders()[0];
    EXPECT_EQ(replacement.side, OrderSide::SELL);
    EXPECT_DOUBLE_EQ(replacement.quantity, 10.0);
    EXPECT_DOUBLE_EQ(replacement.target_position, 0.0);

    Bar fourth("AAPL", 400, 103.0, 105.0, 102.0, 104.0, 1000000);
    apply(simulator.advance({fourth}, ledger.snapshot()));
    EXPECT_DOUBLE_EQ(ledger.snapshot().position_quantity("AAPL"), 0.0);
    EXPECT_TRUE(simulator.open_orders().empty());
}

TEST_F(SimulatorTest, OrdersRecordTheTargetPosition) {
    ledger_config.allow_short = true;
    execution::ExecutionSimulator simulator(frictionless(execution::FillModel::NEXT_BAR_OPEN), ledger_config);
    core::PortfolioLedger ledger(ledger_config);

    auto orders = simulator.submit(sized("AAPL", SignalType::SHORT, 30), bar100, ledger.snapshot());
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_DOUBLE_EQ(orders[0].target_position, -30.0);
}

TEST_F(SimulatorTest, CancelAllHandsOrdersToCompleted) {
    execution::ExecutionSimulator simulator(frictionless(execution::FillModel::NEXT_BAR_OPEN), ledger_config);
    core::PortfolioLedger ledger(ledger_config);

    simulator.submit(sized("AAPL", SignalType::LONG, 10), bar100, ledger.snapshot());
    auto cancelled = simulator.cancel_all(100, "end of run");
    ASSERT_EQ(cancelled.size(), 1u);
    EXPECT_EQ(cancelled[0].status, OrderStatus::CANCELLED);
    EXPECT_EQ(cancelled[0].note, "end of run");
    EXPECT_TRUE(simulator.open_orders().empty());

    auto completed = simulator.take_completed();
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_TRUE(completed[0].is_terminal());
}

TEST_F(SimulatorTest, OrderIdsIncrease) {
    execution::ExecutionSimulator simulator(frictionless(execution::FillModel::NEXT_BAR_OPEN), ledger_config);
    core::PortfolioLedger ledger(ledger_config);

    auto first = simulator.submit(sized("AAPL", SignalType::LONG, 10), bar100, ledger.snapshot());
    Bar msft("MSFT", 100, 50.0, 51.0, 49.0, 50.0, 1000000);
    auto second = simulator.submit(sized("MSFT", SignalType::LONG, 10), msft, ledger.snapshot());
    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_LT(first[0].id, second[0].id);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
