#pragma once

#include <kestrel/backtest/backtest_run.hpp>
#include <kestrel/backtest/configuration.hpp>
#include <kestrel/backtest/metrics_collector.hpp>
#include <kestrel/core/bar.hpp>
#include <kestrel/core/portfolio.hpp>
#include <kestrel/data/market_data_feed.hpp>
#include <kestrel/execution/execution_simulator.hpp>
#include <kestrel/factor/factor_engine.hpp>
#include <kestrel/strategy/strategy_base.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kestrel::backtest {

// Where a run stands between two steps. Enough to report progress or to
// pick a paused live run back up.
struct Checkpoint {
    RunStatus status = RunStatus::INITIALIZED;
    size_t steps = 0;
    int64_t last_timestamp = 0;
    core::Account account;
    std::vector<core::Order> open_orders;
    size_t buffered_bars = 0;  // bars read ahead for the next batch
};

// Drives one feed through one strategy, the execution simulator and the
// ledger, one same-timestamp batch per step:
//
//   feed batch -> factor history -> strategy on_bar -> submit signals
//   -> advance open orders -> apply fills -> mark -> snapshot
//
// Single threaded and deterministic. Each scheduler owns its factor engine,
// simulator, ledger and metrics, so runs never share mutable state.
// cancel() may be called from any thread; it takes effect between steps.
class BacktestScheduler {
private:
    BacktestConfiguration config_;
    std::unique_ptr<data::MarketDataFeed> feed_;
    strategy::StrategyPtr strategy_;

    factor::FactorEngine factors_;
    execution::ExecutionSimulator simulator_;
    core::PortfolioLedger ledger_;
    MetricsCollector metrics_;

    RunStatus status_ = RunStatus::INITIALIZED;
    std::optional<RunFailure> failure_;
    std::atomic<bool> cancel_requested_{false};
    bool sealed_ = false;

    std::vector<core::Account> snapshots_;
    std::vector<core::Fill> fills_;
    std::vector<core::Bar> pending_batch_;
    std::optional<core::Bar> lookahead_;
    bool feed_exhausted_ = false;
    int64_t last_timestamp_ = 0;
    size_t steps_ = 0;

    std::function<void(const core::Signal&)> signal_callback_;
    std::function<void(const core::Order&)> order_callback_;

    // Reads until the batch is complete; empty at end of stream
    std::vector<core::Bar> next_batch();
    void process_batch(const std::vector<core::Bar>& batch);
    std::vector<core::Signal> invoke_strategy(const strategy::StrategyContext& context);
    void notify_strategy(const core::Order& order);
    void publish_order(const core::Order& order);
    void record_completed();
    void verify_equity(const core::Account& account) const;

    void start();
    void finish(RunStatus status);
    void fail(core::ErrorLayer layer, const std::string& message);

public:
    BacktestScheduler(const BacktestConfiguration& config,
                      std::unique_ptr<data::MarketDataFeed> feed,
                      strategy::StrategyPtr strategy);

    BacktestScheduler(const BacktestScheduler&) = delete;
    BacktestScheduler& operator=(const BacktestScheduler&) = delete;

    // Steps until the feed is exhausted, the run fails, is cancelled or
    // pauses on a live stall. Returns the resulting status.
    RunStatus run();

    // Processes one batch. False when no step was taken: the run is
    // terminal, paused, or just reached its end.
    bool step();

    // Cooperative cancellation, honoured before the next step
    void cancel() { cancel_requested_ = true; }

    // PAUSED -> RUNNING after a recoverable feed stall
    void resume();

    Checkpoint checkpoint() const;

    // Replaces an instrument's bar history (corporate action adjustment).
    // Drops every cached factor value of that instrument.
    void amend_history(const std::string& symbol, std::vector<core::Bar> bars);

    // Freezes the run into its artifact. Only once, and only in a terminal
    // state; throws std::logic_error otherwise.
    BacktestRun seal();

    // Live signal and order event stream
    void set_signal_callback(std::function<void(const core::Signal&)> callback) {
        signal_callback_ = std::move(callback);
    }
    void set_order_callback(std::function<void(const core::Order&)> callback) {
        order_callback_ = std::move(callback);
    }

    RunStatus status() const { return status_; }
    const std::optional<RunFailure>& failure() const { return failure_; }
    size_t steps() const { return steps_; }

    const core::PortfolioLedger& ledger() const { return ledger_; }
    const factor::FactorEngine& factors() const { return factors_; }
    const execution::ExecutionSimulator& simulator() const { return simulator_; }
    const std::vector<core::Account>& snapshots() const { return snapshots_; }
    const BacktestConfiguration& config() const { return config_; }
};

} // namespace kestrel::backtest
