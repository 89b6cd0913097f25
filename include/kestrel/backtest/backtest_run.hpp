#pragma once
#include <kestrel/backtest/configuration.hpp>
#include <kestrel/backtest/metrics_collector.hpp>
#include <kestrel/core/errors.hpp>
#include <kestrel/core/order.hpp>
#include <kestrel/core/portfolio.hpp>
#include <optional>
#include <string>
#include <vector>

namespace kestrel::backtest {

enum class RunStatus {
    INITIALIZED,
    RUNNING,
    PAUSED,     // live mode only, resumable
    COMPLETED,
    FAILED,
    CANCELLED
};

const char* to_string(RunStatus status);

bool is_terminal(RunStatus status);

// Structured cause of a failed run
struct RunFailure {
    core::ErrorLayer layer = core::ErrorLayer::FEED;
    std::string message;
    int64_t timestamp = 0;  // last completed step
};

// Sealed result of one scheduler run. Built once by the scheduler and
// read-only afterwards.
class BacktestRun {
private:
    BacktestConfiguration config_;
    std::string strategy_name_;
    RunStatus status_;
    std::vector<core::Account> snapshots_;
    std::vector<core::Order> orders_;
    std::vector<core::Fill> fills_;
    std::vector<core::Trade> trades_;
    std::vector<core::PositionEvent> position_events_;
    PerformanceMetrics metrics_;
    std::optional<RunFailure> failure_;
    size_t steps_;

public:
    BacktestRun(BacktestConfiguration config, std::string strategy_name, RunStatus status,
                std::vector<core::Account> snapshots, std::vector<core::Order> orders,
                std::vector<core::Fill> fills, std::vector<core::Trade> trades,
                std::vector<core::PositionEvent> position_events, PerformanceMetrics metrics,
                std::optional<RunFailure> failure, size_t steps);

    const BacktestConfiguration& config() const { return config_; }
    const std::string& strategy_name() const { return strategy_name_; }
    RunStatus status() const { return status_; }

    // One snapshot per completed step, in step order
    const std::vector<core::Account>& snapshots() const { return snapshots_; }

    // Terminal orders in the order they completed
    const std::vector<core::Order>& orders() const { return orders_; }
    const std::vector<core::Fill>& fills() const { return fills_; }
    const std::vector<core::Trade>& trades() const { return trades_; }
    const std::vector<core::PositionEvent>& position_events() const { return position_events_; }
    const PerformanceMetrics& metrics() const { return metrics_; }
    const std::optional<RunFailure>& failure() const { return failure_; }
    size_t steps() const { return steps_; }

    const core::Account* final_snapshot() const { return snapshots_.empty() ? nullptr : &snapshots_.back(); }
};

} // namespace kestrel::backtest
