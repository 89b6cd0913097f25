#include <kestrel/backtest/backtest_run.hpp>

namespace kestrel::backtest {

const char* to_string(RunStatus status) {
    switch (status) {
        case RunStatus::INITIALIZED: return "INITIALIZED";
        case RunStatus::RUNNING: return "RUNNING";
        case RunStatus::PAUSED: return "PAUSED";
        case RunStatus::COMPLETED: return "COMPLETED";
        case RunStatus::FAILED: return "FAILED";
        case RunStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

bool is_terminal(RunStatus status) {
    return status == RunStatus::COMPLETED || status == RunStatus::FAILED || status == RunStatus::CANCELLED;
}

BacktestRun::BacktestRun(BacktestConfiguration config, std::string strategy_name, RunStatus status,
                         std::vector<core::Account> snapshots, std::vector<core::Order> orders,
                         std::vector<core::Fill> fills, std::vector<core::Trade> trades,
                         std::vector<core::PositionEvent> position_events, PerformanceMetrics metrics,
                         std::optional<RunFailure> failure, size_t steps)
    : config_(std::move(config)),
      strategy_name_(std::move(strategy_name)),
      status_(status),
      snapshots_(std::move(snapshots)),
      orders_(std::move(orders)),
      fills_(std::move(fills)),
      trades_(std::move(trades)),
      position_events_(std::move(position_events)),
      metrics_(metrics),
      failure_(std::move(failure)),
      steps_(steps) {}

} // namespace kestrel::backtest
