#pragma once
#include <kestrel/backtest/backtest_run.hpp>
#include <kestrel/backtest/configuration.hpp>
#include <kestrel/core/bar.hpp>
#include <kestrel/strategy/strategy_factory.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace kestrel::backtest {

// One backtest of a parameter sweep
struct BatchJob {
    std::string label;
    BacktestConfiguration config;
    std::shared_ptr<const std::vector<core::Bar>> bars;  // copied into the job's own feed
};

struct BatchResult {
    std::string label;
    std::optional<BacktestRun> run;
    std::string error;  // set when the job could not produce a run

    bool ok() const { return run.has_value(); }
};

// Runs independent backtests in parallel. Every job builds its own feed,
// strategy, factor engine and ledger; only the read-only bars and the
// strategy factory are shared.
class BatchRunner {
private:
    const strategy::StrategyFactory& factory_;
    size_t max_parallel_;

    BatchResult run_job(const BatchJob& job) const;

public:
    explicit BatchRunner(const strategy::StrategyFactory& factory,
                         size_t max_parallel = std::thread::hardware_concurrency());

    // Results in submission order. A failing job yields an error result or
    // a FAILED run and never affects the others.
    std::vector<BatchResult> run(const std::vector<BatchJob>& jobs) const;

    size_t max_parallel() const { return max_parallel_; }
};

// Jobs for every combination of values, on top of a base configuration.
// Labels read "name=value,name=value".
std::vector<BatchJob> parameter_grid(const BacktestConfiguration& base,
                                     std::shared_ptr<const std::vector<core::Bar>> bars,
                                     const std::map<std::string, std::vector<double>>& grid);

} // namespace kestrel::backtest
