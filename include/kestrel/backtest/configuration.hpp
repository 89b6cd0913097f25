#pragma once
#include <kestrel/backtest/metrics_collector.hpp>
#include <kestrel/core/portfolio.hpp>
#include <kestrel/execution/execution_simulator.hpp>
#include <kestrel/strategy/strategy_base.hpp>
#include <kestrel/utils/config.hpp>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace kestrel::backtest {

// Everything one run needs, resolved once before it starts
struct BacktestConfiguration {
    core::LedgerConfig ledger;
    execution::ExecutionConfig execution;
    MetricsConfig metrics;

    std::string strategy = "ma_cross";
    strategy::ParameterMap strategy_parameters;

    // Empty means every instrument in the data
    std::vector<std::string> instruments;
    int64_t start = std::numeric_limits<int64_t>::min();
    int64_t end = std::numeric_limits<int64_t>::max();

    std::string data_file;
    int64_t bar_interval = 86400;
    int gap_tolerance = -1;

    std::string log_level = "info";

    // Throws InvalidParameter
    void validate() const;
};

// Maps configuration keys onto a BacktestConfiguration. Unset keys keep
// their defaults; "strategy.<name>" entries become strategy parameters.
// Throws InvalidParameter on malformed values.
BacktestConfiguration load_backtest_configuration(const utils::Config& config);

} // namespace kestrel::backtest
