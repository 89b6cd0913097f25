#pragma once
#include <kestrel/core/order.hpp>
#include <kestrel/core/portfolio.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace kestrel::backtest {

struct MetricsConfig {
    // Length of a year in days; returns are measured in calendar seconds
    double periods_per_year = 365.0;
    double risk_free_rate = 0.0;  // annual, continuously compounded

    double year_seconds() const { return periods_per_year * 86400.0; }

    // Throws InvalidParameter
    void validate() const;
};

struct PerformanceMetrics {
    double initial_equity = 0.0;
    double final_equity = 0.0;

    double cumulative_return = 0.0;
    double max_drawdown = 0.0;           // fraction of the running peak
    double annualized_volatility = 0.0;
    double sharpe_like_ratio = 0.0;
    size_t trade_count = 0;              // orders with at least one fill

    double annualized_return = 0.0;
    double sortino_like_ratio = 0.0;
    double calmar_ratio = 0.0;
    int64_t max_drawdown_duration = 0;   // seconds from peak to trough

    size_t closed_trades = 0;
    size_t winning_trades = 0;
    size_t losing_trades = 0;
    double win_rate = 0.0;
    double profit_factor = 0.0;
    double average_win_loss_ratio = 0.0;
};

bool operator==(const PerformanceMetrics& a, const PerformanceMetrics& b);

// Equity statistics over the account snapshot sequence of one run.
//
// Snapshots may be unevenly spaced (weekends, halted days, sparse live
// bars). Each interval contributes its log return weighted by its length in
// years, so drift and volatility are per year no matter how the bars are
// spaced: mu = sum(r_i) / T and sigma^2 = mean((r_i - mu * dt_i)^2 / dt_i).
class MetricsCollector {
private:
    MetricsConfig config_;
    double initial_equity_;
    std::vector<core::Account> snapshots_;

public:
    explicit MetricsCollector(double initial_equity, const MetricsConfig& config = MetricsConfig());

    // Snapshots must arrive in non-decreasing timestamp order; throws LedgerError otherwise
    void record(const core::Account& snapshot);

    PerformanceMetrics finalize(const std::vector<core::Order>& orders,
                                const std::vector<core::Trade>& trades) const;

    const std::vector<core::Account>& snapshots() const { return snapshots_; }
    const MetricsConfig& config() const { return config_; }
    double initial_equity() const { return initial_equity_; }
};

} // namespace kestrel::backtest
