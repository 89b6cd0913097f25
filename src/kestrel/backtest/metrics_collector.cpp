#include <kestrel/backtest/metrics_collector.hpp>
#include <kestrel/core/errors.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace kestrel::backtest {

namespace {

struct Interval {
    double log_return;
    double years;
};

// Log returns between consecutive snapshots. Intervals that start or end
// at a non-positive equity have no log return and are left out.
std::vector<Interval> interval_returns(const std::vector<core::Account>& snapshots, double year_seconds) {
    std::vector<Interval> intervals;
    for (size_t i = 1; i < snapshots.size(); ++i) {
        double before = snapshots[i - 1].equity;
        double after = snapshots[i].equity;
        int64_t elapsed = snapshots[i].timestamp - snapshots[i - 1].timestamp;
        if (elapsed <= 0 || before <= 0.0 || after <= 0.0) {
            continue;
        }
        intervals.push_back({std::log(after / before), static_cast<double>(elapsed) / year_seconds});
    }
    return intervals;
}

void drawdown(const std::vector<core::Account>& snapshots, double initial_equity, PerformanceMetrics& metrics) {
    double peak = initial_equity;
    int64_t peak_time = snapshots.empty() ? 0 : snapshots.front().timestamp;

    for (const auto& snapshot : snapshots) {
        if (snapshot.equity > peak) {
            peak = snapshot.equity;
            peak_time = snapshot.timestamp;
            continue;
        }
        if (peak <= 0.0) {
            continue;
        }
        double depth = (peak - snapshot.equity) / peak;
        if (depth > metrics.max_drawdown) {
            metrics.max_drawdown = depth;
            metrics.max_drawdown_duration = snapshot.timestamp - peak_time;
        }
    }
}

void trade_statistics(const std::vector<core::Trade>& trades, PerformanceMetrics& metrics) {
    double gross_profit = 0.0;
    double gross_loss = 0.0;

    for (const auto& trade : trades) {
        if (trade.pnl > 0.0) {
            gross_profit += trade.pnl;
            metrics.winning_trades++;
        } else if (trade.pnl < 0.0) {
            gross_loss += -trade.pnl;
            metrics.losing_trades++;
        }
    }

    metrics.closed_trades = trades.size();
    metrics.win_rate = trades.empty() ? 0.0
        : static_cast<double>(metrics.winning_trades) / static_cast<double>(trades.size());

    if (gross_loss > 0.0) {
        metrics.profit_factor = gross_profit / gross_loss;
    } else if (gross_profit > 0.0) {
        metrics.profit_factor = std::numeric_limits<double>::infinity();
    }

    if (metrics.winning_trades > 0 && metrics.losing_trades > 0) {
        double average_win = gross_profit / static_cast<double>(metrics.winning_trades);
        double average_loss = gross_loss / static_cast<double>(metrics.losing_trades);
        metrics.average_win_loss_ratio = average_win / average_loss;
    }
}

} // namespace

void MetricsConfig::validate() const {
    if (!(periods_per_year > 0.0) || !std::isfinite(periods_per_year)) {
        throw core::InvalidParameter("periods_per_year", "must be positive");
    }
    if (!std::isfinite(risk_free_rate)) {
        throw core::InvalidParameter("risk_free_rate", "must be finite");
    }
}

bool operator==(const PerformanceMetrics& a, const PerformanceMetrics& b) {
    return a.initial_equity == b.initial_equity && a.final_equity == b.final_equity &&
           a.cumulative_return == b.cumulative_return && a.max_drawdown == b.max_drawdown &&
           a.annualized_volatility == b.annualized_volatility && a.sharpe_like_ratio == b.sharpe_like_ratio &&
           a.trade_count == b.trade_count && a.annualized_return == b.annualized_return &&
           a.sortino_like_ratio == b.sortino_like_ratio && a.calmar_ratio == b.calmar_ratio &&
           a.max_drawdown_duration == b.max_drawdown_duration && a.closed_trades == b.closed_trades &&
           a.winning_trades == b.winning_trades && a.losing_trades == b.losing_trades &&
           a.win_rate == b.win_rate && a.profit_factor == b.profit_factor &&
           a.average_win_loss_ratio == b.average_win_loss_ratio;
}

MetricsCollector::MetricsCollector(double initial_equity, const MetricsConfig& config)
    : config_(config), initial_equity_(initial_equity) {
    config_.validate();
}

void MetricsCollector::record(const core::Account& snapshot) {
    if (!snapshots_.empty() && snapshot.timestamp < snapshots_.back().timestamp) {
        throw core::LedgerError("Snapshot at " + std::to_string(snapshot.timestamp) +
                                " recorded after " + std::to_string(snapshots_.back().timestamp));
    }
    snapshots_.push_back(snapshot);
}

PerformanceMetrics MetricsCollector::finalize(const std::vector<core::Order>& orders,
                                              const std::vector<core::Trade>& trades) const {
    PerformanceMetrics metrics;
    metrics.initial_equity = initial_equity_;
    metrics.final_equity = snapshots_.empty() ? initial_equity_ : snapshots_.back().equity;
    if (initial_equity_ > 0.0) {
        metrics.cumulative_return = metrics.final_equity / initial_equity_ - 1.0;
    }

    metrics.trade_count = static_cast<size_t>(std::count_if(orders.begin(), orders.end(),
        [](const core::Order& order) { return order.filled_quantity > 0.0; }));

    drawdown(snapshots_, initial_equity_, metrics);
    trade_statistics(trades, metrics);

    std::vector<Interval> intervals = interval_returns(snapshots_, config_.year_seconds());
    double total_years = 0.0;
    double total_log_return = 0.0;
    for (const auto& interval : intervals) {
        total_years += interval.years;
        total_log_return += interval.log_return;
    }
    if (intervals.empty() || total_years <= 0.0) {
        return metrics;
    }

    // Annualized log drift, then per-interval residuals scaled to one year
    double drift = total_log_return / total_years;
    double variance = 0.0;
    double downside = 0.0;
    for (const auto& interval : intervals) {
        double residual = interval.log_return - drift * interval.years;
        variance += residual * residual / interval.years;
        if (interval.log_return < 0.0) {
            downside += interval.log_return * interval.log_return / interval.years;
        }
    }
    variance /= static_cast<double>(intervals.size());
    downside /= static_cast<double>(intervals.size());

    metrics.annualized_return = std::exp(drift) - 1.0;
    metrics.annualized_volatility = std::sqrt(variance);
    if (metrics.annualized_volatility > 1e-12) {
        metrics.sharpe_like_ratio = (drift - config_.risk_free_rate) / metrics.annualized_volatility;
    }
    if (downside > 1e-24) {
        metrics.sortino_like_ratio = (drift - config_.risk_free_rate) / std::sqrt(downside);
    }
    if (metrics.max_drawdown > 0.0) {
        metrics.calmar_ratio = metrics.annualized_return / metrics.max_drawdown;
    }
    return metrics;
}

} // namespace kestrel::backtest
