#include <kestrel/backtest/report.hpp>
#include <kestrel/utils/logger.hpp>
#include <fstream>
#include <functional>
#include <iomanip>

namespace kestrel::backtest {

namespace {

// Restores the stream's formatting when done
class FormatGuard {
private:
    std::ostream& out_;
    std::ios::fmtflags flags_;
    std::streamsize precision_;

public:
    explicit FormatGuard(std::ostream& out) : out_(out), flags_(out.flags()), precision_(out.precision()) {}
    ~FormatGuard() {
        out_.flags(flags_);
        out_.precision(precision_);
    }
};

bool write_file(const std::string& path, const BacktestRun& run,
                const std::function<void(std::ostream&, const BacktestRun&)>& writer) {
    std::ofstream file(path);
    if (!file.is_open()) {
        utils::Logger::error() << "Failed to create report file: " << path << utils::Logger::endl;
        return false;
    }
    writer(file, run);
    utils::Logger::info() << "Exported " << path << utils::Logger::endl;
    return true;
}

} // namespace

void write_summary(std::ostream& out, const BacktestRun& run) {
    FormatGuard guard(out);
    const PerformanceMetrics& m = run.metrics();

    out << "==== Backtest: " << run.strategy_name() << " ====\n";
    out << "Status:                " << to_string(run.status()) << "\n";
    if (run.failure()) {
        out << "Failure:               [" << core::to_string(run.failure()->layer) << "] "
            << run.failure()->message << "\n";
    }
    out << "Steps:                 " << run.steps() << "\n";
    out << std::fixed << std::setprecision(2);
    out << "Initial equity:        " << m.initial_equity << "\n";
    out << "Final equity:          " << m.final_equity << "\n";
    out << "Cumulative return:     " << m.cumulative_return * 100.0 << "%\n";
    out << "Annualized return:     " << m.annualized_return * 100.0 << "%\n";
    out << "Annualized volatility: " << m.annualized_volatility * 100.0 << "%\n";
    out << "Max drawdown:          " << m.max_drawdown * 100.0 << "% over "
        << m.max_drawdown_duration / 86400.0 << " days\n";
    out << std::setprecision(3);
    out << "Sharpe-like ratio:     " << m.sharpe_like_ratio << "\n";
    out << "Sortino-like ratio:    " << m.sortino_like_ratio << "\n";
    out << "Calmar ratio:          " << m.calmar_ratio << "\n";
    out << "Orders filled:         " << m.trade_count << " of " << run.orders().size() << "\n";
    out << "Closed trades:         " << m.closed_trades << " (" << m.winning_trades << " won, "
        << m.losing_trades << " lost)\n";
    out << std::setprecision(2);
    out << "Win rate:              " << m.win_rate * 100.0 << "%\n";
    out << "Profit factor:         " << m.profit_factor << "\n";
    out << "Avg win / avg loss:    " << m.average_win_loss_ratio << "\n";
}

void write_equity_csv(std::ostream& out, const BacktestRun& run) {
    FormatGuard guard(out);
    out << "timestamp,cash,market_value,equity,realized_pnl,positions\n";
    out << std::fixed << std::setprecision(4);
    for (const auto& snapshot : run.snapshots()) {
        out << snapshot.timestamp << "," << snapshot.cash << "," << snapshot.market_value << ","
            << snapshot.equity << "," << snapshot.realized_pnl << "," << snapshot.positions.size() << "\n";
    }
}

void write_orders_csv(std::ostream& out, const BacktestRun& run) {
    FormatGuard guard(out);
    out << "id,symbol,side,type,quantity,filled,avg_price,commission,status,reason,created,updated,note\n";
    out << std::fixed << std::setprecision(4);
    for (const auto& order : run.orders()) {
        out << order.id << "," << order.symbol << "," << core::to_string(order.side) << ","
            << core::to_string(order.type) << "," << order.quantity << "," << order.filled_quantity << ","
            << order.average_fill_price << "," << order.total_commission << ","
            << core::to_string(order.status) << "," << core::to_string(order.reject_reason) << ","
            << order.created_at << "," << order.updated_at << ",\"" << order.note << "\"\n";
    }
}

void write_trades_csv(std::ostream& out, const BacktestRun& run) {
    FormatGuard guard(out);
    out << "symbol,direction,quantity,entry_time,entry_price,exit_time,exit_price,pnl\n";
    out << std::fixed << std::setprecision(4);
    for (const auto& trade : run.trades()) {
        out << trade.symbol << "," << (trade.is_long ? "LONG" : "SHORT") << "," << trade.quantity << ","
            << trade.entry_time << "," << trade.entry_price << "," << trade.exit_time << ","
            << trade.exit_price << "," << trade.pnl << "\n";
    }
}

bool export_run(const BacktestRun& run, const std::string& prefix) {
    bool ok = write_file(prefix + "_equity.csv", run, write_equity_csv);
    ok = write_file(prefix + "_orders.csv", run, write_orders_csv) && ok;
    ok = write_file(prefix + "_trades.csv", run, write_trades_csv) && ok;
    return ok;
}

} // namespace kestrel::backtest
