#pragma once
#include <kestrel/backtest/backtest_run.hpp>
#include <ostream>
#include <string>

namespace kestrel::backtest {

// Human readable summary of a sealed run
void write_summary(std::ostream& out, const BacktestRun& run);

// timestamp,cash,market_value,equity,realized_pnl,positions
void write_equity_csv(std::ostream& out, const BacktestRun& run);

// id,symbol,side,type,quantity,filled,avg_price,commission,status,reason,created,updated,note
void write_orders_csv(std::ostream& out, const BacktestRun& run);

// symbol,direction,quantity,entry_time,entry_price,exit_time,exit_price,pnl
void write_trades_csv(std::ostream& out, const BacktestRun& run);

// Writes <prefix>_equity.csv, <prefix>_orders.csv and <prefix>_trades.csv.
// Returns false (and logs) when a file cannot be created.
bool export_run(const BacktestRun& run, const std::string& prefix);

} // namespace kestrel::backtest
