#include <kestrel/backtest/scheduler.hpp>
#include <kestrel/core/errors.hpp>
#include <kestrel/utils/logger.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace kestrel::backtest {

BacktestScheduler::BacktestScheduler(const BacktestConfiguration& config,
                                     std::unique_ptr<data::MarketDataFeed> feed,
                                     strategy::StrategyPtr strategy)
    : config_(config),
      feed_(std::move(feed)),
      strategy_(std::move(strategy)),
      simulator_(config.execution, config.ledger),
      ledger_(config.ledger),
      metrics_(config.ledger.initial_cash, config.metrics) {
    config_.validate();
    if (!feed_) {
        throw core::InvalidParameter("feed", "a market data feed is required");
    }
    if (!strategy_) {
        throw core::InvalidParameter("strategy", "a strategy instance is required");
    }
}

RunStatus BacktestScheduler::run() {
    auto start_time = std::chrono::high_resolution_clock::now();
    size_t steps_before = steps_;

    while (step()) {
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    utils::Logger::info() << "Run of " << strategy_->name() << " " << to_string(status_) << " after "
                          << (steps_ - steps_before) << " steps (" << duration << "ms)" << utils::Logger::endl;
    return status_;
}

bool BacktestScheduler::step() {
    if (sealed_ || is_terminal(status_)) {
        return false;
    }
    if (cancel_requested_) {
        finish(RunStatus::CANCELLED);
        return false;
    }
    if (status_ == RunStatus::PAUSED) {
        return false;
    }

    try {
        if (status_ == RunStatus::INITIALIZED) {
            start();
        }

        std::vector<core::Bar> batch = next_batch();
        if (batch.empty()) {
            finish(RunStatus::COMPLETED);
            return false;
        }
        process_batch(batch);
        return true;
    } catch (const core::FeedDisconnected& e) {
        if (e.recoverable() && feed_->is_live()) {
            status_ = RunStatus::PAUSED;
            utils::Logger::warn() << "Feed stalled, run paused after step " << steps_ << ": " << e.what()
                                  << utils::Logger::endl;
        } else {
            fail(e.layer(), e.what());
        }
    } catch (const core::KestrelError& e) {
        fail(e.layer(), e.what());
    }
    return false;
}

void BacktestScheduler::resume() {
    if (status_ != RunStatus::PAUSED) {
        return;
    }
    status_ = RunStatus::RUNNING;
    utils::Logger::info() << "Run resumed at step " << steps_ << utils::Logger::endl;
}

void BacktestScheduler::start() {
    strategy_->initialize();
    status_ = RunStatus::RUNNING;
    utils::Logger::info() << "Starting run: strategy=" << strategy_->name() << " cash=" << ledger_.cash()
                          << " fill_model=" << execution::to_string(config_.execution.fill_model)
                          << (feed_->is_live() ? " (live)" : "") << utils::Logger::endl;
}

std::vector<core::Bar> BacktestScheduler::next_batch() {
    // A batch is only complete once a bar with a later timestamp shows up,
    // so one bar is read ahead. Bars already read survive a paused feed.
    while (true) {
        if (!lookahead_ && !feed_exhausted_) {
            lookahead_ = feed_->next();
            if (!lookahead_) {
                feed_exhausted_ = true;
            }
        }

        std::vector<core::Bar> batch;
        if (!lookahead_) {
            batch.swap(pending_batch_);
            return batch;
        }

        const core::Bar& bar = *lookahead_;
        if (pending_batch_.empty()) {
            if (steps_ > 0 && bar.timestamp <= last_timestamp_) {
                throw core::OutOfOrderBar("Bar for " + bar.symbol + " at " + std::to_string(bar.timestamp) +
                                          " after step at " + std::to_string(last_timestamp_));
            }
            pending_batch_.push_back(bar);
            lookahead_.reset();
            continue;
        }

        int64_t batch_time = pending_batch_.front().timestamp;
        if (bar.timestamp == batch_time) {
            auto same = std::find_if(pending_batch_.begin(), pending_batch_.end(),
                                     [&bar](const core::Bar& other) { return other.symbol == bar.symbol; });
            if (same != pending_batch_.end()) {
                if (!feed_->is_live()) {
                    throw core::OutOfOrderBar("Second bar for " + bar.symbol + " at " + std::to_string(batch_time));
                }
                // Live ticks share a timestamp resolution; merge them into one bar
                same->absorb(bar);
                lookahead_.reset();
                continue;
            }
            pending_batch_.push_back(bar);
            lookahead_.reset();
            continue;
        }
        if (bar.timestamp < batch_time) {
            throw core::OutOfOrderBar("Bar for " + bar.symbol + " at " + std::to_string(bar.timestamp) +
                                      " arrived inside the batch at " + std::to_string(batch_time));
        }

        // Later bar: it opens the next batch
        batch.swap(pending_batch_);
        return batch;
    }
}

std::vector<core::Signal> BacktestScheduler::invoke_strategy(const strategy::StrategyContext& context) {
    if (!strategy_->is_enabled()) {
        return {};
    }
    try {
        return strategy_->on_bar(context);
    } catch (const core::SignalValidationError& e) {
        utils::Logger::warn() << strategy_->name() << " signals dropped at " << context.timestamp() << ": "
                              << e.what() << utils::Logger::endl;
    } catch (const core::FactorError& e) {
        utils::Logger::warn() << strategy_->name() << " skipped step at " << context.timestamp() << ": "
                              << e.what() << utils::Logger::endl;
    } catch (const core::KestrelError&) {
        throw;
    } catch (const std::exception& e) {
        throw core::StrategyError("Strategy " + strategy_->name() + " failed: " + e.what());
    }
    return {};
}

void BacktestScheduler::notify_strategy(const core::Order& order) {
    try {
        strategy_->on_fill(order);
    } catch (const core::KestrelError&) {
        throw;
    } catch (const std::exception& e) {
        throw core::StrategyError("Strategy " + strategy_->name() + " failed in on_fill: " + e.what());
    }
}

void BacktestScheduler::publish_order(const core::Order& order) {
    if (order_callback_) {
        order_callback_(order);
    }
}

void BacktestScheduler::record_completed() {
    for (auto& order : simulator_.take_completed()) {
        ledger_.record_order(std::move(order));
    }
}

void BacktestScheduler::verify_equity(const core::Account& account) const {
    double expected = account.mark_to_market_equity();
    double tolerance = 1e-9 * std::max(1.0, std::abs(expected));
    if (!(std::abs(account.equity - expected) <= tolerance)) {
        throw core::LedgerInvariantViolation("Equity " + std::to_string(account.equity) + " differs from cash plus "
                                             "marked positions " + std::to_string(expected) + " at " +
                                             std::to_string(account.timestamp));
    }
}

void BacktestScheduler::process_batch(const std::vector<core::Bar>& batch) {
    const int64_t timestamp = batch.front().timestamp;

    // Factors are computed lazily; only the history moves here
    for (const auto& bar : batch) {
        factors_.append(bar);
    }

    core::Account before = ledger_.snapshot();
    strategy::StrategyContext context(timestamp, batch, factors_, before);
    std::vector<core::Signal> signals = invoke_strategy(context);

    for (auto& signal : signals) {
        if (signal.timestamp == 0) {
            signal.timestamp = timestamp;
        }
        try {
            strategy::validate_signal(signal, batch);
        } catch (const core::SignalValidationError& e) {
            utils::Logger::warn() << "Dropped signal from " << strategy_->name() << ": " << e.what()
                                  << utils::Logger::endl;
            continue;
        }
        if (signal.type == core::SignalType::HOLD) {
            continue;
        }
        if (signal_callback_) {
            signal_callback_(signal);
        }

        const core::Bar* bar = context.bar(signal.symbol);
        std::vector<core::Order> orders;
        try {
            orders = simulator_.submit(signal, *bar, before);
        } catch (const core::ExecutionError& e) {
            utils::Logger::warn() << "Signal for " << signal.symbol << " not executed: " << e.what()
                                  << utils::Logger::endl;
            continue;
        }
        for (const auto& order : orders) {
            publish_order(order);
            if (order.status == core::OrderStatus::REJECTED) {
                notify_strategy(order);
            }
        }
    }

    // Fills come back in the order they must be applied
    for (const auto& report : simulator_.advance(batch, ledger_.snapshot())) {
        if (report.fill) {
            ledger_.apply(*report.fill);
            fills_.push_back(*report.fill);
        }
        notify_strategy(report.order);
        publish_order(report.order);
    }
    record_completed();

    const core::Account& marked = ledger_.mark(batch, timestamp);
    verify_equity(marked);

    snapshots_.push_back(marked);
    metrics_.record(marked);
    last_timestamp_ = timestamp;
    ++steps_;

    utils::Logger::debug() << "Step " << steps_ << " at " << timestamp << ": " << batch.size() << " bars, "
                           << signals.size() << " signals, equity=" << marked.equity << utils::Logger::endl;
}

void BacktestScheduler::finish(RunStatus status) {
    if (is_terminal(status_)) {
        return;
    }

    std::string note = status == RunStatus::COMPLETED ? "end of run"
                     : status == RunStatus::CANCELLED ? "run cancelled" : "run failed";
    for (const auto& order : simulator_.cancel_all(last_timestamp_, note)) {
        if (status != RunStatus::FAILED) {
            notify_strategy(order);
        }
        publish_order(order);
    }
    record_completed();

    if (status != RunStatus::FAILED) {
        strategy_->shutdown();
    }
    status_ = status;

    if (status == RunStatus::FAILED) {
        utils::Logger::error() << "Run failed at step " << steps_ << " (" << core::to_string(failure_->layer)
                               << "): " << failure_->message << utils::Logger::endl;
    } else {
        utils::Logger::info() << "Run " << to_string(status) << " after " << steps_ << " steps, equity="
                              << ledger_.equity() << utils::Logger::endl;
    }
}

void BacktestScheduler::fail(core::ErrorLayer layer, const std::string& message) {
    failure_ = RunFailure{layer, message, last_timestamp_};
    try {
        finish(RunStatus::FAILED);
    } catch (const core::KestrelError& e) {
        // The run is already lost; keep the first cause
        utils::Logger::error() << "Cleanup after failure also failed: " << e.what() << utils::Logger::endl;
        status_ = RunStatus::FAILED;
    }
}

Checkpoint BacktestScheduler::checkpoint() const {
    Checkpoint checkpoint;
    checkpoint.status = status_;
    checkpoint.steps = steps_;
    checkpoint.last_timestamp = last_timestamp_;
    checkpoint.account = ledger_.snapshot();
    checkpoint.open_orders = simulator_.open_orders();
    checkpoint.buffered_bars = pending_batch_.size() + (lookahead_ ? 1 : 0);
    return checkpoint;
}

void BacktestScheduler::amend_history(const std::string& symbol, std::vector<core::Bar> bars) {
    factors_.replace_history(symbol, std::move(bars));
}

BacktestRun BacktestScheduler::seal() {
    if (sealed_) {
        throw std::logic_error("Run already sealed");
    }
    if (!is_terminal(status_)) {
        throw std::logic_error(std::string("Cannot seal a run in state ") + to_string(status_));
    }
    sealed_ = true;

    PerformanceMetrics metrics = metrics_.finalize(ledger_.order_history(), ledger_.trades());
    return BacktestRun(config_, strategy_->name(), status_, snapshots_, ledger_.order_history(), fills_,
                       ledger_.trades(), ledger_.position_events(), metrics, failure_, steps_);
}

} // namespace kestrel::backtest
