// src/kestrel/strategy/trend_strategies.cpp
#include "kestrel/strategy/builtin_strategies.hpp"
#include "kestrel/core/errors.hpp"
#include "kestrel/utils/logger.hpp"

namespace kestrel {
namespace strategy {

// ---- moving average cross ----

std::vector<ParameterSpec> MovingAverageCrossStrategy::parameters() const {
    return {
        {"fast_period", ParameterKind::INTEGER, 5, 1, 250, "Fast moving average period"},
        {"slow_period", ParameterKind::INTEGER, 20, 2, 500, "Slow moving average period"},
        {"use_ema", ParameterKind::BOOLEAN, 0, 0, 1, "Exponential instead of simple averages"},
        {"short_on_cross", ParameterKind::BOOLEAN, 0, 0, 1, "Go short on a death cross instead of flat"},
    };
}

void MovingAverageCrossStrategy::on_configured() {
    if (int_parameter("fast_period") >= int_parameter("slow_period")) {
        throw core::InvalidParameter("fast_period", "must be shorter than slow_period");
    }
}

std::vector<core::Signal> MovingAverageCrossStrategy::on_bar(const StrategyContext& context) {
    std::vector<core::Signal> signals;
    const std::string average = bool_parameter("use_ema") ? "ema" : "sma";
    const size_t fast_period = static_cast<size_t>(int_parameter("fast_period"));
    const size_t slow_period = static_cast<size_t>(int_parameter("slow_period"));

    for (const auto& bar : context.batch()) {
        auto fast = context.factor(bar.symbol, average, fast_period);
        auto slow = context.factor(bar.symbol, average, slow_period);
        auto prev_fast = context.previous_factor(bar.symbol, average, fast_period);
        auto prev_slow = context.previous_factor(bar.symbol, average, slow_period);
        if (!fast || !slow || !prev_fast || !prev_slow) {
            continue;
        }

        double position = context.position(bar.symbol);
        bool golden_cross = *prev_fast <= *prev_slow && *fast > *slow;
        bool death_cross = *prev_fast >= *prev_slow && *fast < *slow;

        if (golden_cross && position <= 0.0) {
            signals.push_back(make_signal(context, bar.symbol, core::SignalType::LONG, "golden cross"));
        } else if (death_cross) {
            if (bool_parameter("short_on_cross") && position >= 0.0) {
                signals.push_back(make_signal(context, bar.symbol, core::SignalType::SHORT, "death cross"));
            } else if (position > 0.0) {
                signals.push_back(make_signal(context, bar.symbol, core::SignalType::FLAT, "death cross"));
            }
        }
    }
    return signals;
}

// ---- MACD ----

std::vector<ParameterSpec> MacdStrategy::parameters() const {
    return {
        {"fast_period", ParameterKind::INTEGER, 12, 2, 100, "Fast EMA period"},
        {"slow_period", ParameterKind::INTEGER, 26, 3, 200, "Slow EMA period"},
        {"signal_period", ParameterKind::INTEGER, 9, 1, 50, "Signal line EMA period"},
    };
}

void MacdStrategy::on_configured() {
    if (int_parameter("fast_period") >= int_parameter("slow_period")) {
        throw core::InvalidParameter("fast_period", "must be shorter than slow_period");
    }
}

std::vector<core::Signal> MacdStrategy::on_bar(const StrategyContext& context) {
    std::vector<core::Signal> signals;
    const size_t slow = static_cast<size_t>(int_parameter("slow_period"));
    const factor::FactorParams params{{"fast", parameter("fast_period")}, {"signal", parameter("signal_period")}};

    for (const auto& bar : context.batch()) {
        auto hist = context.factor(bar.symbol, "macd_hist", slow, params);
        auto prev_hist = context.previous_factor(bar.symbol, "macd_hist", slow, params);
        if (!hist || !prev_hist) {
            continue;
        }

        double position = context.position(bar.symbol);
        if (*prev_hist <= 0.0 && *hist > 0.0 && position <= 0.0) {
            signals.push_back(make_signal(context, bar.symbol, core::SignalType::LONG, "MACD crossed above signal"));
        } else if (*prev_hist >= 0.0 && *hist < 0.0 && position > 0.0) {
            signals.push_back(make_signal(context, bar.symbol, core::SignalType::FLAT, "MACD crossed below signal"));
        }
    }
    return signals;
}

// ---- Turtle ----

std::vector<ParameterSpec> TurtleStrategy::parameters() const {
    return {
        {"entry_period", ParameterKind::INTEGER, 20, 5, 100, "Breakout channel length"},
        {"exit_period", ParameterKind::INTEGER, 10, 3, 60, "Exit channel length"},
        {"atr_period", ParameterKind::INTEGER, 20, 2, 100, "ATR period for the stop"},
        {"atr_multiplier", ParameterKind::REAL, 2.0, 0.5, 5.0, "Stop distance in ATRs"},
    };
}

double TurtleStrategy::stop_for(const std::string& symbol) const {
    auto it = stops_.find(symbol);
    return it != stops_.end() ? it->second : 0.0;
}

std::vector<core::Signal> TurtleStrategy::on_bar(const StrategyContext& context) {
    std::vector<core::Signal> signals;
    const factor::FactorParams previous_only{{"exclude_current", 1.0}};
    const double multiplier = parameter("atr_multiplier");

    for (const auto& bar : context.batch()) {
        auto atr = context.factor(bar.symbol, "atr", static_cast<size_t>(int_parameter("atr_period")));
        auto entry_high = context.factor(bar.symbol, "highest",
                                         static_cast<size_t>(int_parameter("entry_period")), previous_only);
        auto exit_low = context.factor(bar.symbol, "lowest",
                                       static_cast<size_t>(int_parameter("exit_period")), previous_only);
        if (!atr || !entry_high || !exit_low) {
            continue;
        }

        double position = context.position(bar.symbol);
        if (position == 0.0) {
            if (bar.high > *entry_high) {
                stops_[bar.symbol] = bar.close - *atr * multiplier;
                signals.push_back(make_signal(context, bar.symbol, core::SignalType::LONG, "channel breakout"));
            }
            continue;
        }
        if (position < 0.0) {
            continue;
        }

        double stop = stop_for(bar.symbol);
        if (bar.low < stop) {
            stops_.erase(bar.symbol);
            signals.push_back(make_signal(context, bar.symbol, core::SignalType::FLAT, "ATR stop hit"));
        } else if (bar.low < *exit_low) {
            stops_.erase(bar.symbol);
            signals.push_back(make_signal(context, bar.symbol, core::SignalType::FLAT, "exit channel broken"));
        } else {
            double trailed = bar.close - *atr * multiplier;
            if (trailed > stop) {
                utils::Logger::debug() << name_ << ": stop for " << bar.symbol << " raised from " << stop
                                       << " to " << trailed << utils::Logger::endl;
                stops_[bar.symbol] = trailed;
            }
        }
    }
    return signals;
}

} // namespace strategy
} // namespace kestrel
