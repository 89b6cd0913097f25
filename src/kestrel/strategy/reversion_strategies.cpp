// src/kestrel/strategy/reversion_strategies.cpp
#include "kestrel/strategy/builtin_strategies.hpp"
#include "kestrel/core/errors.hpp"
#include "kestrel/utils/logger.hpp"
#include <algorithm>
#include <cmath>

namespace kestrel {
namespace strategy {

namespace {

double average_cost(const StrategyContext& context, const std::string& symbol, double fallback) {
    const auto& positions = context.account().positions;
    auto it = positions.find(symbol);
    return it != positions.end() ? it->second.average_cost : fallback;
}

} // namespace

// ---- RSI ----

std::vector<ParameterSpec> RsiStrategy::parameters() const {
    return {
        {"period", ParameterKind::INTEGER, 14, 2, 100, "RSI period"},
        {"oversold", ParameterKind::REAL, 30, 1, 50, "Buy below this RSI"},
        {"overbought", ParameterKind::REAL, 70, 50, 99, "Exit above this RSI"},
    };
}

std::vector<core::Signal> RsiStrategy::on_bar(const StrategyContext& context) {
    std::vector<core::Signal> signals;
    for (const auto& bar : context.batch()) {
        auto rsi = context.factor(bar.symbol, "rsi", static_cast<size_t>(int_parameter("period")));
        if (!rsi) {
            continue;
        }

        double position = context.position(bar.symbol);
        if (position == 0.0 && *rsi < parameter("oversold")) {
            signals.push_back(make_signal(context, bar.symbol, core::SignalType::LONG, "RSI oversold"));
        } else if (position > 0.0 && *rsi > parameter("overbought")) {
            signals.push_back(make_signal(context, bar.symbol, core::SignalType::FLAT, "RSI overbought"));
        }
    }
    return signals;
}

// ---- Bollinger ----

std::vector<ParameterSpec> BollingerStrategy::parameters() const {
    return {
        {"period", ParameterKind::INTEGER, 20, 5, 100, "Middle band moving average period"},
        {"devfactor", ParameterKind::REAL, 2.0, 1.0, 3.0, "Band width in standard deviations"},
    };
}

std::vector<core::Signal> BollingerStrategy::on_bar(const StrategyContext& context) {
    std::vector<core::Signal> signals;
    const size_t period = static_cast<size_t>(int_parameter("period"));
    const factor::FactorParams bands{{"k", parameter("devfactor")}};

    for (const auto& bar : context.batch()) {
        auto upper = context.factor(bar.symbol, "bb_upper", period, bands);
        auto mid = context.factor(bar.symbol, "bb_mid", period, bands);
        auto lower = context.factor(bar.symbol, "bb_lower", period, bands);
        if (!upper || !mid || !lower) {
            continue;
        }

        double position = context.position(bar.symbol);
        if (position == 0.0) {
            if (bar.close <= *lower) {
                half_exited_[bar.symbol] = false;
                signals.push_back(make_signal(context, bar.symbol, core::SignalType::LONG, "touched lower band"));
            }
        } else if (position > 0.0) {
            if (bar.close >= *upper) {
                signals.push_back(make_signal(context, bar.symbol, core::SignalType::FLAT, "reached upper band"));
            } else if (bar.close >= *mid && !half_exited_[bar.symbol]) {
                double keep = position - std::floor(position * 0.5);
                if (keep < position) {
                    core::Signal signal = make_signal(context, bar.symbol, core::SignalType::LONG,
                                                      "half exit at mid band");
                    signal.target_quantity = keep;
                    signals.push_back(signal);
                    half_exited_[bar.symbol] = true;
                }
            }
        }
    }
    return signals;
}

void BollingerStrategy::on_fill(const core::Order& order) {
    // A failed half exit may be retried on a later bar
    if (!order.is_buy() && order.status == core::OrderStatus::REJECTED) {
        half_exited_[order.symbol] = false;
    }
}

// ---- grid ----

std::vector<ParameterSpec> GridStrategy::parameters() const {
    return {
        {"lookback_period", ParameterKind::INTEGER, 60, 5, 250, "Moving average period for the grid centre"},
        {"grid_num", ParameterKind::INTEGER, 5, 2, 20, "Number of grid lines"},
        {"grid_spacing", ParameterKind::REAL, 0.05, 0.005, 0.2, "Distance between grid lines as a fraction"},
        {"max_layers", ParameterKind::INTEGER, 3, 1, 10, "Maximum number of layers held"},
    };
}

size_t GridStrategy::layers(const std::string& symbol) const {
    auto it = grids_.find(symbol);
    return it != grids_.end() ? it->second.size() : 0;
}

std::vector<core::Signal> GridStrategy::on_bar(const StrategyContext& context) {
    std::vector<core::Signal> signals;
    const double spacing = parameter("grid_spacing");
    const int half_grid = int_parameter("grid_num") / 2;
    const size_t max_layers = static_cast<size_t>(int_parameter("max_layers"));

    for (const auto& bar : context.batch()) {
        auto center = context.factor(bar.symbol, "sma", static_cast<size_t>(int_parameter("lookback_period")));
        if (!center) {
            continue;
        }

        std::vector<Layer>& grid = grids_[bar.symbol];
        double position = context.position(bar.symbol);
        double close = bar.close;

        if (!grid.empty() && position > 0.0) {
            double cost = 0.0;
            for (const auto& layer : grid) {
                cost += layer.price;
            }
            cost /= grid.size();
            if (close >= cost * (1.0 + spacing)) {
                double sell = std::min(position, grid.front().quantity);
                if (sell > 0.0) {
                    core::Signal signal = make_signal(context, bar.symbol, core::SignalType::LONG, "grid take profit");
                    signal.target_quantity = position - sell;
                    signals.push_back(signal);
                    continue;
                }
            }
        }

        if (grid.size() >= max_layers || position < 0.0) {
            continue;
        }

        for (int i = -half_grid; i <= half_grid; ++i) {
            if (i == 0) {
                continue;
            }
            double level = *center * (1.0 + i * spacing);
            if (level < close && close * 0.99 <= level) {
                double layer = std::floor(context.account().cash * 0.95 / max_layers / close);
                if (layer > 0.0) {
                    core::Signal signal = make_signal(context, bar.symbol, core::SignalType::LONG, "grid layer buy");
                    signal.target_quantity = position + layer;
                    signals.push_back(signal);
                }
                break;
            }
        }
    }
    return signals;
}

void GridStrategy::on_fill(const core::Order& order) {
    if (order.status != core::OrderStatus::FILLED) {
        return;
    }
    std::vector<Layer>& grid = grids_[order.symbol];
    if (order.is_buy()) {
        grid.push_back({order.average_fill_price, order.filled_quantity});
    } else if (!grid.empty()) {
        double remaining = order.filled_quantity;
        while (!grid.empty() && remaining >= grid.front().quantity) {
            remaining -= grid.front().quantity;
            grid.erase(grid.begin());
        }
        if (!grid.empty()) {
            grid.front().quantity -= remaining;
        }
    }
    utils::Logger::debug() << name_ << ": " << order.symbol << " now holds " << grid.size()
                           << " layers" << utils::Logger::endl;
}

// ---- mean reversion ----

std::vector<ParameterSpec> MeanReversionStrategy::parameters() const {
    return {
        {"lookback_period", ParameterKind::INTEGER, 20, 5, 200, "Mean and deviation window"},
        {"entry_zscore", ParameterKind::REAL, -2.0, -5.0, -0.5, "Enter below this z-score"},
        {"exit_zscore", ParameterKind::REAL, 0.0, -1.0, 3.0, "Exit at or above this z-score"},
        {"stop_loss", ParameterKind::REAL, 0.05, 0.005, 0.5, "Exit below entry by this fraction"},
        {"take_profit", ParameterKind::REAL, 0.10, 0.005, 1.0, "Exit above entry by this fraction"},
        {"max_holding_bars", ParameterKind::INTEGER, 10, 1, 500, "Exit after this many bars held"},
    };
}

std::vector<core::Signal> MeanReversionStrategy::on_bar(const StrategyContext& context) {
    std::vector<core::Signal> signals;
    const size_t lookback = static_cast<size_t>(int_parameter("lookback_period"));

    for (const auto& bar : context.batch()) {
        auto z = context.factor(bar.symbol, "zscore", lookback);
        auto lower = context.factor(bar.symbol, "bb_lower", lookback);
        if (!z || !lower) {
            continue;
        }

        double position = context.position(bar.symbol);
        if (position == 0.0) {
            bool stretched = *z < parameter("entry_zscore");
            bool near_lower_band = bar.close <= *lower * 1.02;
            if (stretched && near_lower_band) {
                core::Signal signal = make_signal(context, bar.symbol, core::SignalType::LONG, "z-score entry");
                signal.target_weight = std::max(0.1, std::min(0.95, 0.5 + (std::abs(*z) - 2.0) * 0.15));
                signal.strength = std::min(1.0, std::abs(*z) / 4.0);
                signals.push_back(signal);
            }
            continue;
        }
        if (position < 0.0) {
            continue;
        }

        int held = ++bars_held_[bar.symbol];
        double entry = average_cost(context, bar.symbol, bar.close);
        double profit = (bar.close - entry) / entry;

        const char* reason = nullptr;
        if (*z >= parameter("exit_zscore")) {
            reason = "reverted to mean";
        } else if (profit <= -parameter("stop_loss")) {
            reason = "stop loss";
        } else if (profit >= parameter("take_profit")) {
            reason = "take profit";
        } else if (held >= int_parameter("max_holding_bars")) {
            reason = "holding period exceeded";
        }
        if (reason) {
            signals.push_back(make_signal(context, bar.symbol, core::SignalType::FLAT, reason));
        }
    }
    return signals;
}

void MeanReversionStrategy::on_fill(const core::Order& order) {
    if (order.status != core::OrderStatus::FILLED) {
        return;
    }
    if (order.is_buy()) {
        bars_held_[order.symbol] = 0;
    } else {
        bars_held_.erase(order.symbol);
    }
}

// ---- multi-factor ----

std::vector<ParameterSpec> MultiFactorStrategy::parameters() const {
    return {
        {"ma_period", ParameterKind::INTEGER, 20, 5, 200, "Moving average, band and volume window"},
        {"macd_fast", ParameterKind::INTEGER, 12, 2, 100, "MACD fast period"},
        {"macd_slow", ParameterKind::INTEGER, 26, 3, 200, "MACD slow period"},
        {"macd_signal", ParameterKind::INTEGER, 9, 1, 50, "MACD signal period"},
        {"rsi_period", ParameterKind::INTEGER, 14, 2, 100, "RSI period"},
        {"roc_period", ParameterKind::INTEGER, 10, 1, 100, "Rate of change period"},
        {"buy_threshold", ParameterKind::REAL, 0.5, 0.0, 1.0, "Enter above this score"},
        {"sell_threshold", ParameterKind::REAL, -0.3, -1.0, 0.0, "Exit below this score"},
        {"stop_loss", ParameterKind::REAL, 0.08, 0.005, 0.5, "Exit below entry by this fraction"},
    };
}

void MultiFactorStrategy::on_configured() {
    if (int_parameter("macd_fast") >= int_parameter("macd_slow")) {
        throw core::InvalidParameter("macd_fast", "must be shorter than macd_slow");
    }
}

std::vector<core::Signal> MultiFactorStrategy::on_bar(const StrategyContext& context) {
    std::vector<core::Signal> signals;
    const factor::FactorParams params{
        {"macd_fast", parameter("macd_fast")},
        {"macd_slow", parameter("macd_slow")},
        {"macd_signal", parameter("macd_signal")},
        {"rsi_period", parameter("rsi_period")},
        {"roc_period", parameter("roc_period")},
    };

    for (const auto& bar : context.batch()) {
        auto score = context.factor(bar.symbol, "multifactor", static_cast<size_t>(int_parameter("ma_period")), params);
        if (!score) {
            continue;
        }

        double position = context.position(bar.symbol);
        if (position == 0.0) {
            if (*score > parameter("buy_threshold")) {
                core::Signal signal = make_signal(context, bar.symbol, core::SignalType::LONG, "factor score entry");
                signal.strength = std::min(1.0, *score);
                signals.push_back(signal);
            }
        } else if (position > 0.0) {
            double entry = average_cost(context, bar.symbol, bar.close);
            if (*score < parameter("sell_threshold")) {
                signals.push_back(make_signal(context, bar.symbol, core::SignalType::FLAT, "factor score exit"));
            } else if (bar.close < entry * (1.0 - parameter("stop_loss"))) {
                signals.push_back(make_signal(context, bar.symbol, core::SignalType::FLAT, "stop loss"));
            }
        }
    }
    return signals;
}

} // namespace strategy
} // namespace kestrel
