// include/kestrel/strategy/builtin_strategies.hpp
#pragma once
#include <map>
#include <string>
#include <vector>
#include "kestrel/strategy/strategy_base.hpp"

namespace kestrel {
namespace strategy {

// Rule-based strategies. All of them trade every instrument in the batch
// independently and keep per-instrument state keyed by symbol. Entries
// without an explicit size use the simulator's default position sizing.

// Fast/slow moving average crossover. Golden cross goes long; death cross
// goes flat, or short when short_on_cross is set.
class MovingAverageCrossStrategy : public StrategyBase {
public:
    explicit MovingAverageCrossStrategy(std::string name = "ma_cross") : StrategyBase(std::move(name)) {}

    std::vector<core::Signal> on_bar(const StrategyContext& context) override;
    std::vector<ParameterSpec> parameters() const override;

protected:
    void on_configured() override;
};

// Buys oversold, exits overbought
class RsiStrategy : public StrategyBase {
public:
    explicit RsiStrategy(std::string name = "rsi") : StrategyBase(std::move(name)) {}

    std::vector<core::Signal> on_bar(const StrategyContext& context) override;
    std::vector<ParameterSpec> parameters() const override;
};

// MACD line crossing its signal line
class MacdStrategy : public StrategyBase {
public:
    explicit MacdStrategy(std::string name = "macd") : StrategyBase(std::move(name)) {}

    std::vector<core::Signal> on_bar(const StrategyContext& context) override;
    std::vector<ParameterSpec> parameters() const override;

protected:
    void on_configured() override;
};

// Buys at the lower band. Sells half the position the first time price
// regains the mid band, the rest at the upper band.
class BollingerStrategy : public StrategyBase {
private:
    std::map<std::string, bool> half_exited_;

public:
    explicit BollingerStrategy(std::string name = "bollinger") : StrategyBase(std::move(name)) {}

    std::vector<core::Signal> on_bar(const StrategyContext& context) override;
    void on_fill(const core::Order& order) override;
    std::vector<ParameterSpec> parameters() const override;
};

// Donchian breakout entry with an ATR stop that only ratchets upward
class TurtleStrategy : public StrategyBase {
private:
    std::map<std::string, double> stops_;

public:
    explicit TurtleStrategy(std::string name = "turtle") : StrategyBase(std::move(name)) {}

    std::vector<core::Signal> on_bar(const StrategyContext& context) override;
    std::vector<ParameterSpec> parameters() const override;

    // Current stop for an instrument, 0 when none is set
    double stop_for(const std::string& symbol) const;
};

// Layered buys at grid lines around the moving average. The oldest layer
// is sold each time price clears the average layer cost by one grid spacing.
class GridStrategy : public StrategyBase {
private:
    struct Layer {
        double price = 0.0;
        double quantity = 0.0;
    };
    std::map<std::string, std::vector<Layer>> grids_;  // held layers, oldest first

public:
    explicit GridStrategy(std::string name = "grid") : StrategyBase(std::move(name)) {}

    std::vector<core::Signal> on_bar(const StrategyContext& context) override;
    void on_fill(const core::Order& order) override;
    std::vector<ParameterSpec> parameters() const override;

    size_t layers(const std::string& symbol) const;
};

// Z-score of close against its moving average. Enters deep below the mean
// near the lower band, sized by how stretched the price is; exits on
// reversion, stop loss, take profit or holding time.
class MeanReversionStrategy : public StrategyBase {
private:
    std::map<std::string, int> bars_held_;

public:
    explicit MeanReversionStrategy(std::string name = "mean_reversion") : StrategyBase(std::move(name)) {}

    std::vector<core::Signal> on_bar(const StrategyContext& context) override;
    void on_fill(const core::Order& order) override;
    std::vector<ParameterSpec> parameters() const override;
};

// Thresholds the weighted multi-factor score, with a stop loss
class MultiFactorStrategy : public StrategyBase {
public:
    explicit MultiFactorStrategy(std::string name = "multifactor") : StrategyBase(std::move(name)) {}

    std::vector<core::Signal> on_bar(const StrategyContext& context) override;
    std::vector<ParameterSpec> parameters() const override;

protected:
    void on_configured() override;
};

} // namespace strategy
} // namespace kestrel
