// src/kestrel/strategy/strategy_factory.cpp
#include "kestrel/strategy/strategy_factory.hpp"
#include "kestrel/strategy/builtin_strategies.hpp"
#include "kestrel/strategy/model_strategy.hpp"
#include "kestrel/core/errors.hpp"

namespace kestrel {
namespace strategy {

void StrategyFactory::register_creator(const std::string& type_name, StrategyCreator creator) {
    if (!creator) {
        throw core::InvalidParameter("strategy", "empty creator for " + type_name);
    }
    creators_[type_name] = std::move(creator);
}

StrategyPtr StrategyFactory::create(const std::string& type_name, const ParameterMap& params) const {
    auto it = creators_.find(type_name);
    if (it == creators_.end()) {
        throw core::InvalidParameter("strategy", "unknown strategy type '" + type_name + "'");
    }
    StrategyPtr strategy = it->second(type_name);
    strategy->configure(params);
    return strategy;
}

std::vector<ParameterSpec> StrategyFactory::describe(const std::string& type_name) const {
    auto it = creators_.find(type_name);
    if (it == creators_.end()) {
        throw core::InvalidParameter("strategy", "unknown strategy type '" + type_name + "'");
    }
    return it->second(type_name)->parameters();
}

bool StrategyFactory::has(const std::string& type_name) const {
    return creators_.find(type_name) != creators_.end();
}

std::vector<std::string> StrategyFactory::registered_types() const {
    std::vector<std::string> types;
    for (const auto& [type, _] : creators_) {
        types.push_back(type);
    }
    return types;
}

StrategyFactory StrategyFactory::with_builtins() {
    StrategyFactory factory;
    factory.register_type<MovingAverageCrossStrategy>("ma_cross");
    factory.register_type<RsiStrategy>("rsi");
    factory.register_type<MacdStrategy>("macd");
    factory.register_type<BollingerStrategy>("bollinger");
    factory.register_type<TurtleStrategy>("turtle");
    factory.register_type<GridStrategy>("grid");
    factory.register_type<MeanReversionStrategy>("mean_reversion");
    factory.register_type<MultiFactorStrategy>("multifactor");
    factory.register_creator("model", [](const std::string& name) -> StrategyPtr {
        return std::make_shared<ModelStrategy>(name, std::make_shared<LinearFactorModel>());
    });
    return factory;
}

} // namespace strategy
} // namespace kestrel
