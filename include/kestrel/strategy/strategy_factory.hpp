// include/kestrel/strategy/strategy_factory.hpp
#pragma once
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "kestrel/strategy/strategy_base.hpp"

namespace kestrel {
namespace strategy {

// Catalogue of strategy types for one caller. Built once, then passed by
// reference; create() only reads it, so a const factory can be shared by
// parallel runs.
class StrategyFactory {
public:
    using StrategyCreator = std::function<StrategyPtr(const std::string& type_name)>;

private:
    std::map<std::string, StrategyCreator> creators_;

public:
    // Register a strategy type with the factory
    template<typename T>
    void register_type(const std::string& type_name) {
        creators_[type_name] = [](const std::string& name) -> StrategyPtr {
            return std::make_shared<T>(name);
        };
    }

    void register_creator(const std::string& type_name, StrategyCreator creator);

    // New configured instance. Throws InvalidParameter for an unknown type
    // or parameters outside the declared ranges.
    StrategyPtr create(const std::string& type_name, const ParameterMap& params = ParameterMap()) const;

    // Declared parameters of a type, for optimizers and help output
    std::vector<ParameterSpec> describe(const std::string& type_name) const;

    bool has(const std::string& type_name) const;
    std::vector<std::string> registered_types() const;

    // Factory holding every built-in rule-based strategy plus "model"
    // (ModelStrategy over a LinearFactorModel)
    static StrategyFactory with_builtins();
};

} // namespace strategy
} // namespace kestrel
