// src/kestrel/strategy/strategy_base.cpp
#include "kestrel/strategy/strategy_base.hpp"
#include "kestrel/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace kestrel {
namespace strategy {

const core::Bar* StrategyContext::bar(const std::string& symbol) const {
    for (const auto& bar : batch_) {
        if (bar.symbol == symbol) {
            return &bar;
        }
    }
    return nullptr;
}

std::optional<double> StrategyContext::factor(const std::string& symbol, const std::string& name,
                                              size_t lookback, const factor::FactorParams& params) const {
    try {
        return factors_.compute(symbol, name, timestamp_, lookback, params);
    } catch (const core::InsufficientHistory&) {
        return std::nullopt;
    }
}

std::optional<double> StrategyContext::previous_factor(const std::string& symbol, const std::string& name,
                                                       size_t lookback, const factor::FactorParams& params) const {
    const auto& history = factors_.history(symbol);
    if (history.empty()) {
        return std::nullopt;
    }
    // The current bar is already in history when its timestamp matches
    size_t index = history.back().timestamp == timestamp_ ? history.size() - 1 : history.size();
    if (index == 0) {
        return std::nullopt;
    }
    try {
        return factors_.compute(symbol, name, history[index - 1].timestamp, lookback, params);
    } catch (const core::InsufficientHistory&) {
        return std::nullopt;
    }
}

double StrategyBase::parameter(const std::string& key) const {
    auto it = parameters_.find(key);
    if (it != parameters_.end()) {
        return it->second;
    }
    for (const auto& spec : parameters()) {
        if (spec.name == key) {
            return spec.default_value;
        }
    }
    throw core::InvalidParameter(key, "not declared by strategy " + name_);
}

int StrategyBase::int_parameter(const std::string& key) const {
    return static_cast<int>(std::lround(parameter(key)));
}

core::Signal StrategyBase::make_signal(const StrategyContext& context, const std::string& symbol,
                                      core::SignalType type, std::string reason) {
    core::Signal signal(symbol, type);
    signal.timestamp = context.timestamp();
    signal.reason = std::move(reason);
    return signal;
}

void StrategyBase::configure(const ParameterMap& values) {
    std::vector<ParameterSpec> specs = parameters();

    for (const auto& [key, value] : values) {
        auto spec = std::find_if(specs.begin(), specs.end(),
                                 [&key](const ParameterSpec& s) { return s.name == key; });
        if (spec == specs.end()) {
            throw core::InvalidParameter(key, "unknown parameter for strategy " + name_);
        }
        if (!std::isfinite(value)) {
            throw core::InvalidParameter(key, "value is not finite");
        }
        if (value < spec->min_value || value > spec->max_value) {
            std::ostringstream oss;
            oss << "value " << value << " outside [" << spec->min_value << ", " << spec->max_value << "]";
            throw core::InvalidParameter(key, oss.str());
        }
        if (spec->kind != ParameterKind::REAL && std::floor(value) != value) {
            throw core::InvalidParameter(key, "value must be a whole number");
        }
        if (spec->kind == ParameterKind::BOOLEAN && value != 0.0 && value != 1.0) {
            throw core::InvalidParameter(key, "value must be 0 or 1");
        }
    }

    ParameterMap complete;
    for (const auto& spec : specs) {
        auto it = values.find(spec.name);
        complete[spec.name] = it != values.end() ? it->second : spec.default_value;
    }
    parameters_ = std::move(complete);
    on_configured();
}

void validate_signal(const core::Signal& signal, const std::vector<core::Bar>& batch) {
    auto in_batch = std::any_of(batch.begin(), batch.end(),
                                [&signal](const core::Bar& bar) { return bar.symbol == signal.symbol; });
    if (!in_batch) {
        throw core::SignalValidationError("Signal for " + signal.symbol + " has no bar in this step");
    }
    if (signal.target_quantity &&
        (!std::isfinite(*signal.target_quantity) || *signal.target_quantity < 0.0)) {
        throw core::SignalValidationError("Signal for " + signal.symbol + " has an invalid target quantity");
    }
    if (signal.target_weight &&
        (!std::isfinite(*signal.target_weight) || *signal.target_weight < 0.0)) {
        throw core::SignalValidationError("Signal for " + signal.symbol + " has an invalid target weight");
    }
    if (signal.limit_price && !(*signal.limit_price > 0.0 && std::isfinite(*signal.limit_price))) {
        throw core::SignalValidationError("Signal for " + signal.symbol + " has a non-positive limit price");
    }
    if (!std::isfinite(signal.strength)) {
        throw core::SignalValidationError("Signal for " + signal.symbol + " has a non-finite strength");
    }
}

} // namespace strategy
} // namespace kestrel
