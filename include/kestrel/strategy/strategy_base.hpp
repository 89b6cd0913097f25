// include/kestrel/strategy/strategy_base.hpp
#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include "kestrel/core/bar.hpp"
#include "kestrel/core/order.hpp"
#include "kestrel/core/portfolio.hpp"
#include "kestrel/core/signal.hpp"
#include "kestrel/factor/factor_engine.hpp"

namespace kestrel {
namespace strategy {

using ParameterMap = std::map<std::string, double>;

enum class ParameterKind {
    INTEGER,
    REAL,
    BOOLEAN
};

// A tunable knob and its admissible range (inclusive)
struct ParameterSpec {
    std::string name;
    ParameterKind kind = ParameterKind::REAL;
    double default_value = 0.0;
    double min_value = 0.0;
    double max_value = 0.0;
    std::string description;
};

// What a strategy sees in one step: the complete same-timestamp batch, the
// run's factor engine and a copy of the account before this step's fills.
class StrategyContext {
private:
    int64_t timestamp_;
    const std::vector<core::Bar>& batch_;
    factor::FactorEngine& factors_;
    const core::Account& account_;

public:
    StrategyContext(int64_t timestamp, const std::vector<core::Bar>& batch,
                    factor::FactorEngine& factors, const core::Account& account)
        : timestamp_(timestamp), batch_(batch), factors_(factors), account_(account) {}

    int64_t timestamp() const { return timestamp_; }
    const std::vector<core::Bar>& batch() const { return batch_; }
    const core::Account& account() const { return account_; }
    factor::FactorEngine& factors() const { return factors_; }

    // nullptr when the instrument has no bar in this batch
    const core::Bar* bar(const std::string& symbol) const;

    double position(const std::string& symbol) const { return account_.position_quantity(symbol); }

    // Factor value as of this step, nullopt while history is too short.
    // Other factor errors propagate.
    std::optional<double> factor(const std::string& symbol, const std::string& name, size_t lookback,
                                 const factor::FactorParams& params = factor::FactorParams()) const;

    // Same, evaluated at the instrument's previous bar
    std::optional<double> previous_factor(const std::string& symbol, const std::string& name, size_t lookback,
                                          const factor::FactorParams& params = factor::FactorParams()) const;
};

class StrategyBase {
protected:
    std::string name_;
    bool enabled_ = true;
    ParameterMap parameters_;

    // Configured value, or the declared default
    double parameter(const std::string& key) const;
    int int_parameter(const std::string& key) const;
    bool bool_parameter(const std::string& key) const { return parameter(key) != 0.0; }

    // Signal stamped with the step timestamp
    static core::Signal make_signal(const StrategyContext& context, const std::string& symbol,
                                    core::SignalType type, std::string reason);

    // Called after parameters_ is validated and complete
    virtual void on_configured() {}

public:
    explicit StrategyBase(std::string name) : name_(std::move(name)) {}
    virtual ~StrategyBase() = default;

    // Core method that must be implemented by all strategies
    virtual std::vector<core::Signal> on_bar(const StrategyContext& context) = 0;

    // Every order of this strategy that reaches a terminal state, including
    // rejections, and every partial fill
    virtual void on_fill(const core::Order& order) { (void)order; }

    // Declared knobs with ranges
    virtual std::vector<ParameterSpec> parameters() const { return {}; }

    // Lifecycle methods
    virtual void initialize() {}
    virtual void shutdown() {}

    // Validates values against parameters() and fills in defaults.
    // Throws InvalidParameter for unknown keys, out-of-range or
    // non-integral values.
    void configure(const ParameterMap& values);

    const ParameterMap& parameter_values() const { return parameters_; }

    // Accessors
    const std::string& name() const { return name_; }
    bool is_enabled() const { return enabled_; }
    void set_enabled(bool enabled) { enabled_ = enabled; }
};

using StrategyPtr = std::shared_ptr<StrategyBase>;

// Rejects signals the execution layer cannot act on: unknown instrument for
// this batch, negative or non-finite sizes, non-positive limit prices.
// Throws SignalValidationError.
void validate_signal(const core::Signal& signal, const std::vector<core::Bar>& batch);

} // namespace strategy
} // namespace kestrel
