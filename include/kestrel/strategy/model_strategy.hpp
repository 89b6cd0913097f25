// include/kestrel/strategy/model_strategy.hpp
#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "kestrel/strategy/strategy_base.hpp"

namespace kestrel {
namespace strategy {

// One model input, computed through the factor engine
struct FeatureSpec {
    std::string name;
    std::string factor;
    size_t lookback = 1;
    factor::FactorParams params;
};

using FeatureVector = std::map<std::string, double>;

// Prediction collaborator behind ModelStrategy. predict() returns the
// expected return over the next bar; a trained model lives behind this
// interface, the engine only sees the score.
class ScorePredictor {
public:
    virtual ~ScorePredictor() = default;

    virtual std::vector<FeatureSpec> features() const = 0;
    virtual double predict(const FeatureVector& features) const = 0;
    virtual std::string name() const = 0;
};

// intercept + sum(weight * feature). Deterministic, no training state.
class LinearFactorModel : public ScorePredictor {
private:
    std::vector<FeatureSpec> features_;
    std::map<std::string, double> weights_;
    double intercept_;

public:
    // Momentum, stretch and RSI features with fixed weights
    LinearFactorModel();
    LinearFactorModel(std::vector<FeatureSpec> features, std::map<std::string, double> weights,
                      double intercept);

    std::vector<FeatureSpec> features() const override { return features_; }
    double predict(const FeatureVector& features) const override;
    std::string name() const override { return "linear"; }
};

// Goes long when the predicted return clears entry_threshold and exits when
// it drops below exit_threshold
class ModelStrategy : public StrategyBase {
private:
    std::shared_ptr<const ScorePredictor> predictor_;
    std::map<std::string, double> last_scores_;

public:
    ModelStrategy(std::string name, std::shared_ptr<const ScorePredictor> predictor);

    std::vector<core::Signal> on_bar(const StrategyContext& context) override;
    std::vector<ParameterSpec> parameters() const override;

    // Most recent prediction per instrument
    const std::map<std::string, double>& last_scores() const { return last_scores_; }
};

} // namespace strategy
} // namespace kestrel
