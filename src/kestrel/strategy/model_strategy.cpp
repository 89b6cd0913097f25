// src/kestrel/strategy/model_strategy.cpp
#include "kestrel/strategy/model_strategy.hpp"
#include "kestrel/core/errors.hpp"
#include "kestrel/utils/logger.hpp"
#include <algorithm>
#include <cmath>

namespace kestrel {
namespace strategy {

LinearFactorModel::LinearFactorModel()
    : features_({{"roc_5", "roc", 5, {}},
                 {"zscore_20", "zscore", 20, {}},
                 {"rsi_14", "rsi", 14, {}}}),
      weights_({{"roc_5", 0.3}, {"zscore_20", -0.005}, {"rsi_14", -0.0005}}),
      intercept_(0.025) {}

LinearFactorModel::LinearFactorModel(std::vector<FeatureSpec> features, std::map<std::string, double> weights,
                                     double intercept)
    : features_(std::move(features)), weights_(std::move(weights)), intercept_(intercept) {
    for (const auto& feature : features_) {
        if (weights_.find(feature.name) == weights_.end()) {
            throw core::InvalidParameter(feature.name, "feature has no weight");
        }
    }
}

double LinearFactorModel::predict(const FeatureVector& features) const {
    double score = intercept_;
    for (const auto& [name, weight] : weights_) {
        auto it = features.find(name);
        if (it == features.end()) {
            throw core::StrategyError("Missing feature " + name + " for linear model");
        }
        score += weight * it->second;
    }
    return score;
}

ModelStrategy::ModelStrategy(std::string name, std::shared_ptr<const ScorePredictor> predictor)
    : StrategyBase(std::move(name)), predictor_(std::move(predictor)) {
    if (!predictor_) {
        throw core::InvalidParameter("predictor", "model strategy needs a predictor");
    }
}

std::vector<ParameterSpec> ModelStrategy::parameters() const {
    return {
        {"entry_threshold", ParameterKind::REAL, 0.01, 0.0, 0.2, "Enter above this predicted return"},
        {"exit_threshold", ParameterKind::REAL, -0.01, -0.2, 0.0, "Exit below this predicted return"},
    };
}

std::vector<core::Signal> ModelStrategy::on_bar(const StrategyContext& context) {
    std::vector<core::Signal> signals;
    const std::vector<FeatureSpec> specs = predictor_->features();

    for (const auto& bar : context.batch()) {
        FeatureVector features;
        bool complete = true;
        for (const auto& spec : specs) {
            auto value = context.factor(bar.symbol, spec.factor, spec.lookback, spec.params);
            if (!value) {
                complete = false;
                break;
            }
            features[spec.name] = *value;
        }
        if (!complete) {
            continue;
        }

        double score = predictor_->predict(features);
        if (!std::isfinite(score)) {
            throw core::StrategyError(predictor_->name() + " predictor returned a non-finite score for " + bar.symbol);
        }
        last_scores_[bar.symbol] = score;

        double position = context.position(bar.symbol);
        if (position == 0.0 && score > parameter("entry_threshold")) {
            core::Signal signal = make_signal(context, bar.symbol, core::SignalType::LONG, "predicted return entry");
            signal.strength = std::min(1.0, std::abs(score) * 10.0);
            signals.push_back(signal);
        } else if (position > 0.0 && score < parameter("exit_threshold")) {
            signals.push_back(make_signal(context, bar.symbol, core::SignalType::FLAT, "predicted return exit"));
        }
    }
    return signals;
}

} // namespace strategy
} // namespace kestrel
