#include <kestrel/factor/indicators.hpp>
#include <kestrel/core/errors.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace kestrel::factor {
namespace indicators {

namespace {

void require(const std::vector<double>& values, size_t needed, const char* what) {
    if (needed == 0) {
        throw core::FactorError(std::string(what) + " needs a positive period");
    }
    if (values.size() < needed) {
        throw core::FactorError(std::string(what) + " needs " + std::to_string(needed) +
                                " values, got " + std::to_string(values.size()));
    }
}

double mean_of(std::vector<double>::const_iterator begin, std::vector<double>::const_iterator end) {
    double sum = 0.0;
    size_t count = 0;
    for (auto it = begin; it != end; ++it) {
        sum += *it;
        ++count;
    }
    return count > 0 ? sum / count : 0.0;
}

// Wilder smoothing seeded with the mean of the first period inputs
double wilder(const std::vector<double>& inputs, size_t period) {
    double average = mean_of(inputs.begin(), inputs.begin() + period);
    for (size_t i = period; i < inputs.size(); ++i) {
        average = (average * (period - 1) + inputs[i]) / period;
    }
    return average;
}

} // namespace

double sma(const std::vector<double>& values, size_t period) {
    require(values, period, "SMA");
    return mean_of(values.end() - period, values.end());
}

std::vector<double> ema_series(const std::vector<double>& values, size_t period) {
    require(values, period, "EMA");

    const double alpha = 2.0 / (period + 1.0);
    std::vector<double> series;
    series.reserve(values.size() - period + 1);
    series.push_back(mean_of(values.begin(), values.begin() + period));
    for (size_t i = period; i < values.size(); ++i) {
        series.push_back(alpha * values[i] + (1.0 - alpha) * series.back());
    }
    return series;
}

double ema(const std::vector<double>& values, size_t period) {
    return ema_series(values, period).back();
}

double stddev(const std::vector<double>& values, size_t period) {
    require(values, period, "StdDev");

    double mean = mean_of(values.end() - period, values.end());
    double sum_sq = 0.0;
    for (auto it = values.end() - period; it != values.end(); ++it) {
        sum_sq += (*it - mean) * (*it - mean);
    }
    return std::sqrt(sum_sq / period);
}

double rsi(const std::vector<double>& values, size_t period) {
    require(values, period + 1, "RSI");

    std::vector<double> gains;
    std::vector<double> losses;
    gains.reserve(values.size() - 1);
    losses.reserve(values.size() - 1);
    for (size_t i = 1; i < values.size(); ++i) {
        double change = values[i] - values[i - 1];
        gains.push_back(change > 0.0 ? change : 0.0);
        losses.push_back(change < 0.0 ? -change : 0.0);
    }

    double avg_gain = wilder(gains, period);
    double avg_loss = wilder(losses, period);
    if (avg_loss == 0.0) {
        return avg_gain == 0.0 ? 50.0 : 100.0;
    }
    double rs = avg_gain / avg_loss;
    return 100.0 - 100.0 / (1.0 + rs);
}

MacdValue macd(const std::vector<double>& values, size_t fast, size_t slow, size_t signal) {
    if (fast >= slow) {
        throw core::FactorError("MACD fast period must be shorter than slow period");
    }
    require(values, slow + signal - 1, "MACD");

    std::vector<double> fast_series = ema_series(values, fast);
    std::vector<double> slow_series = ema_series(values, slow);

    // Align both series on the input index, starting where the slow one does
    std::vector<double> line;
    line.reserve(slow_series.size());
    size_t offset = slow - fast;
    for (size_t j = 0; j < slow_series.size(); ++j) {
        line.push_back(fast_series[j + offset] - slow_series[j]);
    }

    MacdValue result;
    result.macd = line.back();
    result.signal = ema(line, signal);
    result.histogram = result.macd - result.signal;
    return result;
}

BollingerValue bollinger(const std::vector<double>& values, size_t period, double k) {
    BollingerValue result;
    result.mid = sma(values, period);
    double deviation = stddev(values, period);
    result.upper = result.mid + k * deviation;
    result.lower = result.mid - k * deviation;
    return result;
}

double atr(const std::vector<double>& highs, const std::vector<double>& lows,
           const std::vector<double>& closes, size_t period) {
    if (highs.size() != closes.size() || lows.size() != closes.size()) {
        throw core::FactorError("ATR inputs differ in length");
    }
    require(closes, period + 1, "ATR");

    std::vector<double> true_ranges;
    true_ranges.reserve(closes.size() - 1);
    for (size_t i = 1; i < closes.size(); ++i) {
        double prev_close = closes[i - 1];
        true_ranges.push_back(std::max({highs[i] - lows[i],
                                        std::abs(highs[i] - prev_close),
                                        std::abs(lows[i] - prev_close)}));
    }
    return wilder(true_ranges, period);
}

double highest(const std::vector<double>& values, size_t period) {
    require(values, period, "Highest");
    return *std::max_element(values.end() - period, values.end());
}

double lowest(const std::vector<double>& values, size_t period) {
    require(values, period, "Lowest");
    return *std::min_element(values.end() - period, values.end());
}

double roc(const std::vector<double>& values, size_t period) {
    require(values, period + 1, "ROC");
    double base = values[values.size() - 1 - period];
    if (base == 0.0) {
        throw core::FactorError("ROC base value is zero");
    }
    return (values.back() - base) / base;
}

double zscore(const std::vector<double>& values, size_t period) {
    double deviation = stddev(values, period);
    if (deviation == 0.0) {
        return 0.0;
    }
    return (values.back() - sma(values, period)) / deviation;
}

} // namespace indicators
} // namespace kestrel::factor
