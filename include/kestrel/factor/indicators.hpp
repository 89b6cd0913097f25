#pragma once
#include <vector>
#include <cstddef>

namespace kestrel::factor {
namespace indicators {

// All functions evaluate at the last element of the input and throw
// core::FactorError when the input is shorter than they need.
// Exponential averages are seeded with the simple mean of their first
// window; RSI and ATR use Wilder smoothing.

double sma(const std::vector<double>& values, size_t period);

// EMA series; element j is the average ending at values[period - 1 + j]
std::vector<double> ema_series(const std::vector<double>& values, size_t period);
double ema(const std::vector<double>& values, size_t period);

// Population standard deviation of the last period values
double stddev(const std::vector<double>& values, size_t period);

// Needs period + 1 values
double rsi(const std::vector<double>& values, size_t period);

struct MacdValue {
    double macd = 0.0;
    double signal = 0.0;
    double histogram = 0.0;
};

// Needs slow + signal - 1 values
MacdValue macd(const std::vector<double>& values, size_t fast, size_t slow, size_t signal);

struct BollingerValue {
    double upper = 0.0;
    double mid = 0.0;
    double lower = 0.0;
};

BollingerValue bollinger(const std::vector<double>& values, size_t period, double k);

// Average true range; needs period + 1 bars
double atr(const std::vector<double>& highs, const std::vector<double>& lows,
           const std::vector<double>& closes, size_t period);

double highest(const std::vector<double>& values, size_t period);
double lowest(const std::vector<double>& values, size_t period);

// Fractional change over period bars; needs period + 1 values
double roc(const std::vector<double>& values, size_t period);

// (last - mean) / stddev over period; 0 when the window is constant
double zscore(const std::vector<double>& values, size_t period);

} // namespace indicators
} // namespace kestrel::factor
