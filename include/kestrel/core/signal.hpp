#pragma once
#include <string>
#include <optional>
#include <cstdint>

namespace kestrel::core {

enum class SignalType {
    LONG,
    SHORT,
    FLAT,
    HOLD
};

const char* to_string(SignalType type);

// Strategy intent for one instrument, consumed by the execution simulator
// in the step that produced it.
//
// Sizing: target_quantity is an absolute position size in shares (always
// non-negative, direction comes from type). target_weight is a fraction of
// current equity. With neither set, a LONG or SHORT uses the simulator's
// default position fraction.
struct Signal {
    std::string symbol;
    SignalType type = SignalType::HOLD;
    std::optional<double> target_quantity;
    std::optional<double> target_weight;
    std::optional<double> limit_price;
    double strength = 0.0;  // 0.0 to 1.0
    int64_t timestamp = 0;
    std::string reason;

    Signal();
    Signal(const std::string& sym, SignalType t, double s = 1.0);

    static Signal long_entry(const std::string& symbol, std::string reason = "");
    static Signal short_entry(const std::string& symbol, std::string reason = "");
    static Signal flat(const std::string& symbol, std::string reason = "");
};

} // namespace kestrel::core
