#include "kestrel/core/signal.hpp"

namespace kestrel::core {

const char* to_string(SignalType type) {
    switch (type) {
        case SignalType::LONG: return "LONG";
        case SignalType::SHORT: return "SHORT";
        case SignalType::FLAT: return "FLAT";
        case SignalType::HOLD: return "HOLD";
    }
    return "UNKNOWN";
}

Signal::Signal() = default;

Signal::Signal(const std::string& sym, SignalType t, double s)
    : symbol(sym), type(t), strength(s) {}

Signal Signal::long_entry(const std::string& symbol, std::string reason) {
    Signal signal(symbol, SignalType::LONG);
    signal.reason = std::move(reason);
    return signal;
}

Signal Signal::short_entry(const std::string& symbol, std::string reason) {
    Signal signal(symbol, SignalType::SHORT);
    signal.reason = std::move(reason);
    return signal;
}

Signal Signal::flat(const std::string& symbol, std::string reason) {
    Signal signal(symbol, SignalType::FLAT);
    signal.reason = std::move(reason);
    return signal;
}

} // namespace kestrel::core
