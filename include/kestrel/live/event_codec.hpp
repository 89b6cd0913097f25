#pragma once
#include <kestrel/core/bar.hpp>
#include <kestrel/core/order.hpp>
#include <kestrel/core/signal.hpp>
#include <optional>
#include <string>

namespace kestrel::live {

// Flat JSON objects only; no nesting, no arrays.
//
// Bars: {"symbol":"X","timestamp":1700000000,"open":..,"high":..,"low":..,
// "close":..,"volume":..}. Tick messages {"Symbol":"X","Price":..,"Size":..}
// are also accepted and become a bar with open = high = low = close = Price,
// stamped with the receive time. Returns nullopt for anything unusable.
std::optional<core::Bar> parse_bar_json(const std::string& json);

std::string encode_signal_json(const core::Signal& signal);
std::string encode_order_json(const core::Order& order);

// Topic prefixes used on the event stream
inline constexpr const char* kSignalTopic = "signal";
inline constexpr const char* kOrderTopic = "order";

} // namespace kestrel::live
