#include <kestrel/core/bar.hpp>
#include <algorithm>

namespace kestrel::core {

Bar::Bar() = default;

Bar::Bar(const std::string& sym, int64_t ts, double o, double h, double l, double c, double vol)
    : symbol(sym), timestamp(ts), open(o), high(h), low(l), close(c), volume(vol) {}

bool Bar::is_valid() const {
    if (symbol.empty() || open <= 0.0 || close <= 0.0 || low <= 0.0 || volume < 0.0) {
        return false;
    }
    return high >= std::max(open, close) && low <= std::min(open, close);
}

void Bar::absorb(const Bar& later) {
    high = std::max(high, later.high);
    low = std::min(low, later.low);
    close = later.close;
    volume += later.volume;
    sequence = std::max(sequence, later.sequence);
}

bool bar_before(const Bar& a, const Bar& b) {
    if (a.timestamp != b.timestamp) {
        return a.timestamp < b.timestamp;
    }
    return a.sequence < b.sequence;
}

bool operator==(const Bar& a, const Bar& b) {
    return a.symbol == b.symbol && a.timestamp == b.timestamp && a.open == b.open &&
           a.high == b.high && a.low == b.low && a.close == b.close &&
           a.volume == b.volume && a.sequence == b.sequence;
}

bool operator!=(const Bar& a, const Bar& b) {
    return !(a == b);
}

} // namespace kestrel::core
