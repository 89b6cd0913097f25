#pragma once
#include <string>
#include <cstdint>

namespace kestrel::core {

// One OHLCV observation. Timestamps are seconds since the epoch, UTC.
// sequence is assigned by the feed and breaks ties between equal timestamps.
struct Bar {
    std::string symbol;
    int64_t timestamp = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
    uint64_t sequence = 0;

    Bar();
    Bar(const std::string& sym, int64_t ts, double o, double h, double l, double c, double vol);

    // Open, high, low and close are positive and consistent with each other
    bool is_valid() const;

    // Folds a later observation of the same instrument into this bar:
    // widens the range, takes the later close and adds the volume
    void absorb(const Bar& later);
};

// Strict feed order: timestamp first, then sequence
bool bar_before(const Bar& a, const Bar& b);

bool operator==(const Bar& a, const Bar& b);
bool operator!=(const Bar& a, const Bar& b);

} // namespace kestrel::core
