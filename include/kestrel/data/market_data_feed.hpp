#pragma once
#include <kestrel/core/bar.hpp>
#include <optional>
#include <string>
#include <vector>

namespace kestrel::data {

// Time-ordered bar source. next() yields bars in non-decreasing timestamp
// order across all subscribed instruments, nullopt once the stream is
// exhausted. Feed failures are thrown (DataGapError, FeedDisconnected,
// OutOfOrderBar) so callers can tell them apart from exhaustion.
class MarketDataFeed {
public:
    virtual ~MarketDataFeed() = default;

    virtual std::optional<core::Bar> next() = 0;

    // Rewinds to the first bar. Only replayable feeds support this.
    virtual void reset() = 0;

    virtual bool is_live() const { return false; }

    virtual std::vector<std::string> symbols() const = 0;
};

} // namespace kestrel::data
