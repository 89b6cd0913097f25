#pragma once
#include <kestrel/data/market_data_feed.hpp>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace kestrel::data {

struct HistoricalFeedOptions {
    // Inclusive requested range, epoch seconds
    int64_t start = std::numeric_limits<int64_t>::min();
    int64_t end = std::numeric_limits<int64_t>::max();

    // Expected spacing between consecutive bars of one instrument
    int64_t bar_interval = 86400;

    // Missing intervals tolerated before DataGapError; negative disables the check
    int gap_tolerance = -1;
};

// Replays in-memory bars. Bars of all instruments are merge-ordered by
// timestamp; ties keep the instrument subscription order and get
// increasing sequence numbers. Restartable with reset().
class HistoricalFeed : public MarketDataFeed {
private:
    std::vector<core::Bar> bars_;
    std::vector<std::string> symbols_;
    HistoricalFeedOptions options_;
    size_t cursor_ = 0;
    std::map<std::string, int64_t> last_seen_;
    bool exhausted_checked_ = false;

    int64_t max_gap() const;
    void check_gap(const core::Bar& bar);
    void check_range_end();

public:
    // Instruments not in symbols are ignored; empty symbols subscribes to all
    HistoricalFeed(std::vector<core::Bar> bars,
                   std::vector<std::string> symbols = {},
                   HistoricalFeedOptions options = HistoricalFeedOptions());

    std::optional<core::Bar> next() override;
    void reset() override;
    std::vector<std::string> symbols() const override { return symbols_; }

    size_t size() const { return bars_.size(); }
    size_t position() const { return cursor_; }
};

// Reads "symbol,timestamp,open,high,low,close,volume" rows after a header.
// timestamp is epoch seconds or YYYY-MM-DD (UTC midnight). Malformed rows
// are skipped and counted in the log; a missing file throws FeedError.
std::vector<core::Bar> load_bars_csv(const std::string& csv_file);

// YYYY-MM-DD or epoch seconds; throws InvalidParameter when unparseable
int64_t parse_timestamp(const std::string& text);

} // namespace kestrel::data
