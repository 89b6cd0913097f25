#include <gtest/gtest.h>
#include <kestrel/core/errors.hpp>
#include <kestrel/data/historical_feed.hpp>
#include <kestrel/data/live_feed.hpp>
#include <kestrel/live/event_codec.hpp>
#include <kestrel/utils/bounded_queue.hpp>
#include <kestrel/utils/logger.hpp>

#include <chrono>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace kestrel;
using namespace std::chrono_literals;

namespace {

constexpr int64_t kDay = 86400;

core::Bar day_bar(const std::string& symbol, int64_t day, double close) {
    return core::Bar(symbol, day * kDay, close, close + 1.0, close - 1.0, close, 1000.0);
}

std::vector<core::Bar> drain(data::MarketDataFeed& feed) {
    std::vector<core::Bar> bars;
    while (auto bar = feed.next()) {
        bars.push_back(*bar);
    }
    return bars;
}

// Bars arrive only when the test pushes them; close() ends the stream
class GatedSource : public data::BarSource {
public:
    GatedSource() : queue_(64) {}

    void push(const core::Bar& bar) { queue_.push(bar); }
    void close() { queue_.close(); }

    std::optional<core::Bar> receive(std::chrono::milliseconds timeout) override {
        return queue_.pop_for(timeout);
    }
    bool finished() const override { return queue_.closed() && queue_.empty(); }

private:
    utils::BoundedQueue<core::Bar> queue_;
};

// Fails with an unrecoverable disconnect on the first receive
class BrokenSource : public data::BarSource {
public:
    std::optional<core::Bar> receive(std::chrono::milliseconds) override {
        throw core::FeedDisconnected("socket closed by peer", false);
    }
    bool finished() const override { return false; }
};

data::LiveFeedOptions fast_options() {
    data::LiveFeedOptions options;
    options.stall_timeout = 200ms;
    options.poll_interval = 10ms;
    return options;
}

} // namespace

class FeedTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::set_level(utils::LogLevel::LOG_ERROR);
    }
};

TEST_F(FeedTest, MergesInstrumentsByTimestampThenSubscription) {
    std::vector<core::Bar> bars = {day_bar("AAPL", 2, 11), day_bar("MSFT", 1, 50), day_bar("AAPL", 1, 10),
                                   day_bar("MSFT", 2, 51)};
    data::HistoricalFeed feed(bars, {"MSFT", "AAPL"});

    auto replayed = drain(feed);
    ASSERT_EQ(replayed.size(), 4u);
    EXPECT_EQ(replayed[0].symbol, "MSFT");
    EXPECT_EQ(replayed[1].symbol, "AAPL");
    EXPECT_EQ(replayed[1].timestamp, kDay);
    EXPECT_EQ(replayed[2].symbol, "MSFT");
    EXPECT_EQ(replayed[3].timestamp, 2 * kDay);
    for (size_t i = 0; i < replayed.size(); ++i) {
        EXPECT_EQ(replayed[i].sequence, i);
    }
    EXPECT_FALSE(feed.next().has_value());
}

TEST_F(FeedTest, UnsubscribedAndOutOfRangeBarsAreDropped) {
    std::vector<core::Bar> bars = {day_bar("AAPL", 1, 10), day_bar("AAPL", 2, 11), day_bar("AAPL", 3, 12),
                                   day_bar("IBM", 2, 100)};
    data::HistoricalFeedOptions options;
    options.start = 2 * kDay;
    options.end = 3 * kDay;
    data::HistoricalFeed feed(bars, {"AAPL"}, options);

    EXPECT_EQ(feed.size(), 2u);
    auto replayed = drain(feed);
    ASSERT_EQ(replayed.size(), 2u);
    EXPECT_EQ(replayed.front().timestamp, 2 * kDay);
}

TEST_F(FeedTest, EmptySubscriptionTakesEverySymbolSorted) {
    data::HistoricalFeed feed({day_bar("MSFT", 1, 50), day_bar("AAPL", 1, 10)});
    std::vector<std::string> expected = {"AAPL", "MSFT"};
    EXPECT_EQ(feed.symbols(), expected);
    EXPECT_EQ(feed.next()->symbol, "AAPL");
}

TEST_F(FeedTest, DuplicateBarsAreRejected) {
    std::vector<core::Bar> bars = {day_bar("AAPL", 1, 10), day_bar("AAPL", 1, 11)};
    EXPECT_THROW(data::HistoricalFeed feed(bars), core::OutOfOrderBar);
}

TEST_F(FeedTest, MalformedBarsAreRejected) {
    core::Bar bad("AAPL", kDay, 10, 9, 8, 10, 100);  // high below open
    EXPECT_THROW(data::HistoricalFeed feed({bad}), core::FeedError);
}

TEST_F(FeedTest, InvalidRange) {
    data::HistoricalFeedOptions options;
    options.start = 10;
    options.end = 5;
    EXPECT_THROW(data::HistoricalFeed feed({}, {}, options), core::InvalidParameter);
}

TEST_F(FeedTest, GapBeyondToleranceFails) {
    std::vector<core::Bar> bars = {day_bar("AAPL", 1, 10), day_bar("AAPL", 2, 11), day_bar("AAPL", 5, 12)};
    data::HistoricalFeedOptions options;
    options.gap_tolerance = 1;
    data::HistoricalFeed feed(bars, {"AAPL"}, options);

    EXPECT_TRUE(feed.next().has_value());
    EXPECT_TRUE(feed.next().has_value());
    try {
        feed.next();
        FAIL() << "expected DataGapError";
    } catch (const core::DataGapError& e) {
        EXPECT_EQ(e.symbol(), "AAPL");
        EXPECT_EQ(e.gap_start(), 2 * kDay);
        EXPECT_EQ(e.gap_end(), 5 * kDay);
    }
}

TEST_F(FeedTest, GapWithinToleranceIsFine) {
    std::vector<core::Bar> bars = {day_bar("AAPL", 1, 10), day_bar("AAPL", 3, 11)};
    data::HistoricalFeedOptions options;
    options.gap_tolerance = 1;
    data::HistoricalFeed feed(bars, {"AAPL"}, options);
    EXPECT_EQ(drain(feed).size(), 2u);
}

TEST_F(FeedTest, MissingDataAtRangeEdgesFails) {
    std::vector<core::Bar> bars = {day_bar("AAPL", 3, 10), day_bar("AAPL", 4, 11)};
    data::HistoricalFeedOptions options;
    options.gap_tolerance = 1;
    options.start = kDay;
    data::HistoricalFeed late_start(bars, {"AAPL"}, options);
    EXPECT_THROW(late_start.next(), core::DataGapError);

    options.start = 3 * kDay;
    options.end = 10 * kDay;
    data::HistoricalFeed early_end(bars, {"AAPL"}, options);
    EXPECT_TRUE(early_end.next().has_value());
    EXPECT_TRUE(early_end.next().has_value());
    EXPECT_THROW(early_end.next(), core::DataGapError);
}

TEST_F(FeedTest, ResetReplaysIdentically) {
    std::vector<core::Bar> bars = {day_bar("AAPL", 1, 10), day_bar("MSFT", 1, 50), day_bar("AAPL", 2, 11)};
    data::HistoricalFeed feed(bars);

    auto first = drain(feed);
    EXPECT_EQ(feed.position(), 3u);
    feed.reset();
    EXPECT_EQ(feed.position(), 0u);
    EXPECT_EQ(drain(feed), first);
}

TEST(TimestampTest, DatesAndEpochSeconds) {
    EXPECT_EQ(data::parse_timestamp("1970-01-01"), 0);
    EXPECT_EQ(data::parse_timestamp("2024-01-02"), 1704153600);
    EXPECT_EQ(data::parse_timestamp("1700000000"), 1700000000);
    EXPECT_THROW(data::parse_timestamp("2024-13-01"), core::InvalidParameter);
    EXPECT_THROW(data::parse_timestamp("2024-02-31"), core::InvalidParameter);
    EXPECT_THROW(data::parse_timestamp("2023-02-29"), core::InvalidParameter);
    EXPECT_THROW(data::parse_timestamp("2024-04-31"), core::InvalidParameter);
    EXPECT_THROW(data::parse_timestamp("2024-1a-01"), core::InvalidParameter);
    EXPECT_EQ(data::parse_timestamp("2024-02-29"), 1709164800);
    EXPECT_EQ(data::parse_timestamp("2000-02-29") + 86400, data::parse_timestamp("2000-03-01"));
    EXPECT_THROW(data::parse_timestamp("1900-02-29"), core::InvalidParameter);
    EXPECT_THROW(data::parse_timestamp("yesterday"), core::InvalidParameter);
    EXPECT_THROW(data::parse_timestamp("12abc"), core::InvalidParameter);
}

TEST_F(FeedTest, LoadsCsvAndSkipsMalformedRows) {
    std::string path = ::testing::TempDir() + "kestrel_feed_test.csv";
    {
        std::ofstream out(path);
        out << "symbol,timestamp,open,high,low,close,volume\n"
            << "AAPL,2024-01-02,10,11,9,10.5,1000\n"
            << "AAPL,1704240000,10.5,12,10,11.5,2000\r\n"
            << "AAPL,notadate,1,1,1,1,1\n"
            << "\n"
            << "MSFT,2024-01-02,50,51,49,50.5,\n";
    }

    auto bars = data::load_bars_csv(path);
    ASSERT_EQ(bars.size(), 3u);
    EXPECT_EQ(bars[0].timestamp, 1704153600);
    EXPECT_DOUBLE_EQ(bars[1].close, 11.5);
    EXPECT_DOUBLE_EQ(bars[1].volume, 2000.0);
    EXPECT_EQ(bars[2].symbol, "MSFT");
    EXPECT_DOUBLE_EQ(bars[2].volume, 0.0);

    EXPECT_THROW(data::load_bars_csv(path + ".missing"), core::FeedError);
}

TEST_F(FeedTest, ReplaySourceThroughLiveFeed) {
    std::vector<core::Bar> bars = {day_bar("AAPL", 1, 10), day_bar("IBM", 1, 100), day_bar("AAPL", 2, 11)};
    data::LiveFeed feed(std::make_unique<data::ReplayBarSource>(bars), {"AAPL"}, fast_options());
    EXPECT_TRUE(feed.is_live());
    feed.start();

    auto replayed = drain(feed);
    ASSERT_EQ(replayed.size(), 2u);
    EXPECT_EQ(replayed[0].sequence, 0u);
    EXPECT_EQ(replayed[1].sequence, 1u);
    EXPECT_THROW(feed.reset(), core::FeedError);
}

TEST_F(FeedTest, LiveFeedStallIsRecoverable) {
    auto source = std::make_unique<GatedSource>();
    GatedSource* gate = source.get();
    data::LiveFeed feed(std::move(source), {}, fast_options());
    feed.start();

    gate->push(day_bar("AAPL", 1, 10));
    ASSERT_TRUE(feed.next().has_value());

    try {
        feed.next();
        FAIL() << "expected FeedDisconnected";
    } catch (const core::FeedDisconnected& e) {
        EXPECT_TRUE(e.recoverable());
    }

    // Data resumes after the stall
    gate->push(day_bar("AAPL", 2, 11));
    auto bar = feed.next();
    ASSERT_TRUE(bar.has_value());
    EXPECT_EQ(bar->timestamp, 2 * kDay);

    gate->close();
    EXPECT_FALSE(feed.next().has_value());
}

TEST_F(FeedTest, LiveFeedRejectsTimeGoingBackwards) {
    auto source = std::make_unique<GatedSource>();
    GatedSource* gate = source.get();
    data::LiveFeed feed(std::move(source), {}, fast_options());
    feed.start();

    gate->push(day_bar("AAPL", 2, 10));
    gate->push(day_bar("AAPL", 1, 10));
    ASSERT_TRUE(feed.next().has_value());
    EXPECT_THROW(feed.next(), core::OutOfOrderBar);
    gate->close();
}

TEST_F(FeedTest, LiveFeedReportsLostSource) {
    data::LiveFeed feed(std::make_unique<BrokenSource>(), {}, fast_options());
    feed.start();

    try {
        feed.next();
        FAIL() << "expected FeedDisconnected";
    } catch (const core::FeedDisconnected& e) {
        EXPECT_FALSE(e.recoverable());
    }
}

TEST_F(FeedTest, LiveFeedNeedsASource) {
    EXPECT_THROW(data::LiveFeed feed(nullptr), core::InvalidParameter);
}

TEST(EventCodecTest, ParsesBarMessages) {
    auto bar = live::parse_bar_json(
        R"({"symbol":"AAPL","timestamp":1700000000,"open":10,"high":11,"low":9.5,"close":10.5,"volume":1200})");
    ASSERT_TRUE(bar.has_value());
    EXPECT_EQ(bar->symbol, "AAPL");
    EXPECT_EQ(bar->timestamp, 1700000000);
    EXPECT_DOUBLE_EQ(bar->low, 9.5);
    EXPECT_DOUBLE_EQ(bar->close, 10.5);
    EXPECT_DOUBLE_EQ(bar->volume, 1200.0);

    auto close_only = live::parse_bar_json(R"({"symbol": "MSFT", "timestamp": 5, "close": 50})");
    ASSERT_TRUE(close_only.has_value());
    EXPECT_DOUBLE_EQ(close_only->open, 50.0);
    EXPECT_DOUBLE_EQ(close_only->high, 50.0);
}

TEST(EventCodecTest, ParsesTicks) {
    auto bar = live::parse_bar_json(R"({"Symbol":"AAPL","Price":150.25,"Size":300})");
    ASSERT_TRUE(bar.has_value());
    EXPECT_EQ(bar->symbol, "AAPL");
    EXPECT_DOUBLE_EQ(bar->open, 150.25);
    EXPECT_DOUBLE_EQ(bar->close, 150.25);
    EXPECT_DOUBLE_EQ(bar->volume, 300.0);
    EXPECT_GT(bar->timestamp, 0);
}

TEST(EventCodecTest, RejectsUnusableMessages) {
    EXPECT_FALSE(live::parse_bar_json("not json").has_value());
    EXPECT_FALSE(live::parse_bar_json(R"({"symbol":"AAPL","close":10})").has_value());
    EXPECT_FALSE(live::parse_bar_json(R"({"symbol":"AAPL","timestamp":1,"close":"abc"})").has_value());
    EXPECT_FALSE(live::parse_bar_json(R"({"symbol":"AAPL","timestamp":1,"close":-3})").has_value());
}

TEST(EventCodecTest, EncodesSignalsAndOrders) {
    core::Signal signal = core::Signal::long_entry("AAPL", "golden \"cross\"");
    signal.timestamp = 42;
    signal.target_quantity = 100;
    std::string json = live::encode_signal_json(signal);
    EXPECT_NE(json.find("\"type\":\"LONG\""), std::string::npos);
    EXPECT_NE(json.find("\"target_quantity\":100"), std::string::npos);
    EXPECT_NE(json.find("golden \\\"cross\\\""), std::string::npos);
    EXPECT_EQ(json.find("limit_price"), std::string::npos);

    core::Order order("AAPL", core::OrderSide::SELL, 10);
    order.id = 3;
    order.status = core::OrderStatus::REJECTED;
    order.reject_reason = core::RejectReason::INSUFFICIENT_POSITION;
    json = live::encode_order_json(order);
    EXPECT_NE(json.find("\"id\":3"), std::string::npos);
    EXPECT_NE(json.find("\"side\":\"SELL\""), std::string::npos);
    EXPECT_NE(json.find("\"reject_reason\":\"INSUFFICIENT_POSITION\""), std::string::npos);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
