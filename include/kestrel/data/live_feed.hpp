#pragma once
#include <kestrel/data/market_data_feed.hpp>
#include <kestrel/utils/bounded_queue.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace kestrel::data {

// Transport the live feed worker reads from (a socket, a replay file).
class BarSource {
public:
    virtual ~BarSource() = default;

    // Waits up to timeout for one bar. nullopt means nothing arrived yet.
    // Throws FeedDisconnected when the transport fails.
    virtual std::optional<core::Bar> receive(std::chrono::milliseconds timeout) = 0;

    // True once the source will never produce another bar
    virtual bool finished() const = 0;
};

// Replays a fixed list of bars through the live path, optionally paced
class ReplayBarSource : public BarSource {
private:
    std::vector<core::Bar> bars_;
    size_t cursor_ = 0;
    std::chrono::milliseconds pace_;

public:
    explicit ReplayBarSource(std::vector<core::Bar> bars,
                             std::chrono::milliseconds pace = std::chrono::milliseconds(0));

    std::optional<core::Bar> receive(std::chrono::milliseconds timeout) override;
    bool finished() const override { return cursor_ >= bars_.size(); }
};

struct LiveFeedOptions {
    size_t queue_capacity = 1024;

    // How long next() waits before reporting a recoverable stall
    std::chrono::milliseconds stall_timeout{5000};

    // Worker poll granularity, also bounds shutdown latency
    std::chrono::milliseconds poll_interval{100};
};

// Runs a BarSource on a worker thread that pushes into a bounded queue.
// A full queue blocks the worker, so bars are never dropped or reordered.
// next() throws FeedDisconnected(recoverable = true) on a stall and
// FeedDisconnected(recoverable = false) once the worker died on an error.
class LiveFeed : public MarketDataFeed {
private:
    std::unique_ptr<BarSource> source_;
    std::vector<std::string> symbols_;
    LiveFeedOptions options_;
    utils::BoundedQueue<core::Bar> queue_;

    std::thread worker_;
    std::atomic<bool> stop_requested_{false};
    std::mutex error_mutex_;
    std::optional<std::string> worker_error_;

    uint64_t next_sequence_ = 0;
    int64_t last_timestamp_ = 0;
    bool seen_any_ = false;

    void worker_loop();
    bool subscribed(const std::string& symbol) const;
    core::Bar accept(core::Bar bar);

public:
    LiveFeed(std::unique_ptr<BarSource> source,
             std::vector<std::string> symbols = {},
             LiveFeedOptions options = LiveFeedOptions());
    ~LiveFeed() override;

    LiveFeed(const LiveFeed&) = delete;
    LiveFeed& operator=(const LiveFeed&) = delete;

    void start();
    void stop();

    std::optional<core::Bar> next() override;

    // Live streams cannot be rewound; throws FeedError
    void reset() override;

    bool is_live() const override { return true; }
    std::vector<std::string> symbols() const override { return symbols_; }

    size_t queued() const { return queue_.size(); }
};

} // namespace kestrel::data
