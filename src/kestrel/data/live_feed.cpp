#include <kestrel/data/live_feed.hpp>
#include <kestrel/core/errors.hpp>
#include <kestrel/utils/logger.hpp>
#include <algorithm>

namespace kestrel::data {

ReplayBarSource::ReplayBarSource(std::vector<core::Bar> bars, std::chrono::milliseconds pace)
    : bars_(std::move(bars)), pace_(pace) {}

std::optional<core::Bar> ReplayBarSource::receive(std::chrono::milliseconds timeout) {
    if (cursor_ >= bars_.size()) {
        return std::nullopt;
    }
    if (pace_.count() > 0) {
        std::this_thread::sleep_for(std::min(pace_, timeout));
    }
    return bars_[cursor_++];
}

LiveFeed::LiveFeed(std::unique_ptr<BarSource> source,
                   std::vector<std::string> symbols,
                   LiveFeedOptions options)
    : source_(std::move(source)),
      symbols_(std::move(symbols)),
      options_(options),
      queue_(options.queue_capacity) {
    if (!source_) {
        throw core::InvalidParameter("source", "live feed needs a bar source");
    }
}

LiveFeed::~LiveFeed() {
    stop();
}

void LiveFeed::start() {
    if (worker_.joinable()) {
        return;
    }
    stop_requested_ = false;
    worker_ = std::thread(&LiveFeed::worker_loop, this);
    utils::Logger::info() << "Live feed worker started (queue capacity "
                          << queue_.capacity() << ")" << utils::Logger::endl;
}

void LiveFeed::stop() {
    stop_requested_ = true;
    // Unblocks a worker waiting on a full queue
    queue_.close();
    if (worker_.joinable()) {
        worker_.join();
        utils::Logger::info() << "Live feed worker stopped" << utils::Logger::endl;
    }
}

bool LiveFeed::subscribed(const std::string& symbol) const {
    return symbols_.empty() || std::find(symbols_.begin(), symbols_.end(), symbol) != symbols_.end();
}

void LiveFeed::worker_loop() {
    while (!stop_requested_) {
        try {
            std::optional<core::Bar> bar = source_->receive(options_.poll_interval);
            if (bar) {
                if (!subscribed(bar->symbol)) {
                    continue;
                }
                // Blocks while the queue is full; false only after stop()
                if (!queue_.push(std::move(*bar))) {
                    break;
                }
            } else if (source_->finished()) {
                utils::Logger::info() << "Live source finished" << utils::Logger::endl;
                break;
            }
        } catch (const core::FeedDisconnected& e) {
            if (e.recoverable()) {
                utils::Logger::warn() << "Live source hiccup, retrying: " << e.what() << utils::Logger::endl;
                continue;
            }
            std::lock_guard<std::mutex> lock(error_mutex_);
            worker_error_ = e.what();
            utils::Logger::error() << "Live source disconnected: " << e.what() << utils::Logger::endl;
            break;
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(error_mutex_);
            worker_error_ = e.what();
            utils::Logger::error() << "Live source failed: " << e.what() << utils::Logger::endl;
            break;
        }
    }
    queue_.close();
}

core::Bar LiveFeed::accept(core::Bar bar) {
    if (seen_any_ && bar.timestamp < last_timestamp_) {
        throw core::OutOfOrderBar("Live bar for " + bar.symbol + " at " + std::to_string(bar.timestamp) +
                                  " arrived after " + std::to_string(last_timestamp_));
    }
    seen_any_ = true;
    last_timestamp_ = bar.timestamp;
    bar.sequence = next_sequence_++;
    return bar;
}

std::optional<core::Bar> LiveFeed::next() {
    std::optional<core::Bar> bar = queue_.pop_for(options_.stall_timeout);
    if (bar) {
        return accept(std::move(*bar));
    }

    if (!queue_.closed()) {
        throw core::FeedDisconnected("No bar received within " + std::to_string(options_.stall_timeout.count()) +
                                     "ms", true);
    }

    // The worker may have pushed a final bar just before closing
    bar = queue_.pop_for(std::chrono::milliseconds(0));
    if (bar) {
        return accept(std::move(*bar));
    }

    std::lock_guard<std::mutex> lock(error_mutex_);
    if (worker_error_) {
        throw core::FeedDisconnected("Live feed lost: " + *worker_error_, false);
    }
    return std::nullopt;
}

void LiveFeed::reset() {
    throw core::FeedError("A live feed cannot be rewound");
}

} // namespace kestrel::data
