#include <kestrel/data/historical_feed.hpp>
#include <kestrel/core/errors.hpp>
#include <kestrel/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace kestrel::data {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

unsigned days_in_month(int64_t y, unsigned m) {
    static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    return m == 2 && leap ? 29 : days[m - 1];
}

} // namespace

int64_t parse_timestamp(const std::string& text) {
    if (text.size() == 10 && text[4] == '-' && text[7] == '-') {
        for (size_t i = 0; i < text.size(); ++i) {
            if (i != 4 && i != 7 && !std::isdigit(static_cast<unsigned char>(text[i]))) {
                throw core::InvalidParameter("timestamp", "not a date: " + text);
            }
        }
        int year = std::stoi(text.substr(0, 4));
        int month = std::stoi(text.substr(5, 2));
        int day = std::stoi(text.substr(8, 2));
        if (month < 1 || month > 12 || day < 1 ||
            static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month))) {
            throw core::InvalidParameter("timestamp", "date out of range: " + text);
        }
        return days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * 86400;
    }

    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            throw core::InvalidParameter("timestamp", "trailing characters in: " + text);
        }
        return static_cast<int64_t>(value);
    } catch (const std::logic_error&) {
        throw core::InvalidParameter("timestamp", "not a timestamp: " + text);
    }
}

HistoricalFeed::HistoricalFeed(std::vector<core::Bar> bars,
                               std::vector<std::string> symbols,
                               HistoricalFeedOptions options)
    : symbols_(std::move(symbols)), options_(options) {
    if (options_.start > options_.end) {
        throw core::InvalidParameter("start", "range start is after range end");
    }
    if (options_.bar_interval <= 0) {
        throw core::InvalidParameter("bar_interval", "must be positive");
    }

    // Subscription order ranks instruments for same-timestamp ties
    std::unordered_map<std::string, size_t> rank;
    if (symbols_.empty()) {
        for (const auto& bar : bars) {
            if (rank.emplace(bar.symbol, rank.size()).second) {
                symbols_.push_back(bar.symbol);
            }
        }
        std::sort(symbols_.begin(), symbols_.end());
        rank.clear();
    }
    for (size_t i = 0; i < symbols_.size(); ++i) {
        rank.emplace(symbols_[i], i);
    }

    bars_.reserve(bars.size());
    for (auto& bar : bars) {
        if (rank.find(bar.symbol) == rank.end()) {
            continue;
        }
        if (bar.timestamp < options_.start || bar.timestamp > options_.end) {
            continue;
        }
        if (!bar.is_valid()) {
            throw core::FeedError("Malformed bar for " + bar.symbol + " at " + std::to_string(bar.timestamp));
        }
        bars_.push_back(std::move(bar));
    }

    std::stable_sort(bars_.begin(), bars_.end(),
                     [&rank](const core::Bar& a, const core::Bar& b) {
                         if (a.timestamp != b.timestamp) {
                             return a.timestamp < b.timestamp;
                         }
                         return rank.at(a.symbol) < rank.at(b.symbol);
                     });

    for (size_t i = 0; i < bars_.size(); ++i) {
        if (i > 0 && bars_[i].timestamp == bars_[i - 1].timestamp &&
            bars_[i].symbol == bars_[i - 1].symbol) {
            throw core::OutOfOrderBar("Duplicate bar for " + bars_[i].symbol + " at " +
                                      std::to_string(bars_[i].timestamp));
        }
        bars_[i].sequence = i;
    }

    utils::Logger::info() << "Historical feed ready: " << bars_.size() << " bars across "
                          << symbols_.size() << " instruments" << utils::Logger::endl;
}

int64_t HistoricalFeed::max_gap() const {
    return options_.bar_interval * (static_cast<int64_t>(options_.gap_tolerance) + 1);
}

void HistoricalFeed::check_gap(const core::Bar& bar) {
    if (options_.gap_tolerance < 0) {
        return;
    }

    auto it = last_seen_.find(bar.symbol);
    int64_t previous = 0;
    bool bounded = true;
    if (it != last_seen_.end()) {
        previous = it->second;
    } else if (options_.start != std::numeric_limits<int64_t>::min()) {
        // First bar must sit close enough to the requested start
        previous = options_.start - options_.bar_interval;
    } else {
        bounded = false;
    }

    if (bounded && bar.timestamp - previous > max_gap()) {
        throw core::DataGapError(bar.symbol, previous, bar.timestamp,
                                 "Data gap for " + bar.symbol + " between " + std::to_string(previous) +
                                 " and " + std::to_string(bar.timestamp) + " exceeds tolerance of " +
                                 std::to_string(options_.gap_tolerance) + " bars");
    }
}

void HistoricalFeed::check_range_end() {
    if (options_.gap_tolerance < 0 || options_.end == std::numeric_limits<int64_t>::max()) {
        return;
    }

    for (const auto& symbol : symbols_) {
        auto it = last_seen_.find(symbol);
        int64_t last = it != last_seen_.end() ? it->second
                                              : (options_.start == std::numeric_limits<int64_t>::min()
                                                     ? options_.end
                                                     : options_.start - options_.bar_interval);
        if (options_.end + options_.bar_interval - last > max_gap()) {
            throw core::DataGapError(symbol, last, options_.end,
                                     "Data for " + symbol + " ends at " + std::to_string(last) +
                                     ", short of requested end " + std::to_string(options_.end));
        }
    }
}

std::optional<core::Bar> HistoricalFeed::next() {
    if (cursor_ >= bars_.size()) {
        if (!exhausted_checked_) {
            exhausted_checked_ = true;
            check_range_end();
        }
        return std::nullopt;
    }

    const core::Bar& bar = bars_[cursor_];
    check_gap(bar);
    last_seen_[bar.symbol] = bar.timestamp;
    ++cursor_;
    return bar;
}

void HistoricalFeed::reset() {
    cursor_ = 0;
    last_seen_.clear();
    exhausted_checked_ = false;
}

std::vector<core::Bar> load_bars_csv(const std::string& csv_file) {
    auto start_time = std::chrono::steady_clock::now();

    std::ifstream file(csv_file);
    if (!file.is_open()) {
        throw core::FeedError("Failed to open CSV file: " + csv_file);
    }

    std::vector<core::Bar> bars;
    std::string line;

    // Skip header line
    std::getline(file, line);

    size_t line_number = 1;
    size_t skipped = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        std::stringstream ss(line);
        std::string symbol, timestamp, open, high, low, close, volume;
        std::getline(ss, symbol, ',');
        std::getline(ss, timestamp, ',');
        std::getline(ss, open, ',');
        std::getline(ss, high, ',');
        std::getline(ss, low, ',');
        std::getline(ss, close, ',');
        std::getline(ss, volume, ',');

        if (symbol.empty() || timestamp.empty() || close.empty()) {
            ++skipped;
            continue;
        }

        try {
            core::Bar bar(symbol, parse_timestamp(timestamp), std::stod(open), std::stod(high),
                          std::stod(low), std::stod(close), volume.empty() ? 0.0 : std::stod(volume));
            bars.push_back(bar);
        } catch (const std::exception& e) {
            // Don't log every parsing error to avoid flooding the console
            ++skipped;
            utils::Logger::debug() << "Skipping line " << line_number << " of " << csv_file
                                   << ": " << e.what() << utils::Logger::endl;
        }
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();

    utils::Logger::info() << "Loaded " << bars.size() << " bars from " << csv_file << " ("
                          << skipped << " rows skipped, " << duration << "ms)" << utils::Logger::endl;
    return bars;
}

} // namespace kestrel::data
