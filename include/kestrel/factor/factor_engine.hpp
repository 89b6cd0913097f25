#pragma once
#include <kestrel/core/bar.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace kestrel::factor {

// Named numeric knobs of a factor, e.g. {"fast": 12, "signal": 9}
using FactorParams = std::map<std::string, double>;

// Read-only view of the first count bars of an instrument's history.
// Valid only while that history is not modified.
class BarWindow {
private:
    const core::Bar* first_;
    size_t count_;

public:
    BarWindow(const core::Bar* first, size_t count) : first_(first), count_(count) {}

    const core::Bar* begin() const { return first_; }
    const core::Bar* end() const { return first_ + count_; }
    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }
    const core::Bar& operator[](size_t i) const { return first_[i]; }
    const core::Bar& back() const { return first_[count_ - 1]; }
};

// How a factor is evaluated. bars holds the instrument's history up to and
// including the as-of bar; lookback is the factor's primary window.
struct FactorDefinition {
    std::function<size_t(size_t lookback, const FactorParams& params)> required_bars;
    std::function<double(const BarWindow& bars, size_t lookback, const FactorParams& params)> evaluate;
};

// Stable hash of lookback and parameters, part of the cache key
uint64_t parameter_hash(size_t lookback, const FactorParams& params);

// Computes indicators from per-instrument bar history on demand.
//
// Values are memoized per (instrument, factor, timestamp, parameter hash).
// Only values for the latest cached_bars bars of each instrument are kept:
// appending a bar evicts entries that fall behind that window. Replacing an
// instrument's history drops every cached value of that instrument.
// One engine belongs to one run: nothing here is shared or global.
class FactorEngine {
private:
    struct CacheKey {
        std::string name;
        int64_t timestamp;
        uint64_t params;

        bool operator==(const CacheKey& other) const {
            return timestamp == other.timestamp && params == other.params && name == other.name;
        }
    };

    struct CacheKeyHash {
        size_t operator()(const CacheKey& key) const;
    };

    std::map<std::string, FactorDefinition> definitions_;
    std::unordered_map<std::string, std::vector<core::Bar>> history_;
    std::unordered_map<std::string, std::unordered_map<CacheKey, double, CacheKeyHash>> cache_;
    size_t cache_hits_ = 0;
    size_t cache_misses_ = 0;
    size_t cached_bars_;

    void register_builtins();
    void evict_before(const std::string& symbol, int64_t timestamp);

public:
    // cached_bars of at least 2 keeps the previous bar's values for crossovers
    explicit FactorEngine(size_t cached_bars = 2);

    // Adds or overrides a factor for this engine only
    void register_factor(const std::string& name, FactorDefinition definition);
    bool has_factor(const std::string& name) const;
    std::vector<std::string> factor_names() const;

    // Extends an instrument's history. Bars must be newer than the last one
    // held for that instrument; throws OutOfOrderBar otherwise.
    void append(const core::Bar& bar);

    // Amends history (e.g. a split adjustment) and invalidates the whole
    // cache of that instrument
    void replace_history(const std::string& symbol, std::vector<core::Bar> bars);

    // Value of factor name for symbol using bars at or before as_of.
    // Throws InsufficientHistory when fewer bars than the factor needs are
    // available, UnknownFactor for an unregistered name.
    double compute(const std::string& symbol, const std::string& name, int64_t as_of,
                   size_t lookback, const FactorParams& params = FactorParams());

    // Bars compute() would need for this factor and window
    size_t required_bars(const std::string& name, size_t lookback,
                         const FactorParams& params = FactorParams()) const;

    const std::vector<core::Bar>& history(const std::string& symbol) const;
    size_t history_size(const std::string& symbol) const;

    size_t cache_size() const;
    size_t cache_hits() const { return cache_hits_; }
    size_t cache_misses() const { return cache_misses_; }

    void clear();
};

} // namespace kestrel::factor
