#include <kestrel/factor/factor_engine.hpp>
#include <kestrel/factor/indicators.hpp>
#include <kestrel/core/errors.hpp>
#include <kestrel/utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>

namespace kestrel::factor {

namespace {

std::vector<double> closes(const BarWindow& bars) {
    std::vector<double> values;
    values.reserve(bars.size());
    for (const auto& bar : bars) {
        values.push_back(bar.close);
    }
    return values;
}

std::vector<double> field(const BarWindow& bars, double core::Bar::*member) {
    std::vector<double> values;
    values.reserve(bars.size());
    for (const auto& bar : bars) {
        values.push_back(bar.*member);
    }
    return values;
}

double param(const FactorParams& params, const char* name, double default_value) {
    auto it = params.find(name);
    return it != params.end() ? it->second : default_value;
}

size_t period_param(const FactorParams& params, const char* name, size_t default_value) {
    double value = param(params, name, static_cast<double>(default_value));
    if (!(value >= 1.0)) {
        throw core::InvalidParameter(name, "period must be at least 1");
    }
    return static_cast<size_t>(value);
}

size_t macd_required(size_t slow, const FactorParams& params) {
    return slow + period_param(params, "signal", 9) - 1;
}

indicators::MacdValue macd_of(const BarWindow& bars, size_t slow, const FactorParams& params) {
    return indicators::macd(closes(bars), period_param(params, "fast", 12), slow,
                            period_param(params, "signal", 9));
}

// Clamp to [-1, 1]
double bounded(double value) {
    return std::max(-1.0, std::min(1.0, value));
}

// Weighted blend of trend, momentum, volatility and volume scores, each in
// [-1, 1]. lookback is the moving average, band and volume window.
double multifactor_score(const BarWindow& bars, size_t lookback, const FactorParams& params) {
    std::vector<double> close_values = closes(bars);
    double close = close_values.back();

    indicators::MacdValue m = indicators::macd(close_values,
                                               period_param(params, "macd_fast", 12),
                                               period_param(params, "macd_slow", 26),
                                               period_param(params, "macd_signal", 9));
    double spread = m.macd - m.signal;
    double macd_score = m.signal != 0.0 ? bounded(spread / std::abs(m.signal) * 2.0)
                                        : (spread > 0.0 ? 1.0 : (spread < 0.0 ? -1.0 : 0.0));

    double ma = indicators::sma(close_values, lookback);
    double ma_score = bounded((close - ma) / ma * 10.0);

    double rsi = indicators::rsi(close_values, period_param(params, "rsi_period", 14));
    double rsi_score;
    if (rsi < 30.0) {
        rsi_score = 1.0;
    } else if (rsi > 70.0) {
        rsi_score = -1.0;
    } else {
        rsi_score = (50.0 - rsi) / 20.0;
    }

    double roc_score = bounded(indicators::roc(close_values, period_param(params, "roc_period", 10)) / 10.0);

    double bb_score = 0.0;
    indicators::BollingerValue bands = indicators::bollinger(close_values, lookback, 2.0);
    double band_range = bands.upper - bands.lower;
    if (band_range > 0.0) {
        double position = (close - bands.lower) / band_range;
        bb_score = 1.0 - 2.0 * position;
    }

    double volume_score = 0.0;
    std::vector<double> volumes = field(bars, &core::Bar::volume);
    double volume_ma = indicators::sma(volumes, lookback);
    if (volume_ma > 0.0 && volumes.back() / volume_ma > 1.5) {
        // Heavy volume confirms the trend direction
        volume_score = macd_score > 0.0 ? 0.5 : -0.5;
    }

    const double weights[] = {1.0, 0.8, 0.9, 0.7, 0.6, 0.5};
    const double scores[] = {macd_score, ma_score, rsi_score, roc_score, bb_score, volume_score};
    double weighted = 0.0;
    double total_weight = 0.0;
    for (size_t i = 0; i < 6; ++i) {
        weighted += scores[i] * weights[i];
        total_weight += weights[i];
    }
    return weighted / total_weight;
}

} // namespace

uint64_t parameter_hash(size_t lookback, const FactorParams& params) {
    // FNV-1a over a canonical rendering; std::map keeps keys sorted
    std::ostringstream oss;
    oss.precision(17);
    oss << lookback;
    for (const auto& [name, value] : params) {
        oss << ';' << name << '=' << value;
    }

    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : oss.str()) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

size_t FactorEngine::CacheKeyHash::operator()(const CacheKey& key) const {
    size_t h = std::hash<std::string>()(key.name);
    h ^= std::hash<int64_t>()(key.timestamp) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    h ^= std::hash<uint64_t>()(key.params) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
}

FactorEngine::FactorEngine(size_t cached_bars) : cached_bars_(std::max<size_t>(cached_bars, 1)) {
    register_builtins();
}

void FactorEngine::register_builtins() {
    auto same = [](size_t lookback, const FactorParams&) { return lookback; };
    auto plus_one = [](size_t lookback, const FactorParams&) { return lookback + 1; };

    register_factor("sma", {same, [](const BarWindow& bars, size_t lookback, const FactorParams&) {
        return indicators::sma(closes(bars), lookback);
    }});
    register_factor("ema", {same, [](const BarWindow& bars, size_t lookback, const FactorParams&) {
        return indicators::ema(closes(bars), lookback);
    }});
    register_factor("rsi", {plus_one, [](const BarWindow& bars, size_t lookback, const FactorParams&) {
        return indicators::rsi(closes(bars), lookback);
    }});

    // MACD family: lookback is the slow period
    register_factor("macd", {macd_required, [](const BarWindow& bars, size_t lookback,
                                               const FactorParams& params) {
        return macd_of(bars, lookback, params).macd;
    }});
    register_factor("macd_signal", {macd_required, [](const BarWindow& bars, size_t lookback,
                                                      const FactorParams& params) {
        return macd_of(bars, lookback, params).signal;
    }});
    register_factor("macd_hist", {macd_required, [](const BarWindow& bars, size_t lookback,
                                                    const FactorParams& params) {
        return macd_of(bars, lookback, params).histogram;
    }});

    register_factor("bb_upper", {same, [](const BarWindow& bars, size_t lookback,
                                          const FactorParams& params) {
        return indicators::bollinger(closes(bars), lookback, param(params, "k", 2.0)).upper;
    }});
    register_factor("bb_mid", {same, [](const BarWindow& bars, size_t lookback,
                                        const FactorParams& params) {
        return indicators::bollinger(closes(bars), lookback, param(params, "k", 2.0)).mid;
    }});
    register_factor("bb_lower", {same, [](const BarWindow& bars, size_t lookback,
                                          const FactorParams& params) {
        return indicators::bollinger(closes(bars), lookback, param(params, "k", 2.0)).lower;
    }});
    register_factor("bb_pct_b", {same, [](const BarWindow& bars, size_t lookback,
                                          const FactorParams& params) {
        indicators::BollingerValue bands = indicators::bollinger(closes(bars), lookback, param(params, "k", 2.0));
        double range = bands.upper - bands.lower;
        return range > 0.0 ? (bars.back().close - bands.lower) / range : 0.5;
    }});

    register_factor("atr", {plus_one, [](const BarWindow& bars, size_t lookback, const FactorParams&) {
        return indicators::atr(field(bars, &core::Bar::high), field(bars, &core::Bar::low), closes(bars), lookback);
    }});

    // Channel extremes; exclude_current = 1 leaves the as-of bar out
    auto channel_required = [](size_t lookback, const FactorParams& params) {
        return lookback + (param(params, "exclude_current", 0.0) != 0.0 ? 1 : 0);
    };
    register_factor("highest", {channel_required, [](const BarWindow& bars, size_t lookback,
                                                     const FactorParams& params) {
        std::vector<double> highs = field(bars, &core::Bar::high);
        if (param(params, "exclude_current", 0.0) != 0.0) {
            highs.pop_back();
        }
        return indicators::highest(highs, lookback);
    }});
    register_factor("lowest", {channel_required, [](const BarWindow& bars, size_t lookback,
                                                    const FactorParams& params) {
        std::vector<double> lows = field(bars, &core::Bar::low);
        if (param(params, "exclude_current", 0.0) != 0.0) {
            lows.pop_back();
        }
        return indicators::lowest(lows, lookback);
    }});

    register_factor("roc", {plus_one, [](const BarWindow& bars, size_t lookback, const FactorParams&) {
        return indicators::roc(closes(bars), lookback);
    }});
    register_factor("stddev", {same, [](const BarWindow& bars, size_t lookback, const FactorParams&) {
        return indicators::stddev(closes(bars), lookback);
    }});
    register_factor("volume_sma", {same, [](const BarWindow& bars, size_t lookback, const FactorParams&) {
        return indicators::sma(field(bars, &core::Bar::volume), lookback);
    }});
    register_factor("zscore", {same, [](const BarWindow& bars, size_t lookback, const FactorParams&) {
        return indicators::zscore(closes(bars), lookback);
    }});

    register_factor("multifactor", {[](size_t lookback, const FactorParams& params) {
        size_t required = std::max(lookback,
                                   period_param(params, "macd_slow", 26) + period_param(params, "macd_signal", 9) - 1);
        required = std::max(required, period_param(params, "rsi_period", 14) + 1);
        required = std::max(required, period_param(params, "roc_period", 10) + 1);
        return required;
    }, multifactor_score});
}

void FactorEngine::register_factor(const std::string& name, FactorDefinition definition) {
    if (!definition.required_bars || !definition.evaluate) {
        throw core::InvalidParameter(name, "factor definition is incomplete");
    }
    definitions_[name] = std::move(definition);

    // Overriding a definition invalidates what the old one produced
    for (auto& [symbol, entries] : cache_) {
        for (auto it = entries.begin(); it != entries.end();) {
            it = it->first.name == name ? entries.erase(it) : std::next(it);
        }
    }
}

bool FactorEngine::has_factor(const std::string& name) const {
    return definitions_.find(name) != definitions_.end();
}

std::vector<std::string> FactorEngine::factor_names() const {
    std::vector<std::string> names;
    names.reserve(definitions_.size());
    for (const auto& [name, definition] : definitions_) {
        names.push_back(name);
    }
    return names;
}

void FactorEngine::append(const core::Bar& bar) {
    auto& bars = history_[bar.symbol];
    if (!bars.empty() && bar.timestamp <= bars.back().timestamp) {
        throw core::OutOfOrderBar("Bar for " + bar.symbol + " at " + std::to_string(bar.timestamp) +
                                  " is not newer than " + std::to_string(bars.back().timestamp));
    }
    bars.push_back(bar);

    if (bars.size() > cached_bars_) {
        evict_before(bar.symbol, bars[bars.size() - cached_bars_].timestamp);
    }
}

void FactorEngine::evict_before(const std::string& symbol, int64_t timestamp) {
    auto it = cache_.find(symbol);
    if (it == cache_.end()) {
        return;
    }
    auto& entries = it->second;
    for (auto entry = entries.begin(); entry != entries.end();) {
        entry = entry->first.timestamp < timestamp ? entries.erase(entry) : std::next(entry);
    }
}

void FactorEngine::replace_history(const std::string& symbol, std::vector<core::Bar> bars) {
    std::stable_sort(bars.begin(), bars.end(), [](const core::Bar& a, const core::Bar& b) {
        return a.timestamp < b.timestamp;
    });
    for (size_t i = 1; i < bars.size(); ++i) {
        if (bars[i].timestamp == bars[i - 1].timestamp) {
            throw core::OutOfOrderBar("Amended history for " + symbol + " repeats timestamp " +
                                      std::to_string(bars[i].timestamp));
        }
    }

    history_[symbol] = std::move(bars);

    auto it = cache_.find(symbol);
    size_t dropped = it != cache_.end() ? it->second.size() : 0;
    cache_.erase(symbol);

    utils::Logger::info() << "History of " << symbol << " replaced, " << dropped
                          << " cached factor values dropped" << utils::Logger::endl;
}

size_t FactorEngine::required_bars(const std::string& name, size_t lookback, const FactorParams& params) const {
    auto it = definitions_.find(name);
    if (it == definitions_.end()) {
        throw core::UnknownFactor(name);
    }
    return it->second.required_bars(lookback, params);
}

double FactorEngine::compute(const std::string& symbol, const std::string& name, int64_t as_of,
                             size_t lookback, const FactorParams& params) {
    auto def_it = definitions_.find(name);
    if (def_it == definitions_.end()) {
        throw core::UnknownFactor(name);
    }
    const FactorDefinition& definition = def_it->second;
    if (lookback == 0) {
        throw core::InvalidParameter("lookback", "must be positive for factor " + name);
    }

    size_t required = definition.required_bars(lookback, params);

    auto hist_it = history_.find(symbol);
    size_t available = 0;
    if (hist_it != history_.end()) {
        const auto& bars = hist_it->second;
        auto end = std::upper_bound(bars.begin(), bars.end(), as_of,
                                    [](int64_t ts, const core::Bar& bar) { return ts < bar.timestamp; });
        available = static_cast<size_t>(end - bars.begin());
    }
    if (available < required) {
        throw core::InsufficientHistory(symbol, name, required, available);
    }

    const auto& bars = hist_it->second;

    // Keyed by the last bar actually used, so later bars never alias it
    CacheKey key{name, bars[available - 1].timestamp, parameter_hash(lookback, params)};
    auto& entries = cache_[symbol];
    auto cached = entries.find(key);
    if (cached != entries.end()) {
        ++cache_hits_;
        return cached->second;
    }

    ++cache_misses_;
    double value = definition.evaluate(BarWindow(bars.data(), available), lookback, params);
    if (!std::isfinite(value)) {
        throw core::FactorError("Factor " + name + " on " + symbol + " produced a non-finite value");
    }
    entries.emplace(std::move(key), value);
    return value;
}

const std::vector<core::Bar>& FactorEngine::history(const std::string& symbol) const {
    static const std::vector<core::Bar> empty;
    auto it = history_.find(symbol);
    return it != history_.end() ? it->second : empty;
}

size_t FactorEngine::history_size(const std::string& symbol) const {
    return history(symbol).size();
}

size_t FactorEngine::cache_size() const {
    size_t total = 0;
    for (const auto& [symbol, entries] : cache_) {
        total += entries.size();
    }
    return total;
}

void FactorEngine::clear() {
    history_.clear();
    cache_.clear();
    cache_hits_ = 0;
    cache_misses_ = 0;
}

} // namespace kestrel::factor
