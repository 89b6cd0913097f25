#include <kestrel/backtest/configuration.hpp>
#include <kestrel/core/errors.hpp>
#include <kestrel/data/historical_feed.hpp>
#include <cmath>
#include <stdexcept>

namespace kestrel::backtest {

namespace {

double parse_number(const std::string& key, const std::string& text) {
    if (text == "true") {
        return 1.0;
    }
    if (text == "false") {
        return 0.0;
    }
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw core::InvalidParameter(key, "expected a number, got '" + text + "'");
    }
    if (consumed != text.size()) {
        throw core::InvalidParameter(key, "expected a number, got '" + text + "'");
    }
    return value;
}

double number(const utils::Config& config, const std::string& key, double fallback) {
    return config.has(key) ? parse_number(key, config.get(key, "")) : fallback;
}

int integer(const utils::Config& config, const std::string& key, int fallback) {
    double value = number(config, key, fallback);
    if (std::floor(value) != value) {
        throw core::InvalidParameter(key, "expected a whole number");
    }
    return static_cast<int>(value);
}

bool flag(const utils::Config& config, const std::string& key, bool fallback) {
    if (!config.has(key)) {
        return fallback;
    }
    // Unrecognised text falls back to the default, so two defaults expose it
    bool value = config.get_bool(key, false);
    if (value != config.get_bool(key, true)) {
        throw core::InvalidParameter(key, "expected true or false, got '" + config.get(key, "") + "'");
    }
    return value;
}

} // namespace

void BacktestConfiguration::validate() const {
    if (!(ledger.initial_cash > 0.0) || !std::isfinite(ledger.initial_cash)) {
        throw core::InvalidParameter("initial_cash", "must be positive");
    }
    if (!(ledger.max_leverage >= 1.0) || !std::isfinite(ledger.max_leverage)) {
        throw core::InvalidParameter("max_leverage", "must be at least 1");
    }
    execution.validate();
    metrics.validate();
    if (strategy.empty()) {
        throw core::InvalidParameter("strategy", "must name a strategy");
    }
    if (start > end) {
        throw core::InvalidParameter("start", "must not be after end");
    }
    if (bar_interval <= 0) {
        throw core::InvalidParameter("bar_interval", "must be positive");
    }
}

BacktestConfiguration load_backtest_configuration(const utils::Config& config) {
    BacktestConfiguration result;

    result.ledger.initial_cash = number(config, "initial_cash", result.ledger.initial_cash);
    result.ledger.allow_short = flag(config, "allow_short", result.ledger.allow_short);
    result.ledger.allow_margin = flag(config, "allow_margin", result.ledger.allow_margin);
    result.ledger.max_leverage = number(config, "max_leverage", result.ledger.max_leverage);

    auto& execution = result.execution;
    if (config.has("fill_model")) {
        execution.fill_model = execution::parse_fill_model(config.get("fill_model", ""));
    }
    execution.slippage_rate = number(config, "slippage_rate", execution.slippage_rate);
    execution.impact_coefficient = number(config, "impact_coefficient", execution.impact_coefficient);
    execution.commission_rate = number(config, "commission_rate", execution.commission_rate);
    execution.min_commission = number(config, "min_commission", execution.min_commission);
    execution.stamp_duty_rate = number(config, "stamp_duty_rate", execution.stamp_duty_rate);
    execution.lot_size = number(config, "lot_size", execution.lot_size);
    execution.max_volume_participation =
        number(config, "max_volume_participation", execution.max_volume_participation);
    execution.limit_order_ttl_bars = integer(config, "limit_order_ttl_bars", execution.limit_order_ttl_bars);
    execution.position_fraction = number(config, "position_fraction", execution.position_fraction);

    result.metrics.periods_per_year = number(config, "periods_per_year", result.metrics.periods_per_year);
    result.metrics.risk_free_rate = number(config, "risk_free_rate", result.metrics.risk_free_rate);

    result.strategy = config.get("strategy", result.strategy);
    for (const auto& [name, text] : config.with_prefix("strategy.")) {
        result.strategy_parameters[name] = parse_number("strategy." + name, text);
    }

    result.instruments = config.get_list("instruments");
    if (config.has("start")) {
        result.start = data::parse_timestamp(config.get("start", ""));
    }
    if (config.has("end")) {
        result.end = data::parse_timestamp(config.get("end", ""));
    }

    result.data_file = config.get("data_file", result.data_file);
    result.bar_interval = static_cast<int64_t>(integer(config, "bar_interval", static_cast<int>(result.bar_interval)));
    result.gap_tolerance = integer(config, "gap_tolerance", result.gap_tolerance);
    result.log_level = config.get("log_level", result.log_level);

    result.validate();
    return result;
}

} // namespace kestrel::backtest
