#pragma once
#include <stdexcept>
#include <string>
#include <cstdint>

namespace kestrel::core {

// Layer an error originates from. Recorded on failed runs so callers can
// tell data problems from configuration mistakes and engine defects.
enum class ErrorLayer {
    FEED,
    FACTOR,
    CONFIGURATION,
    EXECUTION,
    STRATEGY,
    LEDGER
};

const char* to_string(ErrorLayer layer);

class KestrelError : public std::runtime_error {
public:
    KestrelError(ErrorLayer layer, const std::string& message)
        : std::runtime_error(message), layer_(layer) {}

    ErrorLayer layer() const { return layer_; }

private:
    ErrorLayer layer_;
};

// ---- feed layer ----

class FeedError : public KestrelError {
public:
    explicit FeedError(const std::string& message) : KestrelError(ErrorLayer::FEED, message) {}
};

class DataGapError : public FeedError {
public:
    DataGapError(const std::string& symbol, int64_t from, int64_t to, const std::string& message)
        : FeedError(message), symbol_(symbol), from_(from), to_(to) {}

    const std::string& symbol() const { return symbol_; }
    int64_t gap_start() const { return from_; }
    int64_t gap_end() const { return to_; }

private:
    std::string symbol_;
    int64_t from_;
    int64_t to_;
};

// recoverable() is true for a stall the live feed may come back from
class FeedDisconnected : public FeedError {
public:
    FeedDisconnected(const std::string& message, bool recoverable)
        : FeedError(message), recoverable_(recoverable) {}

    bool recoverable() const { return recoverable_; }

private:
    bool recoverable_;
};

class OutOfOrderBar : public FeedError {
public:
    explicit OutOfOrderBar(const std::string& message) : FeedError(message) {}
};

// ---- factor layer ----

class FactorError : public KestrelError {
public:
    explicit FactorError(const std::string& message) : KestrelError(ErrorLayer::FACTOR, message) {}
};

class InsufficientHistory : public FactorError {
public:
    InsufficientHistory(const std::string& symbol, const std::string& factor,
                        size_t required, size_t available)
        : FactorError("Insufficient history for " + factor + " on " + symbol + ": need " +
                      std::to_string(required) + " bars, have " + std::to_string(available)),
          required_(required), available_(available) {}

    size_t required() const { return required_; }
    size_t available() const { return available_; }

private:
    size_t required_;
    size_t available_;
};

class UnknownFactor : public FactorError {
public:
    explicit UnknownFactor(const std::string& name) : FactorError("Unknown factor: " + name) {}
};

// ---- execution layer ----

// Order-level problems (funds, position) become rejected orders instead;
// this is reserved for misuse of the simulator itself.
class ExecutionError : public KestrelError {
public:
    explicit ExecutionError(const std::string& message)
        : KestrelError(ErrorLayer::EXECUTION, message) {}
};

// ---- configuration layer ----

class ConfigurationError : public KestrelError {
public:
    explicit ConfigurationError(const std::string& message)
        : KestrelError(ErrorLayer::CONFIGURATION, message) {}
};

class InvalidParameter : public ConfigurationError {
public:
    InvalidParameter(const std::string& parameter, const std::string& message)
        : ConfigurationError("Invalid parameter '" + parameter + "': " + message),
          parameter_(parameter) {}

    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
};

// ---- strategy layer ----

class StrategyError : public KestrelError {
public:
    explicit StrategyError(const std::string& message) : KestrelError(ErrorLayer::STRATEGY, message) {}
};

// Declared, non-fatal: the offending signal is dropped and the run goes on
class SignalValidationError : public StrategyError {
public:
    explicit SignalValidationError(const std::string& message) : StrategyError(message) {}
};

// ---- ledger layer ----

class LedgerError : public KestrelError {
public:
    explicit LedgerError(const std::string& message) : KestrelError(ErrorLayer::LEDGER, message) {}
};

// Fatal. A logic defect, the run cannot be salvaged.
class LedgerInvariantViolation : public LedgerError {
public:
    explicit LedgerInvariantViolation(const std::string& message) : LedgerError(message) {}
};

} // namespace kestrel::core
