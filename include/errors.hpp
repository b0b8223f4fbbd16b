#pragma once

#include <stdexcept>
#include <string>

namespace tradebot {

/// Base of all domain errors. Anything deriving from it carries a message
/// naming the offending input and is safe to print to the user as-is.
class BacktestError : public std::runtime_error {
public:
    explicit BacktestError(const std::string& what) : std::runtime_error(what) {}
};

/// Bar source returned nothing usable for the requested symbol/range.
class DataUnavailable : public BacktestError {
public:
    explicit DataUnavailable(const std::string& what) : BacktestError(what) {}
};

/// A gap between consecutive bars under GapPolicy::Fail.
class DataGap : public BacktestError {
public:
    explicit DataGap(const std::string& what) : BacktestError(what) {}
};

/// A bar violating the OHLC invariants. Only thrown in strict mode;
/// otherwise the bar is dropped and logged.
class MalformedBar : public BacktestError {
public:
    explicit MalformedBar(const std::string& what) : BacktestError(what) {}
};

/// Strategy or engine configuration rejected before any simulation work.
class InvalidParameters : public BacktestError {
public:
    explicit InvalidParameters(const std::string& what) : BacktestError(what) {}
};

class StrategyNotImplemented : public BacktestError {
public:
    explicit StrategyNotImplemented(const std::string& what) : BacktestError(what) {}
};

/// Per-fill rejection: a buy would overdraw cash.
class InsufficientFunds : public BacktestError {
public:
    explicit InsufficientFunds(const std::string& what) : BacktestError(what) {}
};

/// Per-fill rejection: a sell would leave a short position with shorting disabled.
class InsufficientPosition : public BacktestError {
public:
    explicit InsufficientPosition(const std::string& what) : BacktestError(what) {}
};

} // namespace tradebot
