#pragma once

#include "bar.hpp"
#include "indicators.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tradebot {

enum class SignalType { Buy, Sell, Hold };

inline const char* signalName(SignalType t) {
    switch (t) {
        case SignalType::Buy: return "BUY";
        case SignalType::Sell: return "SELL";
        case SignalType::Hold: return "HOLD";
    }
    return "";
}

/// Decision for the current bar. size overrides the run's default order size.
struct Signal {
    SignalType type{SignalType::Hold};
    std::optional<double> size;
    double strength{0};

    static Signal hold() { return Signal{}; }
    static Signal buy(std::optional<double> size = std::nullopt, double strength = 1.0) {
        return Signal{SignalType::Buy, size, strength};
    }
    static Signal sell(std::optional<double> size = std::nullopt, double strength = 1.0) {
        return Signal{SignalType::Sell, size, strength};
    }

    bool operator==(const Signal& o) const {
        return type == o.type && size == o.size && strength == o.strength;
    }
};

/// Bars 0..current_index and nothing later (no look-ahead).
/// Indexing past the current bar throws std::out_of_range.
class BarHistoryView {
public:
    BarHistoryView(const std::vector<Bar>& bars, std::size_t current_index);

    std::size_t size() const { return current_ + 1; }
    std::size_t currentIndex() const { return current_; }

    const Bar& operator[](std::size_t i) const;
    const Bar& current() const { return (*bars_)[current_]; }

    /// Bar `k` steps before the current one (ago(0) == current()).
    const Bar& ago(std::size_t k) const;

private:
    const std::vector<Bar>* bars_;
    std::size_t current_;
};

/// Indicator values at the current index and earlier.
class IndicatorSnapshot {
public:
    IndicatorSnapshot(const IndicatorCache& cache, std::size_t current_index);

    /// Value of spec `ago` bars before the current one; nullopt while undefined.
    /// Throws std::out_of_range if the strategy did not declare the spec.
    std::optional<double> value(const IndicatorSpec& spec, std::size_t ago = 0) const;

    std::size_t currentIndex() const { return current_; }

private:
    const IndicatorCache* cache_;
    std::size_t current_;
};

/// Interface every trading strategy implements.
/// The engine calls decide() once per bar in chronological order; the views it
/// passes expose only data up to the current bar.
class IStrategy {
public:
    virtual ~IStrategy() = default;

    /// Registry name, e.g. "sma".
    virtual std::string name() const = 0;

    /// Human-readable parameters, e.g. "fast=10 slow=20 size=1".
    virtual std::string describeParams() const { return ""; }

    /// Indicators the engine must maintain for this strategy.
    virtual std::vector<IndicatorSpec> indicators() const { return {}; }

    virtual Signal decide(std::size_t current_index,
                          const BarHistoryView& bars,
                          const IndicatorSnapshot& indicators) = 0;
};

} // namespace tradebot
