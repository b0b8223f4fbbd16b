#pragma once

#include "bar.hpp"
#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tradebot {

enum class IndicatorKind { Sma, Rsi };

/// Indicator identity: kind + lookback period. Equal specs share one cached series.
struct IndicatorSpec {
    IndicatorKind kind{IndicatorKind::Sma};
    int period{0};

    std::string label() const;  // e.g. "SMA(20)"

    bool operator<(const IndicatorSpec& o) const {
        return kind != o.kind ? kind < o.kind : period < o.period;
    }
    bool operator==(const IndicatorSpec& o) const { return kind == o.kind && period == o.period; }
};

inline IndicatorSpec smaSpec(int period) { return {IndicatorKind::Sma, period}; }
inline IndicatorSpec rsiSpec(int period) { return {IndicatorKind::Rsi, period}; }

/// Values aligned index-for-index with the bars consumed so far.
/// Indices before the lookback is satisfied hold nullopt.
class IndicatorSeries {
public:
    std::size_t size() const { return values_.size(); }
    bool defined(std::size_t i) const { return i < values_.size() && values_[i].has_value(); }

    /// nullopt if undefined or not yet computed.
    std::optional<double> value(std::size_t i) const {
        return i < values_.size() ? values_[i] : std::nullopt;
    }

    void push(std::optional<double> v) { values_.push_back(v); }

private:
    std::vector<std::optional<double>> values_;
};

/// Simple moving average over a fixed window, O(1) per update.
struct SmaAccumulator {
    explicit SmaAccumulator(int period) : period(period) {}

    std::optional<double> update(double x);

    int period;
    double sum{0};
    std::deque<double> window;
    std::size_t updates{0};
};

/// Wilder's RSI. Seeds with the mean of the first `period` gains/losses,
/// then smooths avg = (avg * (period - 1) + x) / period.
struct RsiAccumulator {
    explicit RsiAccumulator(int period) : period(period) {}

    std::optional<double> update(double close);

    int period;
    std::optional<double> prev_close;
    int changes{0};
    double gain_sum{0};
    double loss_sum{0};
    double avg_gain{0};
    double avg_loss{0};
};

/// RSI value from average gain/loss. Both zero (flat prices) gives 50.
double rsiFromAverages(double avg_gain, double avg_loss);

/// Owns the indicator series for one run. Advances one bar at a time so a series
/// never holds values for bars the loop has not reached yet.
class IndicatorCache {
public:
    explicit IndicatorCache(const std::vector<Bar>& bars);

    /// Register a spec (idempotent). A spec added after advancing is caught up
    /// by replaying the bars already consumed. Throws InvalidParameters if period < 1.
    const IndicatorSeries& require(const IndicatorSpec& spec);

    /// Consume bars up to and including index i. Throws std::out_of_range past the last bar.
    void advanceTo(std::size_t i);

    /// Number of bars consumed (0 before the first advanceTo()).
    std::size_t consumed() const { return consumed_; }

    bool has(const IndicatorSpec& spec) const { return entries_.count(spec) != 0; }
    const IndicatorSeries& series(const IndicatorSpec& spec) const;
    std::size_t seriesCount() const { return entries_.size(); }

private:
    struct Entry {
        IndicatorSpec spec;
        IndicatorSeries series;
        std::optional<SmaAccumulator> sma;
        std::optional<RsiAccumulator> rsi;

        void consume(const Bar& bar);
    };

    const std::vector<Bar>& bars_;
    std::size_t consumed_{0};
    std::map<IndicatorSpec, Entry> entries_;
};

/// Full-series computation without the cache, for one-off use.
IndicatorSeries computeIndicator(const std::vector<Bar>& bars, const IndicatorSpec& spec);

} // namespace tradebot
