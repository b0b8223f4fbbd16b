#pragma once

#include "bar.hpp"
#include "indicators.hpp"
#include "metrics.hpp"
#include "portfolio.hpp"
#include "simulator.hpp"
#include "strategy.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tradebot {

/// Cooperative stop request, checked once per bar. Safe to set from another thread.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool cancelled() const { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

struct BacktestOptions {
    double initial_cash = 100000.0;
    double default_order_size = 1.0;   // used when a signal carries no size
    ExecutionOptions execution;
    PortfolioOptions portfolio;
};

/// A fill the ledger refused (InsufficientFunds / InsufficientPosition).
struct RejectedOrder {
    std::int64_t timestamp{0};
    std::size_t bar_index{0};
    Side side{Side::Buy};
    double quantity{0};
    double price{0};
    std::string reason;
};

/// Non-HOLD signal emitted by the strategy.
struct SignalRecord {
    std::size_t bar_index{0};
    std::int64_t timestamp{0};
    Signal signal;
};

/// Immutable outcome of one run. Metrics are computed once, at construction.
class BacktestResult {
public:
    struct Data {
        std::string symbol;
        std::string interval;
        std::string strategy_name;
        std::string strategy_params;
        double initial_cash{0};
        std::size_t bars_total{0};
        std::size_t bars_processed{0};
        double last_price{0};              // close of the last processed bar
        std::vector<EquityPoint> equity_curve;
        std::vector<Fill> fills;
        std::vector<RejectedOrder> rejected;
        std::vector<SignalRecord> signals;
        std::map<std::string, Position> final_positions;
        double final_cash{0};
        double total_fees{0};
        bool completed{true};              // false if cancelled or stopped early
        std::string stop_reason;
    };

    explicit BacktestResult(Data data);

    const std::string& symbol() const { return d_.symbol; }
    const std::string& interval() const { return d_.interval; }
    const std::string& strategyName() const { return d_.strategy_name; }
    const std::string& strategyParams() const { return d_.strategy_params; }
    double initialCash() const { return d_.initial_cash; }
    std::size_t barsTotal() const { return d_.bars_total; }
    std::size_t barsProcessed() const { return d_.bars_processed; }
    double lastPrice() const { return d_.last_price; }
    const std::vector<EquityPoint>& equityCurve() const { return d_.equity_curve; }
    const std::vector<Fill>& fills() const { return d_.fills; }
    const std::vector<RejectedOrder>& rejected() const { return d_.rejected; }
    const std::vector<SignalRecord>& signals() const { return d_.signals; }
    const std::map<std::string, Position>& finalPositions() const { return d_.final_positions; }
    double finalCash() const { return d_.final_cash; }
    bool completed() const { return d_.completed; }
    const std::string& stopReason() const { return d_.stop_reason; }

    const BacktestMetrics& metrics() const { return metrics_; }
    const std::vector<RoundTrip>& roundTrips() const { return round_trips_; }

private:
    Data d_;
    BacktestMetrics metrics_;
    std::vector<RoundTrip> round_trips_;
};

/// Drives one backtest: feeds bars to the strategy in order, fills its orders at
/// the next bar's open, keeps the ledger and records the equity curve.
/// One instance per run; runs share nothing, so separate instances may run on separate threads.
class Backtester {
public:
    Backtester(std::unique_ptr<IStrategy> strategy,
               std::string symbol,
               std::string interval,
               BacktestOptions options = BacktestOptions{});

    /// Run over bars (strictly increasing timestamps, as produced by BarFeed).
    /// Throws InvalidParameters if bars are empty or out of order. If cancel is set
    /// mid-run, returns the consistent partial result up to the last finished bar.
    BacktestResult run(const std::vector<Bar>& bars, const CancellationToken* cancel = nullptr);

    const IStrategy& strategy() const { return *strategy_; }
    const BacktestOptions& options() const { return options_; }

private:
    std::unique_ptr<IStrategy> strategy_;
    std::string symbol_;
    std::string interval_;
    BacktestOptions options_;
};

} // namespace tradebot
