#include "backtester.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "time_utils.hpp"
#include <cmath>
#include <sstream>
#include <utility>

namespace tradebot {

BacktestResult::BacktestResult(Data data) : d_(std::move(data)) {
    double periods = periodsPerYear(intervalSeconds(d_.interval).value_or(SECONDS_PER_DAY));
    metrics_ = computeMetrics(d_.initial_cash, d_.equity_curve, d_.fills, periods);
    round_trips_ = matchRoundTrips(d_.fills).closed;
    metrics_.num_rejected = d_.rejected.size();
    metrics_.total_fees = d_.total_fees;

    auto it = d_.final_positions.find(d_.symbol);
    if (it != d_.final_positions.end() && it->second.quantity != 0) {
        metrics_.open_position = it->second.quantity;
        metrics_.unrealized_pnl = it->second.quantity * (d_.last_price - it->second.average_entry_price);
    }
}

Backtester::Backtester(std::unique_ptr<IStrategy> strategy,
                       std::string symbol,
                       std::string interval,
                       BacktestOptions options)
    : strategy_(std::move(strategy))
    , symbol_(std::move(symbol))
    , interval_(std::move(interval))
    , options_(options)
{
    if (!strategy_) throw InvalidParameters("backtester needs a strategy");
    if (!(options_.default_order_size > 0) || !std::isfinite(options_.default_order_size))
        throw InvalidParameters("order size must be > 0");
}

BacktestResult Backtester::run(const std::vector<Bar>& bars, const CancellationToken* cancel) {
    if (bars.empty()) throw InvalidParameters("no bars to backtest " + symbol_ + " on");
    for (std::size_t i = 1; i < bars.size(); ++i) {
        if (bars[i].timestamp <= bars[i - 1].timestamp)
            throw InvalidParameters("bars must have strictly increasing timestamps (index " +
                                    std::to_string(i) + ")");
    }

    // Everything mutable is local to this call: a run shares no state with other runs.
    Portfolio portfolio(options_.initial_cash, options_.portfolio);
    Simulator sim(options_.execution);
    IndicatorCache cache(bars);
    for (const auto& spec : strategy_->indicators()) cache.require(spec);

    BacktestResult::Data d;
    d.symbol = symbol_;
    d.interval = interval_;
    d.strategy_name = strategy_->name();
    d.strategy_params = strategy_->describeParams();
    d.initial_cash = options_.initial_cash;
    d.bars_total = bars.size();
    d.equity_curve.reserve(bars.size());

    Log::debug("backtest " + d.strategy_name + " (" + d.strategy_params + ") on " + symbol_ + ", " +
               std::to_string(bars.size()) + " bars");

    for (std::size_t i = 0; i < bars.size(); ++i) {
        if (cancel && cancel->cancelled()) {
            d.completed = false;
            d.stop_reason = "cancelled";
            Log::info("backtest cancelled after " + std::to_string(i) + " of " + std::to_string(bars.size()) + " bars");
            break;
        }
        const Bar& bar = bars[i];

        // 1. Order from the previous bar fills at this bar's open
        if (auto fill = sim.processOrders(bar, i)) {
            try {
                portfolio.applyFill(symbol_, *fill);
                d.fills.push_back(*fill);
                std::ostringstream oss;
                oss << "fill " << sideName(fill->side) << " " << fill->quantity << " " << symbol_
                    << " @ " << fill->price << " on " << formatTimestamp(fill->timestamp);
                Log::debug(oss.str());
            } catch (const InsufficientFunds& e) {
                d.rejected.push_back({fill->timestamp, i, fill->side, fill->quantity, fill->price, e.what()});
                Log::warn(std::string("order rejected: ") + e.what());
            } catch (const InsufficientPosition& e) {
                d.rejected.push_back({fill->timestamp, i, fill->side, fill->quantity, fill->price, e.what()});
                Log::warn(std::string("order rejected: ") + e.what());
            }
        }

        // 2. Strategy sees bars and indicators up to this bar only
        cache.advanceTo(i);
        BarHistoryView view(bars, i);
        IndicatorSnapshot snapshot(cache, i);
        Signal signal = strategy_->decide(i, view, snapshot);

        if (signal.type != SignalType::Hold) {
            d.signals.push_back({i, bar.timestamp, signal});
            double qty = signal.size.value_or(options_.default_order_size);
            Side side = signal.type == SignalType::Buy ? Side::Buy : Side::Sell;
            if (!(qty > 0) || !std::isfinite(qty)) {
                Log::warn(std::string("ignoring ") + signalName(signal.type) + " signal with invalid size at bar " +
                          std::to_string(i));
            } else if (i + 1 < bars.size()) {
                sim.placeOrder(side, qty);
            } else {
                Log::info(std::string(signalName(signal.type)) + " signal on the last bar discarded (no next bar to fill)");
            }
        }

        // 3. Mark to market at this bar's close
        double equity = portfolio.markToMarket(symbol_, bar.close);
        d.equity_curve.push_back({bar.timestamp, equity});
        d.bars_processed = i + 1;
        d.last_price = bar.close;

        if (equity <= 0) {
            d.completed = false;
            d.stop_reason = "no more equity";
            Log::warn("equity exhausted at " + formatTimestamp(bar.timestamp) + ", stopping");
            break;
        }
    }

    if (auto dropped = sim.discardPending())
        Log::debug(std::string("pending ") + sideName(dropped->side) + " order dropped at end of run");

    d.final_positions = portfolio.positions();
    d.final_cash = portfolio.cash();
    d.total_fees = portfolio.totalFees();
    return BacktestResult(std::move(d));
}

} // namespace tradebot
