#include "backtester.hpp"
#include "errors.hpp"
#include "report.hpp"
#include "rsi_reversion_strategy.hpp"
#include "sma_crossover_strategy.hpp"
#include "test_support.hpp"
#include <map>
#include <sstream>

namespace {

using namespace tradebot;
using namespace tradebot::test;

const std::string SYM = "ETH-USDC";

/// Emits fixed signals at fixed bar indices; optionally cancels a token while deciding.
class ScriptedStrategy : public IStrategy {
public:
    explicit ScriptedStrategy(std::map<std::size_t, Signal> script,
                              CancellationToken* cancel = nullptr, std::size_t cancel_at = 0)
        : script_(std::move(script)), cancel_(cancel), cancel_at_(cancel_at) {}

    std::string name() const override { return "scripted"; }

    Signal decide(std::size_t current_index, const BarHistoryView&, const IndicatorSnapshot&) override {
        if (cancel_ && current_index == cancel_at_) cancel_->cancel();
        auto it = script_.find(current_index);
        return it == script_.end() ? Signal::hold() : it->second;
    }

private:
    std::map<std::size_t, Signal> script_;
    CancellationToken* cancel_;
    std::size_t cancel_at_;
};

std::unique_ptr<IStrategy> scripted(std::map<std::size_t, Signal> script) {
    return std::make_unique<ScriptedStrategy>(std::move(script));
}

std::vector<Bar> rampBars() {
    std::vector<double> closes;
    for (int i = 0; i < 30; ++i) closes.push_back(100.0 + i * 30.0 / 29.0);
    return barsFromCloses(closes, 900);
}

//--- Rising prices, SMA(3,5): one BUY, one fill at the next open, equity ends higher
void run_ramp_sma_single_buy() {
    auto bars = rampBars();
    SmaParams p;
    p.fast_period = 3;
    p.slow_period = 5;
    Backtester bt(createSmaCrossoverStrategy(p), SYM, "15m");
    auto result = bt.run(bars);

    ASSERT_TRUE(result.completed());
    ASSERT_EQ(result.signals().size(), 1u);
    ASSERT_TRUE(result.signals()[0].signal.type == SignalType::Buy);
    const std::size_t decided = result.signals()[0].bar_index;
    ASSERT_EQ(result.fills().size(), 1u);
    const Fill& f = result.fills()[0];
    ASSERT_EQ(f.bar_index, decided + 1);
    ASSERT_EQ(f.timestamp, bars[decided + 1].timestamp);
    ASSERT_NEAR(f.price, bars[decided + 1].open, 1e-12);
    ASSERT_TRUE(f.side == Side::Buy);

    ASSERT_EQ(result.equityCurve().size(), bars.size());
    ASSERT_TRUE(result.metrics().final_equity > 100000.0);
    ASSERT_NEAR(result.metrics().open_position, 1.0, 1e-12);
    ASSERT_NEAR(result.metrics().unrealized_pnl, bars.back().close - f.price, 1e-9);
    ASSERT_TRUE(!result.metrics().win_rate);
}

//--- Constant price, RSI(14, 30, 70): no trades, flat equity
void run_flat_rsi_no_trades() {
    auto bars = flatBars(60, 100.0, 900);
    Backtester bt(createRsiReversionStrategy(RsiParams{}), SYM, "15m");
    auto result = bt.run(bars);
    ASSERT_EQ(result.fills().size(), 0u);
    ASSERT_EQ(result.signals().size(), 0u);
    ASSERT_EQ(result.equityCurve().size(), bars.size());
    for (const auto& p : result.equityCurve()) ASSERT_EQ(p.equity, 100000.0);
    ASSERT_NEAR(result.metrics().total_return, 0.0, 1e-15);
    ASSERT_NEAR(result.metrics().max_drawdown, 0.0, 1e-15);
}

//--- SELL while flat with shorting off: rejected, no fill, equity untouched
void run_sell_without_position_rejected() {
    auto bars = barsFromCloses({100, 101, 102, 103, 104});
    Backtester bt(scripted({{1, Signal::sell(1.0)}}), SYM, "1m");
    auto result = bt.run(bars);
    ASSERT_EQ(result.fills().size(), 0u);
    ASSERT_EQ(result.rejected().size(), 1u);
    ASSERT_EQ(result.rejected()[0].bar_index, 2u);
    ASSERT_TRUE(result.rejected()[0].side == Side::Sell);
    ASSERT_EQ(result.metrics().num_rejected, 1u);
    for (const auto& p : result.equityCurve()) ASSERT_EQ(p.equity, 100000.0);
}

void run_buy_beyond_cash_rejected() {
    auto bars = barsFromCloses({100, 101, 102});
    BacktestOptions opts;
    opts.initial_cash = 1000.0;
    Backtester bt(scripted({{0, Signal::buy(50.0)}}), SYM, "1m", opts);
    auto result = bt.run(bars);
    ASSERT_EQ(result.fills().size(), 0u);
    ASSERT_EQ(result.rejected().size(), 1u);
    ASSERT_TRUE(result.rejected()[0].reason.find("insufficient funds") != std::string::npos);
    ASSERT_NEAR(result.finalCash(), 1000.0, 1e-12);
}

//--- A signal on the last bar has no next open: dropped, no fill
void run_last_bar_signal_discarded() {
    auto bars = barsFromCloses({100, 101, 102});
    Backtester bt(scripted({{2, Signal::buy()}}), SYM, "1m");
    auto result = bt.run(bars);
    ASSERT_EQ(result.signals().size(), 1u);
    ASSERT_EQ(result.fills().size(), 0u);
    ASSERT_TRUE(result.completed());
}

//--- A signal without a size trades the default order size
void run_default_order_size() {
    auto bars = barsFromCloses({100, 101, 102, 103});
    BacktestOptions opts;
    opts.default_order_size = 3.0;
    Backtester bt(scripted({{0, Signal::buy()}, {1, Signal::sell(1.0)}}), SYM, "1m", opts);
    auto result = bt.run(bars);
    ASSERT_EQ(result.fills().size(), 2u);
    ASSERT_NEAR(result.fills()[0].quantity, 3.0, 1e-12);
    ASSERT_NEAR(result.fills()[1].quantity, 1.0, 1e-12);
    ASSERT_EQ(result.roundTrips().size(), 0u);  // partial close only
    auto pos = result.finalPositions().at(SYM);
    ASSERT_NEAR(pos.quantity, 2.0, 1e-12);
}

//--- Fees and slippage move the fill price and the cash
void run_fees_and_slippage() {
    auto bars = barsFromCloses({100, 101, 102});
    BacktestOptions opts;
    opts.execution.commission = 1.0;
    opts.execution.fee_rate = 0.001;
    opts.execution.slippage = 0.01;
    Backtester bt(scripted({{0, Signal::buy(2.0)}}), SYM, "1m", opts);
    auto result = bt.run(bars);
    ASSERT_EQ(result.fills().size(), 1u);
    const double price = bars[1].open * 1.01;
    const double fee = 1.0 + 0.001 * 2.0 * price;
    ASSERT_NEAR(result.fills()[0].price, price, 1e-9);
    ASSERT_NEAR(result.fills()[0].fee, fee, 1e-9);
    ASSERT_NEAR(result.finalCash(), 100000.0 - 2.0 * price - fee, 1e-9);
    ASSERT_NEAR(result.metrics().total_fees, fee, 1e-12);
}

//--- Same inputs twice: byte-identical serialized results
void run_deterministic_runs() {
    auto bars = barsFromCloses(sineCloses(400, 100.0, 12.0, 0.11), 900);
    std::string out[2];
    for (auto& text : out) {
        SmaParams p;
        p.fast_period = 5;
        p.slow_period = 12;
        BacktestOptions opts;
        opts.execution.fee_rate = 0.001;
        Backtester bt(createSmaCrossoverStrategy(p), SYM, "15m", opts);
        auto result = bt.run(bars);
        std::ostringstream oss;
        Report(result).writeResultJson(oss);
        text = oss.str();
    }
    ASSERT_TRUE(!out[0].empty());
    ASSERT_TRUE(out[0] == out[1]);
}

//--- Cancellation mid-run returns the bars finished so far
void run_cancellation_partial_result() {
    auto bars = barsFromCloses(sineCloses(50));
    CancellationToken token;
    Backtester bt(std::make_unique<ScriptedStrategy>(std::map<std::size_t, Signal>{{2, Signal::buy(1.0)}},
                                                     &token, 5),
                  SYM, "1m");
    auto result = bt.run(bars, &token);
    ASSERT_TRUE(!result.completed());
    ASSERT_EQ(result.stopReason(), std::string("cancelled"));
    ASSERT_EQ(result.barsProcessed(), 6u);
    ASSERT_EQ(result.barsTotal(), 50u);
    ASSERT_EQ(result.equityCurve().size(), 6u);
    ASSERT_EQ(result.fills().size(), 1u);
    ASSERT_NEAR(result.metrics().final_equity, result.equityCurve().back().equity, 1e-12);

    CancellationToken before;
    before.cancel();
    Backtester idle(scripted({}), SYM, "1m");
    auto empty = idle.run(bars, &before);
    ASSERT_EQ(empty.barsProcessed(), 0u);
    ASSERT_TRUE(empty.equityCurve().empty());
    ASSERT_NEAR(empty.metrics().final_equity, 100000.0, 1e-12);
}

//--- Short position blown up by a rally: run stops when equity reaches zero
void run_stops_when_equity_exhausted() {
    std::vector<Bar> bars = {
        makeBar(T0, 10, 10, 10, 10),
        makeBar(T0 + 60, 10, 10, 10, 10),
        makeBar(T0 + 120, 10, 25, 10, 25),
        makeBar(T0 + 180, 25, 26, 24, 25),
    };
    BacktestOptions opts;
    opts.initial_cash = 1000.0;
    opts.portfolio.allow_short = true;
    Backtester bt(scripted({{0, Signal::sell(100.0)}}), SYM, "1m", opts);
    auto result = bt.run(bars);
    ASSERT_TRUE(!result.completed());
    ASSERT_EQ(result.stopReason(), std::string("no more equity"));
    ASSERT_EQ(result.barsProcessed(), 3u);
    ASSERT_NEAR(result.equityCurve().back().equity, 2000.0 - 2500.0, 1e-9);
}

void run_backtester_rejects_bad_input() {
    Backtester bt(scripted({}), SYM, "1m");
    ASSERT_THROWS(bt.run({}), InvalidParameters);
    auto bars = barsFromCloses({100, 101});
    bars[1].timestamp = bars[0].timestamp;
    ASSERT_THROWS(bt.run(bars), InvalidParameters);

    ASSERT_THROWS(Backtester(nullptr, SYM, "1m"), InvalidParameters);
    BacktestOptions opts;
    opts.default_order_size = 0;
    ASSERT_THROWS(Backtester(scripted({}), SYM, "1m", opts), InvalidParameters);
}

} // namespace

void run_backtester_tests() {
    RUN_TEST(ramp_sma_single_buy);
    RUN_TEST(flat_rsi_no_trades);
    RUN_TEST(sell_without_position_rejected);
    RUN_TEST(buy_beyond_cash_rejected);
    RUN_TEST(last_bar_signal_discarded);
    RUN_TEST(default_order_size);
    RUN_TEST(fees_and_slippage);
    RUN_TEST(deterministic_runs);
    RUN_TEST(cancellation_partial_result);
    RUN_TEST(stops_when_equity_exhausted);
    RUN_TEST(backtester_rejects_bad_input);
}
