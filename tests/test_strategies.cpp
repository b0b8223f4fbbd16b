#include "errors.hpp"
#include "rsi_reversion_strategy.hpp"
#include "sma_crossover_strategy.hpp"
#include "strategy_params.hpp"
#include "strategy_registry.hpp"
#include "test_support.hpp"
#include <functional>
#include <stdexcept>

namespace {

using namespace tradebot;
using namespace tradebot::test;

using StrategyMaker = std::function<std::unique_ptr<IStrategy>()>;

// Signals for bars 0..n-1, driving a fresh strategy and cache the way the engine does.
std::vector<Signal> signalsOver(const StrategyMaker& make, const std::vector<Bar>& bars) {
    auto strat = make();
    IndicatorCache cache(bars);
    for (const auto& spec : strat->indicators()) cache.require(spec);
    std::vector<Signal> out;
    for (std::size_t i = 0; i < bars.size(); ++i) {
        cache.advanceTo(i);
        out.push_back(strat->decide(i, BarHistoryView(bars, i), IndicatorSnapshot(cache, i)));
    }
    return out;
}

std::size_t countType(const std::vector<Signal>& signals, SignalType t) {
    std::size_t n = 0;
    for (const auto& s : signals)
        if (s.type == t) ++n;
    return n;
}

//--- Views: nothing past the current bar is reachable
void run_bar_history_view_bounds() {
    auto bars = barsFromCloses({100, 101, 102, 103});
    BarHistoryView view(bars, 2);
    ASSERT_EQ(view.size(), 3u);
    ASSERT_NEAR(view.current().close, 102, 1e-12);
    ASSERT_NEAR(view[0].close, 100, 1e-12);
    ASSERT_NEAR(view.ago(2).close, 100, 1e-12);
    ASSERT_THROWS(view[3], std::out_of_range);
    ASSERT_THROWS(view.ago(3), std::out_of_range);
    ASSERT_THROWS(BarHistoryView(bars, 4), std::out_of_range);
}

void run_indicator_snapshot_bounds() {
    auto bars = barsFromCloses({1, 2, 3, 4, 5});
    IndicatorCache cache(bars);
    cache.require(smaSpec(2));
    cache.advanceTo(3);
    IndicatorSnapshot snap(cache, 3);
    ASSERT_NEAR(*snap.value(smaSpec(2)), 3.5, 1e-12);
    ASSERT_NEAR(*snap.value(smaSpec(2), 1), 2.5, 1e-12);
    ASSERT_TRUE(!snap.value(smaSpec(2), 3));
    ASSERT_TRUE(!snap.value(smaSpec(2), 9));
    ASSERT_THROWS(snap.value(rsiSpec(14)), std::out_of_range);
}

//--- SMA crossover: golden then death cross on a rise-and-fall series
void run_sma_crossover_signals() {
    std::vector<double> closes;
    for (int i = 0; i < 15; ++i) closes.push_back(100 - i);       // falling
    for (int i = 0; i < 15; ++i) closes.push_back(86 + 2 * i);    // rising
    for (int i = 0; i < 15; ++i) closes.push_back(114 - 2 * i);   // falling again
    auto bars = barsFromCloses(closes);
    SmaParams p;
    p.fast_period = 3;
    p.slow_period = 5;
    p.trade_size = 2.0;
    auto sigs = signalsOver([&] { return createSmaCrossoverStrategy(p); }, bars);

    // First defined bar counts as a cross (fast < slow while falling), then one golden and one death cross.
    ASSERT_EQ(countType(sigs, SignalType::Buy), 1u);
    ASSERT_EQ(countType(sigs, SignalType::Sell), 2u);
    ASSERT_TRUE(sigs[4].type == SignalType::Sell);
    for (std::size_t i = 0; i < 4; ++i) ASSERT_TRUE(sigs[i].type == SignalType::Hold);

    std::size_t buy_at = 0;
    for (std::size_t i = 0; i < sigs.size(); ++i)
        if (sigs[i].type == SignalType::Buy) buy_at = i;
    ASSERT_TRUE(buy_at > 15 && buy_at < 30);
    ASSERT_NEAR(*sigs[buy_at].size, 2.0, 1e-12);
}

//--- RSI reversion: oversold / overbought crosses
void run_rsi_reversion_signals() {
    std::vector<double> closes;
    for (int i = 0; i < 10; ++i) closes.push_back(100 + (i % 2));   // choppy, RSI near 50
    for (int i = 0; i < 10; ++i) closes.push_back(100 - 3 * i);     // sell-off
    for (int i = 0; i < 15; ++i) closes.push_back(73 + 4 * i);      // rally
    auto bars = barsFromCloses(closes);
    RsiParams p;
    p.period = 5;
    auto sigs = signalsOver([&] { return createRsiReversionStrategy(p); }, bars);
    ASSERT_EQ(countType(sigs, SignalType::Buy), 1u);
    ASSERT_EQ(countType(sigs, SignalType::Sell), 1u);

    std::size_t buy_at = 0, sell_at = 0;
    for (std::size_t i = 0; i < sigs.size(); ++i) {
        if (sigs[i].type == SignalType::Buy) buy_at = i;
        if (sigs[i].type == SignalType::Sell) sell_at = i;
    }
    ASSERT_TRUE(buy_at >= 10 && buy_at < 20);
    ASSERT_TRUE(sell_at >= 20);
}

void run_rsi_flat_series_holds() {
    RsiParams p;
    auto sigs = signalsOver([&] { return createRsiReversionStrategy(p); }, flatBars(50, 100));
    ASSERT_EQ(countType(sigs, SignalType::Hold), 50u);
}

//--- The signal at i is unchanged when the feed is cut after bar i
void run_no_look_ahead_by_truncation() {
    auto bars = barsFromCloses(sineCloses(80, 100.0, 10.0, 0.35));
    std::vector<StrategyMaker> makers = {
        [] { SmaParams p; p.fast_period = 3; p.slow_period = 8; return createSmaCrossoverStrategy(p); },
        [] { RsiParams p; p.period = 6; return createRsiReversionStrategy(p); },
    };
    for (const auto& make : makers) {
        auto full = signalsOver(make, bars);
        for (std::size_t i = 0; i < bars.size(); i += 7) {
            std::vector<Bar> cut(bars.begin(), bars.begin() + static_cast<std::ptrdiff_t>(i + 1));
            auto partial = signalsOver(make, cut);
            ASSERT_TRUE(partial.back() == full[i]);
        }
    }
}

void run_strategy_parameter_validation() {
    SmaParams sma;
    sma.fast_period = 20;
    sma.slow_period = 20;
    ASSERT_THROWS(createSmaCrossoverStrategy(sma), InvalidParameters);
    sma.fast_period = 0;
    ASSERT_THROWS(createSmaCrossoverStrategy(sma), InvalidParameters);
    sma.fast_period = 5;
    sma.trade_size = 0;
    ASSERT_THROWS(createSmaCrossoverStrategy(sma), InvalidParameters);

    RsiParams rsi;
    rsi.oversold = 70;
    rsi.overbought = 30;
    ASSERT_THROWS(createRsiReversionStrategy(rsi), InvalidParameters);
    rsi.oversold = 0;
    rsi.overbought = 70;
    ASSERT_THROWS(createRsiReversionStrategy(rsi), InvalidParameters);
    rsi.oversold = 30;
    rsi.overbought = 100;
    ASSERT_THROWS(createRsiReversionStrategy(rsi), InvalidParameters);
    rsi.overbought = 70;
    rsi.period = 0;
    ASSERT_THROWS(createRsiReversionStrategy(rsi), InvalidParameters);
}

//--- "k=v,k=v" parsing
void run_params_parse() {
    auto p = StrategyParams::parse(" fast_period=3 , slow_period = 8,junk,=x,");
    ASSERT_EQ(p.values().size(), 2u);
    ASSERT_EQ(p.getInt("fast_period", 0), 3);
    ASSERT_EQ(p.getInt("slow_period", 0), 8);
    ASSERT_EQ(p.getInt("missing", 42), 42);
    ASSERT_NEAR(p.getDouble("fast_period", 0), 3.0, 1e-12);
    ASSERT_TRUE(p.has("slow_period"));
    ASSERT_TRUE(!p.has("junk"));
    ASSERT_TRUE(StrategyParams::parse("").empty());

    auto bad = StrategyParams::parse("period=abc,size=1.5x");
    ASSERT_THROWS(bad.getInt("period", 0), InvalidParameters);
    ASSERT_THROWS(bad.getDouble("size", 0), InvalidParameters);
    ASSERT_THROWS(bad.requireOnly("rsi", {"period"}), InvalidParameters);
}

//--- Registry: names, eager validation, unimplemented variants
void run_registry_create() {
    const auto& reg = StrategyRegistry::builtin();
    ASSERT_EQ(reg.available().size(), 4u);
    ASSERT_TRUE(reg.contains("sma"));
    ASSERT_TRUE(reg.contains("grid"));
    ASSERT_TRUE(!reg.contains("macd"));

    auto sma = reg.create("sma", StrategyParams::parse("fast_period=3,slow_period=5"), 0.5);
    ASSERT_EQ(sma->name(), std::string("sma"));
    ASSERT_EQ(sma->describeParams(), std::string("fast=3 slow=5 size=0.5"));
    ASSERT_EQ(sma->indicators().size(), 2u);

    auto rsi = reg.create("rsi");
    ASSERT_EQ(rsi->name(), std::string("rsi"));
    ASSERT_TRUE(rsi->indicators()[0] == rsiSpec(14));
}

void run_registry_rejects() {
    const auto& reg = StrategyRegistry::builtin();
    ASSERT_THROWS(reg.create("grid"), StrategyNotImplemented);
    ASSERT_THROWS(reg.create("arbitrage"), StrategyNotImplemented);
    ASSERT_THROWS(reg.create("macd"), InvalidParameters);
    ASSERT_THROWS(reg.create("sma", StrategyParams::parse("fast_period=30,slow_period=5")), InvalidParameters);
    ASSERT_THROWS(reg.create("sma", StrategyParams::parse("fast=3")), InvalidParameters);
    ASSERT_THROWS(reg.create("rsi", StrategyParams::parse("oversold=80")), InvalidParameters);

    try {
        reg.create("macd");
    } catch (const InvalidParameters& e) {
        ASSERT_TRUE(std::string(e.what()).find("sma") != std::string::npos);
    }
}

} // namespace

void run_strategy_tests() {
    RUN_TEST(bar_history_view_bounds);
    RUN_TEST(indicator_snapshot_bounds);
    RUN_TEST(sma_crossover_signals);
    RUN_TEST(rsi_reversion_signals);
    RUN_TEST(rsi_flat_series_holds);
    RUN_TEST(no_look_ahead_by_truncation);
    RUN_TEST(strategy_parameter_validation);
    RUN_TEST(params_parse);
    RUN_TEST(registry_create);
    RUN_TEST(registry_rejects);
}
