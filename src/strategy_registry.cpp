#include "strategy_registry.hpp"
#include "errors.hpp"
#include "rsi_reversion_strategy.hpp"
#include "sma_crossover_strategy.hpp"

namespace tradebot {

namespace {

std::unique_ptr<IStrategy> makeSma(const StrategyParams& params, double default_trade_size) {
    params.requireOnly("sma", {"fast_period", "slow_period", "trade_size"});
    SmaParams p;
    p.fast_period = params.getInt("fast_period", p.fast_period);
    p.slow_period = params.getInt("slow_period", p.slow_period);
    p.trade_size = params.getDouble("trade_size", default_trade_size);
    return createSmaCrossoverStrategy(p);
}

std::unique_ptr<IStrategy> makeRsi(const StrategyParams& params, double default_trade_size) {
    params.requireOnly("rsi", {"period", "oversold", "overbought", "trade_size"});
    RsiParams p;
    p.period = params.getInt("period", p.period);
    p.oversold = params.getDouble("oversold", p.oversold);
    p.overbought = params.getDouble("overbought", p.overbought);
    p.trade_size = params.getDouble("trade_size", default_trade_size);
    return createRsiReversionStrategy(p);
}

StrategyRegistry makeBuiltin() {
    StrategyRegistry r;
    r.add({"sma", "Simple moving average crossover (golden/death cross)", true}, makeSma);
    r.add({"rsi", "RSI mean reversion (Wilder RSI oversold/overbought crosses)", true}, makeRsi);
    r.add({"grid", "Grid trading (planned)", false}, nullptr);
    r.add({"arbitrage", "Cross-venue arbitrage (planned)", false}, nullptr);
    return r;
}

} // namespace

const StrategyRegistry& StrategyRegistry::builtin() {
    static const StrategyRegistry registry = makeBuiltin();
    return registry;
}

void StrategyRegistry::add(const StrategyInfo& info, Factory factory) {
    for (auto& e : entries_) {
        if (e.info.name == info.name) {
            e.info = info;
            e.factory = std::move(factory);
            return;
        }
    }
    entries_.push_back({info, std::move(factory)});
}

std::unique_ptr<IStrategy> StrategyRegistry::create(const std::string& name,
                                                    const StrategyParams& params,
                                                    double default_trade_size) const {
    for (const auto& e : entries_) {
        if (e.info.name != name) continue;
        if (!e.info.implemented || !e.factory)
            throw StrategyNotImplemented("strategy '" + name + "' is not implemented yet");
        return e.factory(params, default_trade_size);
    }
    std::string names;
    for (const auto& e : entries_) names += (names.empty() ? "" : ", ") + e.info.name;
    throw InvalidParameters("unknown strategy '" + name + "' (available: " + names + ")");
}

bool StrategyRegistry::contains(const std::string& name) const {
    for (const auto& e : entries_)
        if (e.info.name == name) return true;
    return false;
}

std::vector<StrategyInfo> StrategyRegistry::available() const {
    std::vector<StrategyInfo> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.info);
    return out;
}

} // namespace tradebot
