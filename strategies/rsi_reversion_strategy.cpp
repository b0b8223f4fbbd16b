#include "rsi_reversion_strategy.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <cmath>
#include <memory>
#include <sstream>

namespace tradebot {

class RsiReversionStrategy : public IStrategy {
public:
    explicit RsiReversionStrategy(const RsiParams& params)
        : p_(params), rsi_(rsiSpec(params.period)) {}

    std::string name() const override { return "rsi"; }

    std::string describeParams() const override {
        std::ostringstream oss;
        oss << "period=" << p_.period << " oversold=" << p_.oversold
            << " overbought=" << p_.overbought << " size=" << p_.trade_size;
        return oss.str();
    }

    std::vector<IndicatorSpec> indicators() const override { return {rsi_}; }

    Signal decide(std::size_t current_index, const BarHistoryView& /*bars*/,
                  const IndicatorSnapshot& ind) override {
        auto rsi = ind.value(rsi_);
        if (!rsi) return Signal::hold();
        // First defined value: treat the prior bar as inside the band.
        auto prev = ind.value(rsi_, 1);
        const bool was_oversold = prev && *prev < p_.oversold;
        const bool was_overbought = prev && *prev > p_.overbought;

        if (*rsi < p_.oversold && !was_oversold) {
            Log::debug("RSI " + std::to_string(*rsi) + " crossed below " + std::to_string(p_.oversold) +
                       " at bar " + std::to_string(current_index));
            return Signal::buy(p_.trade_size, (p_.oversold - *rsi) / p_.oversold);
        }
        if (*rsi > p_.overbought && !was_overbought) {
            Log::debug("RSI " + std::to_string(*rsi) + " crossed above " + std::to_string(p_.overbought) +
                       " at bar " + std::to_string(current_index));
            return Signal::sell(p_.trade_size, (*rsi - p_.overbought) / (100.0 - p_.overbought));
        }
        return Signal::hold();
    }

private:
    RsiParams p_;
    IndicatorSpec rsi_;
};

std::unique_ptr<IStrategy> createRsiReversionStrategy(const RsiParams& params) {
    if (params.period < 1)
        throw InvalidParameters("rsi: period must be >= 1");
    if (!(params.oversold > 0 && params.oversold < params.overbought && params.overbought < 100))
        throw InvalidParameters("rsi: thresholds must satisfy 0 < oversold < overbought < 100 (got oversold=" +
                                std::to_string(params.oversold) + ", overbought=" +
                                std::to_string(params.overbought) + ")");
    if (!(params.trade_size > 0) || !std::isfinite(params.trade_size))
        throw InvalidParameters("rsi: trade_size must be > 0");
    return std::make_unique<RsiReversionStrategy>(params);
}

} // namespace tradebot
