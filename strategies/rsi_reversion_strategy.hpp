#pragma once

#include "strategy.hpp"
#include <memory>

namespace tradebot {

/// RSI mean reversion (Wilder's RSI): BUY when RSI crosses below `oversold`,
/// SELL when it crosses above `overbought`, HOLD otherwise.
struct RsiParams {
    int period = 14;
    double oversold = 30.0;
    double overbought = 70.0;
    double trade_size = 1.0;
};

/// Throws InvalidParameters unless period >= 1, 0 < oversold < overbought < 100 and trade_size > 0.
std::unique_ptr<IStrategy> createRsiReversionStrategy(const RsiParams& params = RsiParams{});

} // namespace tradebot
