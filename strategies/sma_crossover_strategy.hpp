#pragma once

#include "strategy.hpp"
#include <memory>

namespace tradebot {

/// SMA crossover: BUY on the bar where fast SMA crosses above slow SMA (golden cross),
/// SELL where it crosses below (death cross), HOLD otherwise.
struct SmaParams {
    int fast_period = 10;
    int slow_period = 20;
    double trade_size = 1.0;
};

/// Throws InvalidParameters unless 1 <= fast < slow and trade_size > 0.
std::unique_ptr<IStrategy> createSmaCrossoverStrategy(const SmaParams& params = SmaParams{});

} // namespace tradebot
