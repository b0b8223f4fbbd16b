#pragma once

#include "bar.hpp"
#include "order.hpp"
#include "portfolio.hpp"
#include <cstddef>
#include <optional>

namespace tradebot {

/// Fill model settings. All zero: fills at the exact open with no fees.
struct ExecutionOptions {
    double commission{0};   // fixed fee per fill, cash units
    double fee_rate{0};     // fraction of notional, e.g. 0.001 = 0.1%
    double slippage{0};     // fraction of price; buys fill at open*(1+s), sells at open*(1-s)
};

/// Simulates market order execution.
/// Orders placed while bar N is current are filled at bar N+1 open (avoids look-ahead).
/// At most one order can be pending at a time: placing a new order overwrites any previous pending order.
class Simulator {
public:
    explicit Simulator(ExecutionOptions options = ExecutionOptions{});

    /// Queue a market order for the next bar. Non-positive quantities are ignored.
    void placeOrder(Side side, double quantity);

    /// Fill the pending order at this bar's open (with slippage and fees), clearing it.
    /// nullopt if nothing was pending.
    std::optional<Fill> processOrders(const Bar& bar, std::size_t bar_index);

    /// Drop the pending order (end of data); returns it if there was one.
    std::optional<Order> discardPending();

    bool hasPending() const { return has_pending_; }
    const ExecutionOptions& options() const { return options_; }

    double fillPrice(Side side, double open) const;
    double feeFor(double quantity, double price) const;

private:
    ExecutionOptions options_;
    Order pending_order_;
    bool has_pending_{false};
};

} // namespace tradebot
