#include "simulator.hpp"
#include "errors.hpp"
#include <cmath>

namespace tradebot {

Simulator::Simulator(ExecutionOptions options) : options_(options) {
    if (!(options.commission >= 0) || !std::isfinite(options.commission))
        throw InvalidParameters("commission must be >= 0");
    if (!(options.fee_rate >= 0 && options.fee_rate < 1))
        throw InvalidParameters("fee rate must be in [0, 1)");
    if (!(options.slippage >= 0 && options.slippage < 1))
        throw InvalidParameters("slippage must be in [0, 1)");
}

void Simulator::placeOrder(Side side, double quantity) {
    if (!(quantity > 0)) return;
    pending_order_.side = side;
    pending_order_.quantity = quantity;
    pending_order_.type = OrderType::Market;
    has_pending_ = true;
}

double Simulator::fillPrice(Side side, double open) const {
    return side == Side::Buy ? open * (1.0 + options_.slippage) : open * (1.0 - options_.slippage);
}

double Simulator::feeFor(double quantity, double price) const {
    return options_.commission + options_.fee_rate * quantity * price;
}

std::optional<Fill> Simulator::processOrders(const Bar& bar, std::size_t bar_index) {
    if (!has_pending_) return std::nullopt;
    has_pending_ = false;

    Fill f;
    f.timestamp = bar.timestamp;
    f.side = pending_order_.side;
    f.quantity = pending_order_.quantity;
    f.price = fillPrice(f.side, bar.open);  // next bar open, never the decision bar's close
    f.fee = feeFor(f.quantity, f.price);
    f.bar_index = bar_index;
    return f;
}

std::optional<Order> Simulator::discardPending() {
    if (!has_pending_) return std::nullopt;
    has_pending_ = false;
    return pending_order_;
}

} // namespace tradebot
