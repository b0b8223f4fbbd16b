#pragma once

namespace tradebot {

enum class Side { Buy, Sell };

inline const char* sideName(Side side) { return side == Side::Buy ? "buy" : "sell"; }

enum class OrderType { Market };

/// Market order decided on one bar and filled at the next bar's open.
struct Order {
    Side side{Side::Buy};
    double quantity{0};
    OrderType type{OrderType::Market};
};

} // namespace tradebot
