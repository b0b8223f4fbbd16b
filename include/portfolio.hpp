#pragma once

#include "order.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace tradebot {

/// Executed trade. quantity and price are positive; side gives the direction.
struct Fill {
    std::int64_t timestamp{0};
    double quantity{0};
    double price{0};
    Side side{Side::Buy};
    double fee{0};              // absolute, in cash units
    std::size_t bar_index{0};   // bar whose open it filled at
};

/// Net holding in one symbol: positive = long, negative = short, 0 = flat.
struct Position {
    std::string symbol;
    double quantity{0};
    double average_entry_price{0};
    double realized_pnl{0};     // gross of fees
    double last_price{0};       // price of the last fill
};

struct PortfolioOptions {
    bool allow_short{false};
};

/// Cash and positions for one run. Fills are applied all-or-nothing:
/// a rejected fill leaves every field exactly as it was.
class Portfolio {
public:
    explicit Portfolio(double initial_cash, PortfolioOptions options = PortfolioOptions{});

    /// Throws std::invalid_argument for a non-positive/non-finite quantity or price or a
    /// negative fee, InsufficientFunds if a buy would overdraw cash, and
    /// InsufficientPosition if a sell would go short with short selling disabled.
    void applyFill(const std::string& symbol, const Fill& fill);

    double cash() const { return cash_; }
    double initialCash() const { return initial_cash_; }
    double totalFees() const { return total_fees_; }
    const PortfolioOptions& options() const { return options_; }

    /// Quantity held in symbol (0 if never traded).
    double quantity(const std::string& symbol) const;
    /// Copy of the position (flat, empty symbol-only position if never traded).
    Position position(const std::string& symbol) const;
    const std::map<std::string, Position>& positions() const { return positions_; }

    /// Realized P&L across all symbols, gross of fees.
    double realizedPnl() const;

    /// cash + positions, valuing `symbol` at price and others at their last fill price.
    double markToMarket(const std::string& symbol, double price) const;

    /// Open P&L of the position in symbol at price.
    double unrealizedPnl(const std::string& symbol, double price) const;

private:
    double initial_cash_;
    PortfolioOptions options_;
    double cash_;
    double total_fees_{0};
    std::map<std::string, Position> positions_;
};

} // namespace tradebot
