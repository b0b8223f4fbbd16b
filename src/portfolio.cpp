#include "portfolio.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace tradebot {

namespace {
    constexpr double POSITION_ZERO_EPS = 1e-9;

    // Rounding tolerance when comparing cash amounts, relative to the amounts involved.
    double cashTolerance(double a, double b) {
        return 1e-9 * std::max(1.0, std::max(std::abs(a), std::abs(b)));
    }

    std::string describe(const Fill& f) {
        std::ostringstream oss;
        oss << sideName(f.side) << " " << f.quantity << " @ " << f.price;
        return oss.str();
    }
}

Portfolio::Portfolio(double initial_cash, PortfolioOptions options)
    : initial_cash_(initial_cash)
    , options_(options)
    , cash_(initial_cash)
{
    if (!(initial_cash >= 0) || !std::isfinite(initial_cash))
        throw InvalidParameters("initial cash must be a finite value >= 0");
}

void Portfolio::applyFill(const std::string& symbol, const Fill& fill) {
    if (!(fill.quantity > 0) || !std::isfinite(fill.quantity))
        throw std::invalid_argument("fill quantity must be positive: " + describe(fill));
    if (!(fill.price > 0) || !std::isfinite(fill.price))
        throw std::invalid_argument("fill price must be positive: " + describe(fill));
    if (!(fill.fee >= 0) || !std::isfinite(fill.fee))
        throw std::invalid_argument("fill fee must be >= 0: " + describe(fill));

    // Work on copies; commit only after every check has passed.
    Position pos = position(symbol);
    double cash = cash_;
    const double q = fill.quantity;
    const double p = fill.price;
    const double notional = q * p;

    if (fill.side == Side::Buy) {
        double cost = notional + fill.fee;
        if (cost > cash + cashTolerance(cost, cash)) {
            std::ostringstream oss;
            oss << "insufficient funds for " << describe(fill) << " " << symbol
                << ": need " << cost << ", have " << cash;
            throw InsufficientFunds(oss.str());
        }
        cash = std::max(0.0, cash - cost);

        if (pos.quantity >= 0) {
            double total = pos.quantity + q;
            pos.average_entry_price = (pos.average_entry_price * pos.quantity + p * q) / total;
            pos.quantity = total;
        } else {
            double close_qty = std::min(q, -pos.quantity);
            pos.realized_pnl += (pos.average_entry_price - p) * close_qty;
            pos.quantity += close_qty;
            double remaining = q - close_qty;
            if (std::abs(pos.quantity) < POSITION_ZERO_EPS) {
                pos.quantity = 0;
                pos.average_entry_price = 0;
            }
            if (remaining > POSITION_ZERO_EPS) {
                pos.quantity = remaining;
                pos.average_entry_price = p;
            }
        }
    } else {
        if (!options_.allow_short && q > pos.quantity + POSITION_ZERO_EPS) {
            std::ostringstream oss;
            oss << "insufficient position for " << describe(fill) << " " << symbol
                << ": holding " << pos.quantity << " and short selling is disabled";
            throw InsufficientPosition(oss.str());
        }
        double proceeds = notional - fill.fee;
        if (cash + proceeds < -cashTolerance(cash, proceeds)) {
            std::ostringstream oss;
            oss << "insufficient funds to pay fee " << fill.fee << " on " << describe(fill) << " " << symbol;
            throw InsufficientFunds(oss.str());
        }
        cash = cash + proceeds;
        if (!options_.allow_short) cash = std::max(0.0, cash);

        if (pos.quantity <= 0) {
            double held = -pos.quantity;
            pos.average_entry_price = (pos.average_entry_price * held + p * q) / (held + q);
            pos.quantity -= q;
        } else {
            double close_qty = std::min(q, pos.quantity);
            pos.realized_pnl += (p - pos.average_entry_price) * close_qty;
            pos.quantity -= close_qty;
            double remaining = q - close_qty;
            if (std::abs(pos.quantity) < POSITION_ZERO_EPS) {
                pos.quantity = 0;
                pos.average_entry_price = 0;
            }
            if (remaining > POSITION_ZERO_EPS) {
                pos.quantity = -remaining;
                pos.average_entry_price = p;
            }
        }
    }
    pos.last_price = p;

    cash_ = cash;
    total_fees_ += fill.fee;
    positions_[symbol] = pos;
}

double Portfolio::quantity(const std::string& symbol) const {
    auto it = positions_.find(symbol);
    return it == positions_.end() ? 0.0 : it->second.quantity;
}

Position Portfolio::position(const std::string& symbol) const {
    auto it = positions_.find(symbol);
    if (it != positions_.end()) return it->second;
    Position flat;
    flat.symbol = symbol;
    return flat;
}

double Portfolio::realizedPnl() const {
    double total = 0;
    for (const auto& kv : positions_) total += kv.second.realized_pnl;
    return total;
}

double Portfolio::markToMarket(const std::string& symbol, double price) const {
    double equity = cash_;
    for (const auto& kv : positions_) {
        const Position& pos = kv.second;
        equity += pos.quantity * (kv.first == symbol ? price : pos.last_price);
    }
    return equity;
}

double Portfolio::unrealizedPnl(const std::string& symbol, double price) const {
    auto it = positions_.find(symbol);
    if (it == positions_.end()) return 0.0;
    return it->second.quantity * (price - it->second.average_entry_price);
}

} // namespace tradebot
