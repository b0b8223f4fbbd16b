#include "metrics.hpp"
#include <algorithm>
#include <cmath>
#include <deque>
#include <numeric>

namespace tradebot {

namespace {

constexpr double QTY_EPS = 1e-9;

struct Lot {
    std::int64_t entry_time{0};
    Side side{Side::Buy};
    double original_qty{0};
    double remaining{0};
    double entry_price{0};
    double fee_per_unit{0};
    double exit_notional{0};   // sum of closing qty * price
    double exit_fees{0};
    std::int64_t last_exit_time{0};
};

RoundTrip toRoundTrip(const Lot& lot) {
    RoundTrip t;
    t.entry_time = lot.entry_time;
    t.exit_time = lot.last_exit_time;
    t.side = lot.side;
    t.quantity = lot.original_qty;
    t.entry_price = lot.entry_price;
    t.exit_price = lot.exit_notional / lot.original_qty;
    double entry_notional = lot.entry_price * lot.original_qty;
    double gross = lot.side == Side::Buy ? lot.exit_notional - entry_notional
                                         : entry_notional - lot.exit_notional;
    t.pnl = gross - lot.fee_per_unit * lot.original_qty - lot.exit_fees;
    t.pnl_pct = entry_notional != 0 ? t.pnl / entry_notional * 100.0 : 0;
    return t;
}

} // namespace

RoundTripMatch matchRoundTrips(const std::vector<Fill>& fills) {
    RoundTripMatch out;
    std::deque<Lot> lots;  // all lots share one side at any time

    for (const Fill& f : fills) {
        double qty = f.quantity;
        const double fee_per_unit = f.quantity > 0 ? f.fee / f.quantity : 0;

        while (qty > QTY_EPS && !lots.empty() && lots.front().side != f.side) {
            Lot& lot = lots.front();
            double close_qty = std::min(qty, lot.remaining);
            lot.remaining -= close_qty;
            lot.exit_notional += close_qty * f.price;
            lot.exit_fees += close_qty * fee_per_unit;
            lot.last_exit_time = f.timestamp;
            qty -= close_qty;
            if (lot.remaining <= QTY_EPS) {
                out.closed.push_back(toRoundTrip(lot));
                lots.pop_front();
            }
        }

        if (qty > QTY_EPS) {
            Lot lot;
            lot.entry_time = f.timestamp;
            lot.side = f.side;
            lot.original_qty = qty;
            lot.remaining = qty;
            lot.entry_price = f.price;
            lot.fee_per_unit = fee_per_unit;
            lots.push_back(lot);
        }
    }

    for (const Lot& lot : lots)
        out.open.push_back({lot.entry_time, lot.side, lot.remaining, lot.entry_price});
    return out;
}

double totalReturn(double initial_equity, const std::vector<EquityPoint>& curve) {
    if (curve.empty() || initial_equity == 0) return 0;
    return curve.back().equity / initial_equity - 1.0;
}

double maxDrawdown(const std::vector<EquityPoint>& curve) {
    if (curve.empty()) return 0;
    double peak = curve[0].equity;
    double max_dd = 0;
    for (const auto& p : curve) {
        if (p.equity > peak) peak = p.equity;
        double dd = (peak > 0) ? (peak - p.equity) / peak : 0;
        if (dd > max_dd) max_dd = dd;
    }
    return max_dd;
}

double sharpeRatio(const std::vector<EquityPoint>& curve, double periods_per_year) {
    if (curve.size() < 3) return 0;
    std::vector<double> returns;
    returns.reserve(curve.size() - 1);
    for (std::size_t i = 1; i < curve.size(); ++i) {
        if (curve[i - 1].equity != 0)
            returns.push_back((curve[i].equity - curve[i - 1].equity) / curve[i - 1].equity);
        else
            returns.push_back(0);
    }
    double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / static_cast<double>(returns.size());
    double sq_sum = 0;
    for (double r : returns) sq_sum += (r - mean) * (r - mean);
    double stddev = std::sqrt(sq_sum / static_cast<double>(returns.size() - 1));
    return (stddev > 0) ? (mean / stddev) * std::sqrt(periods_per_year) : 0;
}

std::optional<double> winRate(const std::vector<RoundTrip>& trips) {
    if (trips.empty()) return std::nullopt;
    std::size_t wins = 0;
    for (const auto& t : trips)
        if (t.pnl > 0) ++wins;
    return static_cast<double>(wins) / static_cast<double>(trips.size());
}

BacktestMetrics computeMetrics(double initial_equity,
                               const std::vector<EquityPoint>& curve,
                               const std::vector<Fill>& fills,
                               double periods_per_year) {
    BacktestMetrics m;
    m.initial_equity = initial_equity;
    m.final_equity = curve.empty() ? initial_equity : curve.back().equity;
    m.total_return = totalReturn(initial_equity, curve);
    m.max_drawdown = maxDrawdown(curve);
    m.sharpe_ratio = sharpeRatio(curve, periods_per_year);
    m.num_fills = fills.size();

    RoundTripMatch match = matchRoundTrips(fills);
    m.num_round_trips = match.closed.size();
    double total_pnl = 0;
    for (const auto& t : match.closed) {
        if (t.pnl > 0) ++m.winning_round_trips;
        total_pnl += t.pnl;
    }
    m.win_rate = winRate(match.closed);
    m.avg_round_trip_pnl = m.num_round_trips > 0 ? total_pnl / static_cast<double>(m.num_round_trips) : 0;
    return m;
}

} // namespace tradebot
