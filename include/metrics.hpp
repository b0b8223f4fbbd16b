#pragma once

#include "order.hpp"
#include "portfolio.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace tradebot {

/// One equity-curve sample: total equity at a bar's close.
struct EquityPoint {
    std::int64_t timestamp{0};
    double equity{0};
};

/// An opening fill paired FIFO with the fill(s) that closed it.
struct RoundTrip {
    std::int64_t entry_time{0};
    std::int64_t exit_time{0};    // time of the fill that closed the last unit
    Side side{Side::Buy};         // Buy = long round trip, Sell = short
    double quantity{0};
    double entry_price{0};
    double exit_price{0};         // quantity-weighted over the closing fills
    double pnl{0};                // net of entry and exit fees allocated by quantity
    double pnl_pct{0};            // pnl / (entry_price * quantity) * 100
};

/// Portion of an opening fill still open after matching.
struct OpenLot {
    std::int64_t entry_time{0};
    Side side{Side::Buy};
    double quantity{0};
    double entry_price{0};
};

struct RoundTripMatch {
    std::vector<RoundTrip> closed;
    std::vector<OpenLot> open;
};

/// Match fills FIFO into round trips. A fill first closes opposite-side lots,
/// oldest first; any remainder opens a new lot.
RoundTripMatch matchRoundTrips(const std::vector<Fill>& fills);

/// Summary statistics of a run. Ratios are fractions (0.25 = 25%).
struct BacktestMetrics {
    double initial_equity{0};
    double final_equity{0};
    double total_return{0};              // final / initial - 1
    double max_drawdown{0};              // largest (peak - equity) / peak
    double sharpe_ratio{0};              // annualized mean/stddev of per-bar returns
    std::size_t num_fills{0};
    std::size_t num_rejected{0};
    std::size_t num_round_trips{0};      // completed round trips only
    std::size_t winning_round_trips{0};
    std::optional<double> win_rate;      // undefined with no round trips
    double avg_round_trip_pnl{0};
    double total_fees{0};
    double open_position{0};             // signed quantity at the end; 0 = flat
    double unrealized_pnl{0};            // mark-to-market P&L on the open position
};

/// final / initial - 1; 0 for an empty curve or zero initial equity.
double totalReturn(double initial_equity, const std::vector<EquityPoint>& curve);

/// max over j of (max_{i<=j} e_i - e_j) / max_{i<=j} e_i. 0 for an empty curve.
double maxDrawdown(const std::vector<EquityPoint>& curve);

/// Sample mean/stddev of bar-to-bar returns scaled by sqrt(periods_per_year).
/// 0 with fewer than two returns or zero variance.
double sharpeRatio(const std::vector<EquityPoint>& curve, double periods_per_year);

/// Profitable / total; nullopt when there are no round trips.
std::optional<double> winRate(const std::vector<RoundTrip>& trips);

/// Metrics derivable from the curve and the fills alone. Callers fill in
/// num_rejected, open_position, unrealized_pnl and total_fees.
BacktestMetrics computeMetrics(double initial_equity,
                               const std::vector<EquityPoint>& curve,
                               const std::vector<Fill>& fills,
                               double periods_per_year);

} // namespace tradebot
