#pragma once

#include "bar.hpp"
#include "data_source.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tradebot {

/// How missing intervals between consecutive bars are handled.
enum class GapPolicy {
    Fail,         // throw DataGap
    ForwardFill,  // insert flat bars at the previous close, volume 0
    Keep          // leave gaps, only count them
};

/// Parses "fail", "fill" or "keep".
std::optional<GapPolicy> parseGapPolicy(const std::string& text);
const char* gapPolicyName(GapPolicy policy);

struct BarFeedOptions {
    GapPolicy gap_policy{GapPolicy::ForwardFill};
    bool strict{false};  // abort the load on the first malformed bar
};

/// Counters from the last load(), for logging and tests.
struct BarFeedStats {
    std::size_t raw{0};
    std::size_t malformed{0};
    std::size_t out_of_range{0};
    std::size_t duplicates{0};
    std::size_t aggregated{0};   // source bars merged into coarser bars
    std::size_t gaps{0};         // number of gaps found
    std::size_t filled{0};       // bars inserted by forward-fill
};

/// Returns a reason string if the bar violates the OHLC invariants, nullopt if it is valid.
std::optional<std::string> validateBar(const Bar& bar);

/// Produces the ordered, deduplicated, validated bar sequence a backtest runs on.
class BarFeed {
public:
    explicit BarFeed(const IBarSource& source, BarFeedOptions options = BarFeedOptions{});

    /// Bars for symbol in [start, end] at the given interval, strictly increasing timestamps.
    /// Source rows are kept only when their interval bucket starts inside the window.
    /// Throws InvalidParameters (unknown interval), MalformedBar (strict mode),
    /// DataGap (GapPolicy::Fail) and DataUnavailable (nothing left).
    std::vector<Bar> load(const std::string& symbol, const std::string& interval,
                          std::int64_t start, std::int64_t end);

    const BarFeedStats& stats() const { return stats_; }
    const BarFeedOptions& options() const { return options_; }

    /// Merge bars into interval_seconds buckets (open=first, high=max, low=min, close=last, volume=sum).
    /// Input must be sorted; bucket timestamp is the bucket start.
    static std::vector<Bar> aggregate(const std::vector<Bar>& bars, std::int64_t interval_seconds);

private:
    const IBarSource& source_;
    BarFeedOptions options_;
    BarFeedStats stats_;

    std::vector<Bar> applyGapPolicy(const std::vector<Bar>& bars, std::int64_t interval_seconds);
};

} // namespace tradebot
