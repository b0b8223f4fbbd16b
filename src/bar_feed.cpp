#include "bar_feed.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "time_utils.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace tradebot {

namespace {

std::int64_t bucketStart(std::int64_t ts, std::int64_t interval_seconds) {
    std::int64_t q = ts / interval_seconds;
    if (ts % interval_seconds < 0) --q;
    return q * interval_seconds;
}

} // namespace

std::optional<GapPolicy> parseGapPolicy(const std::string& text) {
    if (text == "fail") return GapPolicy::Fail;
    if (text == "fill") return GapPolicy::ForwardFill;
    if (text == "keep") return GapPolicy::Keep;
    return std::nullopt;
}

const char* gapPolicyName(GapPolicy policy) {
    switch (policy) {
        case GapPolicy::Fail: return "fail";
        case GapPolicy::ForwardFill: return "fill";
        case GapPolicy::Keep: return "keep";
    }
    return "";
}

std::optional<std::string> validateBar(const Bar& b) {
    if (!std::isfinite(b.open) || !std::isfinite(b.high) || !std::isfinite(b.low) ||
        !std::isfinite(b.close) || !std::isfinite(b.volume))
        return std::string("non-finite field");
    if (b.open <= 0 || b.high <= 0 || b.low <= 0 || b.close <= 0)
        return std::string("non-positive price");
    if (b.volume < 0) return std::string("negative volume");
    if (b.high < b.low) return std::string("high below low");
    if (b.high < b.open || b.high < b.close) return std::string("high below open/close");
    if (b.low > b.open || b.low > b.close) return std::string("low above open/close");
    return std::nullopt;
}

BarFeed::BarFeed(const IBarSource& source, BarFeedOptions options)
    : source_(source), options_(options) {}

std::vector<Bar> BarFeed::load(const std::string& symbol, const std::string& interval,
                               std::int64_t start, std::int64_t end) {
    stats_ = BarFeedStats{};
    auto ivl = intervalSeconds(interval);
    if (!ivl) throw InvalidParameters("unknown interval '" + interval + "'");
    if (start > end) throw InvalidParameters("bar range start is after end");

    BarRequest req;
    req.symbol = symbol;
    req.interval = interval;
    req.start = start;
    req.end = end;
    std::vector<SourceBar> raw = source_.fetch(req);
    stats_.raw = raw.size();

    std::vector<Bar> bars;
    bars.reserve(raw.size());
    for (const auto& sb : raw) {
        std::optional<std::string> reason;
        if (!sb.timestamp_valid) reason = std::string("unparseable timestamp");
        else reason = validateBar(sb.bar);

        if (reason) {
            std::string msg = "malformed bar at " + sb.origin + ": " + *reason;
            if (options_.strict) throw MalformedBar(msg);
            Log::warn(msg + " (dropped)");
            ++stats_.malformed;
            continue;
        }
        // The window applies to the bar each source row lands in, so a
        // bucket cut by start is dropped whole instead of built partially.
        const std::int64_t bucket = bucketStart(sb.bar.timestamp, *ivl);
        if (bucket < start || bucket > end) {
            ++stats_.out_of_range;
            continue;
        }
        bars.push_back(sb.bar);
    }

    std::stable_sort(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        return a.timestamp < b.timestamp;
    });

    // First occurrence of a timestamp wins.
    std::vector<Bar> unique;
    unique.reserve(bars.size());
    for (const Bar& b : bars) {
        if (!unique.empty() && unique.back().timestamp == b.timestamp) {
            Log::warn("duplicate bar at " + formatTimestamp(b.timestamp) + " (dropped)");
            ++stats_.duplicates;
            continue;
        }
        unique.push_back(b);
    }

    std::vector<Bar> resampled = aggregate(unique, *ivl);
    stats_.aggregated = unique.size() - resampled.size();
    if (stats_.aggregated > 0)
        Log::info("aggregated " + std::to_string(unique.size()) + " source bars into " +
                  std::to_string(resampled.size()) + " " + interval + " bars");

    std::vector<Bar> result = applyGapPolicy(resampled, *ivl);

    if (result.empty()) {
        std::ostringstream oss;
        oss << "no bars for " << symbol << " (" << interval << ")";
        if (start != std::numeric_limits<std::int64_t>::min() && end != std::numeric_limits<std::int64_t>::max())
            oss << " between " << formatTimestamp(start) << " and " << formatTimestamp(end);
        throw DataUnavailable(oss.str());
    }

    if (stats_.malformed > 0)
        Log::warn("dropped " + std::to_string(stats_.malformed) + " malformed bar(s) for " + symbol);
    Log::debug("loaded " + std::to_string(result.size()) + " bars for " + symbol + " from " +
               formatTimestamp(result.front().timestamp) + " to " + formatTimestamp(result.back().timestamp));
    return result;
}

std::vector<Bar> BarFeed::aggregate(const std::vector<Bar>& bars, std::int64_t interval_seconds) {
    std::vector<Bar> out;
    if (interval_seconds <= 0) return bars;
    for (const Bar& b : bars) {
        const std::int64_t bucket = bucketStart(b.timestamp, interval_seconds);
        if (out.empty() || out.back().timestamp != bucket) {
            Bar agg = b;
            agg.timestamp = bucket;
            out.push_back(agg);
        } else {
            Bar& agg = out.back();
            if (b.high > agg.high) agg.high = b.high;
            if (b.low < agg.low) agg.low = b.low;
            agg.close = b.close;
            agg.volume += b.volume;
        }
    }
    return out;
}

std::vector<Bar> BarFeed::applyGapPolicy(const std::vector<Bar>& bars, std::int64_t interval_seconds) {
    std::vector<Bar> out;
    out.reserve(bars.size());
    for (const Bar& b : bars) {
        if (!out.empty()) {
            const Bar& prev = out.back();
            std::int64_t missing = (b.timestamp - prev.timestamp) / interval_seconds - 1;
            if (missing > 0) {
                ++stats_.gaps;
                if (options_.gap_policy == GapPolicy::Fail) {
                    throw DataGap("gap of " + std::to_string(missing) + " bar(s) between " +
                                  formatTimestamp(prev.timestamp) + " and " + formatTimestamp(b.timestamp));
                }
                if (options_.gap_policy == GapPolicy::ForwardFill) {
                    const double px = prev.close;
                    const std::int64_t from = prev.timestamp;
                    for (std::int64_t k = 1; k <= missing; ++k) {
                        Bar fill;
                        fill.timestamp = from + k * interval_seconds;
                        fill.open = fill.high = fill.low = fill.close = px;
                        fill.volume = 0;
                        out.push_back(fill);
                        ++stats_.filled;
                    }
                }
            }
        }
        out.push_back(b);
    }
    if (stats_.gaps > 0) {
        if (options_.gap_policy == GapPolicy::ForwardFill)
            Log::info("forward-filled " + std::to_string(stats_.filled) + " bar(s) across " +
                      std::to_string(stats_.gaps) + " gap(s)");
        else
            Log::warn("kept " + std::to_string(stats_.gaps) + " gap(s) in bar sequence");
    }
    return out;
}

} // namespace tradebot
