#include "indicators.hpp"
#include "errors.hpp"
#include <numeric>
#include <stdexcept>

namespace tradebot {

namespace {
    // Re-sum the SMA window this often so running-sum rounding error stays bounded.
    constexpr std::size_t SMA_RESYNC_INTERVAL = 1024;
}

std::string IndicatorSpec::label() const {
    return std::string(kind == IndicatorKind::Sma ? "SMA(" : "RSI(") + std::to_string(period) + ")";
}

std::optional<double> SmaAccumulator::update(double x) {
    window.push_back(x);
    sum += x;
    if (window.size() > static_cast<std::size_t>(period)) {
        sum -= window.front();
        window.pop_front();
    }
    if (window.size() < static_cast<std::size_t>(period)) return std::nullopt;

    if (++updates % SMA_RESYNC_INTERVAL == 0)
        sum = std::accumulate(window.begin(), window.end(), 0.0);
    return sum / period;
}

double rsiFromAverages(double avg_gain, double avg_loss) {
    if (avg_loss == 0) return avg_gain == 0 ? 50.0 : 100.0;
    double rs = avg_gain / avg_loss;
    return 100.0 - 100.0 / (1.0 + rs);
}

std::optional<double> RsiAccumulator::update(double close) {
    if (!prev_close) {
        prev_close = close;
        return std::nullopt;
    }
    double change = close - *prev_close;
    prev_close = close;
    double gain = change > 0 ? change : 0.0;
    double loss = change < 0 ? -change : 0.0;
    ++changes;

    if (changes < period) {
        gain_sum += gain;
        loss_sum += loss;
        return std::nullopt;
    }
    if (changes == period) {
        avg_gain = (gain_sum + gain) / period;
        avg_loss = (loss_sum + loss) / period;
    } else {
        avg_gain = (avg_gain * (period - 1) + gain) / period;
        avg_loss = (avg_loss * (period - 1) + loss) / period;
    }
    return rsiFromAverages(avg_gain, avg_loss);
}

void IndicatorCache::Entry::consume(const Bar& bar) {
    if (sma) series.push(sma->update(bar.close));
    else series.push(rsi->update(bar.close));
}

IndicatorCache::IndicatorCache(const std::vector<Bar>& bars) : bars_(bars) {}

const IndicatorSeries& IndicatorCache::require(const IndicatorSpec& spec) {
    auto it = entries_.find(spec);
    if (it != entries_.end()) return it->second.series;

    if (spec.period < 1)
        throw InvalidParameters(spec.label() + ": period must be >= 1");

    Entry e;
    e.spec = spec;
    if (spec.kind == IndicatorKind::Sma) e.sma.emplace(spec.period);
    else e.rsi.emplace(spec.period);
    for (std::size_t i = 0; i < consumed_; ++i) e.consume(bars_[i]);

    auto inserted = entries_.emplace(spec, std::move(e));
    return inserted.first->second.series;
}

void IndicatorCache::advanceTo(std::size_t i) {
    if (i >= bars_.size())
        throw std::out_of_range("IndicatorCache::advanceTo: index " + std::to_string(i) +
                                " past last bar " + std::to_string(bars_.size()));
    while (consumed_ <= i) {
        for (auto& kv : entries_) kv.second.consume(bars_[consumed_]);
        ++consumed_;
    }
}

const IndicatorSeries& IndicatorCache::series(const IndicatorSpec& spec) const {
    auto it = entries_.find(spec);
    if (it == entries_.end())
        throw std::out_of_range("indicator " + spec.label() + " was not registered");
    return it->second.series;
}

IndicatorSeries computeIndicator(const std::vector<Bar>& bars, const IndicatorSpec& spec) {
    IndicatorCache cache(bars);
    cache.require(spec);
    if (!bars.empty()) cache.advanceTo(bars.size() - 1);
    return cache.series(spec);
}

} // namespace tradebot
