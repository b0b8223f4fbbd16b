#include "strategy.hpp"
#include <stdexcept>

namespace tradebot {

BarHistoryView::BarHistoryView(const std::vector<Bar>& bars, std::size_t current_index)
    : bars_(&bars), current_(current_index) {
    if (current_index >= bars.size())
        throw std::out_of_range("BarHistoryView: current index " + std::to_string(current_index) +
                                " out of range (" + std::to_string(bars.size()) + " bars)");
}

const Bar& BarHistoryView::operator[](std::size_t i) const {
    if (i > current_)
        throw std::out_of_range("look-ahead: bar " + std::to_string(i) +
                                " requested at index " + std::to_string(current_));
    return (*bars_)[i];
}

const Bar& BarHistoryView::ago(std::size_t k) const {
    if (k > current_)
        throw std::out_of_range("BarHistoryView::ago: " + std::to_string(k) +
                                " bars before index " + std::to_string(current_));
    return (*bars_)[current_ - k];
}

IndicatorSnapshot::IndicatorSnapshot(const IndicatorCache& cache, std::size_t current_index)
    : cache_(&cache), current_(current_index) {}

std::optional<double> IndicatorSnapshot::value(const IndicatorSpec& spec, std::size_t ago) const {
    const IndicatorSeries& s = cache_->series(spec);
    if (ago > current_) return std::nullopt;
    return s.value(current_ - ago);
}

} // namespace tradebot
