#include "sma_crossover_strategy.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <cmath>
#include <memory>
#include <sstream>

namespace tradebot {

class SmaCrossoverStrategy : public IStrategy {
public:
    explicit SmaCrossoverStrategy(const SmaParams& params)
        : p_(params)
        , fast_(smaSpec(params.fast_period))
        , slow_(smaSpec(params.slow_period))
    {}

    std::string name() const override { return "sma"; }

    std::string describeParams() const override {
        std::ostringstream oss;
        oss << "fast=" << p_.fast_period << " slow=" << p_.slow_period << " size=" << p_.trade_size;
        return oss.str();
    }

    std::vector<IndicatorSpec> indicators() const override { return {fast_, slow_}; }

    /// The relation at the previous bar counts as neutral while either SMA was still
    /// undefined there, so the first bar with both defined can already be a cross.
    Signal decide(std::size_t current_index, const BarHistoryView& /*bars*/,
                  const IndicatorSnapshot& ind) override {
        auto fast = ind.value(fast_);
        auto slow = ind.value(slow_);
        if (!fast || !slow) return Signal::hold();

        auto prev_fast = ind.value(fast_, 1);
        auto prev_slow = ind.value(slow_, 1);
        const bool prev_known = prev_fast && prev_slow;
        const bool was_above = prev_known && *prev_fast > *prev_slow;
        const bool was_below = prev_known && *prev_fast < *prev_slow;

        if (*fast > *slow && !was_above) {
            Log::debug("golden cross at bar " + std::to_string(current_index));
            return Signal::buy(p_.trade_size, (*fast - *slow) / *slow);
        }
        if (*fast < *slow && !was_below) {
            Log::debug("death cross at bar " + std::to_string(current_index));
            return Signal::sell(p_.trade_size, (*slow - *fast) / *slow);
        }
        return Signal::hold();
    }

private:
    SmaParams p_;
    IndicatorSpec fast_;
    IndicatorSpec slow_;
};

std::unique_ptr<IStrategy> createSmaCrossoverStrategy(const SmaParams& params) {
    if (params.fast_period < 1 || params.slow_period < 1)
        throw InvalidParameters("sma: fast_period and slow_period must be >= 1");
    if (params.fast_period >= params.slow_period)
        throw InvalidParameters("sma: fast_period (" + std::to_string(params.fast_period) +
                                ") must be less than slow_period (" + std::to_string(params.slow_period) + ")");
    if (!(params.trade_size > 0) || !std::isfinite(params.trade_size))
        throw InvalidParameters("sma: trade_size must be > 0");
    return std::make_unique<SmaCrossoverStrategy>(params);
}

} // namespace tradebot
