#pragma once

#include <cstdint>

namespace tradebot {

/// Single OHLCV bar. timestamp is the bar open time in UTC epoch seconds.
struct Bar {
    std::int64_t timestamp{0};
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double volume{0};
};

} // namespace tradebot
