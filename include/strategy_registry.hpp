#pragma once

#include "strategy.hpp"
#include "strategy_params.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tradebot {

struct StrategyInfo {
    std::string name;
    std::string description;
    bool implemented{true};
};

/// Name -> strategy factory. Construction validates parameters eagerly so a bad
/// configuration is rejected before any data is loaded.
class StrategyRegistry {
public:
    using Factory = std::function<std::unique_ptr<IStrategy>(const StrategyParams&, double default_trade_size)>;

    /// Registry with the built-in strategies (sma, rsi, grid, arbitrage).
    static const StrategyRegistry& builtin();

    /// factory may be empty for a declared but unimplemented strategy.
    void add(const StrategyInfo& info, Factory factory);

    /// Throws InvalidParameters for an unknown name or bad params,
    /// StrategyNotImplemented for declared-only strategies.
    std::unique_ptr<IStrategy> create(const std::string& name,
                                      const StrategyParams& params = StrategyParams{},
                                      double default_trade_size = 1.0) const;

    bool contains(const std::string& name) const;
    std::vector<StrategyInfo> available() const;

private:
    struct Entry {
        StrategyInfo info;
        Factory factory;
    };
    std::vector<Entry> entries_;
};

} // namespace tradebot
