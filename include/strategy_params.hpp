#pragma once

#include <map>
#include <set>
#include <string>

namespace tradebot {

/// Strategy parameters from a "key=value,key=value" string.
/// Values stay strings until a strategy reads them with the type it expects.
class StrategyParams {
public:
    StrategyParams() = default;

    /// Whitespace around keys and values is trimmed; pairs without '=' are ignored.
    static StrategyParams parse(const std::string& text);

    bool has(const std::string& key) const { return values_.count(key) != 0; }
    bool empty() const { return values_.empty(); }
    const std::map<std::string, std::string>& values() const { return values_; }

    /// Typed getters: fallback when absent, InvalidParameters when present but malformed.
    int getInt(const std::string& key, int fallback) const;
    double getDouble(const std::string& key, double fallback) const;

    /// Throws InvalidParameters naming the first key not in `accepted`.
    void requireOnly(const std::string& strategy, const std::set<std::string>& accepted) const;

private:
    std::map<std::string, std::string> values_;
};

} // namespace tradebot
