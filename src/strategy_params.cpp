#include "strategy_params.hpp"
#include "errors.hpp"
#include <sstream>
#include <stdexcept>

namespace tradebot {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

StrategyParams StrategyParams::parse(const std::string& text) {
    StrategyParams p;
    std::istringstream iss(text);
    std::string pair;
    while (std::getline(iss, pair, ',')) {
        auto eq = pair.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(pair.substr(0, eq));
        if (key.empty()) continue;
        p.values_[key] = trim(pair.substr(eq + 1));
    }
    return p;
}

int StrategyParams::getInt(const std::string& key, int fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) return fallback;
    try {
        std::size_t pos = 0;
        int v = std::stoi(it->second, &pos);
        if (pos != it->second.size()) throw std::invalid_argument("");
        return v;
    } catch (const std::logic_error&) {
        throw InvalidParameters("parameter " + key + "=\"" + it->second + "\" is not an integer");
    }
}

double StrategyParams::getDouble(const std::string& key, double fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) return fallback;
    try {
        std::size_t pos = 0;
        double v = std::stod(it->second, &pos);
        if (pos != it->second.size()) throw std::invalid_argument("");
        return v;
    } catch (const std::logic_error&) {
        throw InvalidParameters("parameter " + key + "=\"" + it->second + "\" is not a number");
    }
}

void StrategyParams::requireOnly(const std::string& strategy, const std::set<std::string>& accepted) const {
    for (const auto& kv : values_) {
        if (accepted.count(kv.first)) continue;
        std::string list;
        for (const auto& a : accepted) list += (list.empty() ? "" : ", ") + a;
        throw InvalidParameters("unknown parameter '" + kv.first + "' for strategy " + strategy +
                                " (accepted: " + list + ")");
    }
}

} // namespace tradebot
