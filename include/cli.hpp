#pragma once

#include "bar_feed.hpp"
#include <ostream>
#include <string>

namespace tradebot {

enum class Command { None, Help, List, Backtest, Live };

/// All CLI and run options in one place.
struct Config {
    Command command{Command::None};

    std::string symbol;
    std::string strategy_name = "sma";
    std::string interval = "15m";
    int days = 30;
    std::string params;               // "k=v,k=v"
    double initial_cash = 100000.0;
    double trade_size = 1.0;          // default order size when the strategy gives none
    std::string data_path;            // empty: data/<SYMBOL>_<interval>.csv
    std::string end;                  // empty: latest bar in the source

    double commission = 0.0;
    double fee_rate = 0.0;
    double slippage = 0.0;
    bool allow_short = false;
    bool strict = false;
    GapPolicy gap_policy = GapPolicy::ForwardFill;

    std::string output_path;          // JSON result
    std::string reports_dir;          // CSV + text reports
    bool verbose = false;
};

/// Fills cfg from argv. Returns false and sets error_msg on a usage error
/// (unknown command or flag, missing value, missing --symbol).
bool parseArgs(int argc, char* argv[], Config& cfg, std::string& error_msg);

/// Returns false and sets error_msg if a value is out of range.
bool validateConfig(const Config& cfg, std::string& error_msg);

/// Data file used when --data is absent.
std::string defaultDataPath(const Config& cfg);

void printUsage(std::ostream& out);

} // namespace tradebot
