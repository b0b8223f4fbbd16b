#include "cli.hpp"
#include "data_source.hpp"
#include "time_utils.hpp"
#include <cmath>
#include <stdexcept>

namespace tradebot {

namespace {

// Safe parse: on failure set error_msg and return false.
bool parseDouble(const char* s, double& out, std::string& error_msg, const std::string& flag) {
    try {
        std::size_t pos = 0;
        out = std::stod(s, &pos);
        if (s[pos] != '\0') throw std::invalid_argument(s);
        return true;
    } catch (const std::logic_error&) {
        error_msg = "Invalid value for " + flag + ": \"" + s + "\" (expected number)";
        return false;
    }
}

bool parseInt(const char* s, int& out, std::string& error_msg, const std::string& flag) {
    try {
        std::size_t pos = 0;
        out = std::stoi(s, &pos);
        if (s[pos] != '\0') throw std::invalid_argument(s);
        return true;
    } catch (const std::logic_error&) {
        error_msg = "Invalid value for " + flag + ": \"" + s + "\" (expected integer)";
        return false;
    }
}

bool parseCommand(const std::string& word, Command& out) {
    if (word == "list") out = Command::List;
    else if (word == "backtest") out = Command::Backtest;
    else if (word == "live") out = Command::Live;
    else if (word == "help" || word == "--help" || word == "-h") out = Command::Help;
    else return false;
    return true;
}

} // namespace

bool parseArgs(int argc, char* argv[], Config& cfg, std::string& error_msg) {
    if (argc < 2) {
        error_msg = "Missing command (expected list, backtest or live)";
        return false;
    }
    if (!parseCommand(argv[1], cfg.command)) {
        error_msg = std::string("Unknown command: ") + argv[1];
        return false;
    }
    if (cfg.command == Command::Help) return true;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        const char* value = nullptr;
        auto next = [&]() {
            if (i + 1 >= argc) {
                error_msg = "Missing value for " + arg;
                return false;
            }
            value = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") { cfg.command = Command::Help; return true; }
        else if (arg == "--verbose" || arg == "-v") { cfg.verbose = true; }
        else if (arg == "--symbol") { if (!next()) return false; cfg.symbol = value; }
        else if (arg == "--strategy" || arg == "-s") { if (!next()) return false; cfg.strategy_name = value; }
        else if (arg == "--interval" || arg == "-i") { if (!next()) return false; cfg.interval = value; }
        else if (arg == "--days" || arg == "-d") { if (!next() || !parseInt(value, cfg.days, error_msg, arg)) return false; }
        else if (arg == "--params" || arg == "-p") { if (!next()) return false; cfg.params = value; }
        else if (arg == "--capital" || arg == "-c") { if (!next() || !parseDouble(value, cfg.initial_cash, error_msg, arg)) return false; }
        else if (arg == "--size") { if (!next() || !parseDouble(value, cfg.trade_size, error_msg, arg)) return false; }
        else if (arg == "--data") { if (!next()) return false; cfg.data_path = value; }
        else if (arg == "--end") { if (!next()) return false; cfg.end = value; }
        else if (arg == "--commission") { if (!next() || !parseDouble(value, cfg.commission, error_msg, arg)) return false; }
        else if (arg == "--fee-rate") { if (!next() || !parseDouble(value, cfg.fee_rate, error_msg, arg)) return false; }
        else if (arg == "--slippage") { if (!next() || !parseDouble(value, cfg.slippage, error_msg, arg)) return false; }
        else if (arg == "--allow-short") { cfg.allow_short = true; }
        else if (arg == "--strict") { cfg.strict = true; }
        else if (arg == "--gap-policy") {
            if (!next()) return false;
            auto policy = parseGapPolicy(value);
            if (!policy) {
                error_msg = std::string("Invalid value for --gap-policy: \"") + value + "\" (expected fail, fill or keep)";
                return false;
            }
            cfg.gap_policy = *policy;
        }
        else if (arg == "--output" || arg == "-o") { if (!next()) return false; cfg.output_path = value; }
        else if (arg == "--reports-dir") { if (!next()) return false; cfg.reports_dir = value; }
        else {
            error_msg = "Unknown option: " + arg;
            return false;
        }
    }

    if ((cfg.command == Command::Backtest || cfg.command == Command::Live) && cfg.symbol.empty()) {
        error_msg = "Missing required option --symbol";
        return false;
    }
    return true;
}

bool validateConfig(const Config& cfg, std::string& error_msg) {
    if (cfg.command != Command::Backtest && cfg.command != Command::Live) return true;
    if (!isValidSymbol(cfg.symbol)) {
        error_msg = "Invalid value for --symbol: \"" + cfg.symbol + "\" (expected BASE-QUOTE, e.g. ETH-USDC)";
        return false;
    }
    if (!intervalSeconds(cfg.interval)) {
        error_msg = "Unsupported interval (--interval): " + cfg.interval;
        return false;
    }
    if (cfg.command == Command::Live) return true;
    if (cfg.days < 1) { error_msg = "--days must be >= 1"; return false; }
    if (!std::isfinite(cfg.initial_cash) || cfg.initial_cash <= 0) { error_msg = "initial capital (--capital) must be > 0"; return false; }
    if (!std::isfinite(cfg.trade_size) || cfg.trade_size <= 0) { error_msg = "--size must be > 0"; return false; }
    if (!std::isfinite(cfg.commission) || cfg.commission < 0) { error_msg = "commission (--commission) must be >= 0"; return false; }
    if (!std::isfinite(cfg.fee_rate) || cfg.fee_rate < 0 || cfg.fee_rate >= 1) { error_msg = "--fee-rate must be in [0, 1)"; return false; }
    if (!std::isfinite(cfg.slippage) || cfg.slippage < 0 || cfg.slippage >= 1) { error_msg = "--slippage must be in [0, 1)"; return false; }
    if (!cfg.end.empty() && !parseTimestamp(cfg.end)) {
        error_msg = "Invalid value for --end: \"" + cfg.end + "\" (expected date or timestamp)";
        return false;
    }
    return true;
}

std::string defaultDataPath(const Config& cfg) {
    if (!cfg.data_path.empty()) return cfg.data_path;
    return "data/" + cfg.symbol + "_" + cfg.interval + ".csv";
}

void printUsage(std::ostream& out) {
    out << "Usage:\n"
        << "  tradebot list\n"
        << "  tradebot backtest --symbol <SYM> [options]\n"
        << "  tradebot live --symbol <SYM> [--strategy <name>] [--interval <dur>]\n"
        << "\n"
        << "Backtest options:\n"
        << "  -s, --strategy <name>     strategy (default sma; see 'tradebot list')\n"
        << "  -i, --interval <dur>      bar interval: 1s 1m 5m 15m 30m 1h 4h 1d (default 15m)\n"
        << "  -d, --days <n>            days of history (default 30)\n"
        << "  -p, --params k=v,...      strategy parameters\n"
        << "  -c, --capital <cash>      initial capital (default 100000)\n"
        << "      --size <qty>          order size when the strategy sets none (default 1)\n"
        << "      --data <csv>          bar file (default data/<SYM>_<interval>.csv)\n"
        << "      --end <timestamp>     end of the window (default latest bar)\n"
        << "      --commission <abs>    fixed fee per fill\n"
        << "      --fee-rate <frac>     fee as a fraction of notional\n"
        << "      --slippage <frac>     fill price adjustment against the order\n"
        << "      --allow-short         permit sells beyond the held quantity\n"
        << "      --strict              fail on the first malformed bar\n"
        << "      --gap-policy <p>      fail | fill | keep (default fill)\n"
        << "  -o, --output <json>       write the full result as JSON\n"
        << "      --reports-dir <dir>   write trades/fills/equity CSVs and report.txt\n"
        << "  -v, --verbose             debug logging\n";
}

} // namespace tradebot
