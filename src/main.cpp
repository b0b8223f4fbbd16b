#include "backtester.hpp"
#include "bar_feed.hpp"
#include "cli.hpp"
#include "data_source.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "report.hpp"
#include "strategy_params.hpp"
#include "strategy_registry.hpp"
#include "time_utils.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

namespace fs = std::filesystem;

namespace {

using namespace tradebot;

constexpr int EXIT_FATAL = 1;
constexpr int EXIT_USAGE = 2;

//-----------------------------------------------------------------------------
// list: strategies and descriptions
//-----------------------------------------------------------------------------
int runList() {
    std::cout << "Available strategies:\n";
    for (const auto& info : StrategyRegistry::builtin().available()) {
        std::cout << "  " << std::left << std::setw(12) << info.name << info.description;
        if (!info.implemented) std::cout << " [not implemented]";
        std::cout << "\n";
    }
    return 0;
}

//-----------------------------------------------------------------------------
// live: only validates the strategy; no exchange connectivity in this build
//-----------------------------------------------------------------------------
int runLive(const Config& cfg) {
    StrategyRegistry::builtin().create(cfg.strategy_name, StrategyParams::parse(cfg.params), cfg.trade_size);
    std::cerr << "Error: live/paper trading is unavailable (strategy '" << cfg.strategy_name
              << "' on " << cfg.symbol << " " << cfg.interval << ")\n";
    return EXIT_FATAL;
}

//-----------------------------------------------------------------------------
// backtest: validate strategy, load bars, run, report, write files
//-----------------------------------------------------------------------------
int runBacktest(const Config& cfg) {
    // Strategy first so bad names/params fail before any data is read.
    auto strategy = StrategyRegistry::builtin().create(
        cfg.strategy_name, StrategyParams::parse(cfg.params), cfg.trade_size);

    // Resolve default data path when running from build/
    std::string data_path = defaultDataPath(cfg);
    if (cfg.data_path.empty() && !fs::is_regular_file(data_path) && fs::is_regular_file("../" + data_path))
        data_path = "../" + data_path;
    CsvDataSource source(data_path);

    std::int64_t end = 0;
    if (!cfg.end.empty()) {
        end = *parseTimestamp(cfg.end);
    } else {
        auto latest = source.latestTimestamp(cfg.symbol);
        if (!latest)
            throw DataUnavailable("no bars for " + cfg.symbol + " in " + source.path());
        end = *latest;
    }
    const std::int64_t start = end - static_cast<std::int64_t>(cfg.days) * SECONDS_PER_DAY;
    Log::info("Loading " + cfg.symbol + " " + cfg.interval + " bars " + formatTimestamp(start) +
              " -> " + formatTimestamp(end) + " from " + source.path());

    BarFeedOptions feed_opts;
    feed_opts.gap_policy = cfg.gap_policy;
    feed_opts.strict = cfg.strict;
    BarFeed feed(source, feed_opts);
    std::vector<Bar> bars = feed.load(cfg.symbol, cfg.interval, start, end);
    const auto& st = feed.stats();
    Log::debug("Feed: raw=" + std::to_string(st.raw) + " malformed=" + std::to_string(st.malformed) +
               " duplicates=" + std::to_string(st.duplicates) + " gaps=" + std::to_string(st.gaps) +
               " filled=" + std::to_string(st.filled) + " bars=" + std::to_string(bars.size()));

    BacktestOptions opts;
    opts.initial_cash = cfg.initial_cash;
    opts.default_order_size = cfg.trade_size;
    opts.execution.commission = cfg.commission;
    opts.execution.fee_rate = cfg.fee_rate;
    opts.execution.slippage = cfg.slippage;
    opts.portfolio.allow_short = cfg.allow_short;

    Backtester bt(std::move(strategy), cfg.symbol, cfg.interval, opts);
    BacktestResult result = bt.run(bars);

    Report report(result);
    report.printSummary(std::cout);

    int rc = 0;
    if (!cfg.output_path.empty()) {
        if (report.writeResultJson(cfg.output_path))
            std::cout << "Result written to " << cfg.output_path << "\n";
        else
            rc = EXIT_FATAL;
    }
    if (!cfg.reports_dir.empty()) {
        if (report.writeAll(cfg.reports_dir))
            std::cout << "Reports written to " << cfg.reports_dir << "/\n";
        else
            rc = EXIT_FATAL;
    }
    return rc;
}

} // namespace

//-----------------------------------------------------------------------------
// main
//-----------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    Config cfg;
    std::string error_msg;
    if (!parseArgs(argc, argv, cfg, error_msg)) {
        std::cerr << error_msg << "\n\n";
        printUsage(std::cerr);
        return EXIT_USAGE;
    }
    if (cfg.command == Command::Help) {
        printUsage(std::cout);
        return 0;
    }
    if (!validateConfig(cfg, error_msg)) {
        std::cerr << "Error: " << error_msg << "\n";
        return EXIT_FATAL;
    }
    if (cfg.verbose) Log::setLevel(LogLevel::Debug);

    try {
        switch (cfg.command) {
            case Command::List: return runList();
            case Command::Live: return runLive(cfg);
            case Command::Backtest: return runBacktest(cfg);
            default: break;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_FATAL;
    }
    printUsage(std::cerr);
    return EXIT_USAGE;
}
