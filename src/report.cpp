#include "report.hpp"
#include "log.hpp"
#include "time_utils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace tradebot {

namespace {

constexpr int JSON_PRECISION = std::numeric_limits<double>::max_digits10;

void writeCsvQuoted(std::ostream& out, const std::string& s) {
    out << '"';
    for (char c : s) {
        if (c == '"') out << "\"\"";
        else out << c;
    }
    out << '"';
}

void writeJsonString(std::ostream& out, const std::string& s) {
    out << '"';
    for (char c : s) {
        if (c == '"') out << "\\\"";
        else if (c == '\\') out << "\\\\";
        else if (c == '\n') out << "\\n";
        else if (c == '\r') out << "\\r";
        else if (c == '\t') out << "\\t";
        else if (static_cast<unsigned char>(c) < 0x20) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
            out << buf;
        }
        else out << c;
    }
    out << '"';
}

// JSON has no NaN/Infinity literals.
void writeJsonNumber(std::ostream& out, double v) {
    if (std::isfinite(v)) out << v;
    else out << "null";
}

std::string pct(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << fraction * 100.0 << "%";
    return oss.str();
}

bool openForWrite(std::ofstream& f, const std::string& filepath) {
    f.open(filepath);
    if (!f) {
        Log::error("Failed to open for writing: " + filepath);
        return false;
    }
    return true;
}

} // namespace

Report::Report(const BacktestResult& result) : result_(result) {}

void Report::printBody(std::ostream& out) const {
    const auto& m = result_.metrics();
    if (!result_.completed())
        out << "*** Backtest stopped: " << result_.stopReason() << " ***\n\n";
    out << "Strategy:        " << result_.strategyName();
    if (!result_.strategyParams().empty()) out << " (" << result_.strategyParams() << ")";
    out << "\n";
    out << "Symbol:          " << result_.symbol() << " (" << result_.interval() << ")\n";
    out << "Bars processed:  " << result_.barsProcessed() << " / " << result_.barsTotal() << "\n";
    if (!result_.equityCurve().empty()) {
        out << "Period:          " << formatTimestamp(result_.equityCurve().front().timestamp)
            << " -> " << formatTimestamp(result_.equityCurve().back().timestamp) << "\n";
    }
    out << std::fixed << std::setprecision(2);
    out << "Initial equity:  " << m.initial_equity << "\n";
    out << "Final equity:    " << m.final_equity << "\n";
    out << "Total return:    " << pct(m.total_return) << "\n";
    out << "Max drawdown:    " << pct(std::min(m.max_drawdown, 1.0)) << "\n";
    out << "Sharpe ratio:    " << std::setprecision(3) << m.sharpe_ratio << "\n";
    out << std::setprecision(2);
    out << "Fills:           " << m.num_fills << "\n";
    out << "Rejected orders: " << m.num_rejected << "\n";
    out << "Round trips:     " << m.num_round_trips << "\n";
    out << "Winning trips:   " << m.winning_round_trips << "\n";
    out << "Win rate:        " << (m.win_rate ? pct(*m.win_rate) : std::string("n/a")) << "\n";
    out << "Avg trip P&L:    " << m.avg_round_trip_pnl << "\n";
    out << "Fees paid:       " << m.total_fees << "\n";
    if (std::abs(m.open_position) >= 1e-9) {
        out << "Open position:   " << m.open_position
            << (m.open_position > 0 ? " (long)" : " (short)") << "\n";
        out << "Unrealized P&L:  " << m.unrealized_pnl << "\n";
    }
}

void Report::printSummary(std::ostream& out) const {
    std::ios::fmtflags flags(out.flags());
    std::streamsize prec = out.precision();
    out << "\n========== Backtest Report ==========\n";
    printBody(out);
    out << "=====================================\n\n";
    out.flags(flags);
    out.precision(prec);
}

bool Report::writeTradeLog(const std::string& filepath) const {
    std::ofstream f;
    if (!openForWrite(f, filepath)) return false;
    f << "entry_time,exit_time,side,quantity,entry_price,exit_price,pnl,pnl_pct\n";
    f << std::setprecision(JSON_PRECISION);
    for (const auto& t : result_.roundTrips()) {
        writeCsvQuoted(f, formatTimestamp(t.entry_time));
        f << ',';
        writeCsvQuoted(f, formatTimestamp(t.exit_time));
        f << ',' << (t.side == Side::Buy ? "long" : "short") << ','
          << t.quantity << ',' << t.entry_price << ',' << t.exit_price << ','
          << t.pnl << ',' << t.pnl_pct << "\n";
    }
    if (!f) {
        Log::error("Failed to write trade log: " + filepath);
        return false;
    }
    return true;
}

bool Report::writeFillLog(const std::string& filepath) const {
    std::ofstream f;
    if (!openForWrite(f, filepath)) return false;
    f << "bar_index,timestamp,side,quantity,price,fee\n";
    f << std::setprecision(JSON_PRECISION);
    for (const auto& fill : result_.fills()) {
        f << fill.bar_index << ',';
        writeCsvQuoted(f, formatTimestamp(fill.timestamp));
        f << ',' << sideName(fill.side) << ',' << fill.quantity << ',' << fill.price << ',' << fill.fee << "\n";
    }
    if (!f) {
        Log::error("Failed to write fill log: " + filepath);
        return false;
    }
    return true;
}

bool Report::writeEquityCurve(const std::string& filepath) const {
    std::ofstream f;
    if (!openForWrite(f, filepath)) return false;
    f << "bar_index,timestamp,equity\n";
    f << std::setprecision(JSON_PRECISION);
    const auto& curve = result_.equityCurve();
    for (std::size_t i = 0; i < curve.size(); ++i) {
        f << i << ',';
        writeCsvQuoted(f, formatTimestamp(curve[i].timestamp));
        f << ',' << curve[i].equity << "\n";
    }
    if (!f) {
        Log::error("Failed to write equity curve: " + filepath);
        return false;
    }
    return true;
}

bool Report::writeReport(const std::string& filepath) const {
    std::ofstream f;
    if (!openForWrite(f, filepath)) return false;
    f << "Backtest Report\n";
    f << "================\n\n";
    printBody(f);
    if (!result_.rejected().empty()) {
        f << "\nRejected orders:\n";
        for (const auto& r : result_.rejected())
            f << "  " << formatTimestamp(r.timestamp) << "  " << r.reason << "\n";
    }
    if (!f) {
        Log::error("Failed to write report: " + filepath);
        return false;
    }
    return true;
}

void Report::writeResultJson(std::ostream& f) const {
    const auto& m = result_.metrics();
    f << std::setprecision(JSON_PRECISION);
    f << "{\n  \"symbol\": ";
    writeJsonString(f, result_.symbol());
    f << ",\n  \"interval\": ";
    writeJsonString(f, result_.interval());
    f << ",\n  \"strategy\": ";
    writeJsonString(f, result_.strategyName());
    f << ",\n  \"params\": ";
    writeJsonString(f, result_.strategyParams());
    f << ",\n  \"initial_cash\": ";
    writeJsonNumber(f, result_.initialCash());
    f << ",\n  \"bars_total\": " << result_.barsTotal()
      << ",\n  \"bars_processed\": " << result_.barsProcessed()
      << ",\n  \"completed\": " << (result_.completed() ? "true" : "false")
      << ",\n  \"stop_reason\": ";
    writeJsonString(f, result_.stopReason());

    f << ",\n  \"equity_curve\": [\n";
    const auto& curve = result_.equityCurve();
    for (std::size_t i = 0; i < curve.size(); ++i) {
        f << "    {\"t\":" << curve[i].timestamp << ",\"equity\":";
        writeJsonNumber(f, curve[i].equity);
        f << "}" << (i + 1 < curve.size() ? "," : "") << "\n";
    }

    f << "  ],\n  \"fills\": [\n";
    const auto& fills = result_.fills();
    for (std::size_t i = 0; i < fills.size(); ++i) {
        const auto& x = fills[i];
        f << "    {\"t\":" << x.timestamp << ",\"bar_index\":" << x.bar_index
          << ",\"side\":\"" << sideName(x.side) << "\",\"quantity\":";
        writeJsonNumber(f, x.quantity);
        f << ",\"price\":";
        writeJsonNumber(f, x.price);
        f << ",\"fee\":";
        writeJsonNumber(f, x.fee);
        f << "}" << (i + 1 < fills.size() ? "," : "") << "\n";
    }

    f << "  ],\n  \"rejected\": [\n";
    const auto& rejected = result_.rejected();
    for (std::size_t i = 0; i < rejected.size(); ++i) {
        const auto& r = rejected[i];
        f << "    {\"t\":" << r.timestamp << ",\"bar_index\":" << r.bar_index
          << ",\"side\":\"" << sideName(r.side) << "\",\"quantity\":";
        writeJsonNumber(f, r.quantity);
        f << ",\"price\":";
        writeJsonNumber(f, r.price);
        f << ",\"reason\":";
        writeJsonString(f, r.reason);
        f << "}" << (i + 1 < rejected.size() ? "," : "") << "\n";
    }

    f << "  ],\n  \"positions\": [\n";
    std::size_t n = 0;
    for (const auto& kv : result_.finalPositions()) {
        const auto& p = kv.second;
        f << "    {\"symbol\":";
        writeJsonString(f, kv.first);
        f << ",\"quantity\":";
        writeJsonNumber(f, p.quantity);
        f << ",\"average_entry_price\":";
        writeJsonNumber(f, p.average_entry_price);
        f << ",\"realized_pnl\":";
        writeJsonNumber(f, p.realized_pnl);
        f << "}" << (++n < result_.finalPositions().size() ? "," : "") << "\n";
    }
    f << "  ],\n  \"final_cash\": ";
    writeJsonNumber(f, result_.finalCash());

    f << ",\n  \"metrics\": {\n    \"initial_equity\": ";
    writeJsonNumber(f, m.initial_equity);
    f << ",\n    \"final_equity\": ";
    writeJsonNumber(f, m.final_equity);
    f << ",\n    \"total_return\": ";
    writeJsonNumber(f, m.total_return);
    f << ",\n    \"max_drawdown\": ";
    writeJsonNumber(f, m.max_drawdown);
    f << ",\n    \"sharpe_ratio\": ";
    writeJsonNumber(f, m.sharpe_ratio);
    f << ",\n    \"num_fills\": " << m.num_fills
      << ",\n    \"num_rejected\": " << m.num_rejected
      << ",\n    \"num_round_trips\": " << m.num_round_trips
      << ",\n    \"winning_round_trips\": " << m.winning_round_trips
      << ",\n    \"win_rate\": ";
    if (m.win_rate) writeJsonNumber(f, *m.win_rate);
    else f << "null";
    f << ",\n    \"avg_round_trip_pnl\": ";
    writeJsonNumber(f, m.avg_round_trip_pnl);
    f << ",\n    \"total_fees\": ";
    writeJsonNumber(f, m.total_fees);
    f << ",\n    \"open_position\": ";
    writeJsonNumber(f, m.open_position);
    f << ",\n    \"unrealized_pnl\": ";
    writeJsonNumber(f, m.unrealized_pnl);
    f << "\n  }\n}\n";
}

bool Report::writeResultJson(const std::string& filepath) const {
    std::ofstream f;
    if (!openForWrite(f, filepath)) return false;
    writeResultJson(f);
    if (!f) {
        Log::error("Failed to write result JSON: " + filepath);
        return false;
    }
    return true;
}

bool Report::writeAll(const std::string& dir) const {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        Log::error("Failed to create reports directory " + dir + ": " + ec.message());
        return false;
    }
    bool ok = writeTradeLog((fs::path(dir) / "trades.csv").string());
    ok = writeFillLog((fs::path(dir) / "fills.csv").string()) && ok;
    ok = writeEquityCurve((fs::path(dir) / "equity_curve.csv").string()) && ok;
    ok = writeReport((fs::path(dir) / "report.txt").string()) && ok;
    return ok;
}

} // namespace tradebot
