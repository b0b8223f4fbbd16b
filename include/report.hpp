#pragma once

#include "backtester.hpp"
#include <iostream>
#include <ostream>
#include <string>

namespace tradebot {

/// Console summary and report files for one BacktestResult.
class Report {
public:
    explicit Report(const BacktestResult& result);

    /// Print summary to console.
    void printSummary(std::ostream& out = std::cout) const;

    /// Completed round trips as CSV. Returns false and logs on failure.
    bool writeTradeLog(const std::string& filepath) const;

    /// Every fill as CSV. Returns false and logs on failure.
    bool writeFillLog(const std::string& filepath) const;

    /// Equity curve CSV. Returns false and logs on failure.
    bool writeEquityCurve(const std::string& filepath) const;

    /// Full text report (summary plus rejected orders). Returns false and logs on failure.
    bool writeReport(const std::string& filepath) const;

    /// Whole result as JSON: run info, equity curve, fills, rejected orders, final
    /// positions and metrics. Doubles carry 17 significant digits so nothing is lost.
    bool writeResultJson(const std::string& filepath) const;
    void writeResultJson(std::ostream& out) const;

    /// Write trades.csv, fills.csv, equity_curve.csv and report.txt into dir (created if missing).
    bool writeAll(const std::string& dir) const;

private:
    const BacktestResult& result_;

    void printBody(std::ostream& out) const;
};

} // namespace tradebot
