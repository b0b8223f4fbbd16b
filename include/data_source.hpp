#pragma once

#include "bar.hpp"
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace tradebot {

/// What the feed asks a source for. Sources may return bars outside
/// [start, end]; BarFeed trims them.
struct BarRequest {
    std::string symbol;
    std::string interval;
    std::int64_t start{std::numeric_limits<std::int64_t>::min()};
    std::int64_t end{std::numeric_limits<std::int64_t>::max()};
};

/// A bar as delivered by a source, before validation.
/// Unparseable numeric fields arrive as NaN; an unparseable timestamp sets timestamp_valid = false.
struct SourceBar {
    Bar bar;
    bool timestamp_valid{true};
    std::string origin;  // e.g. "data/ETH-USDC_15m.csv:42", used in log messages
};

/// Supplier of raw OHLCV bars (CSV file here; a market-data API client in production).
class IBarSource {
public:
    virtual ~IBarSource() = default;

    virtual std::vector<SourceBar> fetch(const BarRequest& request) const = 0;

    /// Latest valid timestamp the source holds for symbol, if any.
    virtual std::optional<std::int64_t> latestTimestamp(const std::string& symbol) const;
};

/// Loads OHLCV bars from a CSV file.
/// Columns (case-insensitive): timestamp/date/datetime/time, open/o, high/h, low/l, close/c
/// [, volume/vol/v] [, symbol]. When a symbol column exists only matching rows are returned;
/// "ETH-USDC", "eth_usdc" and "ETH/USDC" match each other.
/// Throws DataUnavailable if the file cannot be opened or lacks a required column.
class CsvDataSource : public IBarSource {
public:
    explicit CsvDataSource(const std::string& filepath);

    std::vector<SourceBar> fetch(const BarRequest& request) const override;

    const std::string& path() const { return filepath_; }

private:
    std::string filepath_;
};

/// Canonical form used to compare symbols: upper case, '_' and '/' replaced by '-'.
std::string normalizeSymbol(const std::string& symbol);

/// True if the symbol is BASE-QUOTE ('-', '_' or '/' as separator), both parts non-empty.
bool isValidSymbol(const std::string& symbol);

} // namespace tradebot
