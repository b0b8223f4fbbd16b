#include "errors.hpp"
#include "log.hpp"
#include "test_support.hpp"
#include "time_utils.hpp"
#include <sstream>

namespace {

using namespace tradebot;
using namespace tradebot::test;

//--- Timestamps: ISO forms, epoch seconds/millis, garbage
void run_parse_timestamp_formats() {
    ASSERT_EQ(*parseTimestamp("1970-01-02"), 86400);
    ASSERT_EQ(*parseTimestamp("2024-01-01T00:00:00Z"), T0);
    ASSERT_EQ(*parseTimestamp("2024-01-01 09:30:00"), 1704101400);
    ASSERT_EQ(*parseTimestamp("2024-01-01T09:30"), 1704101400);
    ASSERT_EQ(*parseTimestamp("2025-08-04T00_00_00.000000000Z"), 1754265600);
    ASSERT_EQ(*parseTimestamp("1704067200"), T0);
    ASSERT_EQ(*parseTimestamp("1704067200000"), T0);
    ASSERT_TRUE(!parseTimestamp(""));
    ASSERT_TRUE(!parseTimestamp("yesterday"));
    ASSERT_TRUE(!parseTimestamp("2024-13-01"));
    ASSERT_TRUE(!parseTimestamp("2024-01-01X10:00"));

    // Day must exist in its month
    ASSERT_TRUE(!parseTimestamp("2024-02-31"));
    ASSERT_TRUE(!parseTimestamp("2023-02-29"));
    ASSERT_TRUE(!parseTimestamp("2024-04-31T00:00:00Z"));
    ASSERT_EQ(*parseTimestamp("2024-02-29"), T0 + 59 * 86400);

    // Only 10-digit seconds and 13-digit milliseconds count as epochs
    ASSERT_TRUE(!parseTimestamp("20240102"));
    ASSERT_TRUE(!parseTimestamp("86400"));
    ASSERT_TRUE(!parseTimestamp("17040672000"));
}

void run_format_timestamp() {
    ASSERT_EQ(formatTimestamp(T0), std::string("2024-01-01T00:00:00Z"));
    ASSERT_EQ(formatTimestamp(1704101400), std::string("2024-01-01T09:30:00Z"));
    ASSERT_EQ(formatTimestamp(-1), std::string("1969-12-31T23:59:59Z"));
}

void run_interval_seconds() {
    ASSERT_EQ(*intervalSeconds("1m"), 60);
    ASSERT_EQ(*intervalSeconds("15m"), 900);
    ASSERT_EQ(*intervalSeconds("4h"), 14400);
    ASSERT_EQ(*intervalSeconds("1d"), 86400);
    ASSERT_TRUE(!intervalSeconds("2m"));
    ASSERT_TRUE(!intervalSeconds("15"));
    ASSERT_EQ(supportedIntervals().size(), 8u);
    ASSERT_NEAR(periodsPerYear(86400), 365.0, 1e-12);
    ASSERT_NEAR(periodsPerYear(3600), 365.0 * 24, 1e-9);
}

//--- Log: threshold and prefixes
void run_log_levels() {
    std::ostringstream out;
    Log::setStream(&out);
    LogLevel saved = Log::level();
    Log::setLevel(LogLevel::Info);
    Log::debug("hidden");
    Log::warn("dropped bar");
    ASSERT_EQ(out.str(), std::string("[WARN] dropped bar\n"));
    Log::setLevel(LogLevel::Debug);
    Log::debug("shown");
    ASSERT_TRUE(out.str().find("[DEBUG] shown") != std::string::npos);
    Log::setLevel(saved);
    Log::setStream(&logSink());
}

//--- CsvDataSource: load from CSV (temp file)
void run_csv_source_load() {
    TempFile file("test_sample_ohlc.csv",
                  "timestamp,open,high,low,close,volume\n"
                  "2024-01-01T09:30,100,101,99,100.5,10\n"
                  "2024-01-01T09:45,100.5,102,100,101,20\n");
    CsvDataSource src(file.path());
    BarRequest req;
    req.symbol = "ETH-USDC";
    auto rows = src.fetch(req);
    ASSERT_EQ(rows.size(), 2u);
    ASSERT_TRUE(rows[0].timestamp_valid);
    ASSERT_EQ(rows[0].bar.timestamp, 1704101400);
    ASSERT_NEAR(rows[0].bar.open, 100, 1e-12);
    ASSERT_NEAR(rows[1].bar.close, 101, 1e-12);
    ASSERT_NEAR(rows[1].bar.volume, 20, 1e-12);
    ASSERT_EQ(rows[1].origin, file.path() + ":3");
}

//--- CsvDataSource: symbol column filters rows; "eth_usdc" matches "ETH-USDC"
void run_csv_source_symbol_filter() {
    TempFile file("test_multi_symbol.csv",
                  "\xEF\xBB\xBFSymbol,Date,O,H,L,C\n"
                  "eth_usdc,2024-01-01,100,101,99,100\n"
                  "BTC-USDC,2024-01-01,40000,40100,39900,40050\n"
                  "ETH/USDC,2024-01-02,100,102,99,101\n");
    CsvDataSource src(file.path());
    BarRequest req;
    req.symbol = "ETH-USDC";
    auto rows = src.fetch(req);
    ASSERT_EQ(rows.size(), 2u);
    ASSERT_NEAR(rows[1].bar.close, 101, 1e-12);
    ASSERT_NEAR(rows[0].bar.volume, 0, 1e-12);
    ASSERT_EQ(*src.latestTimestamp("ETH-USDC"), T0 + 86400);
    ASSERT_TRUE(!src.latestTimestamp("SOL-USDC"));
}

//--- CsvDataSource: unparseable fields arrive as NaN / invalid timestamp
void run_csv_source_bad_fields() {
    TempFile file("test_bad_fields.csv",
                  "timestamp,open,high,low,close\n"
                  "not-a-date,100,101,99,100\n"
                  "2024-01-01,abc,101,99,100\n");
    CsvDataSource src(file.path());
    auto rows = src.fetch(BarRequest{});
    ASSERT_EQ(rows.size(), 2u);
    ASSERT_TRUE(!rows[0].timestamp_valid);
    ASSERT_TRUE(std::isnan(rows[1].bar.open));
}

void run_csv_source_errors() {
    CsvDataSource missing("does_not_exist.csv");
    ASSERT_THROWS(missing.fetch(BarRequest{}), DataUnavailable);

    TempFile no_close("test_no_close.csv", "timestamp,open,high,low\n2024-01-01,1,1,1\n");
    CsvDataSource bad(no_close.path());
    ASSERT_THROWS(bad.fetch(BarRequest{}), DataUnavailable);

    TempFile empty("test_empty.csv", "");
    CsvDataSource none(empty.path());
    ASSERT_THROWS(none.fetch(BarRequest{}), DataUnavailable);
}

void run_normalize_symbol() {
    ASSERT_EQ(normalizeSymbol(" eth_usdc "), std::string("ETH-USDC"));
    ASSERT_EQ(normalizeSymbol("btc/usd"), std::string("BTC-USD"));
    ASSERT_TRUE(isValidSymbol("weth_usdc"));
    ASSERT_TRUE(!isValidSymbol("ETHUSDC"));
    ASSERT_TRUE(!isValidSymbol("A-B/C"));
    ASSERT_TRUE(!isValidSymbol(""));
}

} // namespace

void run_time_and_data_source_tests() {
    RUN_TEST(parse_timestamp_formats);
    RUN_TEST(format_timestamp);
    RUN_TEST(interval_seconds);
    RUN_TEST(log_levels);
    RUN_TEST(csv_source_load);
    RUN_TEST(csv_source_symbol_filter);
    RUN_TEST(csv_source_bad_fields);
    RUN_TEST(csv_source_errors);
    RUN_TEST(normalize_symbol);
}
