#include "data_source.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "time_utils.hpp"
#include <cctype>
#include <cmath>
#include <fstream>
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

std::vector<std::string> split(const std::string& line, char delim) {
    std::vector<std::string> parts;
    std::istringstream iss(line);
    std::string part;
    while (std::getline(iss, part, delim)) {
        parts.push_back(trim(part));
    }
    return parts;
}

void toLower(std::string& s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

int findColumn(const std::vector<std::string>& headers, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        for (std::size_t i = 0; i < headers.size(); ++i) {
            if (headers[i] == name) return static_cast<int>(i);
        }
    }
    return -1;
}

// NaN on failure so that bar validation reports the row instead of the parser silently skipping it.
double parseField(const std::vector<std::string>& parts, int column) {
    if (column < 0 || static_cast<std::size_t>(column) >= parts.size())
        return std::nan("");
    const std::string& s = parts[static_cast<std::size_t>(column)];
    try {
        std::size_t pos = 0;
        double v = std::stod(s, &pos);
        if (pos != s.size()) return std::nan("");
        return v;
    } catch (const std::logic_error&) {
        return std::nan("");
    }
}

} // namespace

std::string normalizeSymbol(const std::string& symbol) {
    std::string out = trim(symbol);
    for (auto& c : out) {
        if (c == '_' || c == '/') c = '-';
        else c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

bool isValidSymbol(const std::string& symbol) {
    const std::string norm = normalizeSymbol(symbol);
    const auto sep = norm.find('-');
    if (sep == std::string::npos || sep == 0 || sep + 1 == norm.size()) return false;
    return norm.find('-', sep + 1) == std::string::npos;
}

std::optional<std::int64_t> IBarSource::latestTimestamp(const std::string& symbol) const {
    BarRequest all;
    all.symbol = symbol;
    std::optional<std::int64_t> latest;
    for (const auto& sb : fetch(all)) {
        if (!sb.timestamp_valid) continue;
        if (!latest || sb.bar.timestamp > *latest) latest = sb.bar.timestamp;
    }
    return latest;
}

CsvDataSource::CsvDataSource(const std::string& filepath) : filepath_(filepath) {}

std::vector<SourceBar> CsvDataSource::fetch(const BarRequest& request) const {
    std::ifstream f(filepath_);
    if (!f.is_open())
        throw DataUnavailable("cannot open bar data file: " + filepath_);

    std::string line;
    if (!std::getline(f, line))
        throw DataUnavailable("bar data file is empty: " + filepath_);
    // Tolerate a UTF-8 BOM on the header row.
    if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
        static_cast<unsigned char>(line[1]) == 0xBB && static_cast<unsigned char>(line[2]) == 0xBF)
        line = line.substr(3);

    std::vector<std::string> headers = split(line, ',');
    for (auto& h : headers) toLower(h);

    int iDate = findColumn(headers, {"timestamp", "date", "datetime", "time"});
    int iOpen = findColumn(headers, {"open", "o"});
    int iHigh = findColumn(headers, {"high", "h"});
    int iLow = findColumn(headers, {"low", "l"});
    int iClose = findColumn(headers, {"close", "c"});
    int iVol = findColumn(headers, {"volume", "vol", "v"});
    int iSym = findColumn(headers, {"symbol", "pair", "ticker"});

    if (iDate < 0 || iOpen < 0 || iHigh < 0 || iLow < 0 || iClose < 0)
        throw DataUnavailable("bar data file " + filepath_ +
                              " must have timestamp, open, high, low and close columns");

    const std::string want = normalizeSymbol(request.symbol);
    std::vector<SourceBar> out;
    std::size_t lineNo = 1;
    while (std::getline(f, line)) {
        ++lineNo;
        if (trim(line).empty()) continue;
        auto parts = split(line, ',');

        if (iSym >= 0 && !want.empty()) {
            if (static_cast<std::size_t>(iSym) >= parts.size()) continue;
            if (normalizeSymbol(parts[static_cast<std::size_t>(iSym)]) != want) continue;
        }

        SourceBar sb;
        sb.origin = filepath_ + ":" + std::to_string(lineNo);
        auto ts = static_cast<std::size_t>(iDate) < parts.size()
            ? parseTimestamp(parts[static_cast<std::size_t>(iDate)])
            : std::nullopt;
        sb.timestamp_valid = ts.has_value();
        sb.bar.timestamp = ts.value_or(0);
        sb.bar.open = parseField(parts, iOpen);
        sb.bar.high = parseField(parts, iHigh);
        sb.bar.low = parseField(parts, iLow);
        sb.bar.close = parseField(parts, iClose);
        sb.bar.volume = iVol >= 0 ? parseField(parts, iVol) : 0.0;
        out.push_back(sb);
    }

    Log::debug("read " + std::to_string(out.size()) + " rows for " + request.symbol + " from " + filepath_);
    return out;
}

} // namespace tradebot
