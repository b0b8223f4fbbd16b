#include "time_utils.hpp"
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace tradebot {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civilFromDays(std::int64_t z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(yoe + era * 400) + (m <= 2 ? 1 : 0);
}

bool isLeapYear(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int daysInMonth(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeapYear(y)) return 29;
    return days[m - 1];
}

bool allDigits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s)
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    return true;
}

bool parseFixed(const std::string& s, std::size_t pos, std::size_t len, int& out) {
    if (pos + len > s.size()) return false;
    std::string part = s.substr(pos, len);
    if (!allDigits(part)) return false;
    out = std::stoi(part);
    return true;
}

} // namespace

std::optional<std::int64_t> parseTimestamp(const std::string& text) {
    std::string s = text;
    if (s.empty()) return std::nullopt;

    // Raw epoch: 10 digits = seconds, 13 digits = milliseconds.
    if (allDigits(s)) {
        if (s.size() == 10) return std::stoll(s);
        if (s.size() == 13) return std::stoll(s) / 1000;
        return std::nullopt;
    }

    for (auto& c : s) if (c == '_') c = ':';

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (s.size() < 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    if (!parseFixed(s, 0, 4, year) || !parseFixed(s, 5, 2, month) || !parseFixed(s, 8, 2, day))
        return std::nullopt;
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) return std::nullopt;

    if (s.size() > 10) {
        if (s[10] != 'T' && s[10] != ' ') return std::nullopt;
        std::string timePart = s.substr(11);
        if (!timePart.empty() && (timePart.back() == 'Z' || timePart.back() == 'z')) timePart.pop_back();
        auto dot = timePart.find('.');
        if (dot != std::string::npos) timePart = timePart.substr(0, dot);
        if (timePart.size() < 5 || timePart[2] != ':') return std::nullopt;
        if (!parseFixed(timePart, 0, 2, hour) || !parseFixed(timePart, 3, 2, minute)) return std::nullopt;
        if (timePart.size() > 5) {
            if (timePart.size() != 8 || timePart[5] != ':' || !parseFixed(timePart, 6, 2, second))
                return std::nullopt;
        }
        if (hour > 23 || minute > 59 || second > 60) return std::nullopt;
    }

    std::int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return days * SECONDS_PER_DAY + hour * 3600 + minute * 60 + second;
}

std::string formatTimestamp(std::int64_t epoch_seconds) {
    std::int64_t days = epoch_seconds / SECONDS_PER_DAY;
    std::int64_t rem = epoch_seconds % SECONDS_PER_DAY;
    if (rem < 0) { rem += SECONDS_PER_DAY; --days; }
    int y;
    unsigned m, d;
    civilFromDays(days, y, m, d);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02dZ", y, m, d,
                  static_cast<int>(rem / 3600), static_cast<int>((rem % 3600) / 60),
                  static_cast<int>(rem % 60));
    return std::string(buf);
}

const std::vector<std::string>& supportedIntervals() {
    static const std::vector<std::string> intervals = {"1s", "1m", "5m", "15m", "30m", "1h", "4h", "1d"};
    return intervals;
}

std::optional<std::int64_t> intervalSeconds(const std::string& interval) {
    if (interval == "1s") return 1;
    if (interval == "1m") return 60;
    if (interval == "5m") return 5 * 60;
    if (interval == "15m") return 15 * 60;
    if (interval == "30m") return 30 * 60;
    if (interval == "1h") return 3600;
    if (interval == "4h") return 4 * 3600;
    if (interval == "1d") return SECONDS_PER_DAY;
    return std::nullopt;
}

double periodsPerYear(std::int64_t interval_seconds) {
    if (interval_seconds <= 0) return 0;
    return 365.0 * static_cast<double>(SECONDS_PER_DAY) / static_cast<double>(interval_seconds);
}

} // namespace tradebot
