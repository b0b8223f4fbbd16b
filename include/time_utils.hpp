#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tradebot {

constexpr std::int64_t SECONDS_PER_DAY = 86400;

/// Parse a bar timestamp to UTC epoch seconds.
/// Accepts "2024-01-02", "2024-01-02 12:30:00", "2024-01-02T12:30:00Z",
/// "2025-08-04T00_00_00.000000000Z" (fractional seconds dropped) and integer
/// epoch seconds (10 digits) or milliseconds (13 digits). Dates must exist in
/// the calendar. Returns nullopt if unparseable.
std::optional<std::int64_t> parseTimestamp(const std::string& text);

/// Format epoch seconds as "YYYY-MM-DDTHH:MM:SSZ".
std::string formatTimestamp(std::int64_t epoch_seconds);

/// Length of a bar interval ("1s", "1m", "5m", "15m", "30m", "1h", "4h", "1d").
/// Returns nullopt for anything else.
std::optional<std::int64_t> intervalSeconds(const std::string& interval);

/// Intervals accepted by intervalSeconds(), shortest first.
const std::vector<std::string>& supportedIntervals();

/// Number of bars of this length in a 365-day year (crypto markets trade every day).
double periodsPerYear(std::int64_t interval_seconds);

} // namespace tradebot
