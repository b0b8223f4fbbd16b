#pragma once

#include <ostream>
#include <string>

namespace tradebot {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Process-wide diagnostics sink. Defaults to std::cerr at Info.
/// Not synchronized: set the level and stream before starting runs on other threads.
class Log {
public:
    static void setLevel(LogLevel level);
    static LogLevel level();

    /// Redirect output (e.g. to an ostringstream in tests). nullptr restores std::cerr.
    static void setStream(std::ostream* out);

    static bool enabled(LogLevel level) { return level >= Log::level(); }

    static void debug(const std::string& msg) { write(LogLevel::Debug, msg); }
    static void info(const std::string& msg) { write(LogLevel::Info, msg); }
    static void warn(const std::string& msg) { write(LogLevel::Warn, msg); }
    static void error(const std::string& msg) { write(LogLevel::Error, msg); }

    static void write(LogLevel level, const std::string& msg);
};

} // namespace tradebot
