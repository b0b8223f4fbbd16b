#include "log.hpp"
#include <iostream>

namespace tradebot {

namespace {

LogLevel g_level = LogLevel::Info;
std::ostream* g_stream = nullptr;

const char* prefix(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "[DEBUG] ";
        case LogLevel::Info:  return "[INFO] ";
        case LogLevel::Warn:  return "[WARN] ";
        case LogLevel::Error: return "[ERROR] ";
    }
    return "";
}

} // namespace

void Log::setLevel(LogLevel level) { g_level = level; }
LogLevel Log::level() { return g_level; }
void Log::setStream(std::ostream* out) { g_stream = out; }

void Log::write(LogLevel level, const std::string& msg) {
    if (!enabled(level)) return;
    std::ostream& out = g_stream ? *g_stream : std::cerr;
    out << prefix(level) << msg << "\n";
}

} // namespace tradebot
