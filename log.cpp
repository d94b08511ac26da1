// log.cpp
// Line logger on std::clog, threshold shared by the whole process.

#include "log.hpp"

#include <atomic>
#include <ctime>
#include <iostream>
#include <mutex>

namespace merkledrop {

static std::atomic<int> g_level{(int)LogLevel::warn};
static std::mutex g_log_mu;

void set_log_level(LogLevel lvl) { g_level.store((int)lvl, std::memory_order_relaxed); }
LogLevel log_level() { return (LogLevel)g_level.load(std::memory_order_relaxed); }

bool parse_log_level(std::string_view s, LogLevel& out) {
    if (s == "error") { out = LogLevel::error; return true; }
    if (s == "warn")  { out = LogLevel::warn;  return true; }
    if (s == "info")  { out = LogLevel::info;  return true; }
    if (s == "debug") { out = LogLevel::debug; return true; }
    return false;
}

bool log_enabled(LogLevel lvl) {
    return (int)lvl <= g_level.load(std::memory_order_relaxed);
}

static const char* level_tag(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::error: return "ERROR";
        case LogLevel::warn:  return "WARN";
        case LogLevel::info:  return "INFO";
        case LogLevel::debug: return "DEBUG";
    }
    return "?";
}

void log_write(LogLevel lvl, const std::string& line) {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%dT%H:%M:%SZ", &tm);

    std::lock_guard<std::mutex> lk(g_log_mu);
    std::clog << ts << " [" << level_tag(lvl) << "] " << line << '\n';
}

} // namespace merkledrop
