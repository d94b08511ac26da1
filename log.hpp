#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace merkledrop {

enum class LogLevel : int { error = 0, warn = 1, info = 2, debug = 3 };

void set_log_level(LogLevel lvl);
LogLevel log_level();
bool parse_log_level(std::string_view s, LogLevel& out);

bool log_enabled(LogLevel lvl);
void log_write(LogLevel lvl, const std::string& line);

// log_line(LogLevel::info, "claim period=", p, " index=", i);
template <typename... Args>
void log_line(LogLevel lvl, const Args&... args) {
    if (!log_enabled(lvl)) return;
    std::ostringstream os;
    (os << ... << args);
    log_write(lvl, os.str());
}

} // namespace merkledrop
