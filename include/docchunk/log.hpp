#pragma once
#include <sstream>
#include <string>

namespace docchunk {

enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3 };

// Process-wide threshold; lines below it are dropped.
void set_log_level(LogLevel level);
LogLevel log_level();

// Parses "debug", "info", "warning"/"warn", "error". Throws ConfigError otherwise.
LogLevel parse_log_level(const std::string &name);

// Writes "[component] message" to std::cout (debug/info) or std::cerr
// (warning/error). Safe to call from worker threads.
void log_line(LogLevel level, const std::string &component, const std::string &message);

namespace detail {
inline void append(std::ostringstream &) {}
template <typename T, typename... Rest>
void append(std::ostringstream &os, const T &value, const Rest &...rest) {
    os << value;
    append(os, rest...);
}
} // namespace detail

template <typename... Args>
void log_at(LogLevel level, const std::string &component, const Args &...args) {
    if (level < log_level()) return;
    std::ostringstream os;
    detail::append(os, args...);
    log_line(level, component, os.str());
}

template <typename... Args>
void log_debug(const std::string &component, const Args &...args) { log_at(LogLevel::Debug, component, args...); }
template <typename... Args>
void log_info(const std::string &component, const Args &...args) { log_at(LogLevel::Info, component, args...); }
template <typename... Args>
void log_warning(const std::string &component, const Args &...args) { log_at(LogLevel::Warning, component, args...); }
template <typename... Args>
void log_error(const std::string &component, const Args &...args) { log_at(LogLevel::Error, component, args...); }

} // namespace docchunk
