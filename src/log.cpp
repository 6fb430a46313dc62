#include "docchunk/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

#include "docchunk/errors.hpp"
#include "docchunk/util.hpp"

namespace docchunk {

static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
static std::mutex g_io_mu;

void set_log_level(LogLevel level) { g_level = static_cast<int>(level); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

LogLevel parse_log_level(const std::string &name) {
    std::string n = to_lower(trim_copy(name));
    if (n == "debug") return LogLevel::Debug;
    if (n == "info") return LogLevel::Info;
    if (n == "warning" || n == "warn") return LogLevel::Warning;
    if (n == "error") return LogLevel::Error;
    throw ConfigError("unknown log level: " + name);
}

void log_line(LogLevel level, const std::string &component, const std::string &message) {
    if (level < log_level()) return;
    std::lock_guard<std::mutex> lk(g_io_mu);
    if (level >= LogLevel::Warning) {
        std::cerr << "[" << component << "] "
                  << (level == LogLevel::Error ? "Error: " : "Warning: ")
                  << message << std::endl;
    } else {
        std::cout << "[" << component << "] " << message << "\n";
    }
}

} // namespace docchunk
