#include "log.hpp"
#include "util.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace streamgate {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

} // namespace

std::optional<LogLevel> log_level_from_string(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "debug") return LogLevel::Debug;
    if (n == "info") return LogLevel::Info;
    if (n == "warn" || n == "warning") return LogLevel::Warn;
    if (n == "error") return LogLevel::Error;
    return std::nullopt;
}

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= g_level.load();
}

void log_line(LogLevel level, const char* tag, const std::string& message) {
    if (!log_enabled(level)) return;
    std::lock_guard<std::mutex> lock(log_mutex());
    std::cerr << "[" << tag << "] ";
    if (level == LogLevel::Warn) std::cerr << "warning: ";
    else if (level == LogLevel::Error) std::cerr << "error: ";
    std::cerr << message << '\n';
}

} // namespace streamgate
