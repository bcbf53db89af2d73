#pragma once
#include <string>
#include <optional>

namespace streamgate {

enum class LogLevel { Debug, Info, Warn, Error };

inline const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

// Accepts "debug", "info", "warn"/"warning", "error" (case-insensitive)
std::optional<LogLevel> log_level_from_string(const std::string& name);

// Process-wide threshold. Lines below it are dropped.
void set_log_level(LogLevel level);
LogLevel log_level();

bool log_enabled(LogLevel level);

// Writes "[tag] message" to stderr. Serialized across threads.
void log_line(LogLevel level, const char* tag, const std::string& message);

inline void log_debug(const char* tag, const std::string& message) {
    if (log_enabled(LogLevel::Debug)) log_line(LogLevel::Debug, tag, message);
}
inline void log_info(const char* tag, const std::string& message) {
    if (log_enabled(LogLevel::Info)) log_line(LogLevel::Info, tag, message);
}
inline void log_warn(const char* tag, const std::string& message) {
    if (log_enabled(LogLevel::Warn)) log_line(LogLevel::Warn, tag, message);
}
inline void log_error(const char* tag, const std::string& message) {
    log_line(LogLevel::Error, tag, message);
}

} // namespace streamgate
