#pragma once

#include <string>
#include <filesystem>
#include <fmt/format.h>

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Parse "debug" / "info" / "warn" / "warning" / "error" (case-insensitive).
// Returns fallback for anything else.
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

const char* log_level_name(LogLevel level);

// Process-wide log configuration. Safe to call from any thread.
void set_log_level(LogLevel level);
LogLevel log_level();
void set_log_path(const std::filesystem::path& path);
std::filesystem::path log_path();

// Echo WARN/ERROR lines to stderr in addition to the log file.
void set_log_echo(bool echo);

// Append a timestamped line "[HH:MM:SS.mmm] LEVEL message" to the log file.
void cumulus_log(LogLevel level, const std::string& msg);

template <typename... Args>
void log_debug(fmt::format_string<Args...> f, Args&&... args) {
    if (log_level() > LogLevel::DEBUG) return;
    cumulus_log(LogLevel::DEBUG, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_info(fmt::format_string<Args...> f, Args&&... args) {
    if (log_level() > LogLevel::INFO) return;
    cumulus_log(LogLevel::INFO, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_warn(fmt::format_string<Args...> f, Args&&... args) {
    cumulus_log(LogLevel::WARN, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_error(fmt::format_string<Args...> f, Args&&... args) {
    cumulus_log(LogLevel::ERROR, fmt::format(f, std::forward<Args>(args)...));
}
