#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace fs = std::filesystem;

namespace {

std::mutex g_log_mutex;
std::atomic<int> g_log_level{static_cast<int>(LogLevel::INFO)};
std::atomic<bool> g_log_echo{false};
fs::path g_log_path;   // guarded by g_log_mutex

fs::path default_log_path() {
    return platform::home_dir() / CUMULUS_HOME_DIR / LOG_SUBDIR / "cumulus.log";
}

} // namespace

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "debug") return LogLevel::DEBUG;
    if (n == "info") return LogLevel::INFO;
    if (n == "warn" || n == "warning") return LogLevel::WARN;
    if (n == "error") return LogLevel::ERROR;
    return fallback;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

void set_log_level(LogLevel level) {
    g_log_level = static_cast<int>(level);
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_log_level.load());
}

void set_log_path(const fs::path& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_path = path;
}

fs::path log_path() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_log_path.empty() ? default_log_path() : g_log_path;
}

void set_log_echo(bool echo) {
    g_log_echo = echo;
}

void cumulus_log(LogLevel level, const std::string& msg) {
    if (static_cast<int>(level) < g_log_level.load()) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    std::string line = fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {:<5} {}",
                                   tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                                   static_cast<int>(ms.count()),
                                   log_level_name(level), msg);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    fs::path path = g_log_path.empty() ? default_log_path() : g_log_path;

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    std::ofstream out(path, std::ios::app);
    if (out) out << line << "\n";

    if (g_log_echo && level >= LogLevel::WARN) {
        std::cerr << line << "\n";
    }
}
