#pragma once
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>

namespace mpng {
enum class LogLevel { DEBUG, INFO, WARN, ERROR };

inline const char* level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

inline bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string n;
    for (char c : name) n += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (n == "debug") out = LogLevel::DEBUG;
    else if (n == "info") out = LogLevel::INFO;
    else if (n == "warn" || n == "warning") out = LogLevel::WARN;
    else if (n == "error") out = LogLevel::ERROR;
    else return false;
    return true;
}

namespace detail {
inline std::atomic<int>& min_level() {
    static std::atomic<int> lvl{static_cast<int>(LogLevel::WARN)};
    return lvl;
}
inline std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}
}  // namespace detail

inline void set_log_level(LogLevel lvl) { detail::min_level().store(static_cast<int>(lvl)); }

inline bool log_enabled(LogLevel lvl) {
    return static_cast<int>(lvl) >= detail::min_level().load();
}

// Probe workers log from their own threads; one line is written under the lock.
inline void log(LogLevel lvl, const std::string& msg) {
    if (!log_enabled(lvl)) return;
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%FT%TZ", &tm_utc);
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    std::fprintf(stderr, "[%s] %s: %s\n", buf, level_name(lvl), msg.c_str());
}
}  // namespace mpng
