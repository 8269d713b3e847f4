#pragma once
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace mpng {
using SteadyClock = std::chrono::steady_clock;
using WallClock = std::chrono::system_clock;

inline uint64_t monotonic_ns() {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

inline double elapsed_ms(SteadyClock::time_point since) {
    return std::chrono::duration<double, std::milli>(SteadyClock::now() - since).count();
}

// Milliseconds left until `deadline`, clamped to [0, INT_MAX-ish] for poll().
inline int remaining_ms(SteadyClock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now())
                    .count();
    if (left <= 0) return 0;
    if (left > 86400000) return 86400000;
    return static_cast<int>(left);
}

inline std::string wall_time_iso8601() {
    auto t = WallClock::to_time_t(WallClock::now());
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%FT%TZ", &tm_utc);
    return std::string(buf);
}

// Local time in the locale's preferred format ("%c"), as shown on the dashboard.
inline std::string local_time_string(WallClock::time_point tp, const char* fmt = "%c") {
    auto t = WallClock::to_time_t(tp);
    std::tm tm_local{};
    localtime_r(&t, &tm_local);
    char buf[64];
    if (std::strftime(buf, sizeof(buf), fmt, &tm_local) == 0) return std::string();
    return std::string(buf);
}
}  // namespace mpng
