#pragma once
#include "model.hpp"

namespace mpng {
enum class Status { Empty, Up, Slow, Down };

inline const char* status_name(Status s) {
    switch (s) {
        case Status::Empty: return "empty";
        case Status::Up: return "up";
        case Status::Slow: return "slow";
        case Status::Down: return "down";
    }
    return "?";
}

// Down when the probe failed, Slow at or above the threshold, Up below it.
// A success without a latency reading counts as 0 ms.
inline Status classify(const ProbeResult& r, double slow_threshold_ms) {
    if (!r.ok) return Status::Down;
    double ms = r.latency_ms ? *r.latency_ms : 0.0;
    return ms < slow_threshold_ms ? Status::Up : Status::Slow;
}
}  // namespace mpng
