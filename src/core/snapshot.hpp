#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "model.hpp"
#include "status.hpp"
#include "time_utils.hpp"

namespace mpng {
struct TestView {
    std::string label;
    Protocol protocol{Protocol::ICMP};
    uint16_t port_low{0};
    uint16_t port_high{0};
    Status status{Status::Empty};
    std::optional<double> latency_ms;
    std::optional<WallClock::time_point> last_up;
    std::string failure_reason;
    uint64_t last_cycle{0};
    std::vector<Status> history;  // oldest first
};

struct HostView {
    std::string address;
    std::string description;
    std::vector<TestView> tests;
};

// Whole-system view published once per cycle. Never modified once shared.
struct Snapshot {
    uint64_t cycle{0};
    WallClock::time_point taken_at{};
    double slow_threshold_ms{0};
    std::vector<HostView> hosts;
};

using SnapshotPtr = std::shared_ptr<const Snapshot>;

class SnapshotSink {
   public:
    virtual ~SnapshotSink() = default;
    virtual void on_snapshot(const Snapshot& snap) = 0;
};

class SnapshotBus {
   public:
    void add_sink(SnapshotSink* sink) {
        sinks_.push_back(sink);
    }
    void publish(const Snapshot& snap) {
        for (auto* s : sinks_) s->on_snapshot(snap);
    }

   private:
    std::vector<SnapshotSink*> sinks_;
};
}  // namespace mpng
