#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "../probes/prober.hpp"
#include "channel.hpp"
#include "model.hpp"
#include "snapshot.hpp"
#include "test_state.hpp"
#include "worker_pool.hpp"

namespace mpng {
enum class CyclePhase { Idle, Dispatching, AwaitingResults, Merging, Published };

const char* phase_name(CyclePhase p);

// A probe outcome tagged with the test it belongs to and the cycle it was
// dispatched in.
struct TaggedResult {
    std::size_t test{0};
    uint64_t cycle{0};
    ProbeResult result;
};

// Drives the monitoring cycles. The control loop (the thread calling
// run_cycle/run) is the only writer of TestState; workers hand results back
// through a channel.
class Scheduler {
   public:
    Scheduler(std::vector<Host> hosts, const MonitorSettings& settings, const Prober& prober);
    ~Scheduler();
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void add_sink(SnapshotSink* sink) {
        bus_.add_sink(sink);
    }

    // One full cycle: dispatch, wait, merge, publish. Returns the cycle number.
    uint64_t run_cycle();
    // Runs cycles on the configured interval until `stop` is set, or until
    // `max_cycles` cycles ran when it is non-zero. False if the timer failed.
    bool run(const std::atomic<bool>& stop, uint64_t max_cycles = 0);

    // Applies one result to its test. False for stale results and unknown tests.
    bool merge(const TaggedResult& r);

    SnapshotPtr snapshot() const;
    CyclePhase phase() const {
        return static_cast<CyclePhase>(phase_.load());
    }
    uint64_t cycle() const {
        return cycle_;
    }
    std::size_t test_count() const {
        return entries_.size();
    }
    const TestState& state(std::size_t test) const {
        return entries_.at(test).state;
    }
    std::chrono::milliseconds cycle_budget() const {
        return budget_;
    }

   private:
    struct Entry {
        std::size_t host;
        const TestSpec* test;
        TestState state;
        bool in_flight{false};
    };

    void dispatch(std::size_t index, uint64_t cycle, SteadyClock::time_point deadline);
    void set_phase(CyclePhase p) {
        phase_.store(static_cast<int>(p));
    }
    SnapshotPtr build_snapshot() const;

    std::vector<Host> hosts_;
    MonitorSettings settings_;
    const Prober& prober_;
    std::vector<Entry> entries_;
    SnapshotBus bus_;
    mutable std::mutex snap_mu_;
    SnapshotPtr latest_;
    std::atomic<int> phase_{static_cast<int>(CyclePhase::Idle)};
    uint64_t cycle_{0};
    std::chrono::milliseconds budget_{0};
    Channel<TaggedResult> results_;
    // Declared last: destroyed (and joined) before anything its tasks touch.
    std::unique_ptr<WorkerPool> pool_;
};

// Longest time one probe of `test` may block, counting sequential port batches.
int probe_budget_ms(const TestSpec& test);
}  // namespace mpng
