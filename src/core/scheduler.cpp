#include "scheduler.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

#include "cycle_timer.hpp"
#include "logger.hpp"

namespace mpng {
const char* phase_name(CyclePhase p) {
    switch (p) {
        case CyclePhase::Idle: return "idle";
        case CyclePhase::Dispatching: return "dispatching";
        case CyclePhase::AwaitingResults: return "awaiting";
        case CyclePhase::Merging: return "merging";
        case CyclePhase::Published: return "published";
    }
    return "?";
}

int probe_budget_ms(const TestSpec& test) {
    if (test.protocol != Protocol::TCP) return test.timeout_ms;
    std::size_t per = TcpConnectProbe::kDefaultMaxOpen;
    std::size_t batches = (test.port_count() + per - 1) / per;
    return test.timeout_ms * static_cast<int>(std::max<std::size_t>(batches, 1));
}

Scheduler::Scheduler(std::vector<Host> hosts, const MonitorSettings& settings,
                     const Prober& prober)
    : hosts_(std::move(hosts)), settings_(settings), prober_(prober) {
    if (settings_.interval_ms <= 0) throw std::invalid_argument("interval must be positive");
    int longest = 0;
    for (std::size_t h = 0; h < hosts_.size(); ++h) {
        for (const auto& t : hosts_[h].tests) {
            entries_.push_back(
                Entry{h, &t, TestState(settings_.history_length, settings_.slow_threshold_ms)});
            longest = std::max(longest, probe_budget_ms(t));
        }
    }
    if (entries_.empty()) throw std::invalid_argument("no tests configured");
    pool_ = std::make_unique<WorkerPool>(std::min(settings_.workers, entries_.size()));
    // Tests beyond the worker count queue behind earlier ones: the budget
    // covers every wave of probes, each as long as the slowest test.
    const std::size_t waves = (entries_.size() + pool_->size() - 1) / pool_->size();
    budget_ = std::chrono::milliseconds(
        std::max<long long>(settings_.interval_ms, static_cast<long long>(waves) * longest) +
        std::max(settings_.cycle_grace_ms, 0));
    latest_ = build_snapshot();
    log(LogLevel::INFO, "scheduler ready: " + std::to_string(entries_.size()) + " tests on " +
                            std::to_string(hosts_.size()) + " hosts, " +
                            std::to_string(pool_->size()) + " workers, cycle budget " +
                            std::to_string(budget_.count()) + "ms");
}

Scheduler::~Scheduler() {
    pool_.reset();
}

void Scheduler::dispatch(std::size_t index, uint64_t cycle, SteadyClock::time_point deadline) {
    const Host* host = &hosts_[entries_[index].host];
    const TestSpec* test = entries_[index].test;
    pool_->submit([this, host, test, index, cycle, deadline] {
        ProbeResult r;
        if (SteadyClock::now() >= deadline) {
            r = ProbeResult::failure("not started before cycle deadline");
        } else {
            try {
                r = prober_.probe(*host, *test);
            } catch (const std::exception& ex) {
                log(LogLevel::WARN, "probe " + host->address.str() + " " + test->label() +
                                        " failed unexpectedly: " + ex.what());
                r = ProbeResult::failure(std::string("probe error: ") + ex.what());
            }
        }
        if (!r.ok)
            log(LogLevel::DEBUG, host->address.str() + " " + test->label() + ": " + r.error);
        results_.push(TaggedResult{index, cycle, std::move(r)});
    });
}

uint64_t Scheduler::run_cycle() {
    const uint64_t cycle = ++cycle_;
    const auto deadline = SteadyClock::now() + budget_;

    set_phase(CyclePhase::Dispatching);
    std::size_t dispatched = 0;
    std::vector<bool> skipped(entries_.size(), false);
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].in_flight) {
            skipped[i] = true;
            continue;
        }
        entries_[i].in_flight = true;
        dispatch(i, cycle, deadline);
        ++dispatched;
    }

    set_phase(CyclePhase::AwaitingResults);
    std::vector<TaggedResult> received;
    std::size_t answered = 0;
    auto take = [&](TaggedResult r) {
        entries_[r.test].in_flight = false;
        if (r.cycle == cycle) ++answered;
        received.push_back(std::move(r));
    };
    while (answered < dispatched) {
        auto r = results_.pop_until(deadline);
        if (!r) break;
        take(std::move(*r));
    }
    while (auto r = results_.try_pop()) take(std::move(*r));

    set_phase(CyclePhase::Merging);
    std::vector<bool> merged(entries_.size(), false);
    for (const auto& r : received) {
        if (merge(r))
            merged[r.test] = true;
        else
            log(LogLevel::DEBUG, "dropped stale result from cycle " + std::to_string(r.cycle) +
                                     " (now " + std::to_string(cycle) + ")");
    }
    std::size_t missing = 0;
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (merged[i]) continue;
        ++missing;
        const char* why = "no result before cycle deadline";
        if (skipped[i])
            why = entries_[i].in_flight ? "previous probe still running"
                                        : "previous result arrived after its cycle";
        merge(TaggedResult{i, cycle, ProbeResult::failure(why)});
    }
    if (missing > 0)
        log(LogLevel::INFO, "cycle " + std::to_string(cycle) + ": " + std::to_string(missing) +
                                " tests without a result in time");

    set_phase(CyclePhase::Published);
    SnapshotPtr snap = build_snapshot();
    {
        std::lock_guard<std::mutex> lock(snap_mu_);
        latest_ = snap;
    }
    bus_.publish(*snap);
    set_phase(CyclePhase::Idle);
    return cycle;
}

bool Scheduler::run(const std::atomic<bool>& stop, uint64_t max_cycles) {
    CycleTimer timer;
    if (!timer.start(settings_.interval_ms)) return false;
    uint64_t ran = 0;
    while (!stop.load()) {
        run_cycle();
        ++ran;
        if (max_cycles != 0 && ran >= max_cycles) break;
        uint64_t ticks = 0;
        while (!stop.load() && (ticks = timer.wait(200)) == 0) {
        }
        if (ticks > 1)
            log(LogLevel::DEBUG, "cycle " + std::to_string(cycle_) + " overran " +
                                     std::to_string(ticks - 1) + " boundaries");
    }
    return true;
}

bool Scheduler::merge(const TaggedResult& r) {
    if (r.test >= entries_.size()) return false;
    return entries_[r.test].state.apply(r.cycle, r.result, WallClock::now());
}

SnapshotPtr Scheduler::snapshot() const {
    std::lock_guard<std::mutex> lock(snap_mu_);
    return latest_;
}

SnapshotPtr Scheduler::build_snapshot() const {
    auto snap = std::make_shared<Snapshot>();
    snap->cycle = cycle_;
    snap->taken_at = WallClock::now();
    snap->slow_threshold_ms = settings_.slow_threshold_ms;
    snap->hosts.reserve(hosts_.size());
    for (const auto& h : hosts_) snap->hosts.push_back(HostView{h.address.str(), h.description, {}});
    for (const auto& e : entries_) {
        TestView v;
        v.label = e.test->label();
        v.protocol = e.test->protocol;
        v.port_low = e.test->port_low;
        v.port_high = e.test->port_high;
        v.status = e.state.status();
        v.latency_ms = e.state.latency_ms();
        v.last_up = e.state.last_up();
        v.failure_reason = e.state.failure_reason();
        v.last_cycle = e.state.last_cycle();
        v.history = e.state.history().ordered();
        snap->hosts[e.host].tests.push_back(std::move(v));
    }
    return snap;
}
}  // namespace mpng
