#pragma once
#include <ostream>
#include <string>
#include <utility>

#include "../core/snapshot.hpp"

namespace mpng {
struct DashboardOptions {
    bool color{true};
    bool clear_screen{true};
    std::string title{"MultiPing NG"};
};

// Formats one snapshot as the dashboard text. No I/O.
std::string render_dashboard(const Snapshot& snap, const DashboardOptions& opts);

// Symbol drawn for one history slot (plain, without color).
char history_symbol(Status s);

// Replaces control characters so configured text cannot emit escape sequences.
std::string terminal_safe(const std::string& in);

class TerminalDashboard : public SnapshotSink {
   public:
    TerminalDashboard(std::ostream& out, DashboardOptions opts) : out_(out), opts_(std::move(opts)) {}
    void on_snapshot(const Snapshot& snap) override;

   private:
    std::ostream& out_;
    DashboardOptions opts_;
};
}  // namespace mpng
