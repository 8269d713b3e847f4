#include "dashboard.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>

#include "../core/time_utils.hpp"

namespace mpng {
namespace {
const char* const kBold = "\033[1m";
const char* const kReset = "\033[0m";
const char* const kRed = "\033[31m";
const char* const kYellow = "\033[33m";
const char* const kBoldRed = "\033[1m\033[31m";
const char* const kClear = "\033[H\033[J";

constexpr std::size_t kLabelWidth = 15;
constexpr std::size_t kStatusWidth = 10;
constexpr std::size_t kDescWidth = 20;

std::string pad_right(const std::string& s, std::size_t width) {
    return s.size() >= width ? s : s + std::string(width - s.size(), ' ');
}

// Pads on the visible width, then wraps the text in `style`, so escape
// sequences never shift the columns.
std::string styled_left_pad(const std::string& plain, std::size_t width, const char* style,
                            bool color) {
    std::string pad = plain.size() >= width ? std::string() : std::string(width - plain.size(), ' ');
    if (!color || style == nullptr) return pad + plain;
    return pad + style + plain + kReset;
}

std::string format_latency(double ms) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1fms", ms);
    return buf;
}

std::string status_cell(const TestView& t, bool color) {
    switch (t.status) {
        case Status::Empty: return styled_left_pad("-", kStatusWidth, nullptr, color);
        case Status::Down: return styled_left_pad("DOWN", kStatusWidth, kBoldRed, color);
        case Status::Slow:
            return styled_left_pad(format_latency(t.latency_ms.value_or(0)), kStatusWidth, kYellow,
                                   color);
        case Status::Up:
            return styled_left_pad(format_latency(t.latency_ms.value_or(0)), kStatusWidth, nullptr,
                                   color);
    }
    return std::string(kStatusWidth, ' ');
}

std::string history_cell(const std::vector<Status>& history, bool color) {
    std::string out;
    for (Status s : history) {
        char c = history_symbol(s);
        if (color && s == Status::Slow) {
            out += kBold;
            out += kYellow;
            out += c;
            out += kReset;
        } else if (color && s == Status::Down) {
            out += kRed;
            out += c;
            out += kReset;
        } else {
            out += c;
        }
    }
    return out;
}

std::string last_seen_cell(const TestView& t) {
    if (t.status != Status::Down) return std::string();
    if (!t.last_up) return "Never seen";
    return "Last seen: " + local_time_string(*t.last_up);
}
}  // namespace

char history_symbol(Status s) {
    switch (s) {
        case Status::Empty: return ' ';
        case Status::Up: return '.';
        case Status::Slow: return 'o';
        case Status::Down: return 'X';
    }
    return '?';
}

std::string terminal_safe(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        auto u = static_cast<unsigned char>(c);
        out += (u < 0x20 || u == 0x7f) ? '?' : c;
    }
    return out;
}

std::string render_dashboard(const Snapshot& snap, const DashboardOptions& opts) {
    const bool color = opts.color;
    std::ostringstream out;
    if (opts.clear_screen) out << kClear;
    out << (color ? kBold : "") << "\n\n" << opts.title << " - " << (color ? kReset : "")
        << local_time_string(snap.taken_at) << "\n\n";
    std::size_t history_width = 0;
    for (const auto& h : snap.hosts)
        for (const auto& t : h.tests) history_width = std::max(history_width, t.history.size());

    for (const auto& h : snap.hosts) {
        out << (color ? kBold : "") << pad_right(terminal_safe(h.description), kDescWidth)
            << (color ? kReset : "") << " (" << h.address << ")\n";
        out << "    " << pad_right("Test", kLabelWidth) << " "
            << styled_left_pad("Status", kStatusWidth, nullptr, false) << "   "
            << pad_right("History", history_width) << "  Last Seen\n";
        for (const auto& t : h.tests) {
            std::string row = "    " + pad_right(t.label, kLabelWidth) + " " + status_cell(t, color) +
                              "   " + history_cell(t.history, color);
            if (t.history.size() < history_width)
                row += std::string(history_width - t.history.size(), ' ');
            std::string seen = last_seen_cell(t);
            if (!seen.empty()) row += "  " + seen;
            out << row << "\n";
        }
        out << "\n";
    }
    return out.str();
}

void TerminalDashboard::on_snapshot(const Snapshot& snap) {
    out_ << render_dashboard(snap, opts_);
    out_.flush();
}
}  // namespace mpng
