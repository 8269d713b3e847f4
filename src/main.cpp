#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "config/config.hpp"
#include "core/logger.hpp"
#include "core/scheduler.hpp"
#include "probes/icmp_probe.hpp"
#include "probes/prober.hpp"
#include "render/dashboard.hpp"

using namespace mpng;

namespace {
std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop.store(true); }

void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;  // no SA_RESTART: a pending poll returns EINTR and the loop sees g_stop
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

struct RunOptions {
    std::string config_path;
    int interval_ms{0};
    int history{0};
    int workers{0};
    double slow_ms{0};
    uint64_t cycles{0};
    bool no_color{false};
    std::string log_level;
};

int parse_positive(const std::string& flag, const char* value) {
    int v = std::stoi(value);
    if (v <= 0) throw std::invalid_argument(flag + " must be positive");
    return v;
}

void apply_overrides(const RunOptions& o, MonitorSettings& s) {
    if (o.interval_ms > 0) s.interval_ms = o.interval_ms;
    if (o.history > 0) s.history_length = static_cast<std::size_t>(o.history);
    if (o.workers > 0) s.workers = static_cast<std::size_t>(o.workers);
    if (o.slow_ms > 0) s.slow_threshold_ms = o.slow_ms;
    if (!o.log_level.empty() && !parse_log_level(o.log_level, s.log_level))
        throw ConfigError("unknown log level '" + o.log_level + "'");
}

void warn_if_icmp_unavailable(const MonitorConfig& cfg) {
    bool need_v4 = false, need_v6 = false;
    for (const auto& h : cfg.hosts)
        for (const auto& t : h.tests)
            if (t.protocol == Protocol::ICMP) (h.address.is_v6() ? need_v6 : need_v4) = true;
    if (need_v4 && IcmpProbe::available(AF_INET) == IcmpSocketKind::None)
        log(LogLevel::WARN, "cannot open an ICMP socket; ICMP tests will show DOWN (run 'mpng doctor')");
    if (need_v6 && IcmpProbe::available(AF_INET6) == IcmpSocketKind::None)
        log(LogLevel::WARN, "cannot open an ICMPv6 socket; IPv6 ICMP tests will show DOWN");
}
}  // namespace

static int cmd_doctor() {
    std::cout << "Doctor checks:\n";
    std::cout << " - ICMP (IPv4): " << icmp_socket_kind_name(IcmpProbe::available(AF_INET)) << "\n";
    std::cout << " - ICMP (IPv6): " << icmp_socket_kind_name(IcmpProbe::available(AF_INET6)) << "\n";
    std::ifstream range("/proc/sys/net/ipv4/ping_group_range");
    std::string lo, hi;
    if (range >> lo >> hi)
        std::cout << " - ping_group_range: " << lo << " " << hi << " (gid " << ::getgid() << ")\n";
    std::cout << " - Unprivileged ICMP needs your group inside net.ipv4.ping_group_range,\n"
              << "   otherwise try: setcap cap_net_raw+ep ./mpng\n";
    return 0;
}

static int cmd_check(const std::string& path) {
    MonitorConfig cfg;
    try {
        cfg = load_config_file(path);
    } catch (const ConfigError& ex) {
        log(LogLevel::ERROR, ex.what());
        return 2;
    }
    const auto& s = cfg.settings;
    std::cout << "interval " << s.interval_ms << "ms, history " << s.history_length << ", slow >= "
              << s.slow_threshold_ms << "ms, " << s.workers << " workers\n";
    for (const auto& h : cfg.hosts) {
        std::cout << h.description << " (" << h.address.str() << ")\n";
        for (const auto& t : h.tests)
            std::cout << "    " << t.label() << ", timeout " << t.timeout_ms << "ms\n";
    }
    std::cout << cfg.test_count() << " tests on " << cfg.hosts.size() << " hosts\n";
    return 0;
}

static int cmd_run(const RunOptions& opts) {
    MonitorConfig cfg;
    try {
        cfg = load_config_file(opts.config_path);
        apply_overrides(opts, cfg.settings);
    } catch (const ConfigError& ex) {
        log(LogLevel::ERROR, ex.what());
        return 2;
    }
    set_log_level(cfg.settings.log_level);
    warn_if_icmp_unavailable(cfg);

    NetworkProber prober;
    DashboardOptions dash;
    bool tty = ::isatty(STDOUT_FILENO) == 1;
    dash.color = tty && !opts.no_color;
    dash.clear_screen = tty;
    TerminalDashboard dashboard(std::cout, dash);

    try {
        Scheduler scheduler(std::move(cfg.hosts), cfg.settings, prober);
        scheduler.add_sink(&dashboard);
        install_signal_handlers();
        log(LogLevel::INFO, "monitoring started");
        if (!scheduler.run(g_stop, opts.cycles)) return 1;
    } catch (const std::invalid_argument& ex) {
        log(LogLevel::ERROR, std::string("invalid configuration: ") + ex.what());
        return 2;
    }
    log(LogLevel::INFO, "monitoring stopped");
    std::cout << "\nExiting...\n";
    return 0;
}

static void print_usage() {
    std::cerr << "Usage: mpng <run|check|doctor> [options]\n"
              << "  run    <config.yaml> [--interval <ms>] [--history <n>] [--workers <n>] "
                 "[--slow <ms>] [--cycles <n>] [--no-color] [--log-level <lvl>]\n"
              << "  check  <config.yaml>\n"
              << "  doctor (no args)\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }
    std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h") {
        print_usage();
        return 0;
    }
    if (cmd == "doctor") return cmd_doctor();
    if (cmd == "check") {
        if (argc < 3) {
            print_usage();
            return 1;
        }
        return cmd_check(argv[2]);
    }
    if (cmd == "run") {
        RunOptions opts;
        try {
            for (int i = 2; i < argc; ++i) {
                std::string a = argv[i];
                if (a == "--interval" && i + 1 < argc) {
                    opts.interval_ms = parse_positive(a, argv[++i]);
                } else if (a == "--history" && i + 1 < argc) {
                    opts.history = parse_positive(a, argv[++i]);
                } else if (a == "--workers" && i + 1 < argc) {
                    opts.workers = parse_positive(a, argv[++i]);
                } else if (a == "--slow" && i + 1 < argc) {
                    opts.slow_ms = parse_positive(a, argv[++i]);
                } else if (a == "--cycles" && i + 1 < argc) {
                    opts.cycles = static_cast<uint64_t>(parse_positive(a, argv[++i]));
                } else if (a == "--no-color") {
                    opts.no_color = true;
                } else if (a == "--log-level" && i + 1 < argc) {
                    opts.log_level = argv[++i];
                } else if (!a.empty() && a[0] != '-' && opts.config_path.empty()) {
                    opts.config_path = a;
                } else {
                    std::cerr << "Unknown option: " << a << "\n";
                    print_usage();
                    return 1;
                }
            }
        } catch (const std::exception& ex) {
            std::cerr << "Bad option value: " << ex.what() << "\n";
            return 1;
        }
        if (opts.config_path.empty()) {
            print_usage();
            return 1;
        }
        return cmd_run(opts);
    }
    std::cerr << "Unknown command\n";
    return 1;
}
