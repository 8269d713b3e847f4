#include <filesystem>
#include <fstream>
#include <string>

#include "../src/config/config.hpp"

using namespace mpng;

namespace {
bool rejects(const std::string& yaml, const std::string& needle) {
    try {
        parse_config(yaml);
    } catch (const ConfigError& ex) {
        return std::string(ex.what()).find(needle) != std::string::npos;
    }
    return false;
}
}  // namespace

int main() {
    const std::string text =
        "settings:\n"
        "  interval_ms: 2000\n"
        "  history_length: 10\n"
        "  slow_threshold_ms: 150\n"
        "  tcp_timeout_ms: 300\n"
        "hosts:\n"
        "  - 10.0.0.1:\n"
        "      description: Router\n"
        "      tests:\n"
        "        - protocol: icmp\n"
        "        - protocol: TCP\n"
        "          port: 8000-8002\n"
        "        - protocol: TCP\n"
        "          port: 443\n"
        "          policy: all\n"
        "          timeout_ms: 900\n"
        "  - 10.0.0.2:\n"
        "  - 10.0.0.3:\n"
        "      tests:\n"
        "        - protocol: TCP\n"
        "          port: 20-22\n"
        "          policy: each\n"
        "  - \"::1\":\n"
        "      description: v6 loopback\n";
    MonitorConfig cfg = parse_config(text);
    if (cfg.settings.interval_ms != 2000 || cfg.settings.history_length != 10) return 1;
    if (cfg.settings.slow_threshold_ms != 150) return 2;
    if (cfg.settings.workers != 20 || cfg.settings.icmp_timeout_ms != 1000) return 3;
    if (cfg.hosts.size() != 4) return 4;

    const Host& router = cfg.hosts[0];
    if (router.description != "Router" || router.tests.size() != 3) return 5;
    if (router.tests[0].protocol != Protocol::ICMP || router.tests[0].timeout_ms != 1000) return 6;
    const TestSpec& range = router.tests[1];
    if (range.port_low != 8000 || range.port_high != 8002 || range.timeout_ms != 300) return 7;
    if (range.policy != PortRangePolicy::Any || range.label() != "TCP ports 8000-8002") return 8;
    if (router.tests[2].policy != PortRangePolicy::All || router.tests[2].timeout_ms != 900)
        return 9;
    if (router.tests[2].label() != "TCP port 443") return 10;

    // no tests declared: one ICMP test, description defaults to the address
    const Host& bare = cfg.hosts[1];
    if (bare.description != "10.0.0.2" || bare.tests.size() != 1) return 11;
    if (bare.tests[0].protocol != Protocol::ICMP) return 12;

    // "each" splits the range into one test per port
    const Host& split = cfg.hosts[2];
    if (split.tests.size() != 3) return 13;
    for (std::size_t i = 0; i < 3; ++i)
        if (split.tests[i].port_low != 20 + i || split.tests[i].port_high != 20 + i) return 14;
    if (!cfg.hosts[3].address.is_v6()) return 15;
    if (cfg.test_count() != 8) return 16;

    if (!rejects("hosts:\n  - 10.0.0.300:\n", "invalid IP address")) return 20;
    if (!rejects("hosts:\n  - 10.0.0.1:\n      tests:\n        - protocol: TCP\n", "must specify a port"))
        return 21;
    if (!rejects("hosts:\n  - 10.0.0.1:\n      tests:\n        - protocol: TCP\n          port: 90-80\n",
                 "low > high"))
        return 22;
    if (!rejects("hosts:\n  - 10.0.0.1:\n      tests:\n        - protocol: TCP\n          port: 70000\n",
                 "out of range"))
        return 23;
    if (!rejects("hosts:\n  - 10.0.0.1:\n      tests:\n        - protocol: TCP\n          port: http\n",
                 "invalid port"))
        return 24;
    if (!rejects("hosts:\n  - 10.0.0.1:\n      tests:\n        - protocol: UDP\n", "unknown protocol"))
        return 25;
    if (!rejects("settings:\n  interval_ms: 0\nhosts:\n  - 10.0.0.1:\n", "must be positive")) return 26;
    if (!rejects("nothing: here\n", "'hosts'")) return 27;
    if (!rejects("hosts: []\n", "non-empty")) return 28;
    if (!rejects("hosts: [\n", "error parsing YAML")) return 29;
    if (!rejects("settings:\n  port_range_policy: some\nhosts:\n  - 10.0.0.1:\n", "any, all or each"))
        return 30;

    // ignore_self drops local addresses; the file loader fails if none are left
    MonitorConfig self = parse_config("ignore_self: true\nhosts:\n  - 127.0.0.1:\n  - 10.9.9.9:\n");
    if (!self.settings.ignore_self) return 31;
    if (drop_self_hosts(self, {"127.0.0.1"}) != 1 || self.hosts.size() != 1) return 32;
    if (self.hosts[0].address.str() != "10.9.9.9") return 33;

    auto path = std::filesystem::temp_directory_path() / "mpng_test_self_only.yaml";
    {
        std::ofstream out(path);
        out << "ignore_self: true\nhosts:\n  - 127.0.0.1:\n";
    }
    bool threw = false;
    try {
        load_config_file(path.string());
    } catch (const ConfigError&) {
        threw = true;
    }
    std::filesystem::remove(path);
    if (!threw) return 34;

    try {
        load_config_file("/nonexistent/mpng.yaml");
        return 35;
    } catch (const ConfigError& ex) {
        if (std::string(ex.what()).find("not found") == std::string::npos) return 36;
    }

    uint16_t lo = 0, hi = 0;
    parse_port_spec(" 22 - 25 ", lo, hi);
    if (lo != 22 || hi != 25) return 37;

    // Flow-sequence keys are valid YAML but never a setting name or address.
    if (!rejects("settings:\n  [a, b]: 1\nhosts:\n  - 10.0.0.1\n", "keys must be scalars"))
        return 38;
    if (!rejects("hosts:\n  - {[1, 2]: {}}\n", "keys must be scalars")) return 39;
    return 0;
}
