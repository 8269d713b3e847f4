#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ip_address.hpp"
#include "logger.hpp"

namespace mpng {
enum class Protocol { ICMP, TCP };

// How a TCP test spanning several ports turns into one outcome.
//  Any:  up when at least one port connects.
//  All:  up only when every port connects.
//  Each: the loader splits the range into one single-port test per port.
enum class PortRangePolicy { Any, All, Each };

const char* protocol_name(Protocol p);
const char* policy_name(PortRangePolicy p);
bool parse_policy(const std::string& name, PortRangePolicy& out);

struct TestSpec {
    Protocol protocol{Protocol::ICMP};
    uint16_t port_low{0};
    uint16_t port_high{0};
    PortRangePolicy policy{PortRangePolicy::Any};
    int timeout_ms{1000};

    bool is_range() const {
        return protocol == Protocol::TCP && port_high > port_low;
    }
    std::size_t port_count() const {
        return protocol == Protocol::TCP ? static_cast<std::size_t>(port_high - port_low) + 1 : 0;
    }
    // "ICMP", "TCP port 443", "TCP ports 8000-8002 (all)"
    std::string label() const;
};

struct Host {
    IpAddress address;
    std::string description;
    std::vector<TestSpec> tests;
};

struct ProbeResult {
    bool ok{false};
    std::optional<double> latency_ms;
    std::string error;

    static ProbeResult success(double ms) {
        return ProbeResult{true, ms, std::string()};
    }
    static ProbeResult failure(std::string why) {
        return ProbeResult{false, std::nullopt, std::move(why)};
    }
};

struct MonitorSettings {
    int interval_ms{1000};
    std::size_t history_length{35};
    double slow_threshold_ms{200.0};
    std::size_t workers{20};
    int cycle_grace_ms{250};
    int icmp_timeout_ms{1000};
    int tcp_timeout_ms{500};
    PortRangePolicy port_range_policy{PortRangePolicy::Any};
    LogLevel log_level{LogLevel::WARN};
    bool ignore_self{false};
};
}  // namespace mpng
