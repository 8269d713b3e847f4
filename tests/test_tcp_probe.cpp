#include <arpa/inet.h>
#include <netinet/in.h>
#include <fcntl.h>
#include <sys/socket.h>

#include <cerrno>

#include <chrono>
#include <string>
#include <utility>

#include "../src/core/fd.hpp"
#include "../src/probes/tcp_connect.hpp"

using namespace mpng;

namespace {
// Binds 127.0.0.1:`port` (0 = any) and optionally listens; returns the port or 0.
uint16_t bind_loopback(OwnedFd& fd, uint16_t port, bool listen_too) {
    fd.reset(::socket(AF_INET, SOCK_STREAM, 0));
    if (!fd) return 0;
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port = htons(port);
    sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) < 0) return 0;
    if (listen_too && ::listen(fd.get(), 8) < 0) return 0;
    socklen_t len = sizeof(sa);
    if (::getsockname(fd.get(), reinterpret_cast<sockaddr*>(&sa), &len) < 0) return 0;
    return ntohs(sa.sin_port);
}
}  // namespace

int main() {
    auto lo = *IpAddress::parse("127.0.0.1");
    OwnedFd listener, closed_sock, neighbour;
    uint16_t open_port = bind_loopback(listener, 0, true);
    uint16_t closed_port = bind_loopback(closed_sock, 0, false);  // bound, never listening
    if (open_port == 0 || closed_port == 0) return 1;

    TcpConnectProbe probe;

    // Range around the listener: one port connects, the policy says up.
    uint16_t range_lo = static_cast<uint16_t>(open_port - 1);
    uint16_t range_hi = open_port == 65535 ? open_port : static_cast<uint16_t>(open_port + 1);
    ProbeResult any = probe.run(lo, range_lo, range_hi, PortRangePolicy::Any, 500);
    if (!any.ok) return 2;
    if (!any.latency_ms || *any.latency_ms < 0 || *any.latency_ms > 500) return 3;

    // Smaller batches reach the same answer.
    TcpConnectProbe narrow(1);
    if (!narrow.run(lo, range_lo, range_hi, PortRangePolicy::Any, 500).ok) return 4;

    ProbeResult refused = probe.run(lo, closed_port, closed_port, PortRangePolicy::Any, 500);
    if (refused.ok || refused.latency_ms) return 5;
    if (refused.error.find(std::to_string(closed_port)) == std::string::npos) return 6;

    if (!probe.run(lo, open_port, open_port, PortRangePolicy::All, 500).ok) return 7;
    if (probe.run(lo, closed_port, closed_port, PortRangePolicy::All, 500).ok) return 8;

    // Two adjacent listeners: every port connects under the all policy.
    if (open_port < 65535 &&
        bind_loopback(neighbour, static_cast<uint16_t>(open_port + 1), true) != 0) {
        ProbeResult both = probe.run(lo, open_port, static_cast<uint16_t>(open_port + 1),
                                     PortRangePolicy::All, 500);
        if (!both.ok) return 9;
    }

    // Unroutable documentation address: fails within the timeout, never throws.
    auto start = std::chrono::steady_clock::now();
    ProbeResult blackhole =
        probe.run(*IpAddress::parse("192.0.2.1"), 80, 80, PortRangePolicy::Any, 100);
    if (blackhole.ok) return 10;
    if (std::chrono::steady_clock::now() - start > std::chrono::milliseconds(1000)) return 11;

    // A moved-from owner gives up the descriptor; the new owner closes it.
    int raw = -1;
    {
        OwnedFd first;
        first.reset(::socket(AF_INET, SOCK_STREAM, 0));
        raw = first.get();
        OwnedFd second(std::move(first));
        if (first || second.get() != raw) return 12;
        if (::fcntl(raw, F_GETFD) < 0) return 13;
    }
    if (::fcntl(raw, F_GETFD) != -1 || errno != EBADF) return 14;
    return 0;
}
