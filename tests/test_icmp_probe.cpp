#include <chrono>
#include <cstring>

#include "../src/probes/icmp_probe.hpp"

using namespace mpng;

int main() {
    // RFC 1071 example words 0x0001 0xf203 0xf4f5 0xf6f7 sum to 0xddf2.
    const unsigned char words[] = {0x00, 0x01, 0xf2, 0x03, 0xf4, 0xf5, 0xf6, 0xf7};
    uint16_t sum = icmp_checksum(words, sizeof(words));
    const unsigned char* b = reinterpret_cast<const unsigned char*>(&sum);
    if (b[0] != 0x22 || b[1] != 0x0d) return 1;
    // A buffer carrying its own checksum verifies to zero.
    unsigned char pkt[10];
    std::memcpy(pkt, words, sizeof(words));
    std::memcpy(pkt + 8, &sum, 2);
    if (icmp_checksum(pkt, sizeof(pkt)) != 0) return 2;

    IcmpProbe probe;
    auto loopback = *IpAddress::parse("127.0.0.1");
    auto start = std::chrono::steady_clock::now();
    ProbeResult r = probe.run(loopback, 500);
    if (std::chrono::steady_clock::now() - start > std::chrono::milliseconds(1500)) return 3;
    if (IcmpProbe::available(AF_INET) == IcmpSocketKind::None) {
        // No permission for ICMP here: it must surface as a failure with a reason.
        if (r.ok || r.error.empty()) return 4;
        return 0;
    }
    // Hosts may be set to ignore echo requests; a miss still has to say why.
    if (r.ok && (!r.latency_ms || *r.latency_ms < 0)) return 5;
    if (!r.ok && r.error.empty()) return 7;

    // Documentation address: no reply, reported as a failure within the wait.
    ProbeResult none = probe.run(*IpAddress::parse("192.0.2.1"), 200);
    if (none.ok || none.error.empty()) return 6;
    return 0;
}
