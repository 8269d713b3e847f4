#include "icmp_probe.hpp"

#include <arpa/inet.h>
#include <netinet/icmp6.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <random>

#include "../core/time_utils.hpp"

namespace mpng {
namespace {
constexpr std::size_t kPayloadLen = 16;

uint16_t make_token() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    return static_cast<uint16_t>(rng());
}

struct EchoReply {
    bool matched{false};
    bool unreachable{false};
};

// Parses one datagram read from the socket. Raw IPv4 sockets deliver the IP
// header; datagram sockets and all ICMPv6 sockets do not. The kernel rewrites
// the identifier on datagram sockets and filters replies per socket, so only
// the sequence number is compared there.
EchoReply inspect_v4(const uint8_t* buf, std::size_t n, bool raw, uint16_t id, uint16_t seq) {
    EchoReply out;
    std::size_t off = 0;
    if (raw) {
        if (n < sizeof(iphdr)) return out;
        off = reinterpret_cast<const iphdr*>(buf)->ihl * 4u;
    }
    if (n < off + sizeof(icmphdr)) return out;
    const auto* icmp = reinterpret_cast<const icmphdr*>(buf + off);
    if (icmp->type == ICMP_ECHOREPLY) {
        out.matched = ntohs(icmp->un.echo.sequence) == seq &&
                      (!raw || ntohs(icmp->un.echo.id) == id);
        return out;
    }
    if (raw && icmp->type == ICMP_DEST_UNREACH) {
        // Error quotes our original IP header and the first 8 bytes of the echo.
        std::size_t inner = off + sizeof(icmphdr);
        if (n < inner + sizeof(iphdr)) return out;
        std::size_t inner_icmp = inner + reinterpret_cast<const iphdr*>(buf + inner)->ihl * 4u;
        if (n < inner_icmp + sizeof(icmphdr)) return out;
        const auto* orig = reinterpret_cast<const icmphdr*>(buf + inner_icmp);
        out.unreachable = orig->type == ICMP_ECHO && ntohs(orig->un.echo.id) == id &&
                          ntohs(orig->un.echo.sequence) == seq;
    }
    return out;
}

EchoReply inspect_v6(const uint8_t* buf, std::size_t n, bool raw, uint16_t id, uint16_t seq) {
    EchoReply out;
    if (n < sizeof(icmp6_hdr)) return out;
    const auto* icmp = reinterpret_cast<const icmp6_hdr*>(buf);
    if (icmp->icmp6_type == ICMP6_ECHO_REPLY) {
        out.matched = ntohs(icmp->icmp6_seq) == seq && (!raw || ntohs(icmp->icmp6_id) == id);
        return out;
    }
    if (raw && icmp->icmp6_type == ICMP6_DST_UNREACH) {
        std::size_t inner = sizeof(icmp6_hdr) + 40;  // fixed IPv6 header
        if (n < inner + sizeof(icmp6_hdr)) return out;
        const auto* orig = reinterpret_cast<const icmp6_hdr*>(buf + inner);
        out.unreachable = orig->icmp6_type == ICMP6_ECHO_REQUEST &&
                          ntohs(orig->icmp6_id) == id && ntohs(orig->icmp6_seq) == seq;
    }
    return out;
}
}  // namespace

uint16_t icmp_checksum(const void* data, std::size_t len) {
    const auto* p = static_cast<const uint8_t*>(data);
    uint32_t sum = 0;
    for (; len > 1; len -= 2, p += 2) sum += static_cast<uint32_t>((p[0] << 8) | p[1]);
    if (len == 1) sum += static_cast<uint32_t>(p[0] << 8);
    sum = (sum >> 16) + (sum & 0xFFFF);
    sum += (sum >> 16);
    return htons(static_cast<uint16_t>(~sum));
}

const char* icmp_socket_kind_name(IcmpSocketKind k) {
    switch (k) {
        case IcmpSocketKind::None: return "unavailable";
        case IcmpSocketKind::Datagram: return "datagram";
        case IcmpSocketKind::Raw: return "raw";
    }
    return "?";
}

IcmpProbe::Socket IcmpProbe::open_socket(int family) {
    Socket s;
    int proto = family == AF_INET6 ? IPPROTO_ICMPV6 : IPPROTO_ICMP;
    int fd = ::socket(family, SOCK_DGRAM | SOCK_CLOEXEC, proto);
    if (fd >= 0) {
        s.fd.reset(fd);
        s.kind = IcmpSocketKind::Datagram;
        return s;
    }
    fd = ::socket(family, SOCK_RAW | SOCK_CLOEXEC, proto);
    if (fd >= 0) {
        s.fd.reset(fd);
        s.kind = IcmpSocketKind::Raw;
        return s;
    }
    s.error = errno;
    return s;
}

IcmpSocketKind IcmpProbe::available(int family) {
    return open_socket(family).kind;
}

ProbeResult IcmpProbe::run(const IpAddress& addr, int timeout_ms) const {
    Socket sock = open_socket(addr.family());
    if (!sock.fd) {
        return ProbeResult::failure(std::string("icmp socket: ") + std::strerror(sock.error));
    }
    const bool raw = sock.kind == IcmpSocketKind::Raw;
    const bool v6 = addr.is_v6();
    const uint16_t id = make_token();
    const uint16_t seq = make_token();

    uint8_t pkt[sizeof(icmphdr) + kPayloadLen] = {};
    if (v6) {
        auto* hdr = reinterpret_cast<icmp6_hdr*>(pkt);
        hdr->icmp6_type = ICMP6_ECHO_REQUEST;
        hdr->icmp6_code = 0;
        hdr->icmp6_id = htons(id);
        hdr->icmp6_seq = htons(seq);  // kernel fills the ICMPv6 checksum
    } else {
        auto* hdr = reinterpret_cast<icmphdr*>(pkt);
        hdr->type = ICMP_ECHO;
        hdr->code = 0;
        hdr->un.echo.id = htons(id);
        hdr->un.echo.sequence = htons(seq);
    }
    uint64_t stamp = monotonic_ns();
    std::memcpy(pkt + sizeof(icmphdr), &stamp, sizeof(stamp));
    if (!v6) {
        auto* hdr = reinterpret_cast<icmphdr*>(pkt);
        hdr->checksum = 0;
        hdr->checksum = icmp_checksum(pkt, sizeof(pkt));
    }

    sockaddr_storage dst{};
    socklen_t dst_len = addr.to_sockaddr(0, dst);
    auto start = SteadyClock::now();
    auto deadline = start + std::chrono::milliseconds(timeout_ms);
    if (::sendto(sock.fd.get(), pkt, sizeof(pkt), 0, reinterpret_cast<sockaddr*>(&dst), dst_len) <
        0) {
        return ProbeResult::failure(std::string("icmp send: ") + std::strerror(errno));
    }

    uint8_t buf[1500];
    for (;;) {
        int wait_ms = remaining_ms(deadline);
        if (wait_ms <= 0) return ProbeResult::failure("timeout");
        pollfd pfd{sock.fd.get(), POLLIN, 0};
        int n = ::poll(&pfd, 1, wait_ms);
        if (n == 0) return ProbeResult::failure("timeout");
        if (n < 0) {
            if (errno == EINTR) continue;
            return ProbeResult::failure(std::string("icmp poll: ") + std::strerror(errno));
        }
        sockaddr_storage from{};
        socklen_t from_len = sizeof(from);
        ssize_t got = ::recvfrom(sock.fd.get(), buf, sizeof(buf), MSG_DONTWAIT,
                                 reinterpret_cast<sockaddr*>(&from), &from_len);
        if (got < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return ProbeResult::failure(std::string("icmp recv: ") + std::strerror(errno));
        }
        double ms = elapsed_ms(start);
        // Raw sockets see every ICMP packet for the host; ignore other peers.
        bool from_target = addr.matches(from);
        EchoReply r = v6 ? inspect_v6(buf, static_cast<std::size_t>(got), raw, id, seq)
                         : inspect_v4(buf, static_cast<std::size_t>(got), raw, id, seq);
        if (r.matched && from_target) return ProbeResult::success(ms);
        if (r.unreachable) return ProbeResult::failure("destination unreachable");
    }
}
}  // namespace mpng
