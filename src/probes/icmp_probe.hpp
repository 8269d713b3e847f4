#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "../core/fd.hpp"
#include "../core/ip_address.hpp"
#include "../core/model.hpp"

namespace mpng {
// Which kind of ICMP socket the kernel let us open.
enum class IcmpSocketKind { None, Datagram, Raw };

const char* icmp_socket_kind_name(IcmpSocketKind k);

// Sends one echo request and waits for the matching reply. Prefers the
// unprivileged datagram ICMP socket (net.ipv4.ping_group_range) and falls
// back to a raw socket (CAP_NET_RAW). Stateless; safe from any thread.
class IcmpProbe {
   public:
    ProbeResult run(const IpAddress& addr, int timeout_ms) const;

    // Which socket kind would be used for `family`, without sending anything.
    static IcmpSocketKind available(int family);

   private:
    struct Socket {
        OwnedFd fd;
        IcmpSocketKind kind{IcmpSocketKind::None};
        int error{0};
    };
    static Socket open_socket(int family);
};

uint16_t icmp_checksum(const void* data, std::size_t len);
}  // namespace mpng
