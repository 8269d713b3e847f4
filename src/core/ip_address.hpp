#pragma once
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <optional>
#include <string>

namespace mpng {
// A numeric IPv4 or IPv6 address. Hosts are configured by address, never by
// name, so probes do not depend on a resolver.
class IpAddress {
   public:
    static std::optional<IpAddress> parse(const std::string& text);

    int family() const {
        return family_;
    }
    bool is_v6() const {
        return family_ == AF_INET6;
    }
    const std::string& str() const {
        return text_;
    }
    // Fills `out` with this address and `port`; returns the sockaddr length.
    socklen_t to_sockaddr(uint16_t port, sockaddr_storage& out) const;
    // True when `sa` carries the same address (port ignored).
    bool matches(const sockaddr_storage& sa) const;

    bool operator==(const IpAddress& o) const {
        return family_ == o.family_ && text_ == o.text_;
    }

   private:
    IpAddress() = default;
    int family_{AF_UNSPEC};
    in_addr v4_{};
    in6_addr v6_{};
    std::string text_;
};
}  // namespace mpng
