#include "ip_address.hpp"

#include <arpa/inet.h>

#include <cstring>

namespace mpng {
std::optional<IpAddress> IpAddress::parse(const std::string& text) {
    IpAddress a;
    char buf[INET6_ADDRSTRLEN] = {};
    if (::inet_pton(AF_INET, text.c_str(), &a.v4_) == 1) {
        a.family_ = AF_INET;
        ::inet_ntop(AF_INET, &a.v4_, buf, sizeof(buf));
    } else if (::inet_pton(AF_INET6, text.c_str(), &a.v6_) == 1) {
        a.family_ = AF_INET6;
        ::inet_ntop(AF_INET6, &a.v6_, buf, sizeof(buf));
    } else {
        return std::nullopt;
    }
    a.text_ = buf;  // canonical form, so "::0001" and "::1" compare equal
    return a;
}

socklen_t IpAddress::to_sockaddr(uint16_t port, sockaddr_storage& out) const {
    std::memset(&out, 0, sizeof(out));
    if (family_ == AF_INET) {
        auto* sa = reinterpret_cast<sockaddr_in*>(&out);
        sa->sin_family = AF_INET;
        sa->sin_port = htons(port);
        sa->sin_addr = v4_;
        return sizeof(sockaddr_in);
    }
    auto* sa6 = reinterpret_cast<sockaddr_in6*>(&out);
    sa6->sin6_family = AF_INET6;
    sa6->sin6_port = htons(port);
    sa6->sin6_addr = v6_;
    return sizeof(sockaddr_in6);
}

bool IpAddress::matches(const sockaddr_storage& sa) const {
    if (sa.ss_family != family_) return false;
    if (family_ == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&sa);
        return in->sin_addr.s_addr == v4_.s_addr;
    }
    const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&sa);
    return std::memcmp(&in6->sin6_addr, &v6_, sizeof(v6_)) == 0;
}
}  // namespace mpng
