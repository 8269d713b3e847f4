#include "local_addrs.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include "../core/logger.hpp"

namespace mpng {
std::vector<std::string> local_addresses() {
    std::vector<std::string> out;
    ifaddrs* list = nullptr;
    if (::getifaddrs(&list) != 0) {
        log(LogLevel::WARN, std::string("getifaddrs failed: ") + std::strerror(errno));
        return out;
    }
    for (ifaddrs* it = list; it != nullptr; it = it->ifa_next) {
        if (it->ifa_addr == nullptr) continue;
        char buf[INET6_ADDRSTRLEN] = {};
        int family = it->ifa_addr->sa_family;
        if (family == AF_INET) {
            ::inet_ntop(AF_INET, &reinterpret_cast<sockaddr_in*>(it->ifa_addr)->sin_addr, buf,
                        sizeof(buf));
        } else if (family == AF_INET6) {
            ::inet_ntop(AF_INET6, &reinterpret_cast<sockaddr_in6*>(it->ifa_addr)->sin6_addr, buf,
                        sizeof(buf));
        } else {
            continue;
        }
        if (std::find(out.begin(), out.end(), buf) == out.end()) out.emplace_back(buf);
    }
    ::freeifaddrs(list);
    return out;
}
}  // namespace mpng
