#pragma once
#include <cstddef>
#include <cstdint>

#include "../core/ip_address.hpp"
#include "../core/model.hpp"

namespace mpng {
// Blocking connect check over an inclusive port range. Connects for one call
// are issued together (up to max_open() sockets at a time) and waited on with
// poll, so a whole range costs one timeout rather than one per port.
class TcpConnectProbe {
   public:
    static constexpr std::size_t kDefaultMaxOpen = 64;

    explicit TcpConnectProbe(std::size_t max_open = kDefaultMaxOpen)
        : max_open_(max_open ? max_open : 1) {}

    ProbeResult run(const IpAddress& addr, uint16_t port_low, uint16_t port_high,
                    PortRangePolicy policy, int timeout_ms) const;

    std::size_t max_open() const {
        return max_open_;
    }

   private:
    struct BatchOutcome {
        std::size_t connected{0};
        std::size_t failed{0};
        double first_ok_ms{-1};
        double slowest_ok_ms{0};
        std::string last_error;
    };
    BatchOutcome run_batch(const IpAddress& addr, uint16_t first, uint16_t last,
                           PortRangePolicy policy, int timeout_ms) const;

    std::size_t max_open_;
};
}  // namespace mpng
