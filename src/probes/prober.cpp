#include "prober.hpp"

namespace mpng {
ProbeResult NetworkProber::probe(const Host& host, const TestSpec& test) const {
    switch (test.protocol) {
        case Protocol::ICMP: return icmp_.run(host.address, test.timeout_ms);
        case Protocol::TCP:
            return tcp_.run(host.address, test.port_low, test.port_high, test.policy,
                            test.timeout_ms);
    }
    return ProbeResult::failure("unsupported protocol");
}
}  // namespace mpng
