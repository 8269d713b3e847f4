#pragma once
#include "../core/model.hpp"
#include "icmp_probe.hpp"
#include "tcp_connect.hpp"

namespace mpng {
// Runs one test once. Implementations must be callable from many worker
// threads at the same time and report network failures as ok=false.
class Prober {
   public:
    virtual ~Prober() = default;
    virtual ProbeResult probe(const Host& host, const TestSpec& test) const = 0;
};

class NetworkProber : public Prober {
   public:
    ProbeResult probe(const Host& host, const TestSpec& test) const override;

   private:
    IcmpProbe icmp_;
    TcpConnectProbe tcp_;
};
}  // namespace mpng
