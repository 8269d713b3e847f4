#include "tcp_connect.hpp"
#include <poll.h>
#include <sys/socket.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>
#include "../core/fd.hpp"
#include "../core/time_utils.hpp"

namespace mpng {
namespace {
struct Attempt {
    OwnedFd fd;
    uint16_t port;
    bool done{false};
};

std::string describe_error(int err, uint16_t port) {
    return std::string(std::strerror(err)) + " (port " + std::to_string(port) + ")";
}
}  // namespace

ProbeResult TcpConnectProbe::run(const IpAddress& addr, uint16_t port_low, uint16_t port_high,
                                 PortRangePolicy policy, int timeout_ms) const {
    double first_ok = -1;
    double slowest = 0;
    std::size_t connected = 0;
    std::size_t total = static_cast<std::size_t>(port_high - port_low) + 1;
    std::string last_error;
    for (uint32_t first = port_low; first <= port_high; first += max_open_) {
        uint32_t last = std::min<uint32_t>(port_high, first + max_open_ - 1);
        BatchOutcome b = run_batch(addr, static_cast<uint16_t>(first), static_cast<uint16_t>(last),
                                   policy, timeout_ms);
        connected += b.connected;
        if (b.connected > 0 && first_ok < 0) first_ok = b.first_ok_ms;
        if (b.slowest_ok_ms > slowest) slowest = b.slowest_ok_ms;
        if (!b.last_error.empty()) last_error = b.last_error;
        if (policy == PortRangePolicy::All && b.failed > 0)
            return ProbeResult::failure(last_error);
        if (policy != PortRangePolicy::All && connected > 0) return ProbeResult::success(first_ok);
    }
    if (policy == PortRangePolicy::All && connected == total) return ProbeResult::success(slowest);
    return ProbeResult::failure(last_error.empty() ? "timeout" : last_error);
}

// Any-policy batches stop at the first connect; All-policy batches stop at the
// first failure. Every socket is closed when `attempts` goes out of scope.
TcpConnectProbe::BatchOutcome TcpConnectProbe::run_batch(const IpAddress& addr, uint16_t first,
                                                         uint16_t last, PortRangePolicy policy,
                                                         int timeout_ms) const {
    BatchOutcome out;
    const bool want_all = policy == PortRangePolicy::All;
    std::vector<Attempt> attempts;
    attempts.reserve(static_cast<std::size_t>(last - first) + 1);
    auto start = SteadyClock::now();
    auto deadline = start + std::chrono::milliseconds(timeout_ms);

    for (uint32_t p = first; p <= last; ++p) {
        Attempt a{OwnedFd(), static_cast<uint16_t>(p)};
        a.fd.reset(::socket(addr.family(), SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
        if (!a.fd) {
            ++out.failed;
            out.last_error = std::string("socket: ") + std::strerror(errno);
            if (want_all) return out;
            continue;
        }
        sockaddr_storage sa{};
        socklen_t len = addr.to_sockaddr(a.port, sa);
        if (::connect(a.fd.get(), reinterpret_cast<sockaddr*>(&sa), len) == 0) {
            double ms = elapsed_ms(start);
            ++out.connected;
            if (out.first_ok_ms < 0) out.first_ok_ms = ms;
            if (ms > out.slowest_ok_ms) out.slowest_ok_ms = ms;
            if (!want_all) return out;
            continue;
        }
        if (errno != EINPROGRESS) {
            ++out.failed;
            out.last_error = describe_error(errno, a.port);
            if (want_all) return out;
            continue;
        }
        attempts.push_back(std::move(a));
    }

    std::size_t pending = attempts.size();
    std::vector<pollfd> pfds;
    while (pending > 0) {
        int wait_ms = remaining_ms(deadline);
        if (wait_ms <= 0) break;
        pfds.clear();
        std::vector<std::size_t> index;
        for (std::size_t i = 0; i < attempts.size(); ++i) {
            if (attempts[i].done) continue;
            pfds.push_back(pollfd{attempts[i].fd.get(), POLLOUT, 0});
            index.push_back(i);
        }
        int n = ::poll(pfds.data(), pfds.size(), wait_ms);
        if (n < 0) {
            if (errno == EINTR) continue;
            out.last_error = std::string("poll: ") + std::strerror(errno);
            break;
        }
        if (n == 0) break;
        for (std::size_t k = 0; k < pfds.size(); ++k) {
            if (pfds[k].revents == 0) continue;
            Attempt& a = attempts[index[k]];
            a.done = true;
            --pending;
            int err = 0;
            socklen_t elen = sizeof(err);
            if (::getsockopt(a.fd.get(), SOL_SOCKET, SO_ERROR, &err, &elen) < 0) err = errno;
            if (err == 0) {
                double ms = elapsed_ms(start);
                ++out.connected;
                if (out.first_ok_ms < 0) out.first_ok_ms = ms;
                if (ms > out.slowest_ok_ms) out.slowest_ok_ms = ms;
                if (!want_all) return out;
            } else {
                ++out.failed;
                out.last_error = describe_error(err, a.port);
                if (want_all) return out;
            }
            a.fd.reset();
        }
    }
    if (pending > 0) {
        out.failed += pending;
        out.last_error = "timeout";
    }
    return out;
}
}  // namespace mpng
