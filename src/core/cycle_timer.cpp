#include "cycle_timer.hpp"
#include <poll.h>
#include <sys/timerfd.h>
#include <cerrno>
#include <cstring>
#include "logger.hpp"

namespace mpng {
CycleTimer::CycleTimer() = default;
CycleTimer::~CycleTimer() { stop(); }

bool CycleTimer::start(int interval_ms) {
    int fd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd < 0) {
        log(LogLevel::ERROR, std::string("timerfd_create failed: ") + std::strerror(errno));
        return false;
    }
    tfd_.reset(fd);
    itimerspec its{};
    its.it_interval.tv_sec = interval_ms / 1000;
    its.it_interval.tv_nsec = (interval_ms % 1000) * 1000000L;
    its.it_value = its.it_interval;
    if (::timerfd_settime(fd, 0, &its, nullptr) < 0) {
        log(LogLevel::ERROR, std::string("timerfd_settime failed: ") + std::strerror(errno));
        tfd_.reset();
        return false;
    }
    return true;
}

uint64_t CycleTimer::wait(int slice_ms) {
    if (!tfd_) return 0;
    pollfd pfd{tfd_.get(), POLLIN, 0};
    int n = ::poll(&pfd, 1, slice_ms);
    if (n <= 0) return 0;  // timeout, or EINTR from the stop signal
    uint64_t expirations = 0;
    if (::read(tfd_.get(), &expirations, sizeof(expirations)) != sizeof(expirations)) return 0;
    return expirations;
}

void CycleTimer::stop() {
    if (tfd_) tfd_.reset();
}
}  // namespace mpng
