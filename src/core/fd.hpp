#pragma once
#include <unistd.h>

#include <utility>

namespace mpng {
// Sole owner of a socket or timer descriptor; closes it when dropped.
// Move-constructible so probe attempts can live in a vector, never reassigned.
class OwnedFd {
   public:
    OwnedFd() = default;
    OwnedFd(OwnedFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    OwnedFd(const OwnedFd&) = delete;
    OwnedFd& operator=(const OwnedFd&) = delete;
    OwnedFd& operator=(OwnedFd&&) = delete;
    ~OwnedFd() { reset(); }

    int get() const { return fd_; }
    explicit operator bool() const { return fd_ >= 0; }

    // Takes ownership of fd, closing whatever was held before.
    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

   private:
    int fd_{-1};
};
}  // namespace mpng
