#pragma once
#include <cstdint>

#include "fd.hpp"

namespace mpng {
// Periodic CLOCK_MONOTONIC timer marking cycle boundaries. Boundaries are
// fixed from start(); a caller that overruns sees several expirations at
// once from wait() and runs a single cycle for them.
class CycleTimer {
   public:
    CycleTimer();
    ~CycleTimer();
    bool start(int interval_ms);
    // Blocks up to `slice_ms` for the next boundary. Returns the number of
    // boundaries passed since the last call, 0 if none passed in the slice.
    uint64_t wait(int slice_ms);
    void stop();

   private:
    OwnedFd tfd_;
};
}  // namespace mpng
