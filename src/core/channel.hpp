#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

#include "time_utils.hpp"

namespace mpng {
// Unbounded multi-producer queue drained by a single consumer.
template <typename T>
class Channel {
   public:
    void push(T value) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            items_.push_back(std::move(value));
        }
        cv_.notify_one();
    }

    // Waits for an item until `deadline`; nullopt once the deadline passes.
    std::optional<T> pop_until(SteadyClock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mu_);
        if (!cv_.wait_until(lock, deadline, [this] { return !items_.empty(); }))
            return std::nullopt;
        T out = std::move(items_.front());
        items_.pop_front();
        return out;
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mu_);
        if (items_.empty()) return std::nullopt;
        T out = std::move(items_.front());
        items_.pop_front();
        return out;
    }

   private:
    std::mutex mu_;
    std::condition_variable cv_;
    std::deque<T> items_;
};
}  // namespace mpng
