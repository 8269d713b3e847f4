#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace mpng {
// Fixed set of threads running queued tasks. The pool size is the cap on
// probes (and therefore sockets) open at the same time.
class WorkerPool {
   public:
    explicit WorkerPool(std::size_t threads);
    ~WorkerPool();
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(std::function<void()> task);
    std::size_t size() const {
        return threads_.size();
    }
    std::size_t queued() const;

   private:
    void worker_loop();

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> tasks_;
    bool stopping_{false};
    std::vector<std::thread> threads_;
};
}  // namespace mpng
