#include "worker_pool.hpp"

#include <stdexcept>

#include "logger.hpp"

namespace mpng {
WorkerPool::WorkerPool(std::size_t threads) {
    if (threads == 0) throw std::invalid_argument("worker pool needs at least one thread");
    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) threads_.emplace_back([this] { worker_loop(); });
}

// Tasks still queued are dropped; running ones finish first.
WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        stopping_ = true;
        if (!tasks_.empty())
            log(LogLevel::DEBUG, "worker pool dropping " + std::to_string(tasks_.size()) +
                                     " queued tasks");
        tasks_.clear();
    }
    cv_.notify_all();
    for (auto& t : threads_)
        if (t.joinable()) t.join();
}

void WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (stopping_) return;
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

std::size_t WorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(mu_);
    return tasks_.size();
}

void WorkerPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mu_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (stopping_) return;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        task();
    }
}
}  // namespace mpng
