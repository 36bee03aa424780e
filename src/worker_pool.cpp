#include "worker_pool.hpp"
#include <stdexcept>
#include <algorithm>

WorkerPool::WorkerPool(std::size_t workers) {
    std::size_t count = std::max<std::size_t>(workers, 1);
    threads_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        threads_.emplace_back(&WorkerPool::run, this);
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    ready_.notify_all();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

std::future<void> WorkerPool::submit(std::function<void()> task) {
    std::packaged_task<void()> packaged(std::move(task));
    std::future<void> future = packaged.get_future();
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("Worker pool is shutting down");
        }
        queue_.push_back(std::move(packaged));
    }
    ready_.notify_one();
    return future;
}

void WorkerPool::run() {
    for (;;) {
        std::packaged_task<void()> task;
        {
            std::unique_lock lock(mutex_);
            ready_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        task();
    }
}
