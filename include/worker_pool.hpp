/**
 * @file worker_pool.hpp
 * @brief Fixed-size thread pool running restore pipelines.
 */

#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <condition_variable>
#include <deque>
#include <thread>
#include <vector>

/**
 * @brief Runs submitted tasks on a fixed number of threads, in submission order.
 *
 * The destructor drains the queue: every task already submitted still runs before the
 * threads are joined.
 */
class WorkerPool {
public:
    /**
     * @param workers Number of threads; zero is treated as one.
     */
    explicit WorkerPool(std::size_t workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queues a task.
     * @return Future that becomes ready when the task finished. Exceptions thrown by the
     * task are stored in the future.
     * @throws std::runtime_error If the pool is shutting down.
     */
    std::future<void> submit(std::function<void()> task);

    std::size_t size() const { return threads_.size(); }

private:
    void run();

    std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<std::packaged_task<void()>> queue_;
    bool stopping_ = false;
    std::vector<std::thread> threads_;
};

#endif // WORKER_POOL_HPP
