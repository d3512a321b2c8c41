#pragma once

/** \file worker_pool.hpp
 *  \brief Fixed-size worker pool with a centralized FIFO task queue.
 *
 * Tasks run in submission order of pickup; completion order is unspecified.
 * Callers that need ordered results pair the pool with PendingResults.
 */

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#if defined(__APPLE__) || defined(__linux__)
#include <pthread.h>
#endif

namespace partpipe::stream {

class WorkerPool {
public:
    /** \param num_threads Number of worker threads (0 = hardware concurrency) */
    explicit WorkerPool(std::size_t num_threads = 0)
        : stop_(false) {
        if (num_threads == 0) {
            num_threads = std::max(1u, std::thread::hardware_concurrency());
        }
        workers_.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~WorkerPool() { shutdown(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /** \brief Queue a fire-and-forget task. Throws std::runtime_error once stopped. */
    auto post(std::function<void()> fn) -> void {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("worker pool is stopped");
            }
            tasks_.emplace_back(std::move(fn));
        }
        cv_.notify_one();
    }

    [[nodiscard]] auto num_threads() const noexcept -> std::size_t {
        return workers_.size();
    }

    /** \brief Request cooperative stop. New submissions fail; workers exit when the queue drains. */
    auto request_stop() noexcept -> void {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_.store(true, std::memory_order_relaxed);
        }
        cv_.notify_all();
    }

    /** \brief Drop tasks that have not started yet. Returns how many were dropped. */
    auto cancel_queued() -> std::size_t {
        std::size_t dropped = 0;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            dropped = tasks_.size();
            tasks_.clear();
        }
        return dropped;
    }

    /** \brief Stop and join all workers. Queued tasks still run. Idempotent. */
    auto shutdown() -> void {
        request_stop();
        for (auto& worker : workers_) {
            if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
                worker.join();
            }
        }
    }

private:
    auto worker_loop() -> void {
        #if defined(__APPLE__)
          pthread_setname_np("partpipe-worker");
        #elif defined(__linux__)
          pthread_setname_np(pthread_self(), "partpipe-worker");
        #endif
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }

            task();
        }
    }

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stop_;
};

} // namespace partpipe::stream
