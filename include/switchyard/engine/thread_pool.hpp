#pragma once

#include "../log.hpp"
#include <algorithm>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace switchyard {
namespace engine {

/**
 * @brief Fixed-size worker pool that runs queued jobs in FIFO order
 *
 * Jobs are fire-and-forget; callers that need a result capture their own
 * completion state. shutdown() stops intake, lets already-queued jobs run,
 * then joins the workers.
 *
 * @threadsafety All public methods are thread-safe
 */
class ThreadPool {
public:
    /**
     * @param num_threads Worker count (0 = hardware concurrency, minimum 2)
     */
    explicit ThreadPool(std::size_t num_threads = 0)
        : stop_(false)
    {
        if (num_threads == 0) {
            num_threads = std::max(2u, std::thread::hardware_concurrency());
        }
        workers_.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this]() { worker_loop(); });
        }
    }

    ~ThreadPool() {
        shutdown();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a job for execution
     *
     * @return false if the pool has been shut down
     */
    bool post(std::function<void()> job) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_) {
                return false;
            }
            jobs_.push(std::move(job));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Stop accepting jobs, drain the backlog and join all workers
     *
     * Safe to call more than once.
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    std::size_t size() const {
        return workers_.size();
    }

    /// Jobs queued but not yet picked up by a worker.
    std::size_t backlog() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.size();
    }

private:
    void worker_loop() {
        while (true) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stop_ || !jobs_.empty(); });

                if (stop_ && jobs_.empty()) {
                    return;
                }

                job = std::move(jobs_.front());
                jobs_.pop();
            }

            try {
                job();
            } catch (const std::exception& e) {
                log::get(log::kQueue)->error("Worker job threw: {}", e.what());
            }
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> jobs_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_;
};

} // namespace engine
} // namespace switchyard
