// include/tcrimer/core/worker_pool.hpp
#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace tcrimer {

/**
 * @brief Fixed-size pool of worker threads draining a FIFO task queue
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads, std::string name = "worker");
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a callable
     * @return Future for the callable's result
     * @throws std::runtime_error if the pool has been shut down
     */
    template <typename F>
    auto submit(F&& func) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using ReturnType = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(func));
        std::future<ReturnType> future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw std::runtime_error("WorkerPool " + name_ + " is shut down");
            }
            tasks_.emplace_back([task]() { (*task)(); });
        }
        cv_.notify_one();
        return future;
    }

    /**
     * @brief Run the queued tasks to completion and join the workers
     */
    void shutdown();

    size_t size() const {
        return workers_.size();
    }

    size_t pending() const;

private:
    void worker_loop(size_t index);

    std::string name_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_{false};
};

}  // namespace tcrimer
