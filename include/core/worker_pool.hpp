#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace auditfusion {

/**
 * @brief Bounded pool of worker threads executing submitted tasks FIFO.
 *
 * submit() returns a std::future for the task's result; exceptions thrown
 * by the task surface from future::get(). On shutdown, already-queued tasks
 * still run so that every returned future becomes ready.
 *
 * Thread-safety: submit() may be called from any thread.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t num_workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template<typename F>
    [[nodiscard]] std::future<std::invoke_result_t<F>> submit(F&& fn) {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw std::runtime_error("WorkerPool: submit after shutdown");
            }
            queue_.emplace_back([task] { (*task)(); });
        }
        cv_.notify_one();
        return future;
    }

    /// Stop accepting tasks, drain the queue, join workers. Idempotent.
    void shutdown();

    [[nodiscard]] size_t size() const { return num_workers_; }
    [[nodiscard]] size_t pending() const;

private:
    void worker_loop();

    size_t num_workers_;
    std::vector<std::jthread> workers_;
    std::deque<std::function<void()>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

} // namespace auditfusion
