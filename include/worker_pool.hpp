#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace workspace_rag {

// Fixed set of workers draining one FIFO of jobs. Jobs beyond the worker
// count wait in memory. Destruction runs the jobs already queued, then joins.
class WorkerPool {
public:
    explicit WorkerPool(size_t workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Exceptions thrown by `job` surface from the returned future.
    template <typename F, typename R = std::invoke_result_t<F&>>
    std::future<R> submit(F&& job) {
        // packaged_task is move-only; share it so the queue entry stays copyable.
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(job));
        auto future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutting_down_) throw std::runtime_error("WorkerPool is shutting down");
            jobs_.push_back([task]() { (*task)(); });
        }
        wake_.notify_one();
        return future;
    }

    size_t worker_count() const { return workers_.size(); }
    size_t pending() const;

private:
    void work();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> jobs_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool shutting_down_ = false;
};

} // namespace workspace_rag
