#include "worker_pool.hpp"
#include <spdlog/spdlog.h>

namespace workspace_rag {

WorkerPool::WorkerPool(size_t workers) {
    if (workers == 0) workers = 1;
    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) workers_.emplace_back(&WorkerPool::work, this);
    spdlog::debug("🧵 Worker pool started with {} workers", workers);
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
    }
    wake_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void WorkerPool::work() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait(lock, [this]() { return shutting_down_ || !jobs_.empty(); });
            if (jobs_.empty()) return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        job();
    }
}

} // namespace workspace_rag
