#include "worker_pool.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

WorkerPool::WorkerPool(const std::string& name, int workers) : name_(name) {
    int count = std::max(1, workers);
    running_ = true;
    threads_.reserve(count);
    for (int i = 0; i < count; ++i) {
        threads_.emplace_back([this]() { worker_loop(); });
    }
    spdlog::debug("Worker pool {} started with {} threads", name_, count);
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
    spdlog::debug("Worker pool {} stopped", name_);
}

void WorkerPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mu_);
            cv_.wait(lock, [&]() { return !running_ || !queue_.empty(); });
            if (!running_ && queue_.empty()) return;
            task = std::move(queue_.front());
            queue_.pop();
        }
        // packaged_task stores any exception in its future
        task();
    }
}
