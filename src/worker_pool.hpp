#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// Fixed-size thread pool; tasks still queued at stop() run before the workers exit
class WorkerPool {
public:
    WorkerPool(const std::string& name, int workers);
    ~WorkerPool();
    
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    
    template <typename F>
    auto submit(F&& fn) -> std::future<decltype(fn())> {
        using Result = decltype(fn());
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
        std::future<Result> future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (!running_) {
                throw std::runtime_error("worker pool " + name_ + " is stopped");
            }
            queue_.push([task]() { (*task)(); });
        }
        cv_.notify_one();
        return future;
    }
    
    void stop();
    
    size_t size() const { return threads_.size(); }
    bool running() const { return running_; }
    
private:
    std::string name_;
    std::atomic<bool> running_{false};
    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> queue_;
    std::mutex mu_;
    std::condition_variable cv_;
    
    void worker_loop();
};
