#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// Fixed-size pool draining a FIFO of tasks. Tasks must not throw; a task that
// does is logged and counted, the worker keeps running.
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(Task task);

    size_t thread_count() const { return workers_.size(); }
    size_t pending() const;
    uint64_t failed_tasks() const { return failed_.load(); }

private:
    void worker_loop();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<Task> queue_;
    bool stopping_ = false;
    std::vector<std::thread> workers_;
    std::atomic<uint64_t> failed_{0};
};
