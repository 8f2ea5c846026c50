#pragma once
#include "priority_queue.hpp"
#include <atomic>
#include <thread>
#include <vector>

// Fixed number of threads serving a PriorityTaskQueue.
class ExecutionPool {
public:
    explicit ExecutionPool(std::size_t threads);
    ~ExecutionPool();

    ExecutionPool(const ExecutionPool&) = delete;
    ExecutionPool& operator=(const ExecutionPool&) = delete;

    bool submit(PoolTask task);
    bool remove(const std::string& job_id) { return queue_.remove(job_id); }
    // Runs what is still queued, then joins the threads.
    void shutdown();

    std::size_t capacity() const { return capacity_; }
    std::size_t active() const { return active_.load(); }
    QueueDepth queued() { return queue_.depth(); }

private:
    void worker_loop(std::size_t index);

    std::size_t capacity_;
    PriorityTaskQueue queue_;
    std::vector<std::thread> threads_;
    std::atomic<std::size_t> active_{0};
    std::atomic<bool> stopped_{false};
};
