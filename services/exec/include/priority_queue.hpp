#pragma once
#include "job.hpp"
#include <array>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

struct PoolTask {
    std::string job_id;
    JobPriority priority{JobPriority::Normal};
    std::function<void()> run;
};

struct QueueDepth {
    std::size_t critical{0};
    std::size_t high{0};
    std::size_t normal{0};
    std::size_t low{0};

    std::size_t total() const { return critical + high + normal + low; }
};

// Waiting pool tasks, one FIFO lane per priority. Higher lanes drain first.
class PriorityTaskQueue {
public:
    void enqueue(PoolTask task);
    // Blocks until a task is available. Returns nullopt once closed and drained.
    std::optional<PoolTask> dequeue_wait();
    // Drops a queued task for the job; false when it already left the queue.
    bool remove(const std::string& job_id);
    QueueDepth depth();
    void close();

private:
    std::deque<PoolTask>& lane_for(JobPriority priority);
    std::optional<PoolTask> pop_locked();

    std::mutex mtx_;
    std::condition_variable cv_;
    std::array<std::deque<PoolTask>, 4> lanes_; // critical, high, normal, low
    bool closed_{false};
};
