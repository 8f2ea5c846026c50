#include "priority_queue.hpp"
#include <algorithm>
#include <utility>

std::deque<PoolTask>& PriorityTaskQueue::lane_for(JobPriority priority) {
    switch (priority) {
        case JobPriority::Critical: return lanes_[0];
        case JobPriority::High: return lanes_[1];
        case JobPriority::Normal: return lanes_[2];
        case JobPriority::Low: return lanes_[3];
    }
    return lanes_[2];
}

void PriorityTaskQueue::enqueue(PoolTask task) {
    std::lock_guard<std::mutex> lock(mtx_);
    lane_for(task.priority).push_back(std::move(task));
    cv_.notify_one();
}

std::optional<PoolTask> PriorityTaskQueue::pop_locked() {
    for (auto& lane : lanes_) {
        if (!lane.empty()) {
            PoolTask t = std::move(lane.front());
            lane.pop_front();
            return t;
        }
    }
    return std::nullopt;
}

std::optional<PoolTask> PriorityTaskQueue::dequeue_wait() {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [&] {
        if (closed_) return true;
        return std::any_of(lanes_.begin(), lanes_.end(), [](const std::deque<PoolTask>& l) { return !l.empty(); });
    });
    return pop_locked();
}

bool PriorityTaskQueue::remove(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto& lane : lanes_) {
        auto it = std::find_if(lane.begin(), lane.end(), [&](const PoolTask& t) { return t.job_id == job_id; });
        if (it != lane.end()) {
            lane.erase(it);
            return true;
        }
    }
    return false;
}

QueueDepth PriorityTaskQueue::depth() {
    std::lock_guard<std::mutex> lock(mtx_);
    QueueDepth d;
    d.critical = lanes_[0].size();
    d.high = lanes_[1].size();
    d.normal = lanes_[2].size();
    d.low = lanes_[3].size();
    return d;
}

void PriorityTaskQueue::close() {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = true;
    cv_.notify_all();
}
