#include "execution_pool.hpp"
#include <iostream>

ExecutionPool::ExecutionPool(std::size_t threads) : capacity_(threads == 0 ? 1 : threads) {
    threads_.reserve(capacity_);
    for (std::size_t i = 0; i < capacity_; ++i) {
        threads_.emplace_back(&ExecutionPool::worker_loop, this, i);
    }
}

ExecutionPool::~ExecutionPool() {
    shutdown();
}

bool ExecutionPool::submit(PoolTask task) {
    if (stopped_.load()) return false;
    queue_.enqueue(std::move(task));
    return true;
}

void ExecutionPool::shutdown() {
    if (stopped_.exchange(true)) return;
    queue_.close();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

void ExecutionPool::worker_loop(std::size_t index) {
    while (auto task = queue_.dequeue_wait()) {
        ++active_;
        try {
            task->run();
        } catch (const std::exception& e) {
            std::cerr << "[pool] worker " << index << " task for job " << task->job_id
                      << " failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[pool] worker " << index << " task for job " << task->job_id
                      << " failed with an unknown error" << std::endl;
        }
        --active_;
    }
}
