#include "catch2/catch.hpp"
#include <atomic>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "execution_pool.hpp"
#include "priority_queue.hpp"

namespace {

PoolTask task(const std::string& id, JobPriority priority, std::function<void()> run = [] {}) {
    PoolTask t;
    t.job_id = id;
    t.priority = priority;
    t.run = std::move(run);
    return t;
}

} // namespace

TEST_CASE("higher lanes drain first, FIFO within a lane", "[priority_queue]") {
    PriorityTaskQueue q;
    q.enqueue(task("low", JobPriority::Low));
    q.enqueue(task("normal-1", JobPriority::Normal));
    q.enqueue(task("critical", JobPriority::Critical));
    q.enqueue(task("normal-2", JobPriority::Normal));
    q.enqueue(task("high", JobPriority::High));

    QueueDepth d = q.depth();
    REQUIRE(d.total() == 5);
    REQUIRE(d.normal == 2);

    std::vector<std::string> order;
    q.close();
    while (auto t = q.dequeue_wait()) order.push_back(t->job_id);
    REQUIRE(order == std::vector<std::string>{"critical", "high", "normal-1", "normal-2", "low"});
}

TEST_CASE("queued task can be removed", "[priority_queue]") {
    PriorityTaskQueue q;
    q.enqueue(task("a", JobPriority::Normal));
    q.enqueue(task("b", JobPriority::High));
    REQUIRE(q.remove("a"));
    REQUIRE_FALSE(q.remove("a"));
    REQUIRE(q.depth().total() == 1);
}

TEST_CASE("closed empty queue returns nullopt", "[priority_queue]") {
    PriorityTaskQueue q;
    q.close();
    REQUIRE_FALSE(q.dequeue_wait().has_value());
}

TEST_CASE("pool runs waiting tasks by priority", "[execution_pool]") {
    ExecutionPool pool(1);
    REQUIRE(pool.capacity() == 1);

    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    REQUIRE(pool.submit(task("blocker", JobPriority::Critical, [&started, gate] {
        started.set_value();
        gate.wait();
    })));
    started.get_future().wait();
    REQUIRE(pool.active() == 1);

    std::mutex mtx;
    std::vector<std::string> order;
    auto record = [&](const std::string& id) {
        return [&mtx, &order, id] {
            std::lock_guard<std::mutex> lock(mtx);
            order.push_back(id);
        };
    };
    pool.submit(task("low", JobPriority::Low, record("low")));
    pool.submit(task("normal", JobPriority::Normal, record("normal")));
    pool.submit(task("critical", JobPriority::Critical, record("critical")));
    pool.submit(task("high", JobPriority::High, record("high")));
    REQUIRE(pool.queued().total() == 4);

    release.set_value();
    pool.shutdown();
    REQUIRE(order == std::vector<std::string>{"critical", "high", "normal", "low"});
    REQUIRE_FALSE(pool.submit(task("late", JobPriority::Normal)));
}

TEST_CASE("a throwing task does not take the worker down", "[execution_pool]") {
    ExecutionPool pool(1);
    std::atomic<int> ran{0};
    pool.submit(task("bad", JobPriority::Normal, [] { throw std::runtime_error("boom"); }));
    pool.submit(task("odd", JobPriority::Normal, [] { throw 7; }));
    pool.submit(task("good", JobPriority::Normal, [&ran] { ++ran; }));
    pool.shutdown();
    REQUIRE(ran == 1);
    REQUIRE_FALSE(pool.submit(task("late", JobPriority::Normal, [&ran] { ++ran; })));
    REQUIRE(ran == 1);
}
