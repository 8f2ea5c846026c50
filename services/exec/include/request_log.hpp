#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct RequestEntry {
    std::string endpoint;
    std::string route; // counted under this template; "other" when empty
    std::string method;
    std::string worker; // empty when the request touched no worker
    long duration_ms{0};
    bool success{true};
    std::chrono::system_clock::time_point timestamp;
};

struct RequestCounters {
    std::size_t total{0};
    std::size_t success{0};
    std::size_t failed{0};
    std::map<std::string, std::size_t> by_endpoint;
    std::map<std::string, std::size_t> by_worker;
    std::map<std::string, std::size_t> by_method;
};

nlohmann::json to_json(const RequestEntry& entry);

// Bounded log of served requests plus lifetime counters.
class RequestLog {
public:
    explicit RequestLog(std::size_t capacity = 200);

    void add(RequestEntry entry);
    // Oldest first, at most `count` of the latest entries.
    std::vector<RequestEntry> recent(std::size_t count) const;
    RequestCounters counters() const;
    void clear();

    std::size_t capacity() const { return capacity_; }

private:
    std::size_t capacity_;
    mutable std::mutex mtx_;
    std::deque<RequestEntry> entries_;
    RequestCounters counters_;
};
