#include "request_log.hpp"
#include "util.hpp"
#include <algorithm>

nlohmann::json to_json(const RequestEntry& entry) {
    return {
        {"endpoint", entry.endpoint},
        {"method", entry.method},
        {"worker", entry.worker.empty() ? nlohmann::json(nullptr) : nlohmann::json(entry.worker)},
        {"duration_ms", entry.duration_ms},
        {"success", entry.success},
        {"timestamp", format_time(entry.timestamp)},
    };
}

RequestLog::RequestLog(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void RequestLog::add(RequestEntry entry) {
    std::lock_guard<std::mutex> lock(mtx_);
    ++counters_.total;
    if (entry.success) ++counters_.success;
    else ++counters_.failed;
    ++counters_.by_endpoint[entry.route.empty() ? std::string("other") : entry.route];
    if (!entry.worker.empty()) ++counters_.by_worker[entry.worker];
    ++counters_.by_method[entry.method];

    entries_.push_back(std::move(entry));
    while (entries_.size() > capacity_) entries_.pop_front();
}

std::vector<RequestEntry> RequestLog::recent(std::size_t count) const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t n = std::min(count, entries_.size());
    return std::vector<RequestEntry>(entries_.end() - static_cast<std::ptrdiff_t>(n), entries_.end());
}

RequestCounters RequestLog::counters() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return counters_;
}

void RequestLog::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    entries_.clear();
    counters_ = RequestCounters{};
}
