#pragma once
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "analyzer.hpp"
#include "worker_client.hpp"

using Clock = std::chrono::system_clock;

enum class JobStatus { Pending, Analyzing, Running, Completed, Failed, Cancelled, Timeout };
enum class JobPriority { Low = 1, Normal = 2, High = 3, Critical = 4 };

const char* to_string(JobStatus status);
const char* to_string(JobPriority priority);
std::optional<JobPriority> parse_priority(const std::string& text);
bool is_terminal(JobStatus status);

struct JobMetrics {
    double cpu_usage{0.0};      // load of the target worker when it was chosen
    double memory_usage{0.0};
    double execution_time{0.0}; // seconds
    std::size_t output_size{0};
};

// What an execution function reports back for its job.
struct JobOutcome {
    bool success{false};
    std::string worker;
    nlohmann::json result;
    std::string error;
    double worker_cpu{0.0};
    double worker_memory{0.0};
    std::size_t output_size{0};
};

// Read-only view handed to an execution function.
struct JobTask {
    std::string id;
    std::string code;
    std::string language;
    std::string worker; // empty means pick the best worker
    std::optional<std::chrono::seconds> timeout;
    const CancellationToken* cancel{nullptr};
};

// Owned by the job table through shared_ptr. Everything below `mtx` is guarded by it.
struct Job {
    Job(std::string id_, std::string code_, std::string language_, std::string worker_,
        std::string user_id_, JobPriority priority_, std::optional<std::chrono::seconds> timeout_)
        : id(std::move(id_)), code(std::move(code_)), language(std::move(language_)),
          user_id(std::move(user_id_)), priority(priority_), created_at(Clock::now()),
          timeout(timeout_), worker(std::move(worker_)) {}

    const std::string id;
    const std::string code;
    const std::string language;
    const std::string user_id;
    const JobPriority priority;
    const Clock::time_point created_at;
    const std::optional<std::chrono::seconds> timeout;

    std::mutex mtx;
    std::string worker;
    JobStatus status{JobStatus::Pending};
    std::optional<Clock::time_point> started_at;
    std::optional<Clock::time_point> completed_at;
    nlohmann::json result;
    std::optional<std::string> error;
    std::optional<AnalysisVerdict> analysis;
    JobMetrics metrics;
    double progress{0.0};

    CancellationToken cancel;
};

// Copy of a job taken under its lock.
struct JobSnapshot {
    std::string id;
    std::string code;
    std::string language;
    std::string worker;
    std::string user_id;
    JobStatus status{JobStatus::Pending};
    JobPriority priority{JobPriority::Normal};
    Clock::time_point created_at;
    std::optional<Clock::time_point> started_at;
    std::optional<Clock::time_point> completed_at;
    std::optional<std::chrono::seconds> timeout;
    nlohmann::json result;
    std::optional<std::string> error;
    std::optional<AnalysisVerdict> analysis;
    JobMetrics metrics;
    double progress{0.0};
};

// Caller must hold job.mtx.
JobSnapshot snapshot_locked(const Job& job);

// Summary for listings; `detail` adds code, result, analysis and metrics.
nlohmann::json to_json(const JobSnapshot& job, bool detail);
