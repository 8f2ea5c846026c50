#include "job.hpp"
#include "util.hpp"
#include <cmath>

const char* to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Pending: return "pending";
        case JobStatus::Analyzing: return "analyzing";
        case JobStatus::Running: return "running";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
        case JobStatus::Cancelled: return "cancelled";
        case JobStatus::Timeout: return "timeout";
    }
    return "unknown";
}

const char* to_string(JobPriority priority) {
    switch (priority) {
        case JobPriority::Low: return "low";
        case JobPriority::Normal: return "normal";
        case JobPriority::High: return "high";
        case JobPriority::Critical: return "critical";
    }
    return "normal";
}

std::optional<JobPriority> parse_priority(const std::string& text) {
    if (text == "low") return JobPriority::Low;
    if (text == "normal") return JobPriority::Normal;
    if (text == "high") return JobPriority::High;
    if (text == "critical") return JobPriority::Critical;
    return std::nullopt;
}

bool is_terminal(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Failed ||
           status == JobStatus::Cancelled || status == JobStatus::Timeout;
}

JobSnapshot snapshot_locked(const Job& job) {
    JobSnapshot s;
    s.id = job.id;
    s.code = job.code;
    s.language = job.language;
    s.worker = job.worker;
    s.user_id = job.user_id;
    s.status = job.status;
    s.priority = job.priority;
    s.created_at = job.created_at;
    s.started_at = job.started_at;
    s.completed_at = job.completed_at;
    s.timeout = job.timeout;
    s.result = job.result;
    s.error = job.error;
    s.analysis = job.analysis;
    s.metrics = job.metrics;
    s.progress = job.progress;
    return s;
}

static nlohmann::json opt_time(const std::optional<Clock::time_point>& tp) {
    return tp ? nlohmann::json(format_time(*tp)) : nlohmann::json(nullptr);
}

nlohmann::json to_json(const JobSnapshot& job, bool detail) {
    nlohmann::json j = {
        {"job_id", job.id},
        {"status", to_string(job.status)},
        {"worker", job.worker.empty() ? nlohmann::json(nullptr) : nlohmann::json(job.worker)},
        {"user_id", job.user_id},
        {"language", job.language},
        {"priority", to_string(job.priority)},
        {"created_at", format_time(job.created_at)},
        {"started_at", opt_time(job.started_at)},
        {"completed_at", opt_time(job.completed_at)},
        {"timeout", job.timeout ? nlohmann::json(job.timeout->count()) : nlohmann::json(nullptr)},
        {"progress", std::round(job.progress * 100.0) / 100.0},
        {"error", job.error ? nlohmann::json(*job.error) : nlohmann::json(nullptr)},
    };
    if (!detail) return j;

    j["code"] = job.code;
    j["result"] = job.result;
    j["analysis"] = job.analysis ? to_json(*job.analysis) : nlohmann::json(nullptr);
    j["metrics"] = {
        {"cpu_usage", job.metrics.cpu_usage},
        {"memory_usage", job.metrics.memory_usage},
        {"execution_time", job.metrics.execution_time},
        {"output_size", job.metrics.output_size},
    };
    return j;
}
