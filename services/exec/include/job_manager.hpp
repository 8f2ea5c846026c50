#pragma once
#include "analyzer.hpp"
#include "execution_pool.hpp"
#include "host_metrics.hpp"
#include "job.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

struct JobStats {
    std::size_t total{0};
    std::size_t running{0};
    std::map<std::string, std::size_t> by_status;
    std::map<std::string, std::size_t> by_worker;
    double avg_execution_time{0.0}; // seconds, completed jobs only
    HostUsage host;
    QueueDepth queued;
};

nlohmann::json to_json(const JobStats& stats);

// Owns every execution job: state machine, bounded pool and the timeout monitor.
//
//   PENDING -> [ANALYZING] -> RUNNING -> COMPLETED | FAILED | CANCELLED | TIMEOUT
//
// The pool task, cancel() and the monitor all finish a job through the same
// "still non-terminal?" check under the job's own mutex, so exactly one wins.
class JobManager {
public:
    using ExecutionFn = std::function<JobOutcome(const JobTask&)>;
    using HostSampler = std::function<HostUsage()>;

    struct Options {
        std::size_t max_workers{5};
        std::chrono::milliseconds monitor_interval{1000};
        bool start_monitor{true};
    };

    explicit JobManager(Options opts, HostSampler sampler = read_host_usage);
    ~JobManager();

    JobManager(const JobManager&) = delete;
    JobManager& operator=(const JobManager&) = delete;

    std::string create(const std::string& code, const std::string& language, const std::string& worker,
                       const std::string& user_id, JobPriority priority,
                       std::optional<std::chrono::seconds> timeout);

    // PENDING -> ANALYZING. A rejected verdict without allow_risky finishes the job as FAILED.
    // nullopt when the job is unknown or not PENDING.
    std::optional<AnalysisVerdict> analyze(const std::string& job_id, const CodeAnalyzer& analyzer,
                                           bool allow_risky);

    // PENDING (or admitted ANALYZING) -> RUNNING and queue on the pool. False otherwise.
    bool submit(const std::string& job_id, ExecutionFn fn);

    // False for unknown or terminal jobs.
    bool cancel(const std::string& job_id);

    std::optional<JobSnapshot> get(const std::string& job_id) const;
    std::vector<JobSnapshot> list(const std::optional<std::string>& user_id = std::nullopt) const;
    std::vector<JobSnapshot> running() const;

    // One monitor tick. Returns how many jobs timed out.
    std::size_t check_timeouts(Clock::time_point now);

    // Removes terminal jobs completed before now - max_age.
    std::size_t cleanup(std::chrono::seconds max_age, Clock::time_point now = Clock::now());

    JobStats stats();

    void shutdown();

private:
    std::shared_ptr<Job> find(const std::string& job_id) const;
    std::vector<std::shared_ptr<Job>> all_jobs() const;
    void run_job(const std::shared_ptr<Job>& job, const ExecutionFn& fn);
    void fail_job(Job& job, const std::string& error, Clock::time_point start);
    void monitor_loop();

    Options opts_;
    HostSampler sampler_;

    mutable std::mutex table_mtx_;
    std::unordered_map<std::string, std::shared_ptr<Job>> jobs_;

    ExecutionPool pool_;

    std::mutex monitor_mtx_;
    std::condition_variable monitor_cv_;
    std::thread monitor_;
    std::atomic<bool> stopping_{false};
};
