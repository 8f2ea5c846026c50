#include "job_manager.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace {

double seconds_between(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

} // namespace

nlohmann::json to_json(const JobStats& stats) {
    nlohmann::json by_status = nlohmann::json::object();
    for (const auto& kv : stats.by_status) by_status[kv.first] = kv.second;
    nlohmann::json by_worker = nlohmann::json::object();
    for (const auto& kv : stats.by_worker) by_worker[kv.first] = kv.second;
    return {
        {"total_jobs", stats.total},
        {"running_jobs", stats.running},
        {"by_status", by_status},
        {"by_worker", by_worker},
        {"avg_execution_time", round2(stats.avg_execution_time)},
        {"current_cpu_usage", stats.host.cpu_percent},
        {"current_memory_usage", stats.host.memory_percent},
        {"queued", {{"critical", stats.queued.critical},
                    {"high", stats.queued.high},
                    {"normal", stats.queued.normal},
                    {"low", stats.queued.low}}},
    };
}

JobManager::JobManager(Options opts, HostSampler sampler)
    : opts_(opts), sampler_(std::move(sampler)), pool_(opts.max_workers) {
    if (opts_.start_monitor) {
        monitor_ = std::thread(&JobManager::monitor_loop, this);
    }
}

JobManager::~JobManager() {
    shutdown();
}

std::string JobManager::create(const std::string& code, const std::string& language, const std::string& worker,
                               const std::string& user_id, JobPriority priority,
                               std::optional<std::chrono::seconds> timeout) {
    std::lock_guard<std::mutex> lock(table_mtx_);
    std::string id;
    do {
        id = gen_id();
    } while (jobs_.count(id));
    jobs_.emplace(id, std::make_shared<Job>(id, code, language, worker,
                                            user_id.empty() ? std::string("anonymous") : user_id,
                                            priority, timeout));
    return id;
}

std::shared_ptr<Job> JobManager::find(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(table_mtx_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return nullptr;
    return it->second;
}

std::vector<std::shared_ptr<Job>> JobManager::all_jobs() const {
    std::lock_guard<std::mutex> lock(table_mtx_);
    std::vector<std::shared_ptr<Job>> out;
    out.reserve(jobs_.size());
    for (const auto& kv : jobs_) out.push_back(kv.second);
    return out;
}

std::optional<AnalysisVerdict> JobManager::analyze(const std::string& job_id, const CodeAnalyzer& analyzer,
                                                   bool allow_risky) {
    auto job = find(job_id);
    if (!job) return std::nullopt;
    {
        std::lock_guard<std::mutex> lock(job->mtx);
        if (job->status != JobStatus::Pending) return std::nullopt;
        job->status = JobStatus::Analyzing;
    }

    AnalysisVerdict verdict = analyzer.analyze(job->code);

    std::lock_guard<std::mutex> lock(job->mtx);
    if (is_terminal(job->status)) return verdict;
    job->analysis = verdict;
    if (!verdict.should_execute && !allow_risky) {
        job->status = JobStatus::Failed;
        job->error = "AnalysisRejected: " + std::to_string(verdict.count(Severity::High)) +
                     " high-severity issue(s) found";
        job->completed_at = Clock::now();
        std::cout << "[jobs] job " << job->id << " rejected by " << verdict.language << " analysis" << std::endl;
    }
    return verdict;
}

bool JobManager::submit(const std::string& job_id, ExecutionFn fn) {
    if (stopping_.load()) return false;
    auto job = find(job_id);
    if (!job) return false;
    {
        std::lock_guard<std::mutex> lock(job->mtx);
        if (job->status != JobStatus::Pending && job->status != JobStatus::Analyzing) return false;
        job->status = JobStatus::Running;
        job->started_at = Clock::now();
    }

    PoolTask task;
    task.job_id = job->id;
    task.priority = job->priority;
    task.run = [this, job, fn = std::move(fn)] { run_job(job, fn); };
    if (!pool_.submit(std::move(task))) {
        std::lock_guard<std::mutex> lock(job->mtx);
        if (!is_terminal(job->status)) {
            job->status = JobStatus::Failed;
            job->error = "Execution pool is shut down";
            job->completed_at = Clock::now();
        }
        return false;
    }
    return true;
}

void JobManager::fail_job(Job& job, const std::string& error, Clock::time_point start) {
    auto end = Clock::now();
    std::lock_guard<std::mutex> lock(job.mtx);
    if (is_terminal(job.status)) return;
    job.status = JobStatus::Failed;
    job.error = error;
    job.metrics.execution_time = seconds_between(start, end);
    job.completed_at = end;
    std::cerr << "[jobs] job " << job.id << " raised: " << error << std::endl;
}

void JobManager::run_job(const std::shared_ptr<Job>& job, const ExecutionFn& fn) {
    JobTask task;
    {
        std::lock_guard<std::mutex> lock(job->mtx);
        if (is_terminal(job->status)) return;
        if (job->cancel.cancelled()) {
            job->status = JobStatus::Cancelled;
            job->error = "Job was cancelled before execution";
            job->completed_at = Clock::now();
            return;
        }
        task.id = job->id;
        task.code = job->code;
        task.language = job->language;
        task.worker = job->worker;
        task.timeout = job->timeout;
        task.cancel = &job->cancel;
    }

    auto start = Clock::now();
    try {
        JobOutcome out = fn(task);
        auto end = Clock::now();

        std::lock_guard<std::mutex> lock(job->mtx);
        if (is_terminal(job->status)) return;
        if (job->worker.empty()) job->worker = out.worker;
        if (job->cancel.cancelled()) {
            job->status = JobStatus::Cancelled;
            job->error = "Job was cancelled during execution";
            job->completed_at = end;
            return;
        }
        job->metrics.execution_time = seconds_between(start, end);
        job->metrics.output_size = out.output_size;
        job->metrics.cpu_usage = out.worker_cpu;
        job->metrics.memory_usage = out.worker_memory;
        job->result = std::move(out.result);
        if (out.success) {
            job->status = JobStatus::Completed;
            job->progress = 1.0;
        } else {
            job->status = JobStatus::Failed;
            job->error = out.error;
        }
        job->completed_at = end;
        std::cout << "[jobs] job " << job->id << " " << to_string(job->status) << " on "
                  << (job->worker.empty() ? "-" : job->worker) << " after "
                  << round2(job->metrics.execution_time) << "s" << std::endl;
    } catch (const std::exception& e) {
        fail_job(*job, e.what(), start);
    } catch (...) {
        fail_job(*job, "Unknown error during execution", start);
    }
}

bool JobManager::cancel(const std::string& job_id) {
    auto job = find(job_id);
    if (!job) return false;
    {
        std::lock_guard<std::mutex> lock(job->mtx);
        if (is_terminal(job->status)) return false;
        job->cancel.cancel();
        job->status = JobStatus::Cancelled;
        job->completed_at = Clock::now();
    }
    pool_.remove(job_id);
    std::cout << "[jobs] job " << job_id << " cancelled" << std::endl;
    return true;
}

std::optional<JobSnapshot> JobManager::get(const std::string& job_id) const {
    auto job = find(job_id);
    if (!job) return std::nullopt;
    std::lock_guard<std::mutex> lock(job->mtx);
    return snapshot_locked(*job);
}

std::vector<JobSnapshot> JobManager::list(const std::optional<std::string>& user_id) const {
    std::vector<JobSnapshot> out;
    for (const auto& job : all_jobs()) {
        if (user_id && job->user_id != *user_id) continue;
        std::lock_guard<std::mutex> lock(job->mtx);
        out.push_back(snapshot_locked(*job));
    }
    std::sort(out.begin(), out.end(), [](const JobSnapshot& a, const JobSnapshot& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.id < b.id;
    });
    return out;
}

std::vector<JobSnapshot> JobManager::running() const {
    std::vector<JobSnapshot> out;
    for (const auto& s : list()) {
        if (s.status == JobStatus::Running) out.push_back(s);
    }
    return out;
}

std::size_t JobManager::check_timeouts(Clock::time_point now) {
    std::size_t fired = 0;
    for (const auto& job : all_jobs()) {
        try {
            std::lock_guard<std::mutex> lock(job->mtx);
            if (job->status != JobStatus::Running || !job->started_at) continue;
            double elapsed = seconds_between(*job->started_at, now);
            if (job->timeout && elapsed > static_cast<double>(job->timeout->count())) {
                job->cancel.cancel();
                job->status = JobStatus::Timeout;
                job->error = "Job exceeded timeout of " + std::to_string(job->timeout->count()) + " seconds";
                job->completed_at = now;
                ++fired;
                std::cout << "[monitor] job " << job->id << " timed out after "
                          << job->timeout->count() << "s" << std::endl;
                continue;
            }
            if (elapsed < 0) elapsed = 0;
            if (job->timeout && job->timeout->count() > 0) {
                job->progress = std::min(0.9, elapsed / static_cast<double>(job->timeout->count()) * 0.8);
            } else {
                job->progress = std::min(0.5, elapsed / 300.0);
            }
        } catch (const std::exception& e) {
            std::cerr << "[monitor] job " << job->id << ": " << e.what() << std::endl;
        }
    }
    return fired;
}

std::size_t JobManager::cleanup(std::chrono::seconds max_age, Clock::time_point now) {
    auto cutoff = now - max_age;
    std::size_t removed = 0;
    std::lock_guard<std::mutex> lock(table_mtx_);
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        bool expired = false;
        {
            std::lock_guard<std::mutex> job_lock(it->second->mtx);
            expired = is_terminal(it->second->status) && it->second->completed_at &&
                      *it->second->completed_at < cutoff;
        }
        if (expired) {
            it = jobs_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed) std::cout << "[jobs] cleanup removed " << removed << " job(s)" << std::endl;
    return removed;
}

JobStats JobManager::stats() {
    JobStats s;
    double total_time = 0.0;
    std::size_t completed = 0;
    for (const auto& job : all_jobs()) {
        std::lock_guard<std::mutex> lock(job->mtx);
        ++s.total;
        ++s.by_status[to_string(job->status)];
        ++s.by_worker[job->worker.empty() ? std::string("unassigned") : job->worker];
        if (job->status == JobStatus::Running) ++s.running;
        if (job->status == JobStatus::Completed && job->started_at && job->completed_at) {
            total_time += seconds_between(*job->started_at, *job->completed_at);
            ++completed;
        }
    }
    if (completed) s.avg_execution_time = total_time / static_cast<double>(completed);
    if (sampler_) {
        try {
            s.host = sampler_();
        } catch (const std::exception& e) {
            std::cerr << "[jobs] host usage unavailable: " << e.what() << std::endl;
        }
    }
    s.queued = pool_.queued();
    return s;
}

void JobManager::monitor_loop() {
    std::cout << "[monitor] started, interval " << opts_.monitor_interval.count() << "ms" << std::endl;
    std::unique_lock<std::mutex> lock(monitor_mtx_);
    while (!stopping_.load()) {
        monitor_cv_.wait_for(lock, opts_.monitor_interval, [this] { return stopping_.load(); });
        if (stopping_.load()) break;
        lock.unlock();
        try {
            check_timeouts(Clock::now());
        } catch (const std::exception& e) {
            std::cerr << "[monitor] tick failed: " << e.what() << std::endl;
        }
        lock.lock();
    }
}

void JobManager::shutdown() {
    if (stopping_.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lock(monitor_mtx_);
        monitor_cv_.notify_all();
    }
    if (monitor_.joinable()) monitor_.join();

    std::size_t cancelled = 0;
    for (const auto& job : all_jobs()) {
        std::lock_guard<std::mutex> lock(job->mtx);
        if (is_terminal(job->status)) continue;
        job->cancel.cancel();
        job->status = JobStatus::Cancelled;
        job->error = "Job manager shut down";
        job->completed_at = Clock::now();
        ++cancelled;
    }
    pool_.shutdown();
    std::cout << "[jobs] shut down, cancelled " << cancelled << " job(s)" << std::endl;
}
