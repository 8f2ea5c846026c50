#include "exec_context.hpp"
#include "util.hpp"

static ProbeTimeouts probe_timeouts(const ExecConfig& cfg) {
    ProbeTimeouts t;
    t.ping = std::chrono::milliseconds(cfg.ping_timeout_ms);
    t.status = std::chrono::milliseconds(cfg.status_timeout_ms);
    return t;
}

static JobManager::Options job_options(const ExecConfig& cfg, bool start_monitor) {
    JobManager::Options o;
    o.max_workers = static_cast<std::size_t>(cfg.max_jobs > 0 ? cfg.max_jobs : 1);
    o.monitor_interval = std::chrono::milliseconds(cfg.monitor_ms > 0 ? cfg.monitor_ms : 1000);
    o.start_monitor = start_monitor;
    return o;
}

ExecContext::ExecContext(ExecConfig cfg, std::unique_ptr<WorkerTransport> worker_transport,
                         JobManager::HostSampler sampler, bool start_monitor)
    : config(std::move(cfg)),
      started_at(std::chrono::system_clock::now()),
      transport(std::move(worker_transport)),
      registry(config.agent_port),
      selector(registry, *transport, probe_timeouts(config)),
      dispatcher(registry, selector, *transport),
      analyzers(make_default_analyzers()),
      requests(static_cast<std::size_t>(config.request_log_size > 0 ? config.request_log_size : 200)),
      jobs(job_options(config, start_monitor), std::move(sampler)) {}

std::string ExecContext::worker_command(const std::string& language, const std::string& code) const {
    if (language == "python") return config.python + " -c " + shell_quote(code);
    return code;
}

JobManager::ExecutionFn ExecContext::execution_fn() const {
    return [this](const JobTask& task) {
        std::string cmd = worker_command(task.language, task.code);
        std::chrono::seconds timeout = task.timeout ? *task.timeout : std::chrono::seconds(config.default_timeout_s);
        DispatchResult r = task.worker.empty() ? dispatcher.dispatch_best(cmd, timeout, task.cancel)
                                               : dispatcher.dispatch(task.worker, cmd, timeout, task.cancel);
        return to_job_outcome(r);
    };
}
