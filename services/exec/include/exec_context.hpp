#pragma once
#include "analyzer.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "job_manager.hpp"
#include "request_log.hpp"
#include "worker_client.hpp"
#include "worker_registry.hpp"
#include "worker_selector.hpp"
#include <chrono>
#include <memory>
#include <string>

// Everything the service shares, built once in main and passed by reference.
// Members are declared in dependency order; the job manager goes last so it
// stops its pool before the dispatcher it calls into is destroyed.
struct ExecContext {
    ExecContext(ExecConfig cfg, std::unique_ptr<WorkerTransport> worker_transport,
                JobManager::HostSampler sampler = read_host_usage, bool start_monitor = true);

    // Command line run on the worker for a submission.
    std::string worker_command(const std::string& language, const std::string& code) const;
    // Execution function handed to JobManager::submit for safe-execute jobs.
    JobManager::ExecutionFn execution_fn() const;

    ExecConfig config;
    std::chrono::system_clock::time_point started_at;
    std::unique_ptr<WorkerTransport> transport;
    WorkerRegistry registry;
    WorkerSelector selector;
    ExecDispatcher dispatcher;
    AnalyzerSet analyzers;
    RequestLog requests;
    JobManager jobs;
};
