#pragma once
#include "worker_registry.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct WorkerStatus {
    std::string name;
    bool online{false};   // answered /ping
    bool has_load{false}; // answered /status
    double cpu_percent{0};
    double memory_percent{0};
    nlohmann::json raw; // /status payload
    std::string error;
};

struct Candidate {
    WorkerInfo info;
    WorkerStatus status;

    double load() const { return status.cpu_percent + status.memory_percent; }
};

struct ProbeTimeouts {
    std::chrono::milliseconds ping{2000};
    std::chrono::milliseconds status{3000};
};

nlohmann::json to_json(const WorkerStatus& status);

// memory_percent, or derived from memory_total_gb / memory_available_gb.
double memory_percent_from(const nlohmann::json& status);

// Orders by cpu% + mem% ascending, then gpus descending, then registration order.
bool candidate_before(const Candidate& a, const Candidate& b);

// Probes are never cached: every call asks the workers again.
class WorkerSelector {
public:
    WorkerSelector(const WorkerRegistry& registry, WorkerTransport& transport, ProbeTimeouts timeouts = {});

    WorkerStatus probe(const WorkerInfo& worker) const;
    std::optional<WorkerStatus> probe(const std::string& name) const;
    // Every registered worker, probed concurrently, in registration order.
    std::vector<Candidate> probe_all() const;
    // Eligible workers (ping and status both answered), best first.
    std::vector<Candidate> rank() const;
    std::optional<Candidate> select_best() const;
    // Workers answering /ping, in registration order.
    std::vector<std::string> online_workers() const;

private:
    bool ping(const WorkerInfo& worker, std::string* error) const;

    const WorkerRegistry& registry_;
    WorkerTransport& transport_;
    ProbeTimeouts timeouts_;
};
