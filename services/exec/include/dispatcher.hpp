#pragma once
#include "errors.hpp"
#include "job.hpp"
#include "worker_registry.hpp"
#include "worker_selector.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

struct ExecSuccess {
    std::string output;
    std::string stderr_text;
    nlohmann::json raw;
};
struct WorkerNotFound {};
struct NoEligibleWorker {};
struct ConnectionFailure {
    std::string detail;
};
struct RemoteTimeout {
    std::string detail;
};
struct RemoteNonZeroExit {
    int exit_code{1};
    std::string output;
    std::string stderr_text;
};
struct RemoteFailure {
    long http_status{0};
    std::string detail;
};
struct DispatchCancelled {};

using DispatchOutcome = std::variant<ExecSuccess, WorkerNotFound, NoEligibleWorker, ConnectionFailure,
                                     RemoteTimeout, RemoteNonZeroExit, RemoteFailure, DispatchCancelled>;

struct DispatchResult {
    DispatchOutcome outcome;
    std::string worker; // empty for NoEligibleWorker
    std::string ip;
    bool auto_selected{false};
    std::optional<WorkerStatus> selected_status; // load of the chosen worker when auto-selected
    std::chrono::milliseconds duration{0};

    bool success() const { return std::holds_alternative<ExecSuccess>(outcome); }
    // nullopt on success.
    std::optional<ErrorKind> error_kind() const;
    std::string error_message() const;
};

// {success, worker, ip, output, error, exit_code, kind?, auto_selected?}
nlohmann::json to_json(const DispatchResult& result);

// How a job records a dispatch.
JobOutcome to_job_outcome(const DispatchResult& result);

struct BatchResult {
    std::vector<std::string> order;
    std::map<std::string, DispatchResult> results;
    std::size_t success_count{0};
    std::size_t total{0};
};

nlohmann::json to_json(const BatchResult& batch);

// Never throws: every failure comes back as a DispatchResult alternative.
class ExecDispatcher {
public:
    ExecDispatcher(const WorkerRegistry& registry, const WorkerSelector& selector, WorkerTransport& transport);

    DispatchResult dispatch(const std::string& worker, const std::string& command, std::chrono::seconds timeout,
                            const CancellationToken* cancel = nullptr) const;
    DispatchResult dispatch_best(const std::string& command, std::chrono::seconds timeout,
                                 const CancellationToken* cancel = nullptr) const;
    // {"all"} expands to every registered worker. Duplicates run once.
    BatchResult batch_dispatch(const std::vector<std::string>& workers, const std::string& command,
                               std::chrono::seconds timeout) const;

private:
    DispatchResult call(const WorkerInfo& worker, const std::string& command, std::chrono::seconds timeout,
                        const CancellationToken* cancel) const;

    const WorkerRegistry& registry_;
    const WorkerSelector& selector_;
    WorkerTransport& transport_;
};
