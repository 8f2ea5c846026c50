#include "dispatcher.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <set>

using json = nlohmann::json;

namespace {

std::string string_field(const json& obj, const char* key) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_string()) return obj[key].get<std::string>();
    return std::string();
}

} // namespace

std::optional<ErrorKind> DispatchResult::error_kind() const {
    if (std::holds_alternative<WorkerNotFound>(outcome)) return ErrorKind::WorkerNotFound;
    if (std::holds_alternative<NoEligibleWorker>(outcome)) return ErrorKind::NoEligibleWorker;
    if (std::holds_alternative<ConnectionFailure>(outcome)) return ErrorKind::DispatchConnectionError;
    if (std::holds_alternative<RemoteTimeout>(outcome)) return ErrorKind::DispatchTimeout;
    if (std::holds_alternative<RemoteNonZeroExit>(outcome)) return ErrorKind::RemoteNonZeroExit;
    if (std::holds_alternative<RemoteFailure>(outcome)) return ErrorKind::RemoteError;
    if (std::holds_alternative<DispatchCancelled>(outcome)) return ErrorKind::Cancelled;
    return std::nullopt;
}

std::string DispatchResult::error_message() const {
    if (std::holds_alternative<WorkerNotFound>(outcome)) return "Worker '" + worker + "' not found";
    if (std::holds_alternative<NoEligibleWorker>(outcome)) return "No workers available";
    if (auto* f = std::get_if<ConnectionFailure>(&outcome)) return "Cannot connect: " + f->detail;
    if (auto* t = std::get_if<RemoteTimeout>(&outcome)) return t->detail;
    if (auto* x = std::get_if<RemoteNonZeroExit>(&outcome)) {
        return "Command exited with status " + std::to_string(x->exit_code);
    }
    if (auto* r = std::get_if<RemoteFailure>(&outcome)) return r->detail;
    if (std::holds_alternative<DispatchCancelled>(outcome)) return "Dispatch cancelled";
    return std::string();
}

nlohmann::json to_json(const DispatchResult& result) {
    json j = json::object();
    if (auto* ok = std::get_if<ExecSuccess>(&result.outcome)) {
        if (ok->raw.is_object()) j = ok->raw;
        j["output"] = ok->output;
        j["error"] = ok->stderr_text;
        j["exit_code"] = 0;
    } else if (auto* x = std::get_if<RemoteNonZeroExit>(&result.outcome)) {
        j["output"] = x->output;
        j["error"] = x->stderr_text;
        j["exit_code"] = x->exit_code;
        j["kind"] = to_string(ErrorKind::RemoteNonZeroExit);
    } else {
        j["error"] = result.error_message();
        if (auto kind = result.error_kind()) j["kind"] = to_string(*kind);
    }
    j["success"] = result.success();
    j["worker"] = result.worker.empty() ? json(nullptr) : json(result.worker);
    if (!result.ip.empty()) j["ip"] = result.ip;
    if (result.auto_selected) j["auto_selected"] = true;
    j["duration_ms"] = result.duration.count();
    return j;
}

JobOutcome to_job_outcome(const DispatchResult& result) {
    JobOutcome out;
    out.success = result.success();
    out.worker = result.worker;
    out.result = to_json(result);
    if (auto* ok = std::get_if<ExecSuccess>(&result.outcome)) {
        out.output_size = ok->output.size();
    } else if (auto* x = std::get_if<RemoteNonZeroExit>(&result.outcome)) {
        out.output_size = x->output.size();
    }
    if (!out.success) {
        auto kind = result.error_kind();
        out.error = std::string(kind ? to_string(*kind) : "RemoteError") + ": " + result.error_message();
    }
    if (result.selected_status) {
        out.worker_cpu = result.selected_status->cpu_percent;
        out.worker_memory = result.selected_status->memory_percent;
    }
    return out;
}

nlohmann::json to_json(const BatchResult& batch) {
    json results = json::object();
    for (const auto& name : batch.order) {
        auto it = batch.results.find(name);
        if (it != batch.results.end()) results[name] = to_json(it->second);
    }
    return {{"results", results}, {"success_count", batch.success_count}, {"total", batch.total}};
}

ExecDispatcher::ExecDispatcher(const WorkerRegistry& registry, const WorkerSelector& selector,
                               WorkerTransport& transport)
    : registry_(registry), selector_(selector), transport_(transport) {}

DispatchResult ExecDispatcher::call(const WorkerInfo& worker, const std::string& command,
                                    std::chrono::seconds timeout, const CancellationToken* cancel) const {
    DispatchResult res;
    res.worker = worker.name;
    res.ip = worker.ip;
    if (cancel && cancel->cancelled()) {
        res.outcome = DispatchCancelled{};
        return res;
    }

    auto start = std::chrono::steady_clock::now();
    AgentReply r = transport_.exec(worker.endpoint(), command,
                                   std::chrono::duration_cast<std::chrono::milliseconds>(timeout), cancel);
    res.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    switch (r.code) {
        case TransportCode::Ok: {
            int exit_code = 1;
            if (r.body.contains("exit_code") && r.body["exit_code"].is_number_integer()) {
                exit_code = r.body["exit_code"].get<int>();
            }
            std::string output = string_field(r.body, "output");
            std::string err = string_field(r.body, "error");
            if (exit_code == 0) {
                res.outcome = ExecSuccess{output, err, r.body};
            } else {
                res.outcome = RemoteNonZeroExit{exit_code, output, err};
            }
            break;
        }
        case TransportCode::TimedOut:
            res.outcome = RemoteTimeout{"Timeout after " + std::to_string(timeout.count()) + "s"};
            break;
        case TransportCode::Aborted:
            res.outcome = DispatchCancelled{};
            break;
        case TransportCode::ConnectFailed:
            res.outcome = ConnectionFailure{r.detail};
            break;
        case TransportCode::HttpError:
            // The agent reports its own execution ceiling as 408.
            if (r.http_status == 408) {
                res.outcome = RemoteTimeout{r.detail};
            } else {
                res.outcome = RemoteFailure{r.http_status, r.detail};
            }
            break;
        case TransportCode::BadReply:
            res.outcome = RemoteFailure{r.http_status, r.detail};
            break;
    }
    if (!res.success()) {
        std::cerr << "[dispatch] " << worker.name << ": " << res.error_message() << std::endl;
    }
    return res;
}

DispatchResult ExecDispatcher::dispatch(const std::string& worker, const std::string& command,
                                        std::chrono::seconds timeout, const CancellationToken* cancel) const {
    auto info = registry_.find(worker);
    if (!info) {
        DispatchResult res;
        res.worker = worker;
        res.outcome = WorkerNotFound{};
        return res;
    }
    return call(*info, command, timeout, cancel);
}

DispatchResult ExecDispatcher::dispatch_best(const std::string& command, std::chrono::seconds timeout,
                                             const CancellationToken* cancel) const {
    auto best = selector_.select_best();
    if (!best) {
        DispatchResult res;
        res.outcome = NoEligibleWorker{};
        res.auto_selected = true;
        return res;
    }
    DispatchResult res = call(best->info, command, timeout, cancel);
    res.auto_selected = true;
    res.selected_status = best->status;
    return res;
}

BatchResult ExecDispatcher::batch_dispatch(const std::vector<std::string>& workers, const std::string& command,
                                           std::chrono::seconds timeout) const {
    BatchResult batch;
    std::vector<std::string> requested = workers;
    if (requested.size() == 1 && requested.front() == "all") requested = registry_.names();

    std::set<std::string> seen;
    for (const auto& name : requested) {
        if (seen.insert(name).second) batch.order.push_back(name);
    }
    batch.total = batch.order.size();

    std::vector<std::future<DispatchResult>> pending;
    pending.reserve(batch.order.size());
    for (const auto& name : batch.order) {
        pending.push_back(std::async(std::launch::async, [this, &name, &command, timeout] {
            return dispatch(name, command, timeout);
        }));
    }
    for (std::size_t i = 0; i < batch.order.size(); ++i) {
        DispatchResult res = pending[i].get();
        if (res.success()) ++batch.success_count;
        batch.results.emplace(batch.order[i], std::move(res));
    }
    return batch;
}
