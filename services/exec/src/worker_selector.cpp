#include "worker_selector.hpp"
#include <algorithm>
#include <future>

using json = nlohmann::json;

nlohmann::json to_json(const WorkerStatus& status) {
    json j = {
        {"name", status.name},
        {"online", status.online},
        {"cpu_percent", status.cpu_percent},
        {"memory_percent", status.memory_percent},
        {"status", status.raw.is_null() ? json(nullptr) : status.raw},
    };
    if (!status.error.empty()) j["error"] = status.error;
    return j;
}

static double number_or_zero(const json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key) || !obj[key].is_number()) return 0;
    return obj[key].get<double>();
}

double memory_percent_from(const nlohmann::json& status) {
    if (status.is_object() && status.contains("memory_percent") && status["memory_percent"].is_number()) {
        return status["memory_percent"].get<double>();
    }
    double total = number_or_zero(status, "memory_total_gb");
    double avail = number_or_zero(status, "memory_available_gb");
    if (total <= 0 || avail > total) return 0;
    return 100.0 * (total - avail) / total;
}

bool candidate_before(const Candidate& a, const Candidate& b) {
    if (a.load() != b.load()) return a.load() < b.load();
    if (a.info.gpus != b.info.gpus) return a.info.gpus > b.info.gpus;
    return a.info.index < b.info.index;
}

WorkerSelector::WorkerSelector(const WorkerRegistry& registry, WorkerTransport& transport, ProbeTimeouts timeouts)
    : registry_(registry), transport_(transport), timeouts_(timeouts) {}

bool WorkerSelector::ping(const WorkerInfo& worker, std::string* error) const {
    AgentReply r = transport_.ping(worker.endpoint(), timeouts_.ping);
    // Any 2xx counts, whatever the body.
    if (r.ok() || r.code == TransportCode::BadReply) return true;
    if (error) *error = r.detail;
    return false;
}

WorkerStatus WorkerSelector::probe(const WorkerInfo& worker) const {
    WorkerStatus s;
    s.name = worker.name;
    s.online = ping(worker, &s.error);
    if (!s.online) return s;

    AgentReply r = transport_.status(worker.endpoint(), timeouts_.status);
    if (!r.ok()) {
        s.error = "status probe failed: " + r.detail;
        return s;
    }
    s.has_load = true;
    s.raw = r.body;
    s.cpu_percent = number_or_zero(r.body, "cpu_percent");
    s.memory_percent = memory_percent_from(r.body);
    return s;
}

std::optional<WorkerStatus> WorkerSelector::probe(const std::string& name) const {
    auto worker = registry_.find(name);
    if (!worker) return std::nullopt;
    return probe(*worker);
}

std::vector<Candidate> WorkerSelector::probe_all() const {
    auto workers = registry_.snapshot();
    std::vector<std::future<WorkerStatus>> pending;
    pending.reserve(workers->size());
    for (const auto& w : *workers) {
        pending.push_back(std::async(std::launch::async, [this, &w] { return probe(w); }));
    }
    std::vector<Candidate> out;
    out.reserve(workers->size());
    for (std::size_t i = 0; i < workers->size(); ++i) {
        out.push_back(Candidate{(*workers)[i], pending[i].get()});
    }
    return out;
}

std::vector<Candidate> WorkerSelector::rank() const {
    std::vector<Candidate> eligible;
    for (auto& c : probe_all()) {
        if (c.status.online && c.status.has_load) eligible.push_back(std::move(c));
    }
    std::sort(eligible.begin(), eligible.end(), candidate_before);
    return eligible;
}

std::optional<Candidate> WorkerSelector::select_best() const {
    auto ranked = rank();
    if (ranked.empty()) return std::nullopt;
    return ranked.front();
}

std::vector<std::string> WorkerSelector::online_workers() const {
    auto workers = registry_.snapshot();
    std::vector<std::future<bool>> pending;
    pending.reserve(workers->size());
    for (const auto& w : *workers) {
        pending.push_back(std::async(std::launch::async, [this, &w] { return ping(w, nullptr); }));
    }
    std::vector<std::string> out;
    for (std::size_t i = 0; i < workers->size(); ++i) {
        if (pending[i].get()) out.push_back((*workers)[i].name);
    }
    return out;
}
