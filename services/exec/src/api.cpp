#include "api.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

using json = nlohmann::json;

namespace {

const char* kApiPrefix = "/api";
const char* kJobsPrefix = "/exec/jobs/";

const std::vector<std::string> kFixedRoutes = {
    "/health", "/middleware/health", "/middleware/stats", "/middleware/logs",
    "/exec", "/exec/analyze", "/exec/safe-execute", "/exec/auto", "/exec/batch",
    "/exec/jobs", "/exec/jobs/stats", "/exec/jobs/cleanup",
    "/exec/workers", "/exec/workers/best", "/exec/workers/online",
};

std::string strip_prefix(std::string path) {
    if (path.rfind(kApiPrefix, 0) == 0 && (path.size() == 4 || path[4] == '/')) path = path.substr(4);
    if (path.size() > 1 && path.back() == '/') path.pop_back();
    return path;
}

json parse_body(const ApiRequest& req) {
    if (trim(req.body).empty()) return json::object();
    json j = json::parse(req.body);
    if (!j.is_object()) throw ExecError(ErrorKind::BadRequest, "request body must be a JSON object");
    return j;
}

std::string require_string(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string() || j[key].get<std::string>().empty()) {
        throw ExecError(ErrorKind::BadRequest, std::string("'") + key + "' is required");
    }
    return j[key].get<std::string>();
}

std::string optional_string(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::string();
    if (!j[key].is_string()) throw ExecError(ErrorKind::BadRequest, std::string("'") + key + "' must be a string");
    return j[key].get<std::string>();
}

int positive_or(const json& j, const char* key, int def) {
    if (!j.contains(key) || j[key].is_null()) return def;
    if (!j[key].is_number_integer() || j[key].get<long long>() <= 0 || j[key].get<long long>() > 86400) {
        throw ExecError(ErrorKind::BadRequest, std::string("'") + key + "' must be a positive number of seconds");
    }
    return j[key].get<int>();
}

int query_int_or(const ApiRequest& req, const std::string& key, int def, int min_value) {
    auto it = req.query.find(key);
    if (it == req.query.end() || it->second.empty()) return def;
    std::size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(it->second, &used);
    } catch (const std::exception&) {
        throw ExecError(ErrorKind::BadRequest, "invalid value for '" + key + "'");
    }
    if (used != it->second.size() || v < min_value) {
        throw ExecError(ErrorKind::BadRequest, "invalid value for '" + key + "'");
    }
    return v;
}

const CodeAnalyzer& analyzer_for(const ExecContext& ctx, const std::string& language) {
    if (language.empty()) return ctx.analyzers.default_analyzer();
    const CodeAnalyzer* a = ctx.analyzers.find(language);
    if (!a) {
        std::string known;
        for (const auto& l : ctx.analyzers.languages()) known += (known.empty() ? "" : ", ") + l;
        throw ExecError(ErrorKind::BadRequest, "unsupported language '" + language + "' (known: " + known + ")");
    }
    return *a;
}

json error_body(ErrorKind kind, const std::string& message) {
    return {{"error", message}, {"kind", to_string(kind)}};
}

ApiResponse error_response(ErrorKind kind, const std::string& message) {
    return ApiResponse{http_status_for(kind), error_body(kind, message), {}};
}

// A command that ran but exited non-zero is still a served request.
ApiResponse dispatch_response(const DispatchResult& r) {
    ApiResponse resp;
    resp.body = to_json(r);
    resp.worker = r.worker;
    auto kind = r.error_kind();
    if (kind && *kind != ErrorKind::RemoteNonZeroExit) resp.status = http_status_for(*kind);
    return resp;
}

json health(const ExecContext& ctx) {
    auto now = std::chrono::system_clock::now();
    return {
        {"status", "ok"},
        {"service", "gridx-exec"},
        {"timestamp", format_time(now)},
        {"uptime_s", std::chrono::duration_cast<std::chrono::seconds>(now - ctx.started_at).count()},
        {"workers_registered", ctx.registry.size()},
    };
}

ApiResponse analyze_route(ExecContext& ctx, const ApiRequest& req) {
    json body = parse_body(req);
    std::string code = require_string(body, "code");
    const CodeAnalyzer& analyzer = analyzer_for(ctx, optional_string(body, "language"));
    return ApiResponse{200, to_json(analyzer.analyze(code)), {}};
}

ApiResponse safe_execute_route(ExecContext& ctx, const ApiRequest& req) {
    json body = parse_body(req);
    std::string code = require_string(body, "code");
    const CodeAnalyzer& analyzer = analyzer_for(ctx, optional_string(body, "language"));
    std::string worker = optional_string(body, "worker");
    if (!worker.empty() && !ctx.registry.find(worker)) {
        throw ExecError(ErrorKind::WorkerNotFound, "Worker '" + worker + "' not found");
    }
    int timeout = positive_or(body, "timeout", ctx.config.default_timeout_s);
    JobPriority priority = JobPriority::Normal;
    std::string priority_text = optional_string(body, "priority");
    if (!priority_text.empty()) {
        auto p = parse_priority(priority_text);
        if (!p) throw ExecError(ErrorKind::BadRequest, "priority must be low, normal, high or critical");
        priority = *p;
    }
    bool allow_risky = body.contains("allow_risky") && body["allow_risky"].is_boolean() && body["allow_risky"].get<bool>();
    std::string user_id = optional_string(body, "user_id");

    std::string id = ctx.jobs.create(code, analyzer.language(), worker, user_id, priority,
                                     std::chrono::seconds(timeout));
    auto verdict = ctx.jobs.analyze(id, analyzer, allow_risky);
    if (!verdict) throw ExecError(ErrorKind::InvalidTransition, "job " + id + " could not be analyzed");

    if (!verdict->should_execute && !allow_risky) {
        json out = error_body(ErrorKind::AnalysisRejected,
                              "Code analysis found high-severity issues; resubmit with allow_risky to override");
        out["job_id"] = id;
        out["analysis"] = to_json(*verdict);
        return ApiResponse{http_status_for(ErrorKind::AnalysisRejected), out, worker};
    }
    if (!ctx.jobs.submit(id, ctx.execution_fn())) {
        throw ExecError(ErrorKind::InvalidTransition, "job " + id + " could not be scheduled");
    }
    auto snap = ctx.jobs.get(id);
    json out = {
        {"job_id", id},
        {"status", snap ? to_string(snap->status) : "running"},
        {"analysis", to_json(*verdict)},
        {"allow_risky", allow_risky},
    };
    return ApiResponse{202, out, worker};
}

ApiResponse list_jobs_route(ExecContext& ctx, const ApiRequest& req) {
    std::optional<std::string> user;
    auto it = req.query.find("user_id");
    if (it != req.query.end() && !it->second.empty()) user = it->second;
    json arr = json::array();
    for (const auto& s : ctx.jobs.list(user)) arr.push_back(to_json(s, false));
    return ApiResponse{200, {{"jobs", arr}, {"count", arr.size()}}, {}};
}

ApiResponse cleanup_route(ExecContext& ctx, const ApiRequest& req) {
    int hours = query_int_or(req, "max_age_hours", ctx.config.retention_hours, 0);
    std::size_t removed = ctx.jobs.cleanup(std::chrono::hours(hours));
    return ApiResponse{200, {{"removed", removed}, {"max_age_hours", hours}}, {}};
}

ApiResponse job_route(ExecContext& ctx, const ApiRequest& req, const std::string& rest) {
    std::string id = rest;
    std::string action_path;
    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        id = rest.substr(0, slash);
        action_path = rest.substr(slash);
    }
    if (id.empty()) throw ExecError(ErrorKind::BadRequest, "job id required");

    if (req.method == "GET" && action_path.empty()) {
        auto snap = ctx.jobs.get(id);
        if (!snap) throw ExecError(ErrorKind::JobNotFound, "Job '" + id + "' not found");
        return ApiResponse{200, to_json(*snap, true), snap->worker};
    }
    if (req.method == "POST" && action_path == "/control") {
        json body = parse_body(req);
        std::string action = require_string(body, "action");
        if (action != "cancel") throw ExecError(ErrorKind::BadRequest, "unsupported action '" + action + "'");
        auto snap = ctx.jobs.get(id);
        if (!snap) throw ExecError(ErrorKind::JobNotFound, "Job '" + id + "' not found");
        if (!ctx.jobs.cancel(id)) {
            auto now = ctx.jobs.get(id);
            throw ExecError(ErrorKind::InvalidTransition,
                            "Job '" + id + "' is already " + (now ? to_string(now->status) : "gone"));
        }
        return ApiResponse{200, {{"success", true}, {"job_id", id}, {"status", "cancelled"}}, snap->worker};
    }
    return ApiResponse{404, {{"error", "not found"}}, {}};
}

ApiResponse workers_route(ExecContext& ctx) {
    json arr = json::array();
    std::size_t online = 0;
    for (const auto& c : ctx.selector.probe_all()) {
        json w = to_json(c.info);
        w["online"] = c.status.online;
        w["cpu_percent"] = c.status.cpu_percent;
        w["memory_percent"] = c.status.memory_percent;
        if (!c.status.error.empty()) w["error"] = c.status.error;
        if (c.status.online) ++online;
        arr.push_back(w);
    }
    return ApiResponse{200, {{"workers", arr}, {"count", arr.size()}, {"online", online}}, {}};
}

ApiResponse best_worker_route(ExecContext& ctx) {
    auto ranked = ctx.selector.rank();
    if (ranked.empty()) throw ExecError(ErrorKind::NoEligibleWorker, "No workers available");
    const Candidate& best = ranked.front();
    json candidates = json::array();
    for (const auto& c : ranked) {
        candidates.push_back({{"name", c.info.name}, {"load", c.load()}, {"gpus", c.info.gpus}});
    }
    json out = {
        {"name", best.info.name},
        {"info", to_json(best.info)},
        {"status", to_json(best.status)},
        {"reason", "Selected based on lowest load and resource availability"},
        {"candidates", candidates},
    };
    return ApiResponse{200, out, best.info.name};
}

ApiResponse batch_route(ExecContext& ctx, const ApiRequest& req) {
    json body = parse_body(req);
    std::vector<std::string> workers;
    if (body.contains("workers") && body["workers"].is_string()) {
        workers.push_back(body["workers"].get<std::string>());
    } else if (body.contains("workers") && body["workers"].is_array()) {
        for (const auto& w : body["workers"]) {
            if (!w.is_string()) throw ExecError(ErrorKind::BadRequest, "'workers' must hold worker names");
            workers.push_back(w.get<std::string>());
        }
    }
    if (workers.empty()) throw ExecError(ErrorKind::BadRequest, "No workers specified");
    std::string command = require_string(body, "command");
    int timeout = positive_or(body, "timeout", ctx.config.default_timeout_s);
    BatchResult batch = ctx.dispatcher.batch_dispatch(workers, command, std::chrono::seconds(timeout));
    if (batch.total == 0) throw ExecError(ErrorKind::BadRequest, "No workers specified");
    return ApiResponse{200, to_json(batch), {}};
}

ApiResponse exec_route(ExecContext& ctx, const ApiRequest& req) {
    json body = parse_body(req);
    std::string command = require_string(body, "command");
    std::string worker = optional_string(body, "worker");
    auto timeout = std::chrono::seconds(positive_or(body, "timeout", ctx.config.default_timeout_s));
    return dispatch_response(worker.empty() ? ctx.dispatcher.dispatch_best(command, timeout)
                                            : ctx.dispatcher.dispatch(worker, command, timeout));
}

ApiResponse auto_route(ExecContext& ctx, const ApiRequest& req) {
    auto it = req.query.find("command");
    if (it == req.query.end() || it->second.empty()) {
        throw ExecError(ErrorKind::BadRequest, "'command' query parameter is required");
    }
    int timeout = query_int_or(req, "timeout", ctx.config.default_timeout_s, 1);
    return dispatch_response(ctx.dispatcher.dispatch_best(it->second, std::chrono::seconds(timeout)));
}

ApiResponse logs_route(ExecContext& ctx, const ApiRequest& req) {
    int limit = query_int_or(req, "limit", static_cast<int>(ctx.requests.capacity()), 1);
    json arr = json::array();
    for (const auto& e : ctx.requests.recent(static_cast<std::size_t>(limit))) arr.push_back(to_json(e));
    return ApiResponse{200, {{"logs", arr}, {"count", arr.size()}}, {}};
}

ApiResponse route(ExecContext& ctx, const ApiRequest& req, const std::string& path) {
    const std::string& m = req.method;

    if (m == "GET" && (path == "/health" || path == "/middleware/health")) return ApiResponse{200, health(ctx), {}};

    if (m == "POST" && path == "/exec/analyze") return analyze_route(ctx, req);
    if (m == "POST" && path == "/exec/safe-execute") return safe_execute_route(ctx, req);
    if (m == "GET" && path == "/exec/jobs") return list_jobs_route(ctx, req);
    if (m == "GET" && path == "/exec/jobs/stats") return ApiResponse{200, to_json(ctx.jobs.stats()), {}};
    if (m == "DELETE" && path == "/exec/jobs/cleanup") return cleanup_route(ctx, req);
    if (path.rfind(kJobsPrefix, 0) == 0) return job_route(ctx, req, path.substr(std::string(kJobsPrefix).size()));

    if (m == "GET" && path == "/exec/workers") return workers_route(ctx);
    if (m == "GET" && path == "/exec/workers/best") return best_worker_route(ctx);
    if (m == "GET" && path == "/exec/workers/online") {
        auto online = ctx.selector.online_workers();
        return ApiResponse{200, {{"workers", online}, {"count", online.size()}}, {}};
    }
    if (m == "POST" && path == "/exec/batch") return batch_route(ctx, req);
    if (m == "POST" && path == "/exec") return exec_route(ctx, req);
    if (m == "POST" && path == "/exec/auto") return auto_route(ctx, req);

    if (m == "GET" && path == "/middleware/stats") return ApiResponse{200, admin_stats(ctx), {}};
    if (m == "GET" && path == "/middleware/logs") return logs_route(ctx, req);
    if (m == "DELETE" && path == "/middleware/logs") {
        ctx.requests.clear();
        return ApiResponse{200, {{"success", true}, {"message", "Logs cleared"}}, {}};
    }
    return ApiResponse{404, {{"error", "not found"}}, {}};
}

} // namespace

nlohmann::json admin_stats(ExecContext& ctx) {
    RequestCounters c = ctx.requests.counters();
    std::vector<std::pair<std::string, std::size_t>> endpoints(c.by_endpoint.begin(), c.by_endpoint.end());
    std::stable_sort(endpoints.begin(), endpoints.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    json top = json::array();
    for (std::size_t i = 0; i < endpoints.size() && i < 10; ++i) top.push_back(endpoints[i].first);

    double rate = 100.0 * static_cast<double>(c.success) / static_cast<double>(std::max<std::size_t>(c.total, 1));
    return {
        {"total", c.total},
        {"success", c.success},
        {"failed", c.failed},
        {"by_endpoint", c.by_endpoint},
        {"by_worker", c.by_worker},
        {"by_method", c.by_method},
        {"success_rate", std::round(rate * 100.0) / 100.0},
        {"active_workers", c.by_worker.size()},
        {"top_endpoints", top},
        {"jobs", to_json(ctx.jobs.stats())},
    };
}

std::string route_template(const std::string& raw) {
    std::string path = strip_prefix(raw);
    if (std::find(kFixedRoutes.begin(), kFixedRoutes.end(), path) != kFixedRoutes.end()) return path;
    if (path.rfind(kJobsPrefix, 0) == 0) {
        std::string rest = path.substr(std::string(kJobsPrefix).size());
        auto slash = rest.find('/');
        if (!rest.empty() && slash == std::string::npos) return "/exec/jobs/{id}";
        if (slash != 0 && slash != std::string::npos && rest.substr(slash) == "/control") return "/exec/jobs/{id}/control";
    }
    return "other";
}

ApiResponse handle_request(ExecContext& ctx, const ApiRequest& req) {
    std::string path = strip_prefix(req.path);

    ApiResponse resp;
    try {
        if (path.rfind("/exec", 0) == 0) ctx.registry.refresh();
        resp = route(ctx, req, path);
    } catch (const ExecError& e) {
        resp = error_response(e.kind(), e.what());
    } catch (const json::exception& e) {
        resp = error_response(ErrorKind::BadRequest, std::string("invalid JSON: ") + e.what());
    } catch (const std::exception& e) {
        std::cerr << "[exec] " << req.method << " " << req.path << " failed: " << e.what() << std::endl;
        resp = ApiResponse{500, {{"error", e.what()}}, {}};
    }
    resp.route = route_template(path);
    return resp;
}
