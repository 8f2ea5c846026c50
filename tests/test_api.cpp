#include "catch2/catch.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include "api.hpp"
#include "fake_transport.hpp"

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

HostUsage no_usage() {
    return HostUsage{};
}

WorkerInfo worker(const std::string& name, const std::string& ip) {
    WorkerInfo w;
    w.name = name;
    w.ip = ip;
    return w;
}

// Service wired to fake agents: w1 answers, w2 is registered but unreachable.
struct Service {
    Service() {
        auto t = std::make_unique<FakeTransport>();
        transport = t.get();
        ctx = std::make_unique<ExecContext>(ExecConfig{}, std::move(t), no_usage, false);
        ctx->registry.replace({worker("w1", "10.0.0.1"), worker("w2", "10.0.0.2")});
        transport->set("10.0.0.1", FakeTransport::Agent{});
    }

    ApiResponse call(const std::string& method, const std::string& path, const json& body = json(),
                     std::map<std::string, std::string> query = {}) {
        ApiRequest req{method, path, std::move(query), body.is_null() ? std::string() : body.dump()};
        return handle_request(*ctx, req);
    }

    JobStatus wait_terminal(const std::string& id) {
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (std::chrono::steady_clock::now() < deadline) {
            auto s = ctx->jobs.get(id);
            if (s && is_terminal(s->status)) return s->status;
            std::this_thread::sleep_for(5ms);
        }
        return ctx->jobs.get(id)->status;
    }

    FakeTransport* transport{nullptr};
    std::unique_ptr<ExecContext> ctx;
};

} // namespace

TEST_CASE("health and routing basics", "[api]") {
    Service s;
    ApiResponse r = s.call("GET", "/health");
    REQUIRE(r.status == 200);
    REQUIRE(r.body["status"] == "ok");
    REQUIRE(r.body["workers_registered"] == 2);

    REQUIRE(s.call("GET", "/api/health/").status == 200);
    REQUIRE(s.call("GET", "/middleware/health").status == 200);
    REQUIRE(s.call("GET", "/nowhere").status == 404);
    REQUIRE(s.call("PUT", "/exec").status == 404);
}

TEST_CASE("analyze endpoint", "[api]") {
    Service s;
    ApiResponse r = s.call("POST", "/exec/analyze", {{"code", "while True:\n    pass\n"}});
    REQUIRE(r.status == 200);
    REQUIRE(r.body["should_execute"] == false);
    REQUIRE(r.body["language"] == "python");

    ApiResponse sh = s.call("POST", "/exec/analyze", {{"code", "ls -la"}, {"language", "shell"}});
    REQUIRE(sh.body["should_execute"] == true);

    ApiResponse missing = s.call("POST", "/exec/analyze", json::object());
    REQUIRE(missing.status == 400);
    REQUIRE(missing.body["kind"] == "BadRequest");

    ApiResponse lang = s.call("POST", "/exec/analyze", {{"code", "x"}, {"language", "cobol"}});
    REQUIRE(lang.status == 400);

    ApiRequest raw{"POST", "/exec/analyze", {}, "{not json"};
    REQUIRE(handle_request(*s.ctx, raw).status == 400);
}

TEST_CASE("safe-execute rejects risky code with the analysis", "[api]") {
    Service s;
    ApiResponse r = s.call("POST", "/exec/safe-execute", {{"code", "while True:\n    pass\n"}, {"user_id", "alice"}});
    REQUIRE(r.status == 422);
    REQUIRE(r.body["kind"] == "AnalysisRejected");
    REQUIRE(r.body["analysis"]["should_execute"] == false);
    REQUIRE(r.body["analysis"]["analysis_summary"]["high_severity"].get<int>() >= 1);

    std::string id = r.body["job_id"].get<std::string>();
    ApiResponse job = s.call("GET", "/exec/jobs/" + id);
    REQUIRE(job.status == 200);
    REQUIRE(job.body["status"] == "failed");
    REQUIRE(job.body["started_at"].is_null());
    REQUIRE(s.transport->exec_calls("10.0.0.1") == 0);
}

TEST_CASE("safe-execute runs accepted code on the chosen worker", "[api]") {
    Service s;
    ApiResponse r = s.call("POST", "/exec/safe-execute",
                           {{"code", "print('hi')"}, {"worker", "w1"}, {"priority", "high"}, {"timeout", 10}});
    REQUIRE(r.status == 202);
    REQUIRE(r.body["allow_risky"] == false);
    std::string id = r.body["job_id"].get<std::string>();

    REQUIRE(s.wait_terminal(id) == JobStatus::Completed);
    REQUIRE(s.transport->last_command() == "python3 -c 'print('\\''hi'\\'')'");

    ApiResponse job = s.call("GET", "/exec/jobs/" + id);
    REQUIRE(job.body["worker"] == "w1");
    REQUIRE(job.body["priority"] == "high");
    REQUIRE(job.body["result"]["success"] == true);
    REQUIRE(job.body.contains("analysis"));

    ApiResponse cancel = s.call("POST", "/exec/jobs/" + id + "/control", {{"action", "cancel"}});
    REQUIRE(cancel.status == 409);
    REQUIRE(cancel.body["kind"] == "InvalidTransition");
}

TEST_CASE("safe-execute input validation", "[api]") {
    Service s;
    REQUIRE(s.call("POST", "/exec/safe-execute", {{"code", "print(1)"}, {"worker", "ghost"}}).status == 404);
    REQUIRE(s.call("POST", "/exec/safe-execute", {{"code", "print(1)"}, {"priority", "urgent"}}).status == 400);
    REQUIRE(s.call("POST", "/exec/safe-execute", {{"code", "print(1)"}, {"timeout", -1}}).status == 400);
    REQUIRE(s.call("POST", "/exec/safe-execute", {{"language", "python"}}).status == 400);
    REQUIRE(s.ctx->jobs.list().empty());
}

TEST_CASE("job control and listing", "[api]") {
    Service s;
    FakeTransport::Agent slow;
    slow.delay = 30s;
    s.transport->set("10.0.0.1", slow);

    ApiResponse r = s.call("POST", "/exec/safe-execute", {{"code", "print(1)"}, {"worker", "w1"}, {"user_id", "bob"}});
    REQUIRE(r.status == 202);
    std::string id = r.body["job_id"].get<std::string>();

    ApiResponse listed = s.call("GET", "/exec/jobs", json(), {{"user_id", "bob"}});
    REQUIRE(listed.body["count"] == 1);
    REQUIRE(s.call("GET", "/exec/jobs", json(), {{"user_id", "carol"}}).body["count"] == 0);

    ApiResponse cancel = s.call("POST", "/exec/jobs/" + id + "/control", {{"action", "cancel"}});
    REQUIRE(cancel.status == 200);
    REQUIRE(cancel.body["status"] == "cancelled");
    REQUIRE(s.wait_terminal(id) == JobStatus::Cancelled);

    REQUIRE(s.call("POST", "/exec/jobs/" + id + "/control", {{"action", "pause"}}).status == 400);
    REQUIRE(s.call("GET", "/exec/jobs/unknown").status == 404);
    REQUIRE(s.call("POST", "/exec/jobs/unknown/control", {{"action", "cancel"}}).status == 404);

    ApiResponse stats = s.call("GET", "/exec/jobs/stats");
    REQUIRE(stats.body["total_jobs"] == 1);
    REQUIRE(stats.body["by_status"]["cancelled"] == 1);

    ApiResponse cleaned = s.call("DELETE", "/exec/jobs/cleanup", json(), {{"max_age_hours", "0"}});
    REQUIRE(cleaned.status == 200);
    REQUIRE(cleaned.body["removed"] == 1);
    REQUIRE(s.call("DELETE", "/exec/jobs/cleanup", json(), {{"max_age_hours", "soon"}}).status == 400);
}

TEST_CASE("worker endpoints", "[api]") {
    Service s;
    ApiResponse all = s.call("GET", "/exec/workers");
    REQUIRE(all.body["count"] == 2);
    REQUIRE(all.body["online"] == 1);

    ApiResponse best = s.call("GET", "/exec/workers/best");
    REQUIRE(best.status == 200);
    REQUIRE(best.body["name"] == "w1");
    REQUIRE(best.body["candidates"].size() == 1);

    ApiResponse online = s.call("GET", "/exec/workers/online");
    REQUIRE(online.body["workers"] == json::array({"w1"}));

    s.ctx->registry.replace({});
    ApiResponse none = s.call("GET", "/exec/workers/best");
    REQUIRE(none.status == 503);
    REQUIRE(none.body["kind"] == "NoEligibleWorker");
}

TEST_CASE("direct, auto and batch execution", "[api]") {
    Service s;

    ApiResponse ok = s.call("POST", "/exec", {{"command", "hostname"}, {"worker", "w1"}});
    REQUIRE(ok.status == 200);
    REQUIRE(ok.body["success"] == true);
    REQUIRE(ok.worker == "w1");

    REQUIRE(s.call("POST", "/exec", {{"command", "hostname"}, {"worker", "ghost"}}).status == 404);
    REQUIRE(s.call("POST", "/exec", {{"command", "hostname"}, {"worker", "w2"}}).status == 502);
    REQUIRE(s.call("POST", "/exec", {{"worker", "w1"}}).status == 400);

    FakeTransport::Agent failing;
    failing.exit_code = 2;
    s.transport->set("10.0.0.1", failing);
    ApiResponse nonzero = s.call("POST", "/exec", {{"command", "false"}, {"worker", "w1"}});
    REQUIRE(nonzero.status == 200);
    REQUIRE(nonzero.body["success"] == false);
    REQUIRE(nonzero.body["exit_code"] == 2);
    s.transport->set("10.0.0.1", FakeTransport::Agent{});

    ApiResponse picked = s.call("POST", "/exec/auto", json(), {{"command", "uptime"}});
    REQUIRE(picked.status == 200);
    REQUIRE(picked.body["worker"] == "w1");
    REQUIRE(picked.body["auto_selected"] == true);
    REQUIRE(s.call("POST", "/exec/auto").status == 400);

    ApiResponse batch = s.call("POST", "/exec/batch", {{"workers", "all"}, {"command", "hostname"}});
    REQUIRE(batch.status == 200);
    REQUIRE(batch.body["total"] == 2);
    REQUIRE(batch.body["success_count"] == 1);
    REQUIRE(s.call("POST", "/exec/batch", {{"workers", json::array()}, {"command", "x"}}).status == 400);
}

TEST_CASE("request log endpoints", "[api]") {
    Service s;
    for (int i = 0; i < 3; ++i) {
        RequestEntry e;
        e.endpoint = "/exec";
        e.route = "/exec";
        e.method = "POST";
        e.worker = "w1";
        e.success = i != 0;
        e.timestamp = std::chrono::system_clock::now();
        s.ctx->requests.add(e);
    }

    ApiResponse logs = s.call("GET", "/middleware/logs", json(), {{"limit", "2"}});
    REQUIRE(logs.body["count"] == 2);

    json stats = admin_stats(*s.ctx);
    REQUIRE(stats["total"] == 3);
    REQUIRE(stats["success_rate"].get<double>() == Approx(66.67));
    REQUIRE(stats["active_workers"] == 1);
    REQUIRE(stats["top_endpoints"][0] == "/exec");
    REQUIRE(s.call("GET", "/middleware/stats").body["failed"] == 1);

    REQUIRE(s.call("DELETE", "/middleware/logs").status == 200);
    REQUIRE(s.call("GET", "/middleware/logs").body["count"] == 0);
}

TEST_CASE("requests are counted by route template", "[api]") {
    REQUIRE(route_template("/exec/jobs/3f2a") == "/exec/jobs/{id}");
    REQUIRE(route_template("/api/exec/jobs/3f2a/control") == "/exec/jobs/{id}/control");
    REQUIRE(route_template("/exec/jobs/stats") == "/exec/jobs/stats");
    REQUIRE(route_template("/api/exec/workers/best/") == "/exec/workers/best");
    REQUIRE(route_template("/exec/jobs/3f2a/pause") == "other");
    REQUIRE(route_template("/wp-login.php") == "other");

    Service s;
    REQUIRE(s.call("GET", "/exec/jobs/abc").route == "/exec/jobs/{id}");
    REQUIRE(s.call("GET", "/random/path").route == "other");

    for (int i = 0; i < 50; ++i) {
        std::string path = "/exec/jobs/job" + std::to_string(i);
        RequestEntry e;
        e.endpoint = path;
        e.route = s.call("GET", path).route;
        e.method = "GET";
        e.success = false;
        s.ctx->requests.add(e);
        RequestEntry miss;
        miss.endpoint = "/scan/" + std::to_string(i);
        miss.method = "GET";
        s.ctx->requests.add(miss);
    }
    RequestCounters c = s.ctx->requests.counters();
    REQUIRE(c.by_endpoint.size() == 2);
    REQUIRE(c.by_endpoint["/exec/jobs/{id}"] == 50);
    REQUIRE(c.by_endpoint["other"] == 50);
}
