#include "catch2/catch.hpp"
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include "dispatcher.hpp"
#include "fake_transport.hpp"

using namespace std::chrono_literals;

namespace {

WorkerInfo worker(const std::string& name, const std::string& ip) {
    WorkerInfo w;
    w.name = name;
    w.ip = ip;
    return w;
}

struct Grid {
    Grid() : selector(registry, transport), dispatcher(registry, selector, transport) {
        registry.replace({worker("w1", "10.0.0.1"), worker("w2", "10.0.0.2")});
    }

    WorkerRegistry registry;
    FakeTransport transport;
    WorkerSelector selector;
    ExecDispatcher dispatcher;
};

} // namespace

TEST_CASE("successful dispatch", "[dispatcher]") {
    Grid g;
    FakeTransport::Agent a;
    a.output = "hello\n";
    g.transport.set("10.0.0.1", a);

    DispatchResult r = g.dispatcher.dispatch("w1", "echo hello", 5s);
    REQUIRE(r.success());
    REQUIRE_FALSE(r.error_kind());
    REQUIRE(r.worker == "w1");
    REQUIRE(r.ip == "10.0.0.1");
    REQUIRE(g.transport.last_command() == "echo hello");

    auto j = to_json(r);
    REQUIRE(j["success"] == true);
    REQUIRE(j["output"] == "hello\n");
    REQUIRE(j["exit_code"] == 0);
    REQUIRE(j["worker"] == "w1");
    REQUIRE_FALSE(j.contains("auto_selected"));

    JobOutcome out = to_job_outcome(r);
    REQUIRE(out.success);
    REQUIRE(out.output_size == 6);
}

TEST_CASE("dispatch failures map to kinds", "[dispatcher]") {
    Grid g;

    SECTION("unknown worker") {
        DispatchResult r = g.dispatcher.dispatch("nope", "ls", 5s);
        REQUIRE(r.error_kind() == ErrorKind::WorkerNotFound);
        REQUIRE(r.error_message() == "Worker 'nope' not found");
        REQUIRE(g.transport.exec_calls("10.0.0.1") == 0);
    }
    SECTION("non-zero exit") {
        FakeTransport::Agent a;
        a.exit_code = 3;
        a.output = "partial";
        g.transport.set("10.0.0.1", a);
        DispatchResult r = g.dispatcher.dispatch("w1", "false", 5s);
        REQUIRE(r.error_kind() == ErrorKind::RemoteNonZeroExit);
        auto j = to_json(r);
        REQUIRE(j["exit_code"] == 3);
        REQUIRE(j["output"] == "partial");
        REQUIRE(to_job_outcome(r).error == "RemoteNonZeroExit: Command exited with status 3");
    }
    SECTION("unreachable agent") {
        DispatchResult r = g.dispatcher.dispatch("w2", "ls", 5s);
        REQUIRE(r.error_kind() == ErrorKind::DispatchConnectionError);
        REQUIRE(r.error_message().rfind("Cannot connect: ", 0) == 0);
        REQUIRE(to_json(r)["kind"] == "DispatchConnectionError");
    }
    SECTION("transfer timeout") {
        FakeTransport::Agent a;
        a.exec_code = TransportCode::TimedOut;
        g.transport.set("10.0.0.1", a);
        DispatchResult r = g.dispatcher.dispatch("w1", "sleep 100", 5s);
        REQUIRE(r.error_kind() == ErrorKind::DispatchTimeout);
        REQUIRE(r.error_message() == "Timeout after 5s");
    }
    SECTION("agent-side timeout") {
        FakeTransport::Agent a;
        a.exec_code = TransportCode::HttpError;
        a.http_status = 408;
        g.transport.set("10.0.0.1", a);
        REQUIRE(g.dispatcher.dispatch("w1", "sleep 100", 5s).error_kind() == ErrorKind::DispatchTimeout);
    }
    SECTION("agent error") {
        FakeTransport::Agent a;
        a.exec_code = TransportCode::HttpError;
        a.http_status = 500;
        g.transport.set("10.0.0.1", a);
        REQUIRE(g.dispatcher.dispatch("w1", "ls", 5s).error_kind() == ErrorKind::RemoteError);
    }
}

TEST_CASE("cancellation stops a dispatch", "[dispatcher]") {
    Grid g;
    FakeTransport::Agent slow;
    slow.delay = 10s;
    g.transport.set("10.0.0.1", slow);

    SECTION("token set before the call") {
        CancellationToken token;
        token.cancel();
        DispatchResult r = g.dispatcher.dispatch("w1", "ls", 5s, &token);
        REQUIRE(r.error_kind() == ErrorKind::Cancelled);
        REQUIRE(g.transport.exec_calls("10.0.0.1") == 0);
    }
    SECTION("token set while the call is in flight") {
        CancellationToken token;
        auto pending = std::async(std::launch::async, [&] { return g.dispatcher.dispatch("w1", "ls", 30s, &token); });
        std::this_thread::sleep_for(50ms);
        token.cancel();
        REQUIRE(pending.wait_for(5s) == std::future_status::ready);
        DispatchResult r = pending.get();
        REQUIRE(r.error_kind() == ErrorKind::Cancelled);
        REQUIRE(r.duration < 5s);
    }
}

TEST_CASE("auto-selected dispatch", "[dispatcher]") {
    Grid g;

    SECTION("no eligible worker") {
        DispatchResult r = g.dispatcher.dispatch_best("ls", 5s);
        REQUIRE(r.error_kind() == ErrorKind::NoEligibleWorker);
        REQUIRE(r.error_message() == "No workers available");
        REQUIRE(r.auto_selected);
    }
    SECTION("least loaded worker runs the command") {
        FakeTransport::Agent busy;
        busy.cpu = 90;
        busy.mem = 80;
        FakeTransport::Agent idle;
        idle.cpu = 5;
        idle.mem = 20;
        g.transport.set("10.0.0.1", busy);
        g.transport.set("10.0.0.2", idle);

        DispatchResult r = g.dispatcher.dispatch_best("uptime", 5s);
        REQUIRE(r.success());
        REQUIRE(r.worker == "w2");
        REQUIRE(r.auto_selected);
        REQUIRE(r.selected_status);
        REQUIRE(g.transport.exec_calls("10.0.0.1") == 0);
        REQUIRE(to_json(r)["auto_selected"] == true);

        JobOutcome out = to_job_outcome(r);
        REQUIRE(out.worker == "w2");
        REQUIRE(out.worker_cpu == Approx(5.0));
        REQUIRE(out.worker_memory == Approx(20.0));
    }
}

TEST_CASE("batch dispatch", "[dispatcher]") {
    Grid g;
    g.transport.set("10.0.0.1", FakeTransport::Agent{});

    SECTION("one success, one unreachable") {
        BatchResult b = g.dispatcher.batch_dispatch({"w1", "w2"}, "hostname", 5s);
        REQUIRE(b.total == 2);
        REQUIRE(b.success_count == 1);
        REQUIRE(b.results.at("w1").success());
        REQUIRE(b.results.at("w2").error_kind() == ErrorKind::DispatchConnectionError);

        auto j = to_json(b);
        REQUIRE(j["success_count"] == 1);
        REQUIRE(j["total"] == 2);
        REQUIRE(j["results"]["w2"]["success"] == false);
    }
    SECTION("all expands, duplicates run once") {
        BatchResult all = g.dispatcher.batch_dispatch({"all"}, "hostname", 5s);
        REQUIRE(all.order == std::vector<std::string>{"w1", "w2"});

        BatchResult dup = g.dispatcher.batch_dispatch({"w1", "w1", "ghost"}, "hostname", 5s);
        REQUIRE(dup.total == 2);
        REQUIRE(dup.success_count == 1);
        REQUIRE(dup.results.at("ghost").error_kind() == ErrorKind::WorkerNotFound);
        REQUIRE(g.transport.exec_calls("10.0.0.1") == 2);
    }
}
