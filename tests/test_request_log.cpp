#include "catch2/catch.hpp"
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>
#include "config.hpp"
#include "host_metrics.hpp"
#include "request_log.hpp"
#include "util.hpp"

namespace {

RequestEntry entry(const std::string& endpoint, const std::string& worker, bool success) {
    RequestEntry e;
    e.endpoint = endpoint;
    e.method = "POST";
    e.worker = worker;
    e.duration_ms = 12;
    e.success = success;
    e.timestamp = std::chrono::system_clock::now();
    return e;
}

} // namespace

TEST_CASE("request log is bounded but counters are not", "[request_log]") {
    RequestLog log(3);
    for (int i = 0; i < 5; ++i) log.add(entry("/exec/" + std::to_string(i), i % 2 ? "w1" : "", i != 4));

    auto recent = log.recent(10);
    REQUIRE(recent.size() == 3);
    REQUIRE(recent.front().endpoint == "/exec/2");
    REQUIRE(recent.back().endpoint == "/exec/4");
    REQUIRE(log.recent(1).front().endpoint == "/exec/4");

    RequestCounters c = log.counters();
    REQUIRE(c.total == 5);
    REQUIRE(c.success == 4);
    REQUIRE(c.failed == 1);
    REQUIRE(c.by_worker["w1"] == 2);
    REQUIRE(c.by_worker.count("") == 0);
    REQUIRE(c.by_method["POST"] == 5);

    log.clear();
    REQUIRE(log.recent(10).empty());
    REQUIRE(log.counters().total == 0);
}

TEST_CASE("request entry json", "[request_log]") {
    auto j = to_json(entry("/exec", "", true));
    REQUIRE(j["worker"].is_null());
    REQUIRE(j["duration_ms"] == 12);
    REQUIRE(j["timestamp"].get<std::string>().back() == 'Z');
}

TEST_CASE("proc stat and meminfo parsing", "[host_metrics]") {
    auto t = parse_proc_stat("cpu  100 0 50 800 50 0 0 0 0 0\ncpu0 1 2 3 4\n");
    REQUIRE(t);
    REQUIRE(t->total == 1000);
    REQUIRE(t->idle == 850);
    REQUIRE_FALSE(parse_proc_stat("intr 1 2 3\n"));

    auto mem = parse_meminfo("MemTotal:       16000000 kB\nMemFree:  1000 kB\nMemAvailable:    4000000 kB\n");
    REQUIRE(mem);
    REQUIRE(*mem == Approx(75.0));
    REQUIRE_FALSE(parse_meminfo("MemTotal: 100 kB\n"));
}

TEST_CASE("command line overrides", "[config]") {
    ExecConfig cfg;
    apply_args(cfg, {"--port", "9100", "--hub-config", "/tmp/hub.json", "--max-jobs", "8", "--python", "python3.12"});
    REQUIRE(cfg.port == 9100);
    REQUIRE(cfg.hub_config == "/tmp/hub.json");
    REQUIRE(cfg.max_jobs == 8);
    REQUIRE(cfg.python == "python3.12");
    REQUIRE(cfg.default_timeout_s == 30);

    const std::vector<std::vector<std::string>> bad = {
        {"--bogus", "1"}, {"--port"}, {"--port", "0"}, {"--port", "80x"}, {"--max-jobs", "-2"},
    };
    for (const auto& args : bad) {
        INFO(args.front());
        REQUIRE_THROWS_AS(apply_args(cfg, args), std::invalid_argument);
    }
    REQUIRE(usage().find("--hub-config") != std::string::npos);
}

TEST_CASE("shell quoting survives embedded quotes", "[util]") {
    REQUIRE(shell_quote("print('hi')") == "'print('\\''hi'\\'')'");
    REQUIRE(shell_quote("") == "''");
    REQUIRE(gen_id() != gen_id());
}
