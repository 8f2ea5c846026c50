#include "catch2/catch.hpp"
#include <string>
#include "fake_transport.hpp"
#include "worker_selector.hpp"

namespace {

WorkerInfo worker(const std::string& name, const std::string& ip, int gpus = 0) {
    WorkerInfo w;
    w.name = name;
    w.ip = ip;
    w.gpus = gpus;
    return w;
}

FakeTransport::Agent loaded(double cpu, double mem) {
    FakeTransport::Agent a;
    a.cpu = cpu;
    a.mem = mem;
    return a;
}

} // namespace

TEST_CASE("least loaded worker wins", "[worker_selector]") {
    WorkerRegistry registry;
    registry.replace({worker("b", "10.0.0.2", 1), worker("a", "10.0.0.1", 0)});
    FakeTransport transport;
    transport.set("10.0.0.1", loaded(10, 10));
    transport.set("10.0.0.2", loaded(50, 50));

    WorkerSelector selector(registry, transport);
    auto best = selector.select_best();
    REQUIRE(best);
    REQUIRE(best->info.name == "a");
    REQUIRE(best->load() == Approx(20.0));

    auto ranked = selector.rank();
    REQUIRE(ranked.size() == 2);
    REQUIRE(ranked[1].info.name == "b");
}

TEST_CASE("ties break on gpus, then registration order", "[worker_selector]") {
    WorkerRegistry registry;
    registry.replace({worker("first", "h1", 0), worker("second", "h2", 2), worker("third", "h3", 2)});
    FakeTransport transport;
    transport.set("h1", loaded(20, 20));
    transport.set("h2", loaded(30, 10));
    transport.set("h3", loaded(10, 30));

    WorkerSelector selector(registry, transport);
    auto ranked = selector.rank();
    REQUIRE(ranked.size() == 3);
    REQUIRE(ranked[0].info.name == "second");
    REQUIRE(ranked[1].info.name == "third");
    REQUIRE(ranked[2].info.name == "first");
}

TEST_CASE("workers without load data are not eligible", "[worker_selector]") {
    WorkerRegistry registry;
    registry.replace({worker("offline", "h1"), worker("mute", "h2"), worker("gone", "h3")});
    FakeTransport transport;
    FakeTransport::Agent down;
    down.ping_ok = false;
    transport.set("h1", down);
    FakeTransport::Agent mute;
    mute.status_ok = false;
    transport.set("h2", mute);

    WorkerSelector selector(registry, transport);
    REQUIRE_FALSE(selector.select_best());

    auto all = selector.probe_all();
    REQUIRE(all.size() == 3);
    REQUIRE_FALSE(all[0].status.online);
    REQUIRE(all[1].status.online);
    REQUIRE_FALSE(all[1].status.has_load);
    REQUIRE_FALSE(all[1].status.error.empty());
    REQUIRE_FALSE(all[2].status.online);

    REQUIRE(selector.online_workers() == std::vector<std::string>{"mute"});
}

TEST_CASE("probing by name", "[worker_selector]") {
    WorkerRegistry registry;
    registry.replace({worker("a", "h1")});
    FakeTransport transport;
    transport.set("h1", loaded(5, 6));
    WorkerSelector selector(registry, transport);

    auto s = selector.probe(std::string("a"));
    REQUIRE(s);
    REQUIRE(s->online);
    REQUIRE(s->cpu_percent == Approx(5.0));
    REQUIRE(s->memory_percent == Approx(6.0));
    REQUIRE(to_json(*s)["name"] == "a");
    REQUIRE_FALSE(selector.probe(std::string("missing")));
}

TEST_CASE("memory percent from agent status", "[worker_selector]") {
    REQUIRE(memory_percent_from({{"memory_percent", 42.0}}) == Approx(42.0));
    REQUIRE(memory_percent_from({{"memory_total_gb", 16.0}, {"memory_available_gb", 4.0}}) == Approx(75.0));
    REQUIRE(memory_percent_from({{"memory_total_gb", 0}}) == Approx(0.0));
    REQUIRE(memory_percent_from(nlohmann::json()) == Approx(0.0));
}
