#include "catch2/catch.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include "util.hpp"
#include "worker_registry.hpp"

namespace fs = std::filesystem;

namespace {

// Scratch directory removed when the test ends.
struct TmpDir {
    TmpDir() : path(fs::temp_directory_path() / ("gridx-test-" + gen_id())) { fs::create_directories(path); }
    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    fs::path path;
};

void write_file(const fs::path& p, const std::string& text) {
    std::ofstream out(p, std::ios::trunc);
    out << text;
}

// Moves the file's mtime forward so refresh() sees a change whatever the clock resolution.
void touch_later(const fs::path& p, int seconds) {
    fs::last_write_time(p, fs::last_write_time(p) + std::chrono::seconds(seconds));
}

const char* kHub = R"({
  "peers": {
    "zeta":  {"ip": "10.0.0.9", "cpus": 8, "memory": "16G", "gpus": 1},
    "alpha": {"ip": "10.0.0.2", "cpus": "4", "memory": "8G", "gpus": "0", "port": 9000}
  }
})";

} // namespace

TEST_CASE("worker directory keeps file order", "[worker_registry]") {
    WorkerList workers = parse_worker_directory(kHub, 7576);
    REQUIRE(workers.size() == 2);
    REQUIRE(workers[0].name == "zeta");
    REQUIRE(workers[0].port == 7576);
    REQUIRE(workers[0].gpus == 1);
    REQUIRE(workers[0].memory == "16G");
    REQUIRE(workers[1].name == "alpha");
    REQUIRE(workers[1].index == 1);
    REQUIRE(workers[1].cpus == Approx(4.0));
    REQUIRE(workers[1].port == 9000);
    REQUIRE(workers[1].endpoint().base_url() == "http://10.0.0.2:9000");
}

TEST_CASE("malformed worker directories are rejected", "[worker_registry]") {
    REQUIRE_THROWS(parse_worker_directory("{not json", 7576));
    REQUIRE_THROWS(parse_worker_directory("[]", 7576));
    REQUIRE_THROWS(parse_worker_directory(R"({"peers": {"w": {"cpus": 2}}})", 7576));
    REQUIRE_THROWS(parse_worker_directory(R"({"peers": []})", 7576));
    REQUIRE(parse_worker_directory("{}", 7576).empty());
}

TEST_CASE("registry loads and refreshes from disk", "[worker_registry]") {
    TmpDir tmp;
    fs::path hub = tmp.path / "hub_config.json";
    WorkerRegistry registry(7576);

    SECTION("missing file gives an empty directory") {
        REQUIRE_FALSE(registry.load_file((tmp.path / "absent.json").string()));
        REQUIRE(registry.size() == 0);
        REQUIRE_FALSE(registry.refresh());
    }

    SECTION("reload on change, keep previous on breakage") {
        write_file(hub, kHub);
        REQUIRE(registry.load_file(hub.string()));
        REQUIRE(registry.names() == std::vector<std::string>{"zeta", "alpha"});
        REQUIRE(registry.find("alpha")->ip == "10.0.0.2");
        REQUIRE_FALSE(registry.find("beta"));
        REQUIRE_FALSE(registry.refresh());

        auto before = registry.snapshot();
        write_file(hub, R"({"peers": {"beta": {"ip": "10.0.0.3"}}})");
        touch_later(hub, 5);
        REQUIRE(registry.refresh());
        REQUIRE(registry.names() == std::vector<std::string>{"beta"});
        // Snapshots taken earlier stay valid.
        REQUIRE(before->size() == 2);

        write_file(hub, "{broken");
        touch_later(hub, 10);
        REQUIRE_FALSE(registry.refresh());
        REQUIRE(registry.names() == std::vector<std::string>{"beta"});
    }
}

TEST_CASE("replace reindexes", "[worker_registry]") {
    WorkerRegistry registry;
    WorkerInfo a;
    a.name = "a";
    a.ip = "1.1.1.1";
    a.index = 7;
    WorkerInfo b = a;
    b.name = "b";
    registry.replace({a, b});
    REQUIRE(registry.find("a")->index == 0);
    REQUIRE(registry.find("b")->index == 1);

    auto j = to_json(*registry.find("b"));
    REQUIRE(j["name"] == "b");
    REQUIRE(j["port"] == 7576);
}
