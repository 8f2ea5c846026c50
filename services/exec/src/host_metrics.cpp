#include "host_metrics.hpp"
#include <chrono>
#include <cmath>
#include <fstream>
#include <sstream>
#include <thread>

static std::optional<std::string> read_file(const char* path) {
    std::ifstream in(path);
    if (!in) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::optional<CpuTimes> parse_proc_stat(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("cpu ", 0) != 0) continue;
        std::istringstream fields(line.substr(4));
        CpuTimes t;
        std::uint64_t v = 0;
        int n = 0;
        while (fields >> v) {
            t.total += v;
            // idle + iowait
            if (n == 3 || n == 4) t.idle += v;
            ++n;
        }
        if (n < 4) return std::nullopt;
        return t;
    }
    return std::nullopt;
}

std::optional<double> parse_meminfo(const std::string& text) {
    std::istringstream in(text);
    std::string key;
    std::uint64_t total = 0, available = 0;
    bool have_total = false, have_available = false;
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::uint64_t kb = 0;
        if (!(fields >> key >> kb)) continue;
        if (key == "MemTotal:") { total = kb; have_total = true; }
        if (key == "MemAvailable:") { available = kb; have_available = true; }
    }
    if (!have_total || !have_available || total == 0 || available > total) return std::nullopt;
    return 100.0 * static_cast<double>(total - available) / static_cast<double>(total);
}

static double round1(double v) {
    return std::round(v * 10.0) / 10.0;
}

HostUsage read_host_usage() {
    HostUsage usage;
    auto first = read_file("/proc/stat");
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auto second = read_file("/proc/stat");
    if (first && second) {
        auto a = parse_proc_stat(*first);
        auto b = parse_proc_stat(*second);
        if (a && b && b->total > a->total && b->idle >= a->idle) {
            double busy = static_cast<double>((b->total - a->total) - (b->idle - a->idle));
            usage.cpu_percent = round1(100.0 * busy / static_cast<double>(b->total - a->total));
        }
    }
    if (auto mem = read_file("/proc/meminfo")) {
        if (auto pct = parse_meminfo(*mem)) usage.memory_percent = round1(*pct);
    }
    return usage;
}
