#pragma once
#include <cstdint>
#include <optional>
#include <string>

struct HostUsage {
    double cpu_percent{0.0};
    double memory_percent{0.0};
};

struct CpuTimes {
    std::uint64_t idle{0};
    std::uint64_t total{0};
};

// Aggregate "cpu" line of /proc/stat.
std::optional<CpuTimes> parse_proc_stat(const std::string& text);
// 100 * (MemTotal - MemAvailable) / MemTotal from /proc/meminfo.
std::optional<double> parse_meminfo(const std::string& text);

// Samples /proc/stat twice, 100 ms apart. Any failure reads as 0.
HostUsage read_host_usage();
