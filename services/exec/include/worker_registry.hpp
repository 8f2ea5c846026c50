#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "worker_client.hpp"

struct WorkerInfo {
    std::string name;
    std::string ip;
    int port{7576};
    double cpus{0};
    std::string memory; // as advertised, e.g. "16G"
    int gpus{0};
    std::size_t index{0}; // registration order

    WorkerEndpoint endpoint() const { return WorkerEndpoint{ip, port}; }
};

using WorkerList = std::vector<WorkerInfo>;

nlohmann::json to_json(const WorkerInfo& worker);

// Parses {"peers": {"<name>": {"ip", "cpus", "memory", "gpus"}}} keeping file order.
// Throws std::runtime_error on malformed documents.
WorkerList parse_worker_directory(const std::string& text, int default_port);

// Read side is lock-free: callers take a snapshot and keep it for one decision.
class WorkerRegistry {
public:
    explicit WorkerRegistry(int default_port = 7576);

    // Remembers the path for refresh(). False (and an empty directory) when unreadable.
    bool load_file(const std::string& path);
    // Reloads when the file's modification time moved. True when a reload happened.
    bool refresh();
    void replace(WorkerList workers);

    std::shared_ptr<const WorkerList> snapshot() const;
    std::optional<WorkerInfo> find(const std::string& name) const;
    std::vector<std::string> names() const;
    std::size_t size() const { return snapshot()->size(); }

private:
    bool reload_locked();

    int default_port_;
    std::shared_ptr<const WorkerList> workers_;

    std::mutex file_mtx_;
    std::string path_;
    std::optional<std::filesystem::file_time_type> mtime_;
};
