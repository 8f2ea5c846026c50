#include "worker_registry.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

using ojson = nlohmann::ordered_json;

nlohmann::json to_json(const WorkerInfo& worker) {
    return {
        {"name", worker.name},
        {"ip", worker.ip},
        {"port", worker.port},
        {"cpus", worker.cpus},
        {"memory", worker.memory},
        {"gpus", worker.gpus},
    };
}

// Hub configs written by hand carry numbers as strings now and then.
static double number_field(const ojson& peer, const char* key) {
    if (!peer.contains(key)) return 0;
    const auto& v = peer[key];
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        try {
            return std::stod(v.get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

WorkerList parse_worker_directory(const std::string& text, int default_port) {
    ojson doc = ojson::parse(text);
    if (!doc.is_object()) throw std::runtime_error("worker directory must be a JSON object");
    WorkerList out;
    if (!doc.contains("peers")) return out;
    const auto& peers = doc["peers"];
    if (!peers.is_object()) throw std::runtime_error("\"peers\" must be an object");

    for (auto it = peers.begin(); it != peers.end(); ++it) {
        const auto& peer = it.value();
        if (!peer.is_object()) throw std::runtime_error("peer '" + it.key() + "' must be an object");
        WorkerInfo w;
        w.name = it.key();
        w.ip = peer.value("ip", std::string());
        if (w.ip.empty()) throw std::runtime_error("peer '" + it.key() + "' has no ip");
        w.port = peer.contains("port") && peer["port"].is_number_integer() ? peer["port"].get<int>() : default_port;
        w.cpus = number_field(peer, "cpus");
        if (peer.contains("memory")) {
            const auto& m = peer["memory"];
            w.memory = m.is_string() ? m.get<std::string>() : m.dump();
        }
        w.gpus = static_cast<int>(number_field(peer, "gpus"));
        w.index = out.size();
        out.push_back(std::move(w));
    }
    return out;
}

WorkerRegistry::WorkerRegistry(int default_port)
    : default_port_(default_port), workers_(std::make_shared<const WorkerList>()) {}

bool WorkerRegistry::load_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(file_mtx_);
    path_ = path;
    mtime_.reset();
    return reload_locked();
}

bool WorkerRegistry::refresh() {
    std::lock_guard<std::mutex> lock(file_mtx_);
    if (path_.empty()) return false;
    std::error_code ec;
    auto mtime = std::filesystem::last_write_time(path_, ec);
    if (ec) return false;
    if (mtime_ && *mtime_ == mtime) return false;
    return reload_locked();
}

bool WorkerRegistry::reload_locked() {
    std::error_code ec;
    auto mtime = std::filesystem::last_write_time(path_, ec);
    std::ifstream in(path_);
    if (ec || !in) {
        std::cerr << "[registry] cannot read " << path_ << ", no workers registered" << std::endl;
        replace({});
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    try {
        replace(parse_worker_directory(ss.str(), default_port_));
    } catch (const std::exception& e) {
        // Keep the previous directory when the new file is broken.
        std::cerr << "[registry] " << path_ << ": " << e.what() << std::endl;
        return false;
    }
    mtime_ = mtime;
    std::cout << "[registry] loaded " << size() << " worker(s) from " << path_ << std::endl;
    return true;
}

void WorkerRegistry::replace(WorkerList workers) {
    for (std::size_t i = 0; i < workers.size(); ++i) workers[i].index = i;
    std::atomic_store(&workers_, std::shared_ptr<const WorkerList>(std::make_shared<WorkerList>(std::move(workers))));
}

std::shared_ptr<const WorkerList> WorkerRegistry::snapshot() const {
    return std::atomic_load(&workers_);
}

std::optional<WorkerInfo> WorkerRegistry::find(const std::string& name) const {
    auto workers = snapshot();
    for (const auto& w : *workers) {
        if (w.name == name) return w;
    }
    return std::nullopt;
}

std::vector<std::string> WorkerRegistry::names() const {
    auto workers = snapshot();
    std::vector<std::string> out;
    out.reserve(workers->size());
    for (const auto& w : *workers) out.push_back(w.name);
    return out;
}
