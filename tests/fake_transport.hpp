#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include "worker_client.hpp"

// In-memory stand-in for the worker agents, keyed by host.
class FakeTransport : public WorkerTransport {
public:
    struct Agent {
        bool ping_ok{true};
        bool status_ok{true};
        double cpu{0};
        double mem{0};
        int exit_code{0};
        std::string output{"ok\n"};
        TransportCode exec_code{TransportCode::Ok};
        long http_status{200};
        std::chrono::milliseconds delay{0};
    };

    void set(const std::string& host, Agent agent) {
        std::lock_guard<std::mutex> lock(mtx_);
        agents_[host] = agent;
    }

    int exec_calls(const std::string& host) {
        std::lock_guard<std::mutex> lock(mtx_);
        return exec_calls_[host];
    }

    std::string last_command() {
        std::lock_guard<std::mutex> lock(mtx_);
        return last_command_;
    }

    AgentReply ping(const WorkerEndpoint& ep, std::chrono::milliseconds) override {
        Agent a;
        if (!lookup(ep.host, a) || !a.ping_ok) return unreachable();
        AgentReply r;
        r.code = TransportCode::Ok;
        r.http_status = 200;
        r.body = {{"status", "alive"}};
        return r;
    }

    AgentReply status(const WorkerEndpoint& ep, std::chrono::milliseconds) override {
        Agent a;
        if (!lookup(ep.host, a)) return unreachable();
        AgentReply r;
        if (!a.status_ok) {
            r.code = TransportCode::HttpError;
            r.http_status = 500;
            r.detail = "status unavailable";
            return r;
        }
        r.code = TransportCode::Ok;
        r.http_status = 200;
        r.body = {{"cpu_percent", a.cpu}, {"memory_percent", a.mem}};
        return r;
    }

    AgentReply exec(const WorkerEndpoint& ep, const std::string& cmd, std::chrono::milliseconds,
                    const CancellationToken* cancel) override {
        Agent a;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            ++exec_calls_[ep.host];
            last_command_ = cmd;
        }
        if (!lookup(ep.host, a)) return unreachable();

        auto deadline = std::chrono::steady_clock::now() + a.delay;
        while (std::chrono::steady_clock::now() < deadline) {
            if (cancel && cancel->cancelled()) {
                AgentReply r;
                r.code = TransportCode::Aborted;
                r.detail = "Callback aborted";
                return r;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        AgentReply r;
        r.code = a.exec_code;
        r.http_status = a.http_status;
        if (a.exec_code == TransportCode::Ok) {
            r.body = {{"output", a.output}, {"error", ""}, {"exit_code", a.exit_code}};
        } else {
            r.detail = "agent failure";
        }
        return r;
    }

private:
    static AgentReply unreachable() {
        AgentReply r;
        r.code = TransportCode::ConnectFailed;
        r.detail = "Couldn't connect to server";
        return r;
    }

    bool lookup(const std::string& host, Agent& out) {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = agents_.find(host);
        if (it == agents_.end()) return false;
        out = it->second;
        return true;
    }

    std::mutex mtx_;
    std::map<std::string, Agent> agents_;
    std::map<std::string, int> exec_calls_;
    std::string last_command_;
};
