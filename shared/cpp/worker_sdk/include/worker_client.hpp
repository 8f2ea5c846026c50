#pragma once
#include <atomic>
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

// Cooperative cancellation flag shared between a job and the transfer running for it.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

struct WorkerEndpoint {
    std::string host;
    int port{7576};

    std::string base_url() const;
};

enum class TransportCode {
    Ok,
    ConnectFailed,
    TimedOut,
    Aborted,   // cancelled through the CancellationToken
    HttpError, // agent answered with a non-2xx status
    BadReply   // 2xx but body is not the expected JSON
};

struct AgentReply {
    TransportCode code{TransportCode::ConnectFailed};
    long http_status{0};
    std::string detail;  // curl error text or the agent's "error" field
    nlohmann::json body; // parsed reply, null when none

    bool ok() const { return code == TransportCode::Ok; }
};

// Calls into the per-worker command agent: GET /ping, GET /status, POST /exec {cmd}.
class WorkerTransport {
public:
    virtual ~WorkerTransport() = default;

    virtual AgentReply ping(const WorkerEndpoint& ep, std::chrono::milliseconds timeout) = 0;
    virtual AgentReply status(const WorkerEndpoint& ep, std::chrono::milliseconds timeout) = 0;
    virtual AgentReply exec(const WorkerEndpoint& ep, const std::string& cmd,
                            std::chrono::milliseconds timeout,
                            const CancellationToken* cancel = nullptr) = 0;
};

class CurlWorkerTransport : public WorkerTransport {
public:
    AgentReply ping(const WorkerEndpoint& ep, std::chrono::milliseconds timeout) override;
    AgentReply status(const WorkerEndpoint& ep, std::chrono::milliseconds timeout) override;
    AgentReply exec(const WorkerEndpoint& ep, const std::string& cmd,
                    std::chrono::milliseconds timeout,
                    const CancellationToken* cancel = nullptr) override;

private:
    AgentReply perform(const std::string& url, const std::string* post_body,
                       std::chrono::milliseconds timeout, const CancellationToken* cancel);
};
