#pragma once
#include "exec_context.hpp"
#include <map>
#include <string>
#include <nlohmann/json.hpp>

struct ApiRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    std::string body;
};

struct ApiResponse {
    int status{200};
    nlohmann::json body;
    std::string worker; // worker the request reached, for the request log
    std::string route;  // matched route template, "other" when nothing matched
};

// Routes one request. Every route is also served under /api.
// Errors come back as {"error": message, "kind": ErrorKind name} with the mapped status.
ApiResponse handle_request(ExecContext& ctx, const ApiRequest& req);

// Maps a request path onto its route template, e.g. /api/exec/jobs/ab12 -> /exec/jobs/{id}.
// Unknown paths map to "other" so the per-endpoint counters stay bounded.
std::string route_template(const std::string& path);

// Request-log counters plus derived rates and the job summary.
nlohmann::json admin_stats(ExecContext& ctx);
