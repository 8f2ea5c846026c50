#include "config.hpp"
#include "util.hpp"
#include <stdexcept>

ExecConfig load_config_from_env() {
    ExecConfig cfg;
    cfg.port = getenv_int_or("EXEC_PORT", cfg.port);
    cfg.hub_config = getenv_or("GRIDX_HUB_CONFIG", cfg.hub_config);
    cfg.agent_port = getenv_int_or("GRIDX_AGENT_PORT", cfg.agent_port);
    cfg.max_jobs = getenv_int_or("EXEC_MAX_JOBS", cfg.max_jobs);
    cfg.monitor_ms = getenv_int_or("EXEC_MONITOR_MS", cfg.monitor_ms);
    cfg.default_timeout_s = getenv_int_or("EXEC_DEFAULT_TIMEOUT", cfg.default_timeout_s);
    cfg.ping_timeout_ms = getenv_int_or("EXEC_PING_TIMEOUT_MS", cfg.ping_timeout_ms);
    cfg.status_timeout_ms = getenv_int_or("EXEC_STATUS_TIMEOUT_MS", cfg.status_timeout_ms);
    cfg.request_log_size = getenv_int_or("EXEC_REQUEST_LOG_SIZE", cfg.request_log_size);
    cfg.retention_hours = getenv_int_or("EXEC_RETENTION_HOURS", cfg.retention_hours);
    cfg.python = getenv_or("EXEC_PYTHON", cfg.python);
    return cfg;
}

static int positive_int(const std::string& flag, const std::string& value) {
    int v = 0;
    try {
        std::size_t used = 0;
        v = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
    if (v <= 0) throw std::invalid_argument(flag + " must be positive");
    return v;
}

void apply_args(ExecConfig& cfg, const std::vector<std::string>& args) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (i + 1 >= args.size()) throw std::invalid_argument("missing value for " + a);
        const std::string& v = args[++i];
        if (a == "--port") cfg.port = positive_int(a, v);
        else if (a == "--hub-config") cfg.hub_config = v;
        else if (a == "--agent-port") cfg.agent_port = positive_int(a, v);
        else if (a == "--max-jobs") cfg.max_jobs = positive_int(a, v);
        else if (a == "--monitor-ms") cfg.monitor_ms = positive_int(a, v);
        else if (a == "--default-timeout") cfg.default_timeout_s = positive_int(a, v);
        else if (a == "--ping-timeout-ms") cfg.ping_timeout_ms = positive_int(a, v);
        else if (a == "--status-timeout-ms") cfg.status_timeout_ms = positive_int(a, v);
        else if (a == "--log-size") cfg.request_log_size = positive_int(a, v);
        else if (a == "--retention-hours") cfg.retention_hours = positive_int(a, v);
        else if (a == "--python") cfg.python = v;
        else throw std::invalid_argument("unknown option " + a);
    }
}

std::string usage() {
    return "usage: gridx-exec [--port N] [--hub-config PATH] [--agent-port N] [--max-jobs N]\n"
           "                  [--monitor-ms N] [--default-timeout SEC] [--ping-timeout-ms N]\n"
           "                  [--status-timeout-ms N] [--log-size N] [--retention-hours N]\n"
           "                  [--python CMD]\n";
}
