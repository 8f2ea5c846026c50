#pragma once
#include <string>
#include <vector>

struct ExecConfig {
    int port{8000};
    std::string hub_config{"/etc/gridx/hub_config.json"};
    int agent_port{7576};
    int max_jobs{5};
    int monitor_ms{1000};
    int default_timeout_s{30};
    int ping_timeout_ms{2000};
    int status_timeout_ms{3000};
    int request_log_size{200};
    int retention_hours{24};
    std::string python{"python3"};
};

// Defaults overridden by EXEC_* / GRIDX_* environment variables.
ExecConfig load_config_from_env();

// --port, --hub-config, --agent-port, --max-jobs, --monitor-ms, --default-timeout,
// --ping-timeout-ms, --status-timeout-ms, --log-size, --retention-hours, --python.
// Throws std::invalid_argument on unknown flags, missing or non-positive values.
void apply_args(ExecConfig& cfg, const std::vector<std::string>& args);

std::string usage();
