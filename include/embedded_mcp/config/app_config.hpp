#pragma once

#include <optional>
#include <string>

namespace embedded_mcp {

struct ServerConfig {
    int port = 12345;
    int startup_timeout_ms = 5000;
    int stop_grace_ms = 1000;
    int tool_timeout_ms = 30000;   // 0 = no per-call limit
    int worker_threads = 8;
    double latency_scale = 1.0;    // mock backend delay multiplier
};

struct AppConfig {
    ServerConfig server;
    std::optional<std::string> config_file;
    std::optional<std::string> log_file;
    bool json_logs = false;
    bool verbose = false;
    bool quiet = false;
    bool list_tools = false;
};

} // namespace embedded_mcp
