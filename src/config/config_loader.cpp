#include <embedded_mcp/config/config_loader.hpp>

#include <embedded_mcp/core/types.hpp>
#include <embedded_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

namespace embedded_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error::Make("ConfigLoader", message, ErrorCategory::Config);
}

template <typename T>
void ReadIfPresent(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    config.config_file = std::string(file_path);

    try {
        const YAML::Node root = YAML::LoadFile(std::string(file_path));

        if (root["server"]) {
            const auto& server = root["server"];
            ReadIfPresent(server, "port", config.server.port);
            ReadIfPresent(server, "startup_timeout_ms", config.server.startup_timeout_ms);
            ReadIfPresent(server, "stop_grace_ms", config.server.stop_grace_ms);
            ReadIfPresent(server, "tool_timeout_ms", config.server.tool_timeout_ms);
            ReadIfPresent(server, "worker_threads", config.server.worker_threads);
            ReadIfPresent(server, "latency_scale", config.server.latency_scale);
        }

        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        ReadIfPresent(root, "json_logs", config.json_logs);
        ReadIfPresent(root, "verbose", config.verbose);
        ReadIfPresent(root, "quiet", config.quiet);
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program(kServerName, kVersion);
    program.add_description("Loopback MCP server exposing UI automation tools.");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--port")
        .help("Port to listen on (1024-65535)")
        .scan<'i', int>();
    program.add_argument("--startup-timeout")
        .help("Startup timeout in milliseconds")
        .scan<'i', int>();
    program.add_argument("--grace")
        .help("Grace period for in-flight calls on stop, in milliseconds")
        .scan<'i', int>();
    program.add_argument("--tool-timeout")
        .help("Per-call tool timeout in milliseconds (0 = none)")
        .scan<'i', int>();
    program.add_argument("--threads")
        .help("HTTP worker threads")
        .scan<'i', int>();
    program.add_argument("--latency-scale")
        .help("Multiplier for simulated automation latency")
        .scan<'g', double>();
    program.add_argument("--json-logs")
        .help("Write logs as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("--list-tools")
        .help("Print the available tools and exit")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (auto val = program.present<int>("--port")) {
        config.server.port = *val;
    }
    if (auto val = program.present<int>("--startup-timeout")) {
        config.server.startup_timeout_ms = *val;
    }
    if (auto val = program.present<int>("--grace")) {
        config.server.stop_grace_ms = *val;
    }
    if (auto val = program.present<int>("--tool-timeout")) {
        config.server.tool_timeout_ms = *val;
    }
    if (auto val = program.present<int>("--threads")) {
        config.server.worker_threads = *val;
    }
    if (auto val = program.present<double>("--latency-scale")) {
        config.server.latency_scale = *val;
    }
    if (program.get<bool>("--json-logs")) {
        config.json_logs = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--list-tools")) {
        config.list_tools = true;
    }
    if (program.get<bool>("--verbose")) {
        config.verbose = true;
    }
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    const AppConfig defaults;
    AppConfig merged = yaml_base;

    const auto& cli = cli_overrides.server;
    if (cli.port != defaults.server.port) {
        merged.server.port = cli.port;
    }
    if (cli.startup_timeout_ms != defaults.server.startup_timeout_ms) {
        merged.server.startup_timeout_ms = cli.startup_timeout_ms;
    }
    if (cli.stop_grace_ms != defaults.server.stop_grace_ms) {
        merged.server.stop_grace_ms = cli.stop_grace_ms;
    }
    if (cli.tool_timeout_ms != defaults.server.tool_timeout_ms) {
        merged.server.tool_timeout_ms = cli.tool_timeout_ms;
    }
    if (cli.worker_threads != defaults.server.worker_threads) {
        merged.server.worker_threads = cli.worker_threads;
    }
    if (cli.latency_scale != defaults.server.latency_scale) {
        merged.server.latency_scale = cli.latency_scale;
    }

    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.json_logs) {
        merged.json_logs = true;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (cli_overrides.list_tools) {
        merged.list_tools = true;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    auto port = Port::Create(config.server.port);
    if (port.IsErr()) {
        return Result<void, Error>::Err(MakeConfigError(port.Error()));
    }
    if (config.server.startup_timeout_ms <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Startup timeout must be positive, got " +
                            std::to_string(config.server.startup_timeout_ms)));
    }
    if (config.server.stop_grace_ms < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Stop grace period must not be negative"));
    }
    if (config.server.tool_timeout_ms < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Tool timeout must not be negative"));
    }
    if (config.server.worker_threads < 1 || config.server.worker_threads > 256) {
        return Result<void, Error>::Err(
            MakeConfigError("Worker threads must be between 1 and 256, got " +
                            std::to_string(config.server.worker_threads)));
    }
    if (config.server.latency_scale < 0.0) {
        return Result<void, Error>::Err(
            MakeConfigError("Latency scale must not be negative"));
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

} // namespace embedded_mcp
