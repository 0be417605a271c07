#include <embedded_mcp/automation/automation_tools.hpp>
#include <embedded_mcp/automation/mock_automation_backend.hpp>
#include <embedded_mcp/config/config_loader.hpp>
#include <embedded_mcp/core/log.hpp>
#include <embedded_mcp/core/terminal.hpp>
#include <embedded_mcp/core/version.hpp>
#include <embedded_mcp/mcp/tool_dispatcher.hpp>
#include <embedded_mcp/server/server_lifecycle.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;

std::atomic<bool> g_shutdown_requested{false};

extern "C" void HandleSignal(int /*signal*/) {
    g_shutdown_requested.store(true);
}

void PrintError(const embedded_mcp::Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
}

// Console sink (plain, colored or JSON) plus an optional file sink.
class TeeSink : public embedded_mcp::ILogSink {
public:
    void Add(std::unique_ptr<embedded_mcp::ILogSink> sink) {
        sinks_.push_back(std::move(sink));
    }
    void Write(embedded_mcp::LogLevel level, std::string_view component,
               std::string_view message) override {
        for (auto& sink : sinks_) {
            sink->Write(level, component, message);
        }
    }
private:
    std::vector<std::unique_ptr<embedded_mcp::ILogSink>> sinks_;
};

embedded_mcp::Result<void, embedded_mcp::Error> InitLogging(
    const embedded_mcp::AppConfig& config) {
    using namespace embedded_mcp;

    auto level = LogLevel::Info;
    if (config.verbose) {
        level = LogLevel::Debug;
    } else if (config.quiet) {
        level = LogLevel::Error;
    }

    auto tee = std::make_unique<TeeSink>();
    if (config.json_logs) {
        tee->Add(std::make_unique<JsonSink>(std::cerr));
    } else {
        // NO_COLOR env var (https://no-color.org/).
        bool use_color = !NoColorEnvSet() && IsStderrTty();
        tee->Add(std::make_unique<ColorConsoleSink>(use_color));
    }
    if (config.log_file.has_value()) {
        auto file = std::make_unique<FileSink>(*config.log_file, config.json_logs);
        if (!file->IsOpen()) {
            return Result<void, Error>::Err(Error::Make(
                "InitLogging", "Cannot open log file: " + *config.log_file,
                ErrorCategory::Config));
        }
        tee->Add(std::move(file));
    }
    InitGlobalLogger(std::move(tee), level);
    return Result<void, Error>::Ok();
}

void PrintTools(const std::vector<embedded_mcp::ToolInfo>& tools) {
    for (const auto& tool : tools) {
        std::cout << tool.name << "\n";
        std::cout << "  " << tool.description << "\n";
        std::cout << "  parameters:";
        for (const auto& param : tool.all_parameters) {
            std::cout << " " << param;
        }
        std::cout << "\n  required:";
        if (tool.required_parameters.empty()) {
            std::cout << " (none)";
        }
        for (const auto& param : tool.required_parameters) {
            std::cout << " " << param;
        }
        std::cout << "\n";
    }
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace embedded_mcp;

    // Parse CLI args (argparse handles --help/--version itself).
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error());
        return cli_result.Error().ExitCode();
    }
    AppConfig config = std::move(cli_result).Value();

    // YAML is the base; anything given on the command line wins.
    if (config.config_file.has_value()) {
        auto yaml_result = LoadFromYaml(*config.config_file);
        if (yaml_result.IsErr()) {
            PrintError(yaml_result.Error());
            return yaml_result.Error().ExitCode();
        }
        config = MergeConfigs(yaml_result.Value(), config);
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    auto logging = InitLogging(config);
    if (logging.IsErr()) {
        PrintError(logging.Error());
        return logging.Error().ExitCode();
    }

    auto backend = std::make_shared<MockAutomationBackend>(config.server.latency_scale);
    auto registry_result = BuildAutomationRegistry(backend);
    if (registry_result.IsErr()) {
        auto error = Error::Make("BuildRegistry", registry_result.Error(),
                                 ErrorCategory::Internal);
        PrintError(error);
        return error.ExitCode();
    }
    auto registry = std::make_shared<const ToolRegistry>(std::move(registry_result).Value());

    DispatcherOptions dispatcher_options;
    dispatcher_options.call_timeout =
        std::chrono::milliseconds(config.server.tool_timeout_ms);
    auto dispatcher = std::make_shared<ToolDispatcher>(registry, dispatcher_options);

    HostOptions host_options;
    host_options.worker_threads = static_cast<size_t>(config.server.worker_threads);
    host_options.stop_grace = std::chrono::milliseconds(config.server.stop_grace_ms);
    McpServerHost host(dispatcher, host_options);

    if (config.list_tools) {
        PrintTools(host.GetAvailableTools());
        return kExitSuccess;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    auto started = host.Start(config.server.port,
                              std::chrono::milliseconds(config.server.startup_timeout_ms));
    if (started.IsErr()) {
        LogError("lifecycle", started.Error().ToString());
        PrintError(started.Error());
        return started.Error().ExitCode();
    }

    LogInfo("lifecycle", "Serving " + std::to_string(registry->Size()) +
                             " tools at " + host.GetServerUrl().value_or("") +
                             " (Ctrl+C to stop)");

    while (!g_shutdown_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    LogInfo("lifecycle", "Shutdown requested");
    host.Stop();
    return kExitSuccess;
}
