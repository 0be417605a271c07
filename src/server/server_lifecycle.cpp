#include <embedded_mcp/server/server_lifecycle.hpp>

#include <embedded_mcp/core/log.hpp>
#include <embedded_mcp/core/types.hpp>
#include <embedded_mcp/server/http_routes.hpp>

#include <httplib.h>

#include <future>
#include <thread>

namespace embedded_mcp {

namespace {

constexpr std::chrono::milliseconds kPollInterval{5};

Error LifecycleError(const std::string& operation, const std::string& message,
                     ErrorCategory category) {
    return Error::Make(operation, message, category);
}

} // anonymous namespace

const char* ServerStateName(ServerState state) {
    switch (state) {
        case ServerState::Stopped:  return "stopped";
        case ServerState::Starting: return "starting";
        case ServerState::Running:  return "running";
    }
    return "stopped";
}

// ---------------------------------------------------------------------------
// Listener — one httplib::Server and the thread that runs it.
// ---------------------------------------------------------------------------
struct McpServerHost::Listener {
    httplib::Server server;
    std::thread thread;
    std::promise<bool> bound;
    std::string setup_error;  // written before `bound` is set
    std::atomic<bool> aborted{false};
    std::atomic<bool> finished{false};
};

McpServerHost::McpServerHost(std::shared_ptr<ToolDispatcher> dispatcher,
                             HostOptions options)
    : dispatcher_(std::move(dispatcher)),
      protocol_(std::make_shared<ProtocolHandler>(dispatcher_)),
      options_(std::move(options)) {}

McpServerHost::~McpServerHost() {
    Stop();
}

// ---------------------------------------------------------------------------
// Start
// ---------------------------------------------------------------------------
Result<void, Error> McpServerHost::Start(int port,
                                         std::chrono::milliseconds startup_timeout) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (state_.load() != ServerState::Stopped) {
        return Result<void, Error>::Err(LifecycleError(
            "Start", "MCP server is already running on port " +
                         std::to_string(port_.load()),
            ErrorCategory::AlreadyRunning));
    }

    auto validated = Port::Create(port);
    if (validated.IsErr()) {
        return Result<void, Error>::Err(LifecycleError(
            "Start", validated.Error(), ErrorCategory::InvalidPort));
    }
    const auto port_value = validated.Value().Value();

    state_.store(ServerState::Starting);
    LogInfo("lifecycle", "Starting MCP server on " + LoopbackUrl(port_value));

    const auto deadline = std::chrono::steady_clock::now() + startup_timeout;
    dispatcher_->ResetCancellation();

    auto listener = std::make_unique<Listener>();
    auto bound = listener->bound.get_future();
    Listener* raw = listener.get();
    raw->thread = std::thread([this, raw, port_value] { RunListener(*raw, port_value); });

    if (bound.wait_until(deadline) != std::future_status::ready) {
        return FailStart(std::move(listener), LifecycleError(
            "Start", "Server failed to start within " +
                         std::to_string(startup_timeout.count()) + "ms",
            ErrorCategory::StartupTimeout));
    }
    if (!bound.get()) {
        auto error = LifecycleError(
            "Start", "Failed to bind " + LoopbackUrl(port_value),
            ErrorCategory::BindFailed);
        if (!raw->setup_error.empty()) {
            error.message = "Server setup failed";
            error.detail = raw->setup_error;
        }
        return FailStart(std::move(listener), std::move(error));
    }

    // Bound; wait for the accept loop to come up.
    while (!raw->server.is_running()) {
        if (raw->finished.load()) {
            return FailStart(std::move(listener), LifecycleError(
                "Start", "Listener exited during startup", ErrorCategory::BindFailed));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return FailStart(std::move(listener), LifecycleError(
                "Start", "Server failed to start within " +
                             std::to_string(startup_timeout.count()) + "ms",
                ErrorCategory::StartupTimeout));
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    listener_ = std::move(listener);
    port_.store(port_value);
    state_.store(ServerState::Running);
    LogInfo("lifecycle", "MCP server running at " + LoopbackUrl(port_value) +
                             " with " + std::to_string(dispatcher_->Registry().Size()) +
                             " tools");
    return Result<void, Error>::Ok();
}

void McpServerHost::RunListener(Listener& listener, uint16_t port) {
    try {
        if (options_.worker_threads > 0) {
            const auto threads = options_.worker_threads;
            listener.server.new_task_queue = [threads] {
                return new httplib::ThreadPool(threads);
            };
        }
        InstallRoutes(listener.server, protocol_, port);
        if (options_.configure) {
            options_.configure(listener.server);
        }
    } catch (const std::exception& e) {
        LogError("lifecycle", std::string("Server setup failed: ") + e.what());
        listener.setup_error = e.what();
        listener.bound.set_value(false);
        listener.finished.store(true);
        return;
    }

    if (listener.aborted.load()) {
        listener.bound.set_value(false);
        listener.finished.store(true);
        return;
    }

    // Loopback only; never configurable.
    const bool ok = listener.server.bind_to_port(kLoopbackHost, port);
    listener.bound.set_value(ok);
    // Enter the accept loop even when aborted: only listen_after_bind()
    // releases the bound socket, and TearDown stops it.
    if (ok) {
        listener.server.listen_after_bind();
    }
    listener.finished.store(true);
}

Result<void, Error> McpServerHost::FailStart(std::unique_ptr<Listener> listener,
                                             Error error) {
    LogError("lifecycle", error.ToString());
    TearDown(*listener, std::chrono::milliseconds(0));
    dispatcher_->ResetCancellation();
    port_.store(0);
    state_.store(ServerState::Stopped);
    return Result<void, Error>::Err(std::move(error));
}

// ---------------------------------------------------------------------------
// Stop
// ---------------------------------------------------------------------------
void McpServerHost::Stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (state_.load() == ServerState::Stopped || !listener_) {
        LogDebug("lifecycle", "MCP server is not running, stop() called redundantly");
        return;
    }

    LogInfo("lifecycle", "Stopping MCP server on port " + std::to_string(port_.load()));
    try {
        TearDown(*listener_, options_.stop_grace);
    } catch (const std::exception& e) {
        LogError("lifecycle", std::string("Error stopping MCP server: ") + e.what());
    }

    listener_.reset();
    port_.store(0);
    state_.store(ServerState::Stopped);
    LogInfo("lifecycle", "MCP server stopped");
}

void McpServerHost::TearDown(Listener& listener, std::chrono::milliseconds grace) {
    listener.aborted.store(true);

    // Stop accepting; requests already being served keep running.
    listener.server.stop();

    if (!dispatcher_->WaitIdle(grace)) {
        LogWarn("lifecycle", std::to_string(dispatcher_->InFlight()) +
                                 " tool call(s) still running after grace period; "
                                 "cancelling");
    }
    dispatcher_->CancelInFlight();

    // stop() is a no-op until the accept loop is up, so keep asking until
    // the thread has left it.
    while (!listener.finished.load()) {
        listener.server.stop();
        std::this_thread::sleep_for(kPollInterval);
    }
    if (listener.thread.joinable()) {
        listener.thread.join();
    }
}

// ---------------------------------------------------------------------------
// Restart and queries
// ---------------------------------------------------------------------------
Result<void, Error> McpServerHost::Restart(int new_port,
                                           std::chrono::milliseconds startup_timeout) {
    LogInfo("lifecycle", "Restarting MCP server on port " + std::to_string(new_port));
    Stop();
    return Start(new_port, startup_timeout);
}

std::optional<std::string> McpServerHost::GetServerUrl() const {
    if (!IsRunning()) return std::nullopt;
    return LoopbackUrl(static_cast<uint16_t>(port_.load()));
}

std::optional<int> McpServerHost::GetCurrentPort() const {
    if (!IsRunning()) return std::nullopt;
    return port_.load();
}

std::vector<ToolInfo> McpServerHost::GetAvailableTools() const {
    std::vector<ToolInfo> out;
    for (const auto& def : dispatcher_->Registry().Tools()) {
        ToolInfo info;
        info.name = def.name;
        info.description = def.description;
        info.required_parameters = def.input_schema.required;
        for (const auto& p : def.input_schema.properties) {
            info.all_parameters.push_back(p.name);
        }
        out.push_back(std::move(info));
    }
    return out;
}

} // namespace embedded_mcp
