#pragma once

#include <embedded_mcp/core/result.hpp>
#include <embedded_mcp/mcp/protocol_handler.hpp>
#include <embedded_mcp/mcp/tool_dispatcher.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace httplib {
class Server;
}

namespace embedded_mcp {

enum class ServerState {
    Stopped,
    Starting,
    Running,
};

const char* ServerStateName(ServerState state);

// ---------------------------------------------------------------------------
// ToolInfo — host-facing summary of one tool.
// ---------------------------------------------------------------------------
struct ToolInfo {
    std::string name;
    std::string description;
    std::vector<std::string> required_parameters;
    std::vector<std::string> all_parameters;
};

struct HostOptions {
    size_t worker_threads = 8;

    // How long Stop() lets running tool calls finish before cancelling them.
    std::chrono::milliseconds stop_grace{1000};

    // Runs on the listener thread after the built-in routes are installed
    // and before the socket is bound. Counts against the startup timeout.
    std::function<void(httplib::Server&)> configure;
};

constexpr std::chrono::milliseconds kDefaultStartupTimeout{5000};
constexpr int kDefaultPort = 12345;

// ---------------------------------------------------------------------------
// McpServerHost — owns the loopback HTTP listener and its lifecycle.
//
// One host serves at most one listener at a time. Start/Stop/Restart are
// serialized; IsRunning/State/GetServerUrl are lock-free reads and may be
// called from any thread, including request handlers.
//
// Start failures are returned as Error with category AlreadyRunning,
// InvalidPort, StartupTimeout or BindFailed. After any failure the host is
// Stopped and Start can be called again.
// ---------------------------------------------------------------------------
class McpServerHost {
public:
    explicit McpServerHost(std::shared_ptr<ToolDispatcher> dispatcher,
                           HostOptions options = {});
    ~McpServerHost();

    McpServerHost(const McpServerHost&) = delete;
    McpServerHost& operator=(const McpServerHost&) = delete;

    [[nodiscard]] Result<void, Error> Start(
        int port = kDefaultPort,
        std::chrono::milliseconds startup_timeout = kDefaultStartupTimeout);

    /// Safe to call at any time; a no-op when already stopped.
    void Stop();

    /// Stop() followed by Start(). Not atomic: if Start fails the host stays
    /// Stopped and the caller retries.
    [[nodiscard]] Result<void, Error> Restart(
        int new_port,
        std::chrono::milliseconds startup_timeout = kDefaultStartupTimeout);

    [[nodiscard]] bool IsRunning() const noexcept {
        return state_.load() == ServerState::Running;
    }
    [[nodiscard]] ServerState State() const noexcept { return state_.load(); }

    /// "http://127.0.0.1:<port>" while running.
    [[nodiscard]] std::optional<std::string> GetServerUrl() const;
    [[nodiscard]] std::optional<int> GetCurrentPort() const;

    [[nodiscard]] std::vector<ToolInfo> GetAvailableTools() const;

private:
    struct Listener;

    void RunListener(Listener& listener, uint16_t port);
    void TearDown(Listener& listener, std::chrono::milliseconds grace);
    Result<void, Error> FailStart(std::unique_ptr<Listener> listener, Error error);

    std::shared_ptr<ToolDispatcher> dispatcher_;
    std::shared_ptr<ProtocolHandler> protocol_;
    HostOptions options_;

    std::mutex lifecycle_mutex_;
    std::atomic<ServerState> state_{ServerState::Stopped};
    std::atomic<int> port_{0};
    std::unique_ptr<Listener> listener_;
};

} // namespace embedded_mcp
