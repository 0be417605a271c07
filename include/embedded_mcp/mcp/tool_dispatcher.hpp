#pragma once

#include <embedded_mcp/core/cancellation.hpp>
#include <embedded_mcp/core/result.hpp>
#include <embedded_mcp/mcp/rpc_error.hpp>
#include <embedded_mcp/mcp/tool_registry.hpp>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace embedded_mcp {

/// Checks `raw_arguments` against `schema` and returns the arguments with
/// defaults filled in. Absent or null arguments count as an empty object.
/// On failure the error is InvalidParams; data.violations lists every
/// problem found, the message names the first.
Result<nlohmann::ordered_json, RpcError> ValidateArguments(
    const InputSchema& schema, const nlohmann::ordered_json& raw_arguments);

struct DispatcherOptions {
    // Upper bound for a single tool call; zero disables the limit.
    std::chrono::milliseconds call_timeout{30000};
};

// ---------------------------------------------------------------------------
// ToolDispatcher — resolves, validates and runs tool calls.
//
// Safe to call from many request threads at once: the registry is
// immutable and each call gets its own argument copy and token.
// ---------------------------------------------------------------------------
class ToolDispatcher {
public:
    explicit ToolDispatcher(std::shared_ptr<const ToolRegistry> registry,
                            DispatcherOptions options = {});

    ToolDispatcher(const ToolDispatcher&) = delete;
    ToolDispatcher& operator=(const ToolDispatcher&) = delete;

    /// ToolNotFound and InvalidParams are returned as errors before the
    /// handler runs. Anything the handler does wrong, including throwing
    /// or being cancelled, comes back as Ok with is_error set.
    [[nodiscard]] Result<ToolResult, RpcError> Invoke(
        const std::string& name, const nlohmann::ordered_json& raw_arguments);

    [[nodiscard]] const ToolRegistry& Registry() const noexcept { return *registry_; }

    // -- In-flight tracking (used by the server's stop path) -----------------

    [[nodiscard]] size_t InFlight() const;

    /// Blocks until no call is running or the timeout expires. Returns true
    /// if idle.
    bool WaitIdle(std::chrono::milliseconds timeout);

    /// Interrupts every running call. Their results are discarded.
    void CancelInFlight();

    /// Re-arms cancellation so new calls run normally again.
    void ResetCancellation();

private:
    ToolResult RunHandler(const std::string& name, const ToolHandler& handler,
                          const nlohmann::ordered_json& arguments);

    std::shared_ptr<const ToolRegistry> registry_;
    DispatcherOptions options_;
    CancellationSource cancel_source_;

    mutable std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
    size_t in_flight_ = 0;
};

} // namespace embedded_mcp
