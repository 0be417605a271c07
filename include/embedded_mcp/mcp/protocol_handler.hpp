#pragma once

#include <embedded_mcp/core/result.hpp>
#include <embedded_mcp/mcp/rpc_error.hpp>
#include <embedded_mcp/mcp/tool_dispatcher.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace embedded_mcp {

constexpr const char* kProtocolVersion = "2024-11-05";

// ---------------------------------------------------------------------------
// McpMethod — the closed set of methods this server answers.
// ---------------------------------------------------------------------------
enum class McpMethod {
    Initialize,
    Initialized,  // notifications/initialized
    ToolsList,
    ToolsCall,
};

/// Exact, case-sensitive lookup in the method table.
std::optional<McpMethod> ParseMethod(std::string_view name);
const char* MethodName(McpMethod method);

// Response of the flat legacy surface (/list_tools, /call_tool), which has
// no envelope and reports status through HTTP.
struct FlatResponse {
    int http_status = 200;
    nlohmann::ordered_json body;
};

// ---------------------------------------------------------------------------
// ProtocolHandler — JSON-RPC 2.0 MCP request handling.
//
// Methods:
//   - initialize
//   - notifications/initialized
//   - tools/list
//   - tools/call
//
// Stateless between requests. Every entry point returns a well-formed
// envelope and never throws; faults become InternalError.
//
// Tool failures surface as ToolExecutionError (-32001) envelopes carrying
// the tool's content in error.data. The flat surface instead returns the
// tool result with isError=true.
// ---------------------------------------------------------------------------
class ProtocolHandler {
public:
    explicit ProtocolHandler(std::shared_ptr<ToolDispatcher> dispatcher);

    /// Parse a raw request body and handle it. Unparseable JSON yields a
    /// ParseError envelope with a null id.
    [[nodiscard]] nlohmann::ordered_json HandleBody(std::string_view body);

    /// Handle one decoded request message.
    [[nodiscard]] nlohmann::ordered_json HandleMessage(const nlohmann::ordered_json& message);

    // -- Flat surface --------------------------------------------------------

    /// {"tools": [...]}
    [[nodiscard]] nlohmann::ordered_json ListToolsFlat() const;

    [[nodiscard]] size_t ToolCount() const { return dispatcher_->Registry().Size(); }

    /// Body {"name", "arguments"} -> {"content", "isError"} or {"error"}.
    [[nodiscard]] FlatResponse CallToolFlat(std::string_view body);

    // -- Envelope encoding ---------------------------------------------------

    static nlohmann::ordered_json MakeResult(const nlohmann::ordered_json& id,
                                             const nlohmann::ordered_json& result);
    static nlohmann::ordered_json MakeError(const nlohmann::ordered_json& id,
                                            const RpcError& error);

private:
    Result<nlohmann::ordered_json, RpcError> Route(McpMethod method,
                                                   const nlohmann::ordered_json& params);

    nlohmann::ordered_json HandleInitialize() const;
    nlohmann::ordered_json HandleToolsList(const nlohmann::ordered_json& params) const;
    Result<nlohmann::ordered_json, RpcError> HandleToolsCall(const nlohmann::ordered_json& params);

    std::shared_ptr<ToolDispatcher> dispatcher_;
};

} // namespace embedded_mcp
