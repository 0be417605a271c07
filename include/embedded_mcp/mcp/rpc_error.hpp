#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace embedded_mcp {

// JSON-RPC 2.0 error codes plus the two server-defined tool codes.
// Values are part of the wire contract.
enum class RpcErrorCode : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
    ToolNotFound = -32000,
    ToolExecutionError = -32001,
};

// ---------------------------------------------------------------------------
// RpcError — the ErrorObject of a response envelope.
// ---------------------------------------------------------------------------
struct RpcError {
    RpcErrorCode code = RpcErrorCode::InternalError;
    std::string message;
    std::optional<nlohmann::ordered_json> data;

    static RpcError Make(RpcErrorCode code, std::string message,
                         std::optional<nlohmann::ordered_json> data = std::nullopt) {
        return RpcError{code, std::move(message), std::move(data)};
    }

    [[nodiscard]] int Code() const noexcept { return static_cast<int>(code); }

    [[nodiscard]] nlohmann::ordered_json ToJson() const {
        nlohmann::ordered_json out = {{"code", Code()}, {"message", message}};
        if (data.has_value()) {
            out["data"] = *data;
        }
        return out;
    }
};

} // namespace embedded_mcp
