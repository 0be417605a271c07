#include <embedded_mcp/mcp/protocol_handler.hpp>

#include <embedded_mcp/core/log.hpp>
#include <embedded_mcp/core/version.hpp>

#include <array>
#include <utility>

namespace embedded_mcp {

namespace {

constexpr std::array<std::pair<std::string_view, McpMethod>, 4> kMethodTable = {{
    {"initialize", McpMethod::Initialize},
    {"notifications/initialized", McpMethod::Initialized},
    {"tools/list", McpMethod::ToolsList},
    {"tools/call", McpMethod::ToolsCall},
}};

bool IsValidId(const nlohmann::ordered_json& id) {
    return id.is_null() || id.is_string() || id.is_number();
}

int HttpStatusFor(RpcErrorCode code) {
    switch (code) {
        case RpcErrorCode::ParseError:
        case RpcErrorCode::InvalidRequest:
        case RpcErrorCode::InvalidParams:      return 400;
        case RpcErrorCode::MethodNotFound:
        case RpcErrorCode::ToolNotFound:       return 404;
        case RpcErrorCode::ToolExecutionError: return 400;
        case RpcErrorCode::InternalError:      return 500;
    }
    return 500;
}

// Absent arguments stay null; the dispatcher treats null as {}.
nlohmann::ordered_json ArgumentsOf(const nlohmann::ordered_json& params) {
    auto it = params.find("arguments");
    return it == params.end() ? nlohmann::ordered_json() : *it;
}

FlatResponse FlatError(const RpcError& error) {
    return FlatResponse{HttpStatusFor(error.code),
                        nlohmann::ordered_json{{"error", error.ToJson()}}};
}

} // anonymous namespace

std::optional<McpMethod> ParseMethod(std::string_view name) {
    for (const auto& [text, method] : kMethodTable) {
        if (text == name) return method;
    }
    return std::nullopt;
}

const char* MethodName(McpMethod method) {
    for (const auto& [text, m] : kMethodTable) {
        if (m == method) return text.data();
    }
    return "";
}

ProtocolHandler::ProtocolHandler(std::shared_ptr<ToolDispatcher> dispatcher)
    : dispatcher_(std::move(dispatcher)) {}

// ---------------------------------------------------------------------------
// Decode
// ---------------------------------------------------------------------------
nlohmann::ordered_json ProtocolHandler::HandleBody(std::string_view body) {
    nlohmann::ordered_json message;
    try {
        message = nlohmann::ordered_json::parse(body);
    } catch (const nlohmann::ordered_json::exception& e) {
        LogDebug("protocol", std::string("Parse error: ") + e.what());
        return MakeError(nullptr, RpcError::Make(RpcErrorCode::ParseError,
                                                 "Parse error"));
    }
    return HandleMessage(message);
}

nlohmann::ordered_json ProtocolHandler::HandleMessage(const nlohmann::ordered_json& message) {
    nlohmann::ordered_json id = nullptr;
    try {
        if (!message.is_object()) {
            return MakeError(nullptr, RpcError::Make(
                RpcErrorCode::InvalidRequest, "Request must be a JSON object"));
        }

        if (message.contains("id")) {
            if (!IsValidId(message["id"])) {
                return MakeError(nullptr, RpcError::Make(
                    RpcErrorCode::InvalidRequest,
                    "id must be a string, number or null"));
            }
            id = message["id"];
        }

        if (message.contains("jsonrpc") && message["jsonrpc"] != "2.0") {
            return MakeError(id, RpcError::Make(RpcErrorCode::InvalidRequest,
                                                "Invalid JSON-RPC version"));
        }

        if (!message.contains("method") || !message["method"].is_string()) {
            return MakeError(id, RpcError::Make(RpcErrorCode::InvalidRequest,
                                                "Missing 'method'"));
        }
        const auto method_name = message["method"].get<std::string>();

        nlohmann::ordered_json params = nlohmann::ordered_json::object();
        if (message.contains("params") && !message["params"].is_null()) {
            if (!message["params"].is_object()) {
                return MakeError(id, RpcError::Make(RpcErrorCode::InvalidRequest,
                                                    "params must be an object"));
            }
            params = message["params"];
        }

        auto method = ParseMethod(method_name);
        if (!method.has_value()) {
            LogDebug("protocol", "Method not found: " + method_name);
            return MakeError(id, RpcError::Make(RpcErrorCode::MethodNotFound,
                                                "Method not found: " + method_name));
        }

        auto routed = Route(*method, params);
        if (routed.IsErr()) {
            return MakeError(id, routed.Error());
        }
        return MakeResult(id, routed.Value());
    } catch (const std::exception& e) {
        LogError("protocol", std::string("Internal error: ") + e.what());
        return MakeError(id, RpcError::Make(RpcErrorCode::InternalError,
                                            std::string("Internal error: ") + e.what()));
    } catch (...) {
        LogError("protocol", "Internal error: unknown exception");
        return MakeError(id, RpcError::Make(RpcErrorCode::InternalError,
                                            "Internal error: unknown exception"));
    }
}

// ---------------------------------------------------------------------------
// Route
// ---------------------------------------------------------------------------
Result<nlohmann::ordered_json, RpcError> ProtocolHandler::Route(
    McpMethod method, const nlohmann::ordered_json& params) {
    using R = Result<nlohmann::ordered_json, RpcError>;
    switch (method) {
        case McpMethod::Initialize:  return R::Ok(HandleInitialize());
        case McpMethod::Initialized: return R::Ok(nlohmann::ordered_json::object());
        case McpMethod::ToolsList:   return R::Ok(HandleToolsList(params));
        case McpMethod::ToolsCall:   return HandleToolsCall(params);
    }
    return R::Err(RpcError::Make(RpcErrorCode::InternalError, "Unrouted method"));
}

nlohmann::ordered_json ProtocolHandler::HandleInitialize() const {
    return {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", {{"tools", {{"listChanged", false}}}}},
        {"serverInfo", {{"name", kServerName}, {"version", kVersion}}},
    };
}

nlohmann::ordered_json ProtocolHandler::HandleToolsList(
    const nlohmann::ordered_json& /*params*/) const {
    // A cursor may be sent but the whole list always fits in one page.
    nlohmann::ordered_json result = ListToolsFlat();
    result["nextCursor"] = nullptr;
    return result;
}

Result<nlohmann::ordered_json, RpcError> ProtocolHandler::HandleToolsCall(
    const nlohmann::ordered_json& params) {
    using R = Result<nlohmann::ordered_json, RpcError>;

    if (!params.contains("name") || !params["name"].is_string()) {
        return R::Err(RpcError::Make(RpcErrorCode::InvalidParams,
                                     "Missing 'name' parameter"));
    }
    const auto name = params["name"].get<std::string>();
    const auto arguments = ArgumentsOf(params);

    auto invoked = dispatcher_->Invoke(name, arguments);
    if (invoked.IsErr()) {
        return R::Err(invoked.Error());
    }

    const auto& result = invoked.Value();
    if (result.is_error) {
        const auto message = result.content.empty()
            ? "Tool execution failed: " + name
            : result.content.front().text;
        return R::Err(RpcError::Make(RpcErrorCode::ToolExecutionError, message,
                                     nlohmann::ordered_json{{"tool", name},
                                                            {"content", result.ContentJson()}}));
    }
    return R::Ok(result.ToJson());
}

// ---------------------------------------------------------------------------
// Flat surface
// ---------------------------------------------------------------------------
nlohmann::ordered_json ProtocolHandler::ListToolsFlat() const {
    nlohmann::ordered_json tools = nlohmann::ordered_json::array();
    for (const auto& def : dispatcher_->Registry().Tools()) {
        tools.push_back(def.ToJson());
    }
    return {{"tools", tools}};
}

FlatResponse ProtocolHandler::CallToolFlat(std::string_view body) {
    try {
        nlohmann::ordered_json request;
        try {
            request = nlohmann::ordered_json::parse(body);
        } catch (const nlohmann::ordered_json::exception&) {
            return FlatError(RpcError::Make(RpcErrorCode::ParseError, "Parse error"));
        }
        if (!request.is_object()) {
            return FlatError(RpcError::Make(RpcErrorCode::InvalidRequest,
                                            "Request must be a JSON object"));
        }
        if (!request.contains("name") || !request["name"].is_string()) {
            return FlatError(RpcError::Make(RpcErrorCode::InvalidParams,
                                            "Missing 'name' parameter"));
        }

        const auto name = request["name"].get<std::string>();
        auto invoked = dispatcher_->Invoke(name, ArgumentsOf(request));
        if (invoked.IsErr()) {
            return FlatError(invoked.Error());
        }
        const auto& result = invoked.Value();
        return FlatResponse{result.is_error ? 400 : 200, result.ToJson()};
    } catch (const std::exception& e) {
        LogError("protocol", std::string("Internal error: ") + e.what());
        return FlatError(RpcError::Make(RpcErrorCode::InternalError,
                                        std::string("Internal error: ") + e.what()));
    } catch (...) {
        LogError("protocol", "Internal error: unknown exception");
        return FlatError(RpcError::Make(RpcErrorCode::InternalError,
                                        "Internal error: unknown exception"));
    }
}

// ---------------------------------------------------------------------------
// Encode
// ---------------------------------------------------------------------------
nlohmann::ordered_json ProtocolHandler::MakeResult(const nlohmann::ordered_json& id,
                                                   const nlohmann::ordered_json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::ordered_json ProtocolHandler::MakeError(const nlohmann::ordered_json& id,
                                                  const RpcError& error) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", error.ToJson()}
    };
}

} // namespace embedded_mcp
