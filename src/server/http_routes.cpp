#include <embedded_mcp/server/http_routes.hpp>

#include <embedded_mcp/core/log.hpp>
#include <embedded_mcp/core/version.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <cctype>
#include <exception>
#include <string>

namespace embedded_mcp {

namespace {

constexpr const char* kJson = "application/json";
constexpr size_t kMaxPayloadBytes = 10 * 1024 * 1024;

std::string ToLower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool IsDigits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

void SetJson(httplib::Response& res, int status, const nlohmann::ordered_json& body) {
    res.status = status;
    res.set_content(body.dump(), kJson);
}

nlohmann::ordered_json HttpError(int code, const std::string& message) {
    return {{"error", {{"code", code}, {"message", message}}}};
}

void ApplyCorsHeaders(const httplib::Request& req, httplib::Response& res) {
    if (!req.has_header("Origin")) return;
    res.set_header("Access-Control-Allow-Origin", req.get_header_value("Origin"));
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
    res.set_header("Access-Control-Max-Age", "3600");
    res.set_header("Vary", "Origin");
}

nlohmann::ordered_json ServerDescriptor() {
    return {
        {"name", kServerName},
        {"version", kVersion},
        {"description", "Embedded MCP server for UI automation"},
        {"protocolVersion", kProtocolVersion},
        {"endpoints", {
            {"jsonrpc", "POST / - JSON-RPC 2.0 (initialize, tools/list, tools/call)"},
            {"list_tools", "GET /list_tools - List all available automation tools"},
            {"call_tool", "POST /call_tool - Execute a tool with parameters"},
            {"health", "GET /health - Server health check"},
        }},
        {"documentation", "https://spec.modelcontextprotocol.io/specification/"},
    };
}

} // anonymous namespace

bool IsLoopbackOrigin(std::string_view origin) {
    const auto lower = ToLower(origin);
    std::string_view rest(lower);

    if (rest.rfind("http://", 0) == 0) {
        rest.remove_prefix(7);
    } else if (rest.rfind("https://", 0) == 0) {
        rest.remove_prefix(8);
    } else {
        return false;
    }

    std::string_view host = rest;
    auto colon = rest.find(':');
    if (colon != std::string_view::npos) {
        host = rest.substr(0, colon);
        if (!IsDigits(rest.substr(colon + 1))) return false;
    }
    return host == "127.0.0.1" || host == "localhost";
}

std::string ServerHeaderValue() {
    return std::string(kServerName) + "/" + kVersion;
}

void InstallRoutes(httplib::Server& server,
                   std::shared_ptr<ProtocolHandler> protocol,
                   uint16_t port) {
    server.set_payload_max_length(kMaxPayloadBytes);
    server.set_read_timeout(30, 0);
    server.set_write_timeout(30, 0);
    server.set_keep_alive_timeout(1);

    // -- Origin check and common headers -------------------------------------
    server.set_pre_routing_handler(
        [](const httplib::Request& req, httplib::Response& res) {
            res.set_header("X-MCP-Server", ServerHeaderValue());
            if (req.has_header("Origin") &&
                !IsLoopbackOrigin(req.get_header_value("Origin"))) {
                LogWarn("http", "Rejected origin: " + req.get_header_value("Origin"));
                SetJson(res, 403, HttpError(403, "Origin not allowed: " +
                                                     req.get_header_value("Origin")));
                return httplib::Server::HandlerResponse::Handled;
            }
            ApplyCorsHeaders(req, res);
            return httplib::Server::HandlerResponse::Unhandled;
        });

    server.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    // -- JSON-RPC endpoint ---------------------------------------------------
    server.Post("/", [protocol](const httplib::Request& req, httplib::Response& res) {
        SetJson(res, 200, protocol->HandleBody(req.body));
    });

    // -- Discovery and liveness ----------------------------------------------
    server.Get("/", [](const httplib::Request&, httplib::Response& res) {
        SetJson(res, 200, ServerDescriptor());
    });

    server.Get("/health",
               [protocol, port](const httplib::Request&, httplib::Response& res) {
        SetJson(res, 200, {
            {"status", "healthy"},
            {"server", kServerName},
            {"version", kVersion},
            {"port", port},
            {"tools_count", protocol->ToolCount()},
        });
    });

    // -- Flat surface --------------------------------------------------------
    server.Get("/list_tools",
               [protocol](const httplib::Request&, httplib::Response& res) {
        SetJson(res, 200, protocol->ListToolsFlat());
    });

    server.Post("/call_tool",
                [protocol](const httplib::Request& req, httplib::Response& res) {
        auto flat = protocol->CallToolFlat(req.body);
        SetJson(res, flat.http_status, flat.body);
    });

    // -- Fallbacks -----------------------------------------------------------
    server.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) return;
        const auto message = res.status == 404
            ? "Not found: " + req.method + " " + req.path
            : "HTTP " + std::to_string(res.status);
        SetJson(res, res.status, HttpError(res.status, message));
    });

    server.set_exception_handler([](const httplib::Request&, httplib::Response& res,
                                    std::exception_ptr ep) {
        std::string message = "Unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = e.what();
        } catch (...) {
            message = "Non-standard exception";
        }
        LogError("http", "Unhandled exception: " + message);
        SetJson(res, 500, ProtocolHandler::MakeError(
            nullptr, RpcError::Make(RpcErrorCode::InternalError,
                                    "Internal error: " + message)));
    });

    server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LogDebug("http", req.method + " " + req.path + " -> " +
                             std::to_string(res.status));
    });
}

} // namespace embedded_mcp
