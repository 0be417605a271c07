#pragma once

#include <embedded_mcp/mcp/protocol_handler.hpp>

#include <cstdint>
#include <memory>
#include <string_view>

namespace httplib {
class Server;
}

namespace embedded_mcp {

// ---------------------------------------------------------------------------
// HTTP surface of the server.
//
//   POST /            JSON-RPC envelope (initialize, tools/list, tools/call)
//   GET  /            server descriptor and endpoint catalog
//   GET  /health      liveness probe
//   GET  /list_tools  flat tool list
//   POST /call_tool   flat tool call {name, arguments}
//   OPTIONS *         CORS preflight
//
// Browser clients are only admitted from loopback origins. Every body,
// including 404s and escaped exceptions, is JSON.
// ---------------------------------------------------------------------------
void InstallRoutes(httplib::Server& server,
                   std::shared_ptr<ProtocolHandler> protocol,
                   uint16_t port);

/// True for http(s)://127.0.0.1[:port] and http(s)://localhost[:port].
bool IsLoopbackOrigin(std::string_view origin);

/// Value of the X-MCP-Server response header.
std::string ServerHeaderValue();

} // namespace embedded_mcp
