#include <catch2/catch_test_macros.hpp>

#include <embedded_mcp/automation/automation_tools.hpp>
#include <embedded_mcp/automation/mock_automation_backend.hpp>
#include <embedded_mcp/core/version.hpp>
#include <embedded_mcp/server/http_routes.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace embedded_mcp;

namespace {

std::shared_ptr<ProtocolHandler> MakeProtocol() {
    auto registry = BuildAutomationRegistry(std::make_shared<MockAutomationBackend>(0.0));
    REQUIRE(registry.IsOk());
    auto dispatcher = std::make_shared<ToolDispatcher>(
        std::make_shared<const ToolRegistry>(std::move(registry).Value()));
    return std::make_shared<ProtocolHandler>(dispatcher);
}

// RAII wrapper: binds the routes to an OS-picked loopback port and serves
// them on a background thread.
class LocalServer {
public:
    explicit LocalServer(std::shared_ptr<ProtocolHandler> protocol,
                         const std::function<void(httplib::Server&)>& extra = nullptr) {
        port_ = svr_.bind_to_any_port("127.0.0.1");
        InstallRoutes(svr_, std::move(protocol), static_cast<uint16_t>(port_));
        if (extra) extra(svr_);
        thread_ = std::thread([this] { svr_.listen_after_bind(); });
        svr_.wait_until_ready();
    }

    ~LocalServer() {
        svr_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    LocalServer(const LocalServer&) = delete;
    LocalServer& operator=(const LocalServer&) = delete;

    [[nodiscard]] int Port() const noexcept { return port_; }

    [[nodiscard]] httplib::Client Client() const {
        httplib::Client cli("127.0.0.1", port_);
        cli.set_connection_timeout(5, 0);
        cli.set_read_timeout(5, 0);
        return cli;
    }

private:
    httplib::Server svr_;
    int port_ = 0;
    std::thread thread_;
};

nlohmann::ordered_json Body(const httplib::Result& res) {
    REQUIRE(res);
    return nlohmann::ordered_json::parse(res->body);
}

} // anonymous namespace

// ===========================================================================
// IsLoopbackOrigin
// ===========================================================================

TEST_CASE("IsLoopbackOrigin: accepts loopback hosts", "[server][http]") {
    CHECK(IsLoopbackOrigin("http://localhost"));
    CHECK(IsLoopbackOrigin("http://localhost:3000"));
    CHECK(IsLoopbackOrigin("https://127.0.0.1:8443"));
    CHECK(IsLoopbackOrigin("HTTP://LOCALHOST:12345"));
}

TEST_CASE("IsLoopbackOrigin: rejects everything else", "[server][http]") {
    CHECK_FALSE(IsLoopbackOrigin("http://evil.example.com"));
    CHECK_FALSE(IsLoopbackOrigin("http://localhost.evil.com"));
    CHECK_FALSE(IsLoopbackOrigin("http://127.0.0.1.evil.com"));
    CHECK_FALSE(IsLoopbackOrigin("http://localhost:abc"));
    CHECK_FALSE(IsLoopbackOrigin("http://192.168.1.10"));
    CHECK_FALSE(IsLoopbackOrigin("file://localhost"));
    CHECK_FALSE(IsLoopbackOrigin("null"));
    CHECK_FALSE(IsLoopbackOrigin(""));
}

TEST_CASE("ServerHeaderValue: name and version", "[server][http]") {
    CHECK(ServerHeaderValue() == std::string(kServerName) + "/" + kVersion);
}

// ===========================================================================
// Live routes
// ===========================================================================

TEST_CASE("HTTP: health reports status, port and tool count", "[server][http]") {
    LocalServer server(MakeProtocol());
    auto cli = server.Client();

    auto res = cli.Get("/health");
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(res->get_header_value("Content-Type").find("application/json") == 0);
    CHECK(res->get_header_value("X-MCP-Server") == ServerHeaderValue());

    auto body = Body(res);
    CHECK(body["status"] == "healthy");
    CHECK(body["server"] == kServerName);
    CHECK(body["port"] == server.Port());
    CHECK(body["tools_count"] == 4);
}

TEST_CASE("HTTP: GET / describes the server", "[server][http]") {
    LocalServer server(MakeProtocol());
    auto cli = server.Client();

    auto body = Body(cli.Get("/"));
    CHECK(body["name"] == kServerName);
    CHECK(body["protocolVersion"] == "2024-11-05");
    CHECK(body["endpoints"].contains("health"));
}

TEST_CASE("HTTP: JSON-RPC over POST /", "[server][http]") {
    LocalServer server(MakeProtocol());
    auto cli = server.Client();

    SECTION("tools/list") {
        auto res = cli.Post("/", R"({"jsonrpc":"2.0","method":"tools/list","id":1})",
                            "application/json");
        REQUIRE(res);
        CHECK(res->status == 200);
        auto body = Body(res);
        CHECK(body["id"] == 1);
        CHECK(body["result"]["tools"].size() == 4);
    }
    SECTION("tools/call") {
        auto res = cli.Post("/",
            R"({"jsonrpc":"2.0","method":"tools/call","id":"c1",)"
            R"("params":{"name":"scroll","arguments":{"direction":"down"}}})",
            "application/json");
        auto body = Body(res);
        CHECK(body["id"] == "c1");
        CHECK(body["result"]["content"][0]["text"] ==
              "Successfully scrolled down (medium distance) on main screen");
    }
    SECTION("malformed JSON still gets an envelope") {
        auto res = cli.Post("/", "{oops", "application/json");
        REQUIRE(res);
        CHECK(res->status == 200);
        auto body = Body(res);
        CHECK(body["error"]["code"] == -32700);
        CHECK(body["id"].is_null());
    }
}

TEST_CASE("HTTP: flat surface", "[server][http]") {
    LocalServer server(MakeProtocol());
    auto cli = server.Client();

    auto list = Body(cli.Get("/list_tools"));
    CHECK(list["tools"].size() == 4);

    auto ok = cli.Post("/call_tool", R"({"name":"getScreenInfo","arguments":{}})",
                       "application/json");
    REQUIRE(ok);
    CHECK(ok->status == 200);
    CHECK(Body(ok)["isError"] == false);

    auto missing = cli.Post("/call_tool", R"({"name":"ghost"})", "application/json");
    REQUIRE(missing);
    CHECK(missing->status == 404);
    CHECK(Body(missing)["error"]["code"] == -32000);

    auto failed = cli.Post("/call_tool", R"({"name":"tapButton","arguments":{}})",
                           "application/json");
    REQUIRE(failed);
    CHECK(failed->status == 400);
    auto failed_body = Body(failed);
    CHECK(failed_body["isError"] == true);
    CHECK(failed_body["content"][0]["text"] ==
          "Error: Either 'text' or 'resourceId' parameter is required");
}

TEST_CASE("HTTP: unknown path returns JSON 404", "[server][http]") {
    LocalServer server(MakeProtocol());
    auto cli = server.Client();

    auto res = cli.Get("/nope");
    REQUIRE(res);
    CHECK(res->status == 404);
    CHECK(Body(res)["error"]["message"] == "Not found: GET /nope");
}

TEST_CASE("HTTP: escaped handler exception returns JSON 500", "[server][http]") {
    LocalServer server(MakeProtocol(), [](httplib::Server& svr) {
        svr.Get("/explode", [](const httplib::Request&, httplib::Response&) {
            throw std::runtime_error("kaboom");
        });
    });
    auto cli = server.Client();

    auto res = cli.Get("/explode");
    REQUIRE(res);
    CHECK(res->status == 500);
    auto body = Body(res);
    CHECK(body["error"]["code"] == -32603);
    CHECK(body["error"]["message"] == "Internal error: kaboom");
}

// ===========================================================================
// Origin policy
// ===========================================================================

TEST_CASE("HTTP: foreign origin is rejected", "[server][http][cors]") {
    LocalServer server(MakeProtocol());
    auto cli = server.Client();

    httplib::Headers headers = {{"Origin", "http://evil.example.com"}};
    auto res = cli.Post("/", headers, R"({"method":"tools/list","id":1})",
                        "application/json");
    REQUIRE(res);
    CHECK(res->status == 403);
    CHECK_FALSE(res->has_header("Access-Control-Allow-Origin"));
    CHECK(Body(res)["error"]["code"] == 403);
}

TEST_CASE("HTTP: loopback origin gets CORS headers", "[server][http][cors]") {
    LocalServer server(MakeProtocol());
    auto cli = server.Client();

    httplib::Headers headers = {{"Origin", "http://localhost:3000"}};
    auto res = cli.Get("/health", headers);
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(res->get_header_value("Access-Control-Allow-Origin") == "http://localhost:3000");
    CHECK(res->get_header_value("Vary") == "Origin");
    CHECK_FALSE(res->has_header("Access-Control-Allow-Credentials"));
}

TEST_CASE("HTTP: preflight returns 204 with allowed methods", "[server][http][cors]") {
    LocalServer server(MakeProtocol());
    auto cli = server.Client();

    httplib::Headers headers = {
        {"Origin", "http://127.0.0.1:5173"},
        {"Access-Control-Request-Method", "POST"},
    };
    auto res = cli.Options("/", headers);
    REQUIRE(res);
    CHECK(res->status == 204);
    CHECK(res->get_header_value("Access-Control-Allow-Methods") == "GET, POST, OPTIONS");
    CHECK(res->get_header_value("Access-Control-Allow-Headers") == "Content-Type");
    CHECK(res->get_header_value("Access-Control-Max-Age") == "3600");
}

TEST_CASE("HTTP: requests without Origin are served", "[server][http][cors]") {
    LocalServer server(MakeProtocol());
    auto cli = server.Client();

    auto res = cli.Get("/health");
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK_FALSE(res->has_header("Access-Control-Allow-Origin"));
}
