#include <catch2/catch_test_macros.hpp>

#include <embedded_mcp/mcp/tool_dispatcher.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace embedded_mcp;
using namespace std::chrono_literals;

namespace {

struct Counters {
    std::atomic<int> echo_calls{0};
    nlohmann::ordered_json last_echo_args;
};

std::shared_ptr<const ToolRegistry> MakeTestRegistry(Counters& counters) {
    std::vector<ToolEntry> entries;

    InputSchema echo_schema;
    echo_schema.properties = {
        StringParam("message", "Text to echo"),
        WithDefault(NumberParam("repeat", "How many times"), 1),
        WithDefault(EnumParam("mode", "Echo mode", {"fast", "slow"}), "fast"),
        BooleanParam("loud", "Uppercase"),
    };
    echo_schema.required = {"message"};
    entries.push_back({ToolDefinition{"echo", "Echo the input", echo_schema},
        [&counters](const nlohmann::ordered_json& args, const CancellationToken&) {
            ++counters.echo_calls;
            counters.last_echo_args = args;
            return ToolResult::Text(args["message"].get<std::string>());
        }});

    entries.push_back({ToolDefinition{"boom", "Always throws", {}},
        [](const nlohmann::ordered_json&, const CancellationToken&) -> ToolResult {
            throw std::runtime_error("boom");
        }});

    entries.push_back({ToolDefinition{"throws_int", "Throws a non-exception value", {}},
        [](const nlohmann::ordered_json&, const CancellationToken&) -> ToolResult {
            throw 42;
        }});

    entries.push_back({ToolDefinition{"slow", "Waits ten seconds", {}},
        [](const nlohmann::ordered_json&, const CancellationToken& token) {
            if (!token.WaitFor(10000ms)) {
                return ToolResult::Failure("interrupted");
            }
            return ToolResult::Text("finished");
        }});

    entries.push_back({ToolDefinition{"fails", "Reports a failure", {}},
        [](const nlohmann::ordered_json&, const CancellationToken&) {
            return ToolResult::Failure("device offline");
        }});

    entries.push_back({ToolDefinition{"silent", "Returns no content", {}},
        [](const nlohmann::ordered_json&, const CancellationToken&) {
            return ToolResult{};
        }});

    auto r = ToolRegistry::Create(std::move(entries));
    REQUIRE(r.IsOk());
    return std::make_shared<const ToolRegistry>(std::move(r).Value());
}

} // anonymous namespace

// ===========================================================================
// ValidateArguments
// ===========================================================================

TEST_CASE("ValidateArguments: null and absent arguments count as empty", "[mcp][dispatch]") {
    InputSchema schema;
    schema.properties = {WithDefault(BooleanParam("includeInvisible", ""), false)};

    auto r = ValidateArguments(schema, nlohmann::ordered_json());
    REQUIRE(r.IsOk());
    CHECK(r.Value() == nlohmann::ordered_json{{"includeInvisible", false}});
}

TEST_CASE("ValidateArguments: non-object arguments rejected", "[mcp][dispatch]") {
    InputSchema schema;
    auto r = ValidateArguments(schema, nlohmann::ordered_json::array({1, 2}));
    REQUIRE(r.IsErr());
    CHECK(r.Error().code == RpcErrorCode::InvalidParams);
    CHECK(r.Error().message == "Invalid params: arguments must be an object");
}

TEST_CASE("ValidateArguments: collects every violation", "[mcp][dispatch]") {
    InputSchema schema;
    schema.properties = {
        StringParam("text", ""),
        EnumParam("direction", "", {"up", "down"}),
        NumberParam("timeout", ""),
    };
    schema.required = {"text"};

    nlohmann::ordered_json args = {{"direction", "sideways"}, {"timeout", "soon"}, {"extra", 1}};
    auto r = ValidateArguments(schema, args);
    REQUIRE(r.IsErr());

    const auto& err = r.Error();
    CHECK(err.Code() == -32602);
    REQUIRE(err.data.has_value());
    const auto& violations = (*err.data)["violations"];
    REQUIRE(violations.size() == 4);
    CHECK(violations[0] == "unknown parameter 'extra'");
    CHECK(violations[1] == "missing required parameter 'text'");
    CHECK(violations[2] == "parameter 'direction' must be one of: up, down");
    CHECK(violations[3] == "parameter 'timeout' must be a number");
    CHECK(err.message == "Invalid params: unknown parameter 'extra'");
}

TEST_CASE("ValidateArguments: additional properties allowed when declared", "[mcp][dispatch]") {
    InputSchema schema;
    schema.additional_properties = true;
    auto r = ValidateArguments(schema, nlohmann::ordered_json{{"anything", 1}});
    REQUIRE(r.IsOk());
    CHECK(r.Value()["anything"] == 1);
}

TEST_CASE("ValidateArguments: explicit values win over defaults", "[mcp][dispatch]") {
    InputSchema schema;
    schema.properties = {WithDefault(EnumParam("distance", "", {"short", "medium", "long"}),
                                     "medium")};
    auto r = ValidateArguments(schema, nlohmann::ordered_json{{"distance", "long"}});
    REQUIRE(r.IsOk());
    CHECK(r.Value()["distance"] == "long");
}

// ===========================================================================
// Invoke
// ===========================================================================

TEST_CASE("ToolDispatcher: unknown tool is ToolNotFound", "[mcp][dispatch]") {
    Counters counters;
    ToolDispatcher dispatcher(MakeTestRegistry(counters));

    auto r = dispatcher.Invoke("nonexistent", nlohmann::ordered_json::object());
    REQUIRE(r.IsErr());
    CHECK(r.Error().Code() == -32000);
    CHECK(r.Error().message == "Tool not found: nonexistent");
    CHECK((*r.Error().data)["name"] == "nonexistent");
}

TEST_CASE("ToolDispatcher: tool names are case-sensitive", "[mcp][dispatch]") {
    Counters counters;
    ToolDispatcher dispatcher(MakeTestRegistry(counters));
    auto r = dispatcher.Invoke("Echo", nlohmann::ordered_json{{"message", "x"}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().code == RpcErrorCode::ToolNotFound);
}

TEST_CASE("ToolDispatcher: invalid arguments never reach the handler", "[mcp][dispatch]") {
    Counters counters;
    ToolDispatcher dispatcher(MakeTestRegistry(counters));

    CHECK(dispatcher.Invoke("echo", nlohmann::ordered_json::object()).IsErr());
    CHECK(dispatcher.Invoke("echo", nlohmann::ordered_json{{"message", 5}}).IsErr());
    CHECK(dispatcher.Invoke("echo",
                            nlohmann::ordered_json{{"message", "x"}, {"mode", "warp"}}).IsErr());
    CHECK(dispatcher.Invoke("echo", nlohmann::ordered_json{{"message", "x"}, {"bogus", 1}}).IsErr());
    CHECK(dispatcher.Invoke("echo", "not an object").IsErr());

    CHECK(counters.echo_calls == 0);
}

TEST_CASE("ToolDispatcher: handler sees defaults filled in", "[mcp][dispatch]") {
    Counters counters;
    ToolDispatcher dispatcher(MakeTestRegistry(counters));

    auto r = dispatcher.Invoke("echo", nlohmann::ordered_json{{"message", "hi"}});
    REQUIRE(r.IsOk());
    CHECK_FALSE(r.Value().is_error);
    CHECK(r.Value().content[0].text == "hi");
    CHECK(counters.last_echo_args["repeat"] == 1);
    CHECK(counters.last_echo_args["mode"] == "fast");
    CHECK_FALSE(counters.last_echo_args.contains("loud"));
}

TEST_CASE("ToolDispatcher: thrown exception becomes failed result", "[mcp][dispatch]") {
    Counters counters;
    ToolDispatcher dispatcher(MakeTestRegistry(counters));

    auto r = dispatcher.Invoke("boom", nlohmann::ordered_json());
    REQUIRE(r.IsOk());
    CHECK(r.Value().is_error);
    CHECK(r.Value().content[0].text == "Error: Tool execution failed: boom");
    CHECK(dispatcher.InFlight() == 0);
}

TEST_CASE("ToolDispatcher: non-standard throw becomes failed result", "[mcp][dispatch]") {
    Counters counters;
    ToolDispatcher dispatcher(MakeTestRegistry(counters));

    auto r = dispatcher.Invoke("throws_int", nlohmann::ordered_json());
    REQUIRE(r.IsOk());
    CHECK(r.Value().is_error);
    CHECK(r.Value().content[0].text == "Error: Tool execution failed: unknown exception");
    CHECK(dispatcher.InFlight() == 0);
}

TEST_CASE("ToolDispatcher: handler failure passes through", "[mcp][dispatch]") {
    Counters counters;
    ToolDispatcher dispatcher(MakeTestRegistry(counters));

    auto r = dispatcher.Invoke("fails", nlohmann::ordered_json::object());
    REQUIRE(r.IsOk());
    CHECK(r.Value().is_error);
    CHECK(r.Value().content[0].text == "Error: device offline");
}

TEST_CASE("ToolDispatcher: empty content gets one empty text item", "[mcp][dispatch]") {
    Counters counters;
    ToolDispatcher dispatcher(MakeTestRegistry(counters));

    auto r = dispatcher.Invoke("silent", nlohmann::ordered_json::object());
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().content.size() == 1);
    CHECK(r.Value().content[0].type == "text");
    CHECK(r.Value().content[0].text.empty());
}

TEST_CASE("ToolDispatcher: call timeout interrupts a slow handler", "[mcp][dispatch]") {
    Counters counters;
    DispatcherOptions options;
    options.call_timeout = 50ms;
    ToolDispatcher dispatcher(MakeTestRegistry(counters), options);

    auto start = std::chrono::steady_clock::now();
    auto r = dispatcher.Invoke("slow", nlohmann::ordered_json::object());
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(r.IsOk());
    CHECK(r.Value().is_error);
    CHECK(r.Value().content[0].text == "Error: Tool 'slow' timed out after 50ms");
    CHECK(elapsed < 5000ms);
}

TEST_CASE("ToolDispatcher: CancelInFlight interrupts running calls", "[mcp][dispatch]") {
    Counters counters;
    ToolDispatcher dispatcher(MakeTestRegistry(counters));

    Result<ToolResult, RpcError> outcome =
        Result<ToolResult, RpcError>::Ok(ToolResult::Text("unset"));
    std::thread caller([&] {
        outcome = dispatcher.Invoke("slow", nlohmann::ordered_json::object());
    });

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (dispatcher.InFlight() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE(dispatcher.InFlight() == 1);
    CHECK_FALSE(dispatcher.WaitIdle(20ms));

    dispatcher.CancelInFlight();
    caller.join();

    CHECK(dispatcher.WaitIdle(0ms));
    REQUIRE(outcome.IsOk());
    CHECK(outcome.Value().is_error);
    CHECK(outcome.Value().content[0].text == "Error: Tool 'slow' cancelled");

    // Re-armed dispatcher runs new calls normally.
    dispatcher.ResetCancellation();
    auto r = dispatcher.Invoke("echo", nlohmann::ordered_json{{"message", "again"}});
    REQUIRE(r.IsOk());
    CHECK_FALSE(r.Value().is_error);
}

TEST_CASE("ToolDispatcher: concurrent calls are isolated", "[mcp][dispatch]") {
    std::vector<ToolEntry> entries;
    InputSchema schema;
    schema.properties = {StringParam("message", "")};
    schema.required = {"message"};
    entries.push_back({ToolDefinition{"echo", "", schema},
        [](const nlohmann::ordered_json& args, const CancellationToken& token) {
            (void)token.WaitFor(10ms);
            return ToolResult::Text(args["message"].get<std::string>());
        }});
    auto registry = ToolRegistry::Create(std::move(entries));
    REQUIRE(registry.IsOk());
    ToolDispatcher dispatcher(std::make_shared<const ToolRegistry>(std::move(registry).Value()));

    constexpr int kThreads = 16;
    std::vector<std::string> results(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            auto r = dispatcher.Invoke("echo",
                                       nlohmann::ordered_json{{"message", "m" + std::to_string(i)}});
            if (r.IsOk()) results[i] = r.Value().content[0].text;
        });
    }
    for (auto& t : threads) t.join();

    for (int i = 0; i < kThreads; ++i) {
        CHECK(results[i] == "m" + std::to_string(i));
    }
    CHECK(dispatcher.InFlight() == 0);
}
