#pragma once

#include <embedded_mcp/core/cancellation.hpp>
#include <embedded_mcp/core/result.hpp>
#include <embedded_mcp/mcp/tool_schema.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace embedded_mcp {

// A tool handler receives arguments that already passed schema validation
// with defaults filled in. It may block; long waits should go through
// `token` so a stopping server or an expired call can interrupt them.
// Throwing is allowed and is reported as a failed ToolResult.
using ToolHandler = std::function<ToolResult(
    const nlohmann::ordered_json& arguments, const CancellationToken& token)>;

struct ToolEntry {
    ToolDefinition definition;
    ToolHandler handler;
};

// ---------------------------------------------------------------------------
// ToolRegistry — immutable set of tools, fixed at construction.
//
// Hosts that want a different tool set build a new registry.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    /// Validates the entries and builds the registry. Fails on duplicate or
    /// empty names, missing handlers, required names that are not declared
    /// properties, enums on non-string parameters, and defaults that do not
    /// satisfy their own declaration.
    static Result<ToolRegistry, std::string> Create(std::vector<ToolEntry> entries);

    /// Definitions in registration order.
    [[nodiscard]] const std::vector<ToolDefinition>& Tools() const noexcept {
        return definitions_;
    }

    [[nodiscard]] const ToolDefinition* FindDefinition(std::string_view name) const;
    [[nodiscard]] const ToolHandler* FindHandler(std::string_view name) const;

    [[nodiscard]] bool HasTool(std::string_view name) const {
        return FindHandler(name) != nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept { return definitions_.size(); }

private:
    ToolRegistry() = default;

    std::vector<ToolDefinition> definitions_;
    std::map<std::string, ToolHandler, std::less<>> handlers_;
};

} // namespace embedded_mcp
