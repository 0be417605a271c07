#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace embedded_mcp {

// ---------------------------------------------------------------------------
// ParamType — the JSON types a tool parameter may declare.
// ---------------------------------------------------------------------------
enum class ParamType {
    String,
    Number,
    Integer,
    Boolean,
};

/// JSON Schema name of a type ("string", "number", ...).
const char* ParamTypeName(ParamType type);

/// True if `value` is an instance of `type`. Integers satisfy Number.
bool MatchesType(ParamType type, const nlohmann::ordered_json& value);

// ---------------------------------------------------------------------------
// ParamSchema — one property of a tool's input schema.
// ---------------------------------------------------------------------------
struct ParamSchema {
    std::string name;
    ParamType type = ParamType::String;
    std::string description;
    std::optional<nlohmann::ordered_json> default_value;
    std::optional<std::vector<std::string>> enum_values;

    [[nodiscard]] nlohmann::ordered_json ToJson() const;
};

// ---------------------------------------------------------------------------
// InputSchema — an object schema with ordered properties.
// ---------------------------------------------------------------------------
struct InputSchema {
    std::vector<ParamSchema> properties;
    std::vector<std::string> required;
    bool additional_properties = false;

    [[nodiscard]] const ParamSchema* FindProperty(const std::string& name) const;
    [[nodiscard]] bool IsRequired(const std::string& name) const;

    [[nodiscard]] nlohmann::ordered_json ToJson() const;
};

// ---------------------------------------------------------------------------
// ToolDefinition — discovery metadata for one tool.
// ---------------------------------------------------------------------------
struct ToolDefinition {
    std::string name;
    std::string description;
    InputSchema input_schema;

    [[nodiscard]] nlohmann::ordered_json ToJson() const;
};

// ---------------------------------------------------------------------------
// ToolContent / ToolResult — what a tool invocation produces.
// ---------------------------------------------------------------------------
struct ToolContent {
    std::string type = "text";
    std::string text;

    [[nodiscard]] nlohmann::ordered_json ToJson() const {
        return {{"type", type}, {"text", text}};
    }
};

struct ToolResult {
    std::vector<ToolContent> content;
    bool is_error = false;

    static ToolResult Text(std::string text) {
        return ToolResult{{ToolContent{"text", std::move(text)}}, false};
    }

    static ToolResult Failure(std::string text) {
        return ToolResult{{ToolContent{"text", "Error: " + std::move(text)}}, true};
    }

    [[nodiscard]] nlohmann::ordered_json ContentJson() const;

    /// {"content": [...], "isError": bool}
    [[nodiscard]] nlohmann::ordered_json ToJson() const;
};

// -- Property builders ------------------------------------------------------

ParamSchema StringParam(std::string name, std::string description);
ParamSchema NumberParam(std::string name, std::string description);
ParamSchema BooleanParam(std::string name, std::string description);
ParamSchema EnumParam(std::string name, std::string description,
                      std::vector<std::string> values);
ParamSchema WithDefault(ParamSchema param, nlohmann::ordered_json value);

} // namespace embedded_mcp
