#include <embedded_mcp/mcp/tool_schema.hpp>

#include <algorithm>

namespace embedded_mcp {

const char* ParamTypeName(ParamType type) {
    switch (type) {
        case ParamType::String:  return "string";
        case ParamType::Number:  return "number";
        case ParamType::Integer: return "integer";
        case ParamType::Boolean: return "boolean";
    }
    return "string";
}

bool MatchesType(ParamType type, const nlohmann::ordered_json& value) {
    switch (type) {
        case ParamType::String:  return value.is_string();
        case ParamType::Number:  return value.is_number();
        case ParamType::Integer: return value.is_number_integer();
        case ParamType::Boolean: return value.is_boolean();
    }
    return false;
}

nlohmann::ordered_json ParamSchema::ToJson() const {
    nlohmann::ordered_json out = {
        {"type", ParamTypeName(type)},
        {"description", description},
    };
    if (default_value.has_value()) {
        out["default"] = *default_value;
    }
    if (enum_values.has_value()) {
        out["enum"] = *enum_values;
    }
    return out;
}

const ParamSchema* InputSchema::FindProperty(const std::string& name) const {
    auto it = std::find_if(properties.begin(), properties.end(),
                           [&](const ParamSchema& p) { return p.name == name; });
    return it == properties.end() ? nullptr : &*it;
}

bool InputSchema::IsRequired(const std::string& name) const {
    return std::find(required.begin(), required.end(), name) != required.end();
}

nlohmann::ordered_json InputSchema::ToJson() const {
    // Properties keep declaration order on the wire.
    nlohmann::ordered_json props = nlohmann::ordered_json::object();
    for (const auto& p : properties) {
        props[p.name] = p.ToJson();
    }
    return {
        {"type", "object"},
        {"properties", props},
        {"required", required},
        {"additionalProperties", additional_properties},
    };
}

nlohmann::ordered_json ToolDefinition::ToJson() const {
    return {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema.ToJson()},
    };
}

nlohmann::ordered_json ToolResult::ContentJson() const {
    nlohmann::ordered_json out = nlohmann::ordered_json::array();
    for (const auto& c : content) {
        out.push_back(c.ToJson());
    }
    return out;
}

nlohmann::ordered_json ToolResult::ToJson() const {
    return {{"content", ContentJson()}, {"isError", is_error}};
}

ParamSchema StringParam(std::string name, std::string description) {
    return ParamSchema{std::move(name), ParamType::String, std::move(description),
                       std::nullopt, std::nullopt};
}

ParamSchema NumberParam(std::string name, std::string description) {
    return ParamSchema{std::move(name), ParamType::Number, std::move(description),
                       std::nullopt, std::nullopt};
}

ParamSchema BooleanParam(std::string name, std::string description) {
    return ParamSchema{std::move(name), ParamType::Boolean, std::move(description),
                       std::nullopt, std::nullopt};
}

ParamSchema EnumParam(std::string name, std::string description,
                      std::vector<std::string> values) {
    return ParamSchema{std::move(name), ParamType::String, std::move(description),
                       std::nullopt, std::move(values)};
}

ParamSchema WithDefault(ParamSchema param, nlohmann::ordered_json value) {
    param.default_value = std::move(value);
    return param;
}

} // namespace embedded_mcp
